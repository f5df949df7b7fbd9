#include "backend/audio_backend.h"
#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "events/event.h"
#include "graceful_shutdown.h"
#include "logging/logger.h"
#include "transport/command_client.h"
#include "transport/snapshot_source.h"
#include "transport/subscription_registry.h"
#include "transport/zmq_event_channel.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace roomcast;
using json = nlohmann::json;

namespace {

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [--endpoint <ep>] [--timeout <ms>] <command> [args]"
              << '\n'
              << '\n'
              << "Commands:" << '\n'
              << "  ping                         Check that roomcastd answers" << '\n'
              << "  state                        Print the full state snapshot" << '\n'
              << "  source <name>                none|librespot|bluetooth|roc" << '\n'
              << "  routing <mode>               direct|multiroom" << '\n'
              << "  eq <on|off>                  Toggle the equalizer" << '\n'
              << "  volume <0..100>              Absolute volume" << '\n'
              << "  volume +N | -N               Relative volume" << '\n'
              << "  step <N>                     Relative volume in configured steps" << '\n'
              << "  mute <on|off>" << '\n'
              << "  play|pause|toggle|next|previous <source>" << '\n'
              << "  seek <source> <position_ms>" << '\n'
              << "  report <source> <plugin_state>" << '\n'
              << "  dismiss                      Clear the error banner" << '\n'
              << "  watch                        Stream events until Ctrl+C" << '\n';
}

std::optional<bool> parseOnOff(const std::string& value) {
    if (value == "on" || value == "true" || value == "1") {
        return true;
    }
    if (value == "off" || value == "false" || value == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<int> parseInt(const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

struct Request {
    std::string cmd;
    json params = json::object();
};

// Maps CLI words onto the daemon's command surface
std::optional<Request> buildRequest(const std::vector<std::string>& words) {
    const std::string& verb = words[0];
    auto arg = [&](size_t i) -> std::optional<std::string> {
        if (i < words.size()) {
            return words[i];
        }
        return std::nullopt;
    };

    if (verb == "ping") {
        return Request{"PING"};
    }
    if (verb == "state") {
        return Request{"GET_STATE"};
    }
    if (verb == "dismiss") {
        return Request{"ERROR_DISMISS"};
    }
    if (verb == "source" && arg(1)) {
        return Request{"SOURCE_SET", json{{"source", *arg(1)}}};
    }
    if (verb == "routing" && arg(1)) {
        return Request{"ROUTING_SET", json{{"mode", *arg(1)}}};
    }
    if (verb == "eq" && arg(1)) {
        auto enabled = parseOnOff(*arg(1));
        if (enabled) {
            return Request{"EQUALIZER_SET", json{{"enabled", *enabled}}};
        }
    }
    if (verb == "mute" && arg(1)) {
        auto muted = parseOnOff(*arg(1));
        if (muted) {
            return Request{"VOLUME_MUTE", json{{"muted", *muted}}};
        }
    }
    if (verb == "volume" && arg(1)) {
        const std::string& value = *arg(1);
        auto level = parseInt(value);
        if (level && (value[0] == '+' || value[0] == '-')) {
            return Request{"VOLUME_ADJUST", json{{"delta", *level}, {"show_bar", true}}};
        }
        if (level) {
            return Request{"VOLUME_SET", json{{"volume", *level}, {"show_bar", true}}};
        }
    }
    if (verb == "step" && arg(1)) {
        auto steps = parseInt(*arg(1));
        if (steps) {
            return Request{"VOLUME_ADJUST", json{{"client_steps", *steps}, {"show_bar", true}}};
        }
    }
    if (verb == "seek" && arg(1) && arg(2)) {
        auto position = parseInt(*arg(2));
        if (position) {
            return Request{"PLAYBACK", json{{"source", *arg(1)},
                                            {"command", "seek"},
                                            {"data", json{{"position_ms", *position}}}}};
        }
    }
    if (verb == "report" && arg(1) && arg(2)) {
        return Request{"PLUGIN_REPORT", json{{"source", *arg(1)}, {"plugin_state", *arg(2)}}};
    }
    if (backend::parsePlaybackCommand(verb) && verb != "seek" && arg(1)) {
        return Request{"PLAYBACK", json{{"source", *arg(1)}, {"command", verb}}};
    }
    return std::nullopt;
}

int runCommand(const std::string& endpoint, int timeoutMs, const Request& request) {
    transport::CommandClient client(endpoint, timeoutMs);
    auto reply = client.request(request.cmd, request.params);
    if (!reply) {
        std::cerr << "Error: " << errorCodeToString(ErrorCode::IPC_DAEMON_NOT_RUNNING)
                  << " (no reply from " << endpoint << ")" << '\n';
        return 1;
    }
    std::cout << reply->dump(2) << '\n';
    return transport::isOkResponse(*reply) ? 0 : 1;
}

int runWatch(const std::string& endpoint, int timeoutMs) {
    std::signal(SIGINT, GracefulShutdown::signalHandler);
    std::signal(SIGTERM, GracefulShutdown::signalHandler);

    auto channel = std::make_shared<transport::ZmqEventChannel>(endpoint);
    auto snapshots = std::make_shared<transport::ZmqSnapshotSource>(endpoint, timeoutMs);
    transport::SubscriptionRegistry registry(channel, snapshots);

    std::mutex outputMutex;
    auto print = [&outputMutex](const events::Event& event) {
        json line;
        line["event"] = events::eventKindName(event.kind);
        line["source"] = event.source;
        line["data"] = event.data;
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cout << line.dump() << std::endl;
    };

    transport::SubscriptionRegistry::Callbacks callbacks;
    for (auto kind : events::kAllEventKinds) {
        callbacks[kind] = print;
    }
    registry.addSubscriber("roomcastctl-watch", callbacks);

    GracefulShutdown::Controller controller;
    controller.setSignalState(&GracefulShutdown::getGlobalSignalState());
    while (controller.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        controller.processPendingSignals();
    }

    registry.removeSubscriber("roomcastctl-watch");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    int timeoutMs = DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS * 3;
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--endpoint" && i + 1 < argc) {
            endpoint = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            auto parsed = parseInt(argv[++i]);
            if (!parsed || *parsed <= 0) {
                std::cerr << "Invalid --timeout" << '\n';
                return 1;
            }
            timeoutMs = *parsed;
        } else {
            words.push_back(arg);
        }
    }

    if (words.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    logging::LogConfig logConfig;
    logConfig.name = "roomcastctl";
    logConfig.level = logging::LogLevel::Warn;
    logConfig.consoleStderr = true;
    logging::initialize(logConfig);

    if (words[0] == "watch") {
        return runWatch(endpoint, timeoutMs);
    }

    auto request = buildRequest(words);
    if (!request) {
        std::cerr << "Invalid command: " << words[0] << '\n';
        printUsage(argv[0]);
        return 1;
    }
    return runCommand(endpoint, timeoutMs, *request);
}
