#include "backend/command_backend.h"

#include "logging/logger.h"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <utility>
#include <vector>

extern char** environ;

namespace roomcast::backend {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

bool spawnProcess(const CommandLine& args, pid_t& pid) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int rc = posix_spawnp(&pid, args[0].c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        LOG_ERROR("[CommandBackend] Failed to spawn '{}': {} ({})", args[0], rc,
                  std::strerror(rc));
        return false;
    }
    return true;
}

enum class ExitWait : uint8_t { Exited, TimedOut, Failed };

// Fills @p status when the child exited within @p timeout
ExitWait waitForExit(pid_t pid, std::chrono::milliseconds timeout, int& status) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            return ExitWait::Exited;
        }
        if (ret < 0 && errno != EINTR) {
            LOG_ERROR("[CommandBackend] waitpid({}) failed: {}", pid, std::strerror(errno));
            return ExitWait::Failed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return ExitWait::TimedOut;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

std::string joinArgs(const CommandLine& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

}  // namespace

ProcessResult runProcess(const CommandLine& args, std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (args.empty()) {
        result.spawned = true;
        result.exitCode = 0;
        return result;
    }

    pid_t pid = -1;
    if (!spawnProcess(args, pid)) {
        return result;
    }
    result.spawned = true;

    int status = 0;
    switch (waitForExit(pid, timeout, status)) {
        case ExitWait::Exited:
            break;
        case ExitWait::TimedOut:
            result.timedOut = true;
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return result;
        case ExitWait::Failed:
            result.waitFailed = true;
            return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

CommandLine substitute(const CommandLine& args, const std::string& key, const std::string& value) {
    const std::string placeholder = "{" + key + "}";
    CommandLine out;
    out.reserve(args.size());
    for (auto arg : args) {
        size_t pos = 0;
        while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
            arg.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
        out.push_back(std::move(arg));
    }
    return out;
}

CommandBackend::CommandBackend(BackendCommandConfig config, std::chrono::milliseconds processTimeout)
    : config_(std::move(config)), processTimeout_(processTimeout) {}

BackendResult CommandBackend::run(const CommandLine& args, ErrorCode failureCode,
                                  const std::string& what) {
    if (args.empty()) {
        LOG_DEBUG("[CommandBackend] {}: no command configured", what);
        return BackendResult::success();
    }

    LOG_DEBUG("[CommandBackend] {}: {}", what, joinArgs(args));
    ProcessResult result = runProcess(args, processTimeout_);
    if (!result.spawned) {
        return BackendResult::failure(failureCode, what + ": could not spawn " + args[0]);
    }
    if (result.timedOut) {
        return BackendResult::failure(ErrorCode::BACKEND_TIMEOUT,
                                      what + ": " + args[0] + " killed after timeout");
    }
    if (result.waitFailed) {
        return BackendResult::failure(failureCode,
                                      what + ": exit status of " + args[0] + " is unknown");
    }
    if (result.exitCode != 0) {
        return BackendResult::failure(
            failureCode, what + ": " + args[0] + " exited with " + std::to_string(result.exitCode));
    }
    return BackendResult::success();
}

BackendResult CommandBackend::start(state::SourceId source, state::RoutingMode mode,
                                    bool equalizerEnabled) {
    auto it = config_.sources.find(source);
    if (it == config_.sources.end()) {
        return run({}, ErrorCode::BACKEND_START_FAILED,
                   std::string("start ") + state::sourceToString(source));
    }
    CommandLine args = substitute(it->second.start, "routing_mode", state::routingModeToString(mode));
    args = substitute(args, "equalizer", equalizerEnabled ? "on" : "off");
    return run(args, ErrorCode::BACKEND_START_FAILED,
               std::string("start ") + state::sourceToString(source));
}

BackendResult CommandBackend::stop(state::SourceId source) {
    CommandLine args;
    auto it = config_.sources.find(source);
    if (it != config_.sources.end()) {
        args = it->second.stop;
    }
    return run(args, ErrorCode::BACKEND_STOP_FAILED,
               std::string("stop ") + state::sourceToString(source));
}

BackendResult CommandBackend::reconfigureOutput(state::RoutingMode mode, bool equalizerEnabled) {
    const CommandLine& output =
        mode == state::RoutingMode::Multiroom ? config_.outputMultiroom : config_.outputDirect;
    BackendResult result = run(output, ErrorCode::BACKEND_RECONFIGURE_FAILED,
                               std::string("output ") + state::routingModeToString(mode));
    if (!result.ok()) {
        return result;
    }
    return run(equalizerEnabled ? config_.equalizerOn : config_.equalizerOff,
               ErrorCode::BACKEND_RECONFIGURE_FAILED,
               equalizerEnabled ? "equalizer on" : "equalizer off");
}

BackendResult CommandBackend::setVolume(int hardwareLevel, bool muted) {
    CommandLine args =
        substitute(config_.volume, "volume", std::to_string(muted ? 0 : hardwareLevel));
    args = substitute(args, "muted", muted ? "1" : "0");
    return run(args, ErrorCode::BACKEND_VOLUME_FAILED, "volume");
}

BackendResult CommandBackend::playback(state::SourceId source, PlaybackCommand command,
                                       const nlohmann::json& data) {
    auto it = config_.playback.find(source);
    if (it == config_.playback.end()) {
        return BackendResult::failure(ErrorCode::BACKEND_COMMAND_FAILED,
                                      std::string("no playback command for ") +
                                          state::sourceToString(source));
    }
    CommandLine args = substitute(it->second, "command", playbackCommandToString(command));
    int64_t position = 0;
    if (data.is_object() && data.contains("position_ms") && data["position_ms"].is_number()) {
        position = data["position_ms"].get<int64_t>();
    }
    args = substitute(args, "position_ms", std::to_string(position));
    return run(args, ErrorCode::BACKEND_COMMAND_FAILED,
               std::string("playback ") + playbackCommandToString(command));
}

}  // namespace roomcast::backend
