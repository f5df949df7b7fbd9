#include "core/config_loader.h"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace roomcast {

namespace {

using json = nlohmann::json;

int sanitizePositive(int value, int fallback, const char* name, bool verbose) {
    if (value > 0) {
        return value;
    }
    if (verbose) {
        LOG_WARN("Config: {} must be positive (got {}), using {}", name, value, fallback);
    }
    return fallback;
}

void parseIpc(const json& section, IpcConfig& out, bool verbose) {
    if (section.contains("endpoint") && section["endpoint"].is_string()) {
        out.endpoint = section["endpoint"].get<std::string>();
    }
    if (section.contains("recvTimeoutMs")) {
        out.recvTimeoutMs = sanitizePositive(section["recvTimeoutMs"].get<int>(),
                                             DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS,
                                             "ipc.recvTimeoutMs", verbose);
    }
}

void parseTransition(const json& section, TransitionConfig& out, bool verbose) {
    if (section.contains("backendTimeoutMs")) {
        out.backendTimeoutMs = sanitizePositive(section["backendTimeoutMs"].get<int>(),
                                                DaemonConstants::DEFAULT_BACKEND_TIMEOUT_MS,
                                                "transition.backendTimeoutMs", verbose);
    }
    if (section.contains("initialSource") && section["initialSource"].is_string()) {
        auto name = section["initialSource"].get<std::string>();
        auto source = state::parseSource(name);
        if (source) {
            out.initialSource = *source;
        } else if (verbose) {
            LOG_WARN("Config: unknown transition.initialSource '{}', using 'none'", name);
        }
    }
}

void parseVolume(const json& section, VolumeConfig& out, bool verbose) {
    if (section.contains("startup")) {
        int startup = section["startup"].get<int>();
        if (startup >= DaemonConstants::VOLUME_MIN && startup <= DaemonConstants::VOLUME_MAX) {
            out.startup = startup;
        } else if (verbose) {
            LOG_WARN("Config: volume.startup out of range (got {}), using {}", startup,
                     out.startup);
        }
    }
    if (section.contains("step")) {
        out.step = sanitizePositive(section["step"].get<int>(),
                                    DaemonConstants::DEFAULT_VOLUME_STEP, "volume.step", verbose);
    }
    if (section.contains("coalesceMs")) {
        out.coalesceMs = sanitizePositive(section["coalesceMs"].get<int>(),
                                          DaemonConstants::DEFAULT_VOLUME_COALESCE_MS,
                                          "volume.coalesceMs", verbose);
    }
    int hwMin = out.hardwareMin;
    int hwMax = out.hardwareMax;
    if (section.contains("hardwareMin")) {
        hwMin = section["hardwareMin"].get<int>();
    }
    if (section.contains("hardwareMax")) {
        hwMax = section["hardwareMax"].get<int>();
    }
    if (hwMin < hwMax) {
        out.hardwareMin = hwMin;
        out.hardwareMax = hwMax;
    } else if (verbose) {
        LOG_WARN("Config: volume.hardwareMin ({}) must be below hardwareMax ({}), using {}..{}",
                 hwMin, hwMax, out.hardwareMin, out.hardwareMax);
    }
    if (section.contains("restoreLast")) {
        out.restoreLast = section["restoreLast"].get<bool>();
    }
    if (section.contains("lastVolumeFile") && section["lastVolumeFile"].is_string()) {
        out.lastVolumeFile = section["lastVolumeFile"].get<std::string>();
    }
}

void parseTransport(const json& section, TransportConfig& out, bool verbose) {
    if (section.contains("heartbeatIntervalMs")) {
        out.heartbeatIntervalMs = sanitizePositive(
            section["heartbeatIntervalMs"].get<int>(),
            DaemonConstants::DEFAULT_HEARTBEAT_INTERVAL_MS, "transport.heartbeatIntervalMs",
            verbose);
    }
    if (section.contains("heartbeatTimeoutMs")) {
        out.heartbeatTimeoutMs = sanitizePositive(
            section["heartbeatTimeoutMs"].get<int>(), DaemonConstants::DEFAULT_HEARTBEAT_TIMEOUT_MS,
            "transport.heartbeatTimeoutMs", verbose);
    }
    if (section.contains("backoffInitialMs")) {
        out.backoffInitialMs = sanitizePositive(
            section["backoffInitialMs"].get<int>(), DaemonConstants::DEFAULT_BACKOFF_INITIAL_MS,
            "transport.backoffInitialMs", verbose);
    }
    if (section.contains("backoffFactor")) {
        double factor = section["backoffFactor"].get<double>();
        if (factor >= 1.0) {
            out.backoffFactor = factor;
        } else if (verbose) {
            LOG_WARN("Config: transport.backoffFactor must be >= 1.0 (got {}), using {}", factor,
                     out.backoffFactor);
        }
    }
    if (section.contains("backoffMaxMs")) {
        out.backoffMaxMs = sanitizePositive(section["backoffMaxMs"].get<int>(),
                                            DaemonConstants::DEFAULT_BACKOFF_MAX_MS,
                                            "transport.backoffMaxMs", verbose);
    }
    if (out.backoffMaxMs < out.backoffInitialMs) {
        out.backoffMaxMs = out.backoffInitialMs;
    }
}

void readCommand(const json& section, const char* key, CommandLine& out, const std::string& path,
                 bool verbose) {
    if (!section.contains(key)) {
        return;
    }
    if (!parseCommandLine(section[key], out) && verbose) {
        LOG_WARN("Config: {}.{} must be an array of strings, ignoring", path, key);
    }
}

void parseBackends(const json& section, BackendCommandConfig& out, bool verbose) {
    for (state::SourceId source : state::kPlayableSources) {
        const char* name = state::sourceToString(source);
        if (section.contains(name) && section[name].is_object()) {
            SourceCommands commands;
            std::string path = std::string("backends.") + name;
            readCommand(section[name], "start", commands.start, path, verbose);
            readCommand(section[name], "stop", commands.stop, path, verbose);
            out.sources[source] = std::move(commands);
        }
    }

    if (section.contains("output") && section["output"].is_object()) {
        readCommand(section["output"], "direct", out.outputDirect, "backends.output", verbose);
        readCommand(section["output"], "multiroom", out.outputMultiroom, "backends.output",
                    verbose);
    }
    if (section.contains("equalizer") && section["equalizer"].is_object()) {
        readCommand(section["equalizer"], "on", out.equalizerOn, "backends.equalizer", verbose);
        readCommand(section["equalizer"], "off", out.equalizerOff, "backends.equalizer", verbose);
    }
    readCommand(section, "volume", out.volume, "backends", verbose);

    if (section.contains("playback") && section["playback"].is_object()) {
        for (const auto& [name, value] : section["playback"].items()) {
            auto source = state::parseSource(name);
            if (!source || *source == state::SourceId::None) {
                if (verbose) {
                    LOG_WARN("Config: backends.playback has unknown source '{}'", name);
                }
                continue;
            }
            CommandLine command;
            if (parseCommandLine(value, command)) {
                out.playback[*source] = std::move(command);
            } else if (verbose) {
                LOG_WARN("Config: backends.playback.{} must be an array of strings", name);
            }
        }
    }
}

void parseLogging(const json& section, logging::LogConfig& out) {
    if (section.contains("level")) {
        out.level = logging::stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath")) {
        out.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize")) {
        out.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups")) {
        out.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput")) {
        out.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("consoleStderr")) {
        out.consoleStderr = section["consoleStderr"].get<bool>();
    }
    if (section.contains("coloredOutput")) {
        out.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern")) {
        out.pattern = section["pattern"].get<std::string>();
    }
}

}  // namespace

bool parseCommandLine(const json& j, CommandLine& out) {
    if (!j.is_array()) {
        return false;
    }
    CommandLine parsed;
    for (const auto& arg : j) {
        if (!arg.is_string()) {
            return false;
        }
        parsed.push_back(arg.get<std::string>());
    }
    out = std::move(parsed);
    return true;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    try {
        json j;
        file >> j;

        if (j.contains("ipc") && j["ipc"].is_object()) {
            parseIpc(j["ipc"], outConfig.ipc, verbose);
        }
        if (j.contains("transition") && j["transition"].is_object()) {
            parseTransition(j["transition"], outConfig.transition, verbose);
        }
        if (j.contains("routing") && j["routing"].is_object()) {
            const auto& routing = j["routing"];
            if (routing.contains("multiroom")) {
                outConfig.routing.multiroom = routing["multiroom"].get<bool>();
            }
            if (routing.contains("equalizer")) {
                outConfig.routing.equalizer = routing["equalizer"].get<bool>();
            }
            if (routing.contains("restoreLast")) {
                outConfig.routing.restoreLast = routing["restoreLast"].get<bool>();
            }
            if (routing.contains("settingsFile") && routing["settingsFile"].is_string()) {
                outConfig.routing.settingsFile = routing["settingsFile"].get<std::string>();
            }
        }
        if (j.contains("volume") && j["volume"].is_object()) {
            parseVolume(j["volume"], outConfig.volume, verbose);
        }
        if (j.contains("transport") && j["transport"].is_object()) {
            parseTransport(j["transport"], outConfig.transport, verbose);
        }
        if (j.contains("backends") && j["backends"].is_object()) {
            parseBackends(j["backends"], outConfig.backends, verbose);
        }
        if (j.contains("logging") && j["logging"].is_object()) {
            parseLogging(j["logging"], outConfig.logging);
        }

        if (verbose) {
            LOG_INFO("Config: loaded {} (ipc={}, backendTimeout={}ms, coalesce={}ms)",
                     configPath.string(), outConfig.ipc.endpoint,
                     outConfig.transition.backendTimeoutMs, outConfig.volume.coalesceMs);
        }
        return true;
    } catch (const json::exception& e) {
        if (verbose) {
            std::cerr << "Config: Failed to parse " << configPath << ": " << e.what() << '\n';
        }
        outConfig = AppConfig{};
        return false;
    }
}

}  // namespace roomcast
