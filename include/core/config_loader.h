#ifndef ROOMCAST_CONFIG_LOADER_H
#define ROOMCAST_CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "logging/logger.h"
#include "state/system_state.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace roomcast {

// argv for an external command; empty = nothing to run
using CommandLine = std::vector<std::string>;

struct IpcConfig {
    std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
    int recvTimeoutMs = DaemonConstants::ZEROMQ_RECV_TIMEOUT_MS;
};

struct TransitionConfig {
    int backendTimeoutMs = DaemonConstants::DEFAULT_BACKEND_TIMEOUT_MS;
    state::SourceId initialSource = state::SourceId::None;
};

// Initial routing flags applied at startup
struct RoutingConfig {
    bool multiroom = false;
    bool equalizer = false;
    // Persist runtime toggles to settingsFile and prefer them over the flags above
    bool restoreLast = false;
    std::string settingsFile = DaemonConstants::DEFAULT_ROUTING_SETTINGS_FILE;
};

struct VolumeConfig {
    int startup = DaemonConstants::DEFAULT_STARTUP_VOLUME;
    int step = DaemonConstants::DEFAULT_VOLUME_STEP;
    int coalesceMs = DaemonConstants::DEFAULT_VOLUME_COALESCE_MS;
    int hardwareMin = DaemonConstants::DEFAULT_HARDWARE_VOLUME_MIN;
    int hardwareMax = DaemonConstants::DEFAULT_HARDWARE_VOLUME_MAX;
    bool restoreLast = false;
    std::string lastVolumeFile = DaemonConstants::DEFAULT_LAST_VOLUME_FILE;
};

struct TransportConfig {
    int heartbeatIntervalMs = DaemonConstants::DEFAULT_HEARTBEAT_INTERVAL_MS;
    int heartbeatTimeoutMs = DaemonConstants::DEFAULT_HEARTBEAT_TIMEOUT_MS;
    int backoffInitialMs = DaemonConstants::DEFAULT_BACKOFF_INITIAL_MS;
    double backoffFactor = DaemonConstants::DEFAULT_BACKOFF_FACTOR;
    int backoffMaxMs = DaemonConstants::DEFAULT_BACKOFF_MAX_MS;
};

struct SourceCommands {
    CommandLine start;
    CommandLine stop;
};

// Commands run by the command backend. "{volume}" and "{command}" are substituted.
struct BackendCommandConfig {
    std::map<state::SourceId, SourceCommands> sources;
    CommandLine outputDirect;
    CommandLine outputMultiroom;
    CommandLine equalizerOn;
    CommandLine equalizerOff;
    CommandLine volume;
    std::map<state::SourceId, CommandLine> playback;
};

struct AppConfig {
    IpcConfig ipc;
    TransitionConfig transition;
    RoutingConfig routing;
    VolumeConfig volume;
    TransportConfig transport;
    BackendCommandConfig backends;
    logging::LogConfig logging;
};

/**
 * @brief Load the JSON config into @p outConfig.
 *
 * @p outConfig is reset to defaults first. Out-of-range values are replaced by their
 * defaults with a warning.
 *
 * @return false if the file is missing or unparsable (defaults stay in place)
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

// Reads a JSON array of strings; false (and @p out untouched) for anything else
bool parseCommandLine(const nlohmann::json& j, CommandLine& out);

}  // namespace roomcast

#endif  // ROOMCAST_CONFIG_LOADER_H
