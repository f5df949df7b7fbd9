#pragma once

#include "backend/audio_backend.h"
#include "core/config_loader.h"

#include <chrono>
#include <string>
#include <sys/types.h>

namespace roomcast::backend {

// Outcome of one external command
struct ProcessResult {
    bool spawned = false;
    bool timedOut = false;
    // waitpid() failed; the exit status is unknown
    bool waitFailed = false;
    int exitCode = -1;
};

// posix_spawnp + waitpid; kills the child once @p timeout expires
ProcessResult runProcess(const CommandLine& args, std::chrono::milliseconds timeout);

// Replace every "{key}" in @p args with @p value
CommandLine substitute(const CommandLine& args, const std::string& key, const std::string& value);

/**
 * @brief AudioBackend that drives the receivers and the output graph through
 * configured commands (systemctl units, helper scripts).
 *
 * An empty command line counts as success so partially configured systems keep
 * working. A routing change runs the output command for the new mode followed by
 * the equalizer command for the new flag.
 */
class CommandBackend : public AudioBackend {
   public:
    CommandBackend(BackendCommandConfig config, std::chrono::milliseconds processTimeout);

    BackendResult start(state::SourceId source, state::RoutingMode mode,
                        bool equalizerEnabled) override;
    BackendResult stop(state::SourceId source) override;
    BackendResult reconfigureOutput(state::RoutingMode mode, bool equalizerEnabled) override;
    BackendResult setVolume(int hardwareLevel, bool muted) override;
    BackendResult playback(state::SourceId source, PlaybackCommand command,
                           const nlohmann::json& data) override;

   private:
    BackendResult run(const CommandLine& args, ErrorCode failureCode, const std::string& what);

    BackendCommandConfig config_;
    std::chrono::milliseconds processTimeout_;
};

}  // namespace roomcast::backend
