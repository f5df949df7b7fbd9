#pragma once

#include "core/error_codes.h"
#include "state/system_state.h"

#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace roomcast::backend {

struct BackendResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const {
        return code == ErrorCode::OK;
    }

    static BackendResult success() {
        return BackendResult{};
    }
    static BackendResult failure(ErrorCode code, std::string message) {
        return BackendResult{code, std::move(message)};
    }
};

enum class PlaybackCommand : uint8_t { Play, Pause, Toggle, Next, Previous, Seek };

const char* playbackCommandToString(PlaybackCommand command);
std::optional<PlaybackCommand> parsePlaybackCommand(const std::string& str);

/**
 * @brief Outbound interface to the external audio daemons.
 *
 * Calls may block for seconds. The coordinator runs them through a
 * BackendInvoker, which bounds them with a timeout and serializes them.
 * Metadata and plugin state reach the coordinator through pushMetadata() and
 * pushPluginState(), called by implementations or by the PLUGIN_REPORT command
 * on behalf of a receiver's event hook. Both may be called from any thread.
 */
class AudioBackend {
   public:
    using MetadataCallback =
        std::function<void(state::SourceId, const state::PlaybackMetadata&)>;
    using PluginStateCallback = std::function<void(state::SourceId, state::PluginState)>;

    virtual ~AudioBackend() = default;

    virtual BackendResult start(state::SourceId source, state::RoutingMode mode,
                                bool equalizerEnabled) = 0;
    virtual BackendResult stop(state::SourceId source) = 0;
    virtual BackendResult reconfigureOutput(state::RoutingMode mode, bool equalizerEnabled) = 0;

    // @p hardwareLevel is already mapped onto the mixer range
    virtual BackendResult setVolume(int hardwareLevel, bool muted) = 0;

    virtual BackendResult playback(state::SourceId source, PlaybackCommand command,
                                   const nlohmann::json& data) = 0;

    void setMetadataCallback(MetadataCallback callback);
    void setPluginStateCallback(PluginStateCallback callback);

    void pushMetadata(state::SourceId source, const state::PlaybackMetadata& metadata);
    void pushPluginState(state::SourceId source, state::PluginState pluginState);

   private:
    std::mutex callbackMutex_;
    MetadataCallback metadataCallback_;
    PluginStateCallback pluginStateCallback_;
};

}  // namespace roomcast::backend
