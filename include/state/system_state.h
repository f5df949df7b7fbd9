#pragma once

#include "core/error_codes.h"

#include <array>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace roomcast::state {

// Exclusive audio inputs. None only at startup or after full teardown.
enum class SourceId : uint8_t {
    None,
    Librespot,  // streaming receiver
    Bluetooth,  // Bluetooth sink
    Roc         // network-audio receiver
};

constexpr std::array<SourceId, 3> kPlayableSources = {SourceId::Librespot, SourceId::Bluetooth,
                                                      SourceId::Roc};

enum class RoutingMode : uint8_t { Direct, Multiroom };

// Lifecycle of the active source's receiver, as reported by its backend
enum class PluginState : uint8_t { Inactive, Ready, Connected, Error };

const char* sourceToString(SourceId source);
std::optional<SourceId> parseSource(const std::string& str);

const char* routingModeToString(RoutingMode mode);
std::optional<RoutingMode> parseRoutingMode(const std::string& str);

const char* pluginStateToString(PluginState state);
std::optional<PluginState> parsePluginState(const std::string& str);

struct PlaybackMetadata {
    std::string title;
    std::string artist;
    std::string album;
    std::string albumArtUrl;
    int64_t positionMs = 0;
    int64_t durationMs = 0;
    bool isPlaying = false;
    bool connected = false;
    std::string deviceName;
    nlohmann::json extra = nlohmann::json::object();  // passed through verbatim

    bool operator==(const PlaybackMetadata& other) const;
    bool operator!=(const PlaybackMetadata& other) const {
        return !(*this == other);
    }
};

struct VolumeState {
    int level = 0;  // 0..100 display scale
    bool muted = false;

    bool operator==(const VolumeState& other) const {
        return level == other.level && muted == other.muted;
    }
    bool operator!=(const VolumeState& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Authoritative appliance state.
 *
 * Owned by StateStore; copies handed out by snapshot() are immutable views.
 * `version` increases by one on every applied mutation.
 */
struct SystemState {
    SourceId activeSource = SourceId::None;
    PluginState pluginState = PluginState::Inactive;
    bool transitioning = false;
    RoutingMode routingMode = RoutingMode::Direct;
    bool equalizerEnabled = false;
    std::map<SourceId, PlaybackMetadata> metadata;
    VolumeState volume;
    std::optional<ErrorDescriptor> error;
    uint64_t version = 0;

    bool multiroomEnabled() const {
        return routingMode == RoutingMode::Multiroom;
    }
};

nlohmann::json metadataToJson(const PlaybackMetadata& metadata);

// Missing keys keep their defaults; wrongly typed keys throw nlohmann::json::exception
PlaybackMetadata metadataFromJson(const nlohmann::json& j);

nlohmann::json errorToJson(const ErrorDescriptor& error);

// Full snapshot as carried in system.state_changed.data.full_state
nlohmann::json stateToJson(const SystemState& state);

/**
 * @brief Decode a full_state object.
 * @return false (and leaves @p out untouched) if required keys are missing or malformed
 */
bool stateFromJson(const nlohmann::json& j, SystemState& out);

}  // namespace roomcast::state
