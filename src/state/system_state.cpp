#include "state/system_state.h"

namespace roomcast::state {

namespace {

using json = nlohmann::json;

template <typename T>
void readIfPresent(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

}  // namespace

const char* sourceToString(SourceId source) {
    switch (source) {
    case SourceId::Librespot:
        return "librespot";
    case SourceId::Bluetooth:
        return "bluetooth";
    case SourceId::Roc:
        return "roc";
    case SourceId::None:
    default:
        return "none";
    }
}

std::optional<SourceId> parseSource(const std::string& str) {
    if (str == "none") {
        return SourceId::None;
    }
    for (SourceId source : kPlayableSources) {
        if (str == sourceToString(source)) {
            return source;
        }
    }
    return std::nullopt;
}

const char* routingModeToString(RoutingMode mode) {
    switch (mode) {
    case RoutingMode::Multiroom:
        return "multiroom";
    case RoutingMode::Direct:
    default:
        return "direct";
    }
}

std::optional<RoutingMode> parseRoutingMode(const std::string& str) {
    if (str == "direct") {
        return RoutingMode::Direct;
    }
    if (str == "multiroom") {
        return RoutingMode::Multiroom;
    }
    return std::nullopt;
}

const char* pluginStateToString(PluginState state) {
    switch (state) {
    case PluginState::Ready:
        return "ready";
    case PluginState::Connected:
        return "connected";
    case PluginState::Error:
        return "error";
    case PluginState::Inactive:
    default:
        return "inactive";
    }
}

std::optional<PluginState> parsePluginState(const std::string& str) {
    for (PluginState state : {PluginState::Inactive, PluginState::Ready, PluginState::Connected,
                              PluginState::Error}) {
        if (str == pluginStateToString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

bool PlaybackMetadata::operator==(const PlaybackMetadata& other) const {
    return title == other.title && artist == other.artist && album == other.album &&
           albumArtUrl == other.albumArtUrl && positionMs == other.positionMs &&
           durationMs == other.durationMs && isPlaying == other.isPlaying &&
           connected == other.connected && deviceName == other.deviceName &&
           extra == other.extra;
}

json metadataToJson(const PlaybackMetadata& metadata) {
    return json{{"title", metadata.title},
                {"artist", metadata.artist},
                {"album", metadata.album},
                {"album_art_url", metadata.albumArtUrl},
                {"position_ms", metadata.positionMs},
                {"duration_ms", metadata.durationMs},
                {"is_playing", metadata.isPlaying},
                {"connected", metadata.connected},
                {"device_name", metadata.deviceName},
                {"extra", metadata.extra.is_null() ? json::object() : metadata.extra}};
}

PlaybackMetadata metadataFromJson(const json& j) {
    PlaybackMetadata metadata;
    if (!j.is_object()) {
        return metadata;
    }
    readIfPresent(j, "title", metadata.title);
    readIfPresent(j, "artist", metadata.artist);
    readIfPresent(j, "album", metadata.album);
    readIfPresent(j, "album_art_url", metadata.albumArtUrl);
    readIfPresent(j, "position_ms", metadata.positionMs);
    readIfPresent(j, "duration_ms", metadata.durationMs);
    readIfPresent(j, "is_playing", metadata.isPlaying);
    readIfPresent(j, "connected", metadata.connected);
    readIfPresent(j, "device_name", metadata.deviceName);
    if (j.contains("extra") && j["extra"].is_object()) {
        metadata.extra = j["extra"];
    }
    return metadata;
}

json errorToJson(const ErrorDescriptor& error) {
    return json{{"code", errorCodeToString(error.code)},
                {"message", error.message},
                {"source", error.source},
                {"timestamp", error.timestampMs}};
}

json stateToJson(const SystemState& state) {
    json metadata = json::object();
    for (const auto& [source, entry] : state.metadata) {
        metadata[sourceToString(source)] = metadataToJson(entry);
    }

    return json{{"active_source", sourceToString(state.activeSource)},
                {"plugin_state", pluginStateToString(state.pluginState)},
                {"transitioning", state.transitioning},
                {"routing_mode", routingModeToString(state.routingMode)},
                {"multiroom_enabled", state.multiroomEnabled()},
                {"equalizer_enabled", state.equalizerEnabled},
                {"metadata", metadata},
                {"volume", {{"level", state.volume.level}, {"muted", state.volume.muted}}},
                {"error", state.error ? errorToJson(*state.error) : json(nullptr)},
                {"version", state.version}};
}

bool stateFromJson(const json& j, SystemState& out) {
    if (!j.is_object() || !j.contains("active_source") || !j.contains("version")) {
        return false;
    }

    try {
        SystemState parsed;

        auto source = parseSource(j["active_source"].get<std::string>());
        if (!source) {
            return false;
        }
        parsed.activeSource = *source;

        if (j.contains("plugin_state")) {
            parsed.pluginState =
                parsePluginState(j["plugin_state"].get<std::string>()).value_or(PluginState::Inactive);
        }
        readIfPresent(j, "transitioning", parsed.transitioning);
        if (j.contains("routing_mode")) {
            auto mode = parseRoutingMode(j["routing_mode"].get<std::string>());
            if (!mode) {
                return false;
            }
            parsed.routingMode = *mode;
        }
        readIfPresent(j, "equalizer_enabled", parsed.equalizerEnabled);

        if (j.contains("metadata") && j["metadata"].is_object()) {
            for (const auto& [key, value] : j["metadata"].items()) {
                auto metaSource = parseSource(key);
                if (metaSource && *metaSource != SourceId::None) {
                    parsed.metadata[*metaSource] = metadataFromJson(value);
                }
            }
        }

        if (j.contains("volume") && j["volume"].is_object()) {
            readIfPresent(j["volume"], "level", parsed.volume.level);
            readIfPresent(j["volume"], "muted", parsed.volume.muted);
        }

        if (j.contains("error") && j["error"].is_object()) {
            const auto& err = j["error"];
            ErrorDescriptor descriptor;
            std::string code;
            readIfPresent(err, "code", code);
            descriptor.code = stringToErrorCode(code).value_or(ErrorCode::INTERNAL_UNKNOWN);
            readIfPresent(err, "message", descriptor.message);
            readIfPresent(err, "source", descriptor.source);
            readIfPresent(err, "timestamp", descriptor.timestampMs);
            parsed.error = descriptor;
        }

        parsed.version = j["version"].get<uint64_t>();
        out = std::move(parsed);
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

}  // namespace roomcast::state
