#include "events/event.h"

#include "logging/logger.h"

#include <chrono>

namespace roomcast::events {

namespace {

using json = nlohmann::json;

constexpr std::array<EventKey, kEventKindCount> kEventKeys = {{
    {"system", "state_changed"},
    {"system", "transition_start"},
    {"system", "transition_complete"},
    {"system", "error"},
    {"system", "heartbeat"},
    {"plugin", "plugin_state_changed"},
    {"plugin", "plugin_metadata"},
    {"volume", "volume_changed"},
}};

constexpr const char* kCoordinatorSource = "coordinator";

Event makeEvent(EventKind kind, json data, std::string source) {
    Event event;
    event.kind = kind;
    event.data = std::move(data);
    event.source = std::move(source);
    event.timestampMs = nowMs();
    return event;
}

}  // namespace

EventKey eventKey(EventKind kind) {
    return kEventKeys[eventKindIndex(kind)];
}

std::optional<EventKind> eventKindFromKey(std::string_view category, std::string_view type) {
    for (EventKind kind : kAllEventKinds) {
        const auto& key = kEventKeys[eventKindIndex(kind)];
        if (key.category == category && key.type == type) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string eventKindName(EventKind kind) {
    auto key = eventKey(kind);
    std::string name(key.category);
    name += '.';
    name += key.type;
    return name;
}

const char* transitionKindToString(TransitionKind kind) {
    switch (kind) {
    case TransitionKind::Routing:
        return "routing";
    case TransitionKind::Equalizer:
        return "equalizer";
    case TransitionKind::Source:
    default:
        return "source";
    }
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string encodeEvent(const Event& event) {
    auto key = eventKey(event.kind);
    json j;
    j["category"] = std::string(key.category);
    j["type"] = std::string(key.type);
    j["data"] = event.data;
    j["source"] = event.source;
    j["timestamp"] = event.timestampMs;
    return j.dump();
}

std::optional<Event> decodeEvent(const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::parse_error& e) {
        LOG_DEBUG("Event: dropping unparsable message: {}", e.what());
        return std::nullopt;
    }

    if (!j.is_object() || !j.contains("category") || !j.contains("type") ||
        !j["category"].is_string() || !j["type"].is_string()) {
        LOG_DEBUG("Event: dropping message without category/type");
        return std::nullopt;
    }

    const auto category = j["category"].get<std::string>();
    const auto type = j["type"].get<std::string>();
    auto kind = eventKindFromKey(category, type);
    if (!kind) {
        LOG_DEBUG("Event: dropping unknown event {}.{}", category, type);
        return std::nullopt;
    }

    Event event;
    event.kind = *kind;
    if (j.contains("data") && j["data"].is_object()) {
        event.data = j["data"];
    }
    if (j.contains("source") && j["source"].is_string()) {
        event.source = j["source"].get<std::string>();
    }
    if (j.contains("timestamp") && j["timestamp"].is_number_integer()) {
        event.timestampMs = j["timestamp"].get<int64_t>();
    }
    return event;
}

std::optional<uint64_t> fullStateVersion(const Event& event) {
    auto it = event.data.find("full_state");
    if (it == event.data.end() || !it->is_object()) {
        return std::nullopt;
    }
    auto version = it->find("version");
    if (version == it->end() || !version->is_number_unsigned()) {
        return std::nullopt;
    }
    return version->get<uint64_t>();
}

Event makeStateChanged(const state::SystemState& state, const std::string& reason) {
    return makeEvent(EventKind::SystemStateChanged,
                     json{{"full_state", state::stateToJson(state)}, {"reason", reason}},
                     kCoordinatorSource);
}

Event makeTransitionEvent(EventKind kind, TransitionKind transition, const std::string& from,
                          const std::string& to, const state::SystemState& state) {
    return makeEvent(kind,
                     json{{"kind", transitionKindToString(transition)},
                          {"from", from},
                          {"to", to},
                          {"full_state", state::stateToJson(state)}},
                     kCoordinatorSource);
}

Event makeErrorEvent(const ErrorDescriptor& error, TransitionKind transition,
                     const state::SystemState& state) {
    return makeEvent(EventKind::SystemError,
                     json{{"code", errorCodeToString(error.code)},
                          {"message", error.message},
                          {"kind", transitionKindToString(transition)},
                          {"full_state", state::stateToJson(state)}},
                     kCoordinatorSource);
}

Event makeHeartbeat() {
    auto event = makeEvent(EventKind::SystemHeartbeat, json::object(), "roomcastd");
    event.data["timestamp"] = event.timestampMs;
    return event;
}

Event makePluginStateChanged(state::SourceId source, state::PluginState pluginState) {
    return makeEvent(EventKind::PluginStateChanged,
                     json{{"source", state::sourceToString(source)},
                          {"plugin_state", state::pluginStateToString(pluginState)}},
                     state::sourceToString(source));
}

Event makePluginMetadata(state::SourceId source, const state::PlaybackMetadata& metadata) {
    return makeEvent(EventKind::PluginMetadata,
                     json{{"source", state::sourceToString(source)},
                          {"metadata", state::metadataToJson(metadata)}},
                     state::sourceToString(source));
}

Event makeVolumeChanged(const state::VolumeState& volume, bool multiroom, bool showBar, int step) {
    return makeEvent(EventKind::VolumeChanged,
                     json{{"volume", volume.level},
                          {"muted", volume.muted},
                          {"multiroom_mode", multiroom},
                          {"show_bar", showBar},
                          {"step", step}},
                     "volume");
}

}  // namespace roomcast::events
