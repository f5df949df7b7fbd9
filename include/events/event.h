#pragma once

#include "state/system_state.h"

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace roomcast::events {

// Closed set of event kinds. Wire keys are the (category, type) pairs in eventKey().
enum class EventKind : uint8_t {
    SystemStateChanged,
    SystemTransitionStart,
    SystemTransitionComplete,
    SystemError,
    SystemHeartbeat,
    PluginStateChanged,
    PluginMetadata,
    VolumeChanged,
};

constexpr size_t kEventKindCount = 8;

constexpr std::array<EventKind, kEventKindCount> kAllEventKinds = {
    EventKind::SystemStateChanged, EventKind::SystemTransitionStart,
    EventKind::SystemTransitionComplete, EventKind::SystemError,
    EventKind::SystemHeartbeat, EventKind::PluginStateChanged,
    EventKind::PluginMetadata, EventKind::VolumeChanged,
};

constexpr size_t eventKindIndex(EventKind kind) {
    return static_cast<size_t>(kind);
}

struct EventKey {
    std::string_view category;
    std::string_view type;
};

EventKey eventKey(EventKind kind);
std::optional<EventKind> eventKindFromKey(std::string_view category, std::string_view type);

// "category.type", for logs
std::string eventKindName(EventKind kind);

// What a transition event refers to
enum class TransitionKind : uint8_t { Source, Routing, Equalizer };

const char* transitionKindToString(TransitionKind kind);

struct Event {
    EventKind kind = EventKind::SystemStateChanged;
    nlohmann::json data = nlohmann::json::object();
    std::string source;  // emitting component ("coordinator", "volume", a source id)
    int64_t timestampMs = 0;
};

// Milliseconds since epoch
int64_t nowMs();

// {category, type, data, source, timestamp}
std::string encodeEvent(const Event& event);

/**
 * @brief Parse a wire message.
 * @return std::nullopt for malformed JSON or an unknown (category, type) pair
 */
std::optional<Event> decodeEvent(const std::string& raw);

// Version of data.full_state, if the event carries one
std::optional<uint64_t> fullStateVersion(const Event& event);

// ---- Builders -------------------------------------------------------------

Event makeStateChanged(const state::SystemState& state, const std::string& reason);

Event makeTransitionEvent(EventKind kind, TransitionKind transition, const std::string& from,
                          const std::string& to, const state::SystemState& state);

Event makeErrorEvent(const ErrorDescriptor& error, TransitionKind transition,
                     const state::SystemState& state);

Event makeHeartbeat();

Event makePluginStateChanged(state::SourceId source, state::PluginState pluginState);

Event makePluginMetadata(state::SourceId source, const state::PlaybackMetadata& metadata);

Event makeVolumeChanged(const state::VolumeState& volume, bool multiroom, bool showBar, int step);

}  // namespace roomcast::events
