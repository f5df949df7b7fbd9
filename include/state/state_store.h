#pragma once

#include "state/system_state.h"

#include <mutex>
#include <optional>
#include <vector>

namespace roomcast::state {

/**
 * @brief Partial mutation of SystemState.
 *
 * Unset fields are left untouched. Metadata entries are replaced per source.
 */
struct StateUpdate {
    std::optional<SourceId> activeSource;
    std::optional<PluginState> pluginState;
    std::optional<bool> transitioning;
    std::optional<RoutingMode> routingMode;
    std::optional<bool> equalizerEnabled;
    std::optional<VolumeState> volume;
    std::map<SourceId, PlaybackMetadata> metadata;
    std::vector<SourceId> clearMetadata;  // applied before `metadata`
    std::optional<ErrorDescriptor> error;
    bool clearError = false;  // ignored when `error` is set

    bool empty() const;
};

/**
 * @brief Sole owner of the mutable SystemState.
 *
 * Readers get consistent copies; apply() is atomic with respect to them. Only the
 * transition coordinator and the volume controller hold a non-const reference.
 * The store never broadcasts; callers publish the snapshot apply() returns.
 */
class StateStore {
   public:
    explicit StateStore(SystemState initial = SystemState{});

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    SystemState snapshot() const;

    // Merge @p update, bump the version and return the resulting snapshot
    SystemState apply(const StateUpdate& update);

    uint64_t version() const;

   private:
    mutable std::mutex mutex_;
    SystemState state_;
};

}  // namespace roomcast::state
