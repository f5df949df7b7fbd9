#pragma once

#include "events/event.h"
#include "events/event_bus.h"
#include "state/state_store.h"

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace roomcast::coordinator {

/**
 * @brief Serializes "apply to the store, then broadcast" for every writer.
 *
 * Holding one lock across apply() and publish() keeps broadcast order equal to
 * version order. Bus handlers run under this lock and must not call back into a
 * committer-backed component.
 */
class StateCommitter {
   public:
    using EventBuilder = std::function<std::vector<events::Event>(const state::SystemState&)>;
    using Decision = std::function<std::optional<state::StateUpdate>(const state::SystemState&)>;

    StateCommitter(state::StateStore& store, events::EventBus& bus);

    state::SystemState commit(const state::StateUpdate& update, const EventBuilder& build = {});

    /**
     * @brief Check-and-commit.
     *
     * @p decide sees the current state under the commit lock. If it returns an
     * update, the update is applied and the built events are published before
     * the lock is released.
     *
     * @return the new snapshot, or std::nullopt if @p decide declined
     */
    std::optional<state::SystemState> commitIf(const Decision& decide,
                                               const EventBuilder& build = {});

    // Publish without mutating (heartbeats, targeted events)
    void publish(const events::Event& event);

    state::SystemState snapshot() const {
        return store_.snapshot();
    }

   private:
    state::SystemState applyLocked(const state::StateUpdate& update, const EventBuilder& build);

    state::StateStore& store_;
    events::EventBus& bus_;
    std::mutex commitMutex_;
};

}  // namespace roomcast::coordinator
