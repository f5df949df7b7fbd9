#include "coordinator/state_committer.h"

namespace roomcast::coordinator {

StateCommitter::StateCommitter(state::StateStore& store, events::EventBus& bus)
    : store_(store), bus_(bus) {}

state::SystemState StateCommitter::applyLocked(const state::StateUpdate& update,
                                               const EventBuilder& build) {
    state::SystemState snapshot = store_.apply(update);
    if (build) {
        for (const auto& event : build(snapshot)) {
            bus_.publish(event);
        }
    }
    return snapshot;
}

state::SystemState StateCommitter::commit(const state::StateUpdate& update,
                                          const EventBuilder& build) {
    std::lock_guard<std::mutex> lock(commitMutex_);
    return applyLocked(update, build);
}

std::optional<state::SystemState> StateCommitter::commitIf(const Decision& decide,
                                                           const EventBuilder& build) {
    std::lock_guard<std::mutex> lock(commitMutex_);
    auto update = decide(store_.snapshot());
    if (!update) {
        return std::nullopt;
    }
    return applyLocked(*update, build);
}

void StateCommitter::publish(const events::Event& event) {
    std::lock_guard<std::mutex> lock(commitMutex_);
    bus_.publish(event);
}

}  // namespace roomcast::coordinator
