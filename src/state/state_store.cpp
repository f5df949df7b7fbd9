#include "state/state_store.h"

#include <utility>

namespace roomcast::state {

bool StateUpdate::empty() const {
    return !activeSource && !pluginState && !transitioning && !routingMode && !equalizerEnabled &&
           !volume && metadata.empty() && clearMetadata.empty() && !error && !clearError;
}

StateStore::StateStore(SystemState initial) : state_(std::move(initial)) {}

SystemState StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SystemState StateStore::apply(const StateUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (update.activeSource) {
        state_.activeSource = *update.activeSource;
    }
    if (update.pluginState) {
        state_.pluginState = *update.pluginState;
    }
    if (update.transitioning) {
        state_.transitioning = *update.transitioning;
    }
    if (update.routingMode) {
        state_.routingMode = *update.routingMode;
    }
    if (update.equalizerEnabled) {
        state_.equalizerEnabled = *update.equalizerEnabled;
    }
    if (update.volume) {
        state_.volume = *update.volume;
    }
    for (SourceId source : update.clearMetadata) {
        state_.metadata.erase(source);
    }
    for (const auto& [source, metadata] : update.metadata) {
        state_.metadata[source] = metadata;
    }
    if (update.error) {
        state_.error = update.error;
    } else if (update.clearError) {
        state_.error.reset();
    }

    ++state_.version;
    return state_;
}

uint64_t StateStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.version;
}

}  // namespace roomcast::state
