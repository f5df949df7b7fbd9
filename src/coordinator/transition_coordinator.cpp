#include "coordinator/transition_coordinator.h"

#include "coordinator/routing_settings.h"
#include "logging/logger.h"

#include <utility>
#include <vector>

namespace roomcast::coordinator {

namespace {

using state::PluginState;
using state::RoutingMode;
using state::SourceId;
using state::StateUpdate;
using state::SystemState;

RoutingMode modeFromFlag(bool multiroom) {
    return multiroom ? RoutingMode::Multiroom : RoutingMode::Direct;
}

const char* equalizerName(bool enabled) {
    return enabled ? "enabled" : "disabled";
}

}  // namespace

TransitionCoordinator::TransitionCoordinator(StateCommitter& committer,
                                             std::shared_ptr<backend::AudioBackend> backend,
                                             CoordinatorOptions options)
    : committer_(committer),
      backend_(std::move(backend)),
      options_(options),
      transitionInvoker_(backend_, options_.backendTimeout, "transition"),
      controlInvoker_(backend_, options_.backendTimeout, "control") {
    if (backend_) {
        backend_->setMetadataCallback(
            [this](SourceId source, const state::PlaybackMetadata& metadata) {
                reportMetadata(source, metadata);
            });
        backend_->setPluginStateCallback([this](SourceId source, PluginState pluginState) {
            reportPluginState(source, pluginState);
        });
    }
    worker_ = std::thread(&TransitionCoordinator::workerLoop, this);
    playbackWorker_ = std::thread(&TransitionCoordinator::playbackLoop, this);
}

TransitionCoordinator::~TransitionCoordinator() {
    {
        std::lock_guard<std::mutex> lock(jobMutex_);
        stopping_ = true;
    }
    jobCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    stopPlaybackWorker();
    if (backend_) {
        backend_->setMetadataCallback(nullptr);
        backend_->setPluginStateCallback(nullptr);
    }
}

// ============================================================
// Requests
// ============================================================

RequestResult TransitionCoordinator::requestSourceChange(SourceId target) {
    if (shutDown_.load()) {
        return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
    }

    RequestResult result = RequestResult::accepted();
    std::optional<Job> job;

    committer_.commitIf(
        [&](const SystemState& current) -> std::optional<StateUpdate> {
            if (current.transitioning) {
                result = RequestResult::busy();
                return std::nullopt;
            }
            if (current.activeSource == target) {
                result = RequestResult::noop();
                return std::nullopt;
            }
            Job planned;
            planned.kind = JobKind::Source;
            planned.fromSource = current.activeSource;
            planned.toSource = target;
            job = planned;

            StateUpdate update;
            update.transitioning = true;
            return update;
        },
        [&](const SystemState& snapshot) {
            return std::vector<events::Event>{events::makeTransitionEvent(
                events::EventKind::SystemTransitionStart, events::TransitionKind::Source,
                state::sourceToString(job->fromSource), state::sourceToString(target),
                snapshot)};
        });

    if (job) {
        LOG_INFO("[Coordinator] Source change {} -> {} accepted",
                 state::sourceToString(job->fromSource), state::sourceToString(target));
        return submit(*job);
    }
    return result;
}

RequestResult TransitionCoordinator::requestRoutingModeChange(bool multiroom) {
    if (shutDown_.load()) {
        return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
    }

    RequestResult result = RequestResult::accepted();
    std::optional<Job> job;

    committer_.commitIf(
        [&](const SystemState& current) -> std::optional<StateUpdate> {
            if (current.transitioning) {
                result = RequestResult::busy();
                return std::nullopt;
            }
            if (current.multiroomEnabled() == multiroom) {
                result = RequestResult::noop();
                return std::nullopt;
            }
            Job planned;
            planned.kind = JobKind::Routing;
            planned.fromFlag = current.multiroomEnabled();
            planned.toFlag = multiroom;
            job = planned;

            StateUpdate update;
            update.transitioning = true;
            return update;
        },
        [&](const SystemState& snapshot) {
            return std::vector<events::Event>{events::makeTransitionEvent(
                events::EventKind::SystemTransitionStart, events::TransitionKind::Routing,
                state::routingModeToString(modeFromFlag(!multiroom)),
                state::routingModeToString(modeFromFlag(multiroom)), snapshot)};
        });

    return job ? submit(*job) : result;
}

RequestResult TransitionCoordinator::requestEqualizerChange(bool enabled) {
    if (shutDown_.load()) {
        return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
    }

    RequestResult result = RequestResult::accepted();
    std::optional<Job> job;

    committer_.commitIf(
        [&](const SystemState& current) -> std::optional<StateUpdate> {
            if (current.transitioning) {
                result = RequestResult::busy();
                return std::nullopt;
            }
            if (current.equalizerEnabled == enabled) {
                result = RequestResult::noop();
                return std::nullopt;
            }
            Job planned;
            planned.kind = JobKind::Equalizer;
            planned.fromFlag = current.equalizerEnabled;
            planned.toFlag = enabled;
            job = planned;

            StateUpdate update;
            update.transitioning = true;
            return update;
        },
        [&](const SystemState& snapshot) {
            return std::vector<events::Event>{events::makeTransitionEvent(
                events::EventKind::SystemTransitionStart, events::TransitionKind::Equalizer,
                equalizerName(!enabled), equalizerName(enabled), snapshot)};
        });

    return job ? submit(*job) : result;
}

RequestResult TransitionCoordinator::requestOutputSync() {
    if (shutDown_.load()) {
        return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
    }

    RequestResult result = RequestResult::accepted();
    std::optional<Job> job;

    committer_.commitIf(
        [&](const SystemState& current) -> std::optional<StateUpdate> {
            if (current.transitioning) {
                result = RequestResult::busy();
                return std::nullopt;
            }
            Job planned;
            planned.kind = JobKind::Routing;
            planned.fromFlag = current.multiroomEnabled();
            planned.toFlag = current.multiroomEnabled();
            job = planned;

            StateUpdate update;
            update.transitioning = true;
            return update;
        },
        [&](const SystemState& snapshot) {
            const char* mode = state::routingModeToString(snapshot.routingMode);
            return std::vector<events::Event>{
                events::makeTransitionEvent(events::EventKind::SystemTransitionStart,
                                            events::TransitionKind::Routing, mode, mode, snapshot)};
        });

    return job ? submit(*job) : result;
}

RequestResult TransitionCoordinator::submit(const Job& job) {
    {
        std::lock_guard<std::mutex> lock(jobMutex_);
        if (!stopping_) {
            pendingJob_ = job;
            jobCv_.notify_all();
            return RequestResult::accepted();
        }
    }

    // Worker already gone: undo the transition flag so state never sticks
    StateUpdate revert;
    revert.transitioning = false;
    committer_.commit(revert, [](const SystemState& snapshot) {
        return std::vector<events::Event>{events::makeStateChanged(snapshot, "transition_aborted")};
    });
    return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
}

RequestResult TransitionCoordinator::requestPlayback(SourceId source,
                                                     backend::PlaybackCommand command,
                                                     const nlohmann::json& data) {
    if (shutDown_.load()) {
        return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
    }

    SystemState current = committer_.snapshot();
    if (source == SourceId::None || current.activeSource != source) {
        return RequestResult::invalid(ErrorCode::VALIDATION_SOURCE_NOT_ACTIVE,
                                      std::string("Source '") + state::sourceToString(source) +
                                          "' is not active");
    }

    {
        std::lock_guard<std::mutex> lock(playbackMutex_);
        if (playbackStopping_) {
            return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
        }
        if (playbackQueue_.size() >= kMaxQueuedPlayback) {
            return RequestResult{RequestStatus::Busy, ErrorCode::TRANSITION_BUSY,
                                 "Too many playback commands pending"};
        }
        playbackQueue_.push_back(PlaybackJob{source, command, data});
    }
    playbackCv_.notify_one();
    return RequestResult::accepted();
}

void TransitionCoordinator::playbackLoop() {
    while (true) {
        PlaybackJob job;
        {
            std::unique_lock<std::mutex> lock(playbackMutex_);
            playbackCv_.wait(lock, [this] { return playbackStopping_ || !playbackQueue_.empty(); });
            if (playbackStopping_) {
                break;
            }
            job = std::move(playbackQueue_.front());
            playbackQueue_.pop_front();
        }

        std::string what = std::string("playback ") +
                           backend::playbackCommandToString(job.command) + " on " +
                           state::sourceToString(job.source);
        auto result = controlInvoker_.invoke(
            what, [source = job.source, command = job.command,
                   data = std::move(job.data)](backend::AudioBackend& b) {
                return b.playback(source, command, data);
            });
        if (!result.ok()) {
            LOG_WARN("[Coordinator] {} failed: {}", what, result.message);
        }
    }
}

void TransitionCoordinator::stopPlaybackWorker() {
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(playbackMutex_);
        playbackStopping_ = true;
        discarded = playbackQueue_.size();
        playbackQueue_.clear();
    }
    playbackCv_.notify_all();
    if (playbackWorker_.joinable()) {
        playbackWorker_.join();
    }
    if (discarded > 0) {
        LOG_INFO("[Coordinator] Discarded {} pending playback command(s)", discarded);
    }
}

RequestResult TransitionCoordinator::dismissError() {
    auto snapshot = committer_.commitIf(
        [](const SystemState& current) -> std::optional<StateUpdate> {
            if (!current.error) {
                return std::nullopt;
            }
            StateUpdate update;
            update.clearError = true;
            return update;
        },
        [](const SystemState& updated) {
            return std::vector<events::Event>{events::makeStateChanged(updated, "error_dismissed")};
        });
    return snapshot ? RequestResult::accepted() : RequestResult::noop();
}

// ============================================================
// Inbound reports
// ============================================================

void TransitionCoordinator::reportMetadata(SourceId source,
                                           const state::PlaybackMetadata& metadata) {
    if (source == SourceId::None) {
        LOG_WARN("[Coordinator] Ignoring metadata without a source");
        return;
    }

    committer_.commitIf(
        [&](const SystemState& current) -> std::optional<StateUpdate> {
            auto it = current.metadata.find(source);
            if (it != current.metadata.end() && it->second == metadata) {
                return std::nullopt;
            }
            StateUpdate update;
            update.metadata[source] = metadata;
            return update;
        },
        [&](const SystemState&) {
            return std::vector<events::Event>{events::makePluginMetadata(source, metadata)};
        });
}

void TransitionCoordinator::reportPluginState(SourceId source, PluginState pluginState) {
    if (source == SourceId::None) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reportMutex_);
        reportedPluginState_[source] = pluginState;
    }

    auto applied = committer_.commitIf(
        [&](const SystemState& current) -> std::optional<StateUpdate> {
            if (current.transitioning || current.activeSource != source ||
                current.pluginState == pluginState) {
                return std::nullopt;
            }
            StateUpdate update;
            update.pluginState = pluginState;
            return update;
        },
        [&](const SystemState& snapshot) {
            return std::vector<events::Event>{
                events::makePluginStateChanged(source, pluginState),
                events::makeStateChanged(snapshot, "plugin_state")};
        });

    if (!applied) {
        LOG_DEBUG("[Coordinator] Plugin state {} for {} recorded, not applied",
                  state::pluginStateToString(pluginState), state::sourceToString(source));
    }
}

PluginState TransitionCoordinator::pluginStateFor(SourceId source) const {
    if (source == SourceId::None) {
        return PluginState::Inactive;
    }
    std::lock_guard<std::mutex> lock(reportMutex_);
    auto it = reportedPluginState_.find(source);
    return it != reportedPluginState_.end() ? it->second : PluginState::Ready;
}

// ============================================================
// Worker
// ============================================================

bool TransitionCoordinator::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(jobMutex_);
    return jobCv_.wait_for(lock, timeout, [this] { return !pendingJob_ && !executing_; });
}

void TransitionCoordinator::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(jobMutex_);
            jobCv_.wait(lock, [this] { return stopping_ || pendingJob_.has_value(); });
            if (!pendingJob_) {
                break;
            }
            job = *pendingJob_;
            pendingJob_.reset();
            executing_ = true;
        }

        execute(job);

        {
            std::lock_guard<std::mutex> lock(jobMutex_);
            executing_ = false;
        }
        jobCv_.notify_all();
    }
}

void TransitionCoordinator::execute(const Job& job) {
    if (job.kind == JobKind::Source) {
        runSourceChange(job);
    } else {
        runOutputChange(job);
    }
}

void TransitionCoordinator::runSourceChange(const Job& job) {
    const SystemState current = committer_.snapshot();
    const SourceId from = job.fromSource;
    const SourceId to = job.toSource;

    if (from != SourceId::None) {
        auto stopped = transitionInvoker_.invoke(
            std::string("stop ") + state::sourceToString(from),
            [from](backend::AudioBackend& b) { return b.stop(from); });
        if (!stopped.ok()) {
            // The outgoing source is still the best known running one
            StateUpdate update;
            update.activeSource = from;
            update.pluginState = pluginStateFor(from);
            commitFailure(job, update, stopped.code, stopped.message, state::sourceToString(from));
            return;
        }
    }

    if (to != SourceId::None) {
        {
            std::lock_guard<std::mutex> lock(reportMutex_);
            reportedPluginState_.erase(to);
        }
        auto started = startSource(to, current.routingMode, current.equalizerEnabled, "start");
        if (!started.ok()) {
            // On timeout startSource already queued the stop
            if (started.code != ErrorCode::BACKEND_TIMEOUT) {
                auto cleanup = transitionInvoker_.invoke(
                    std::string("stop ") + state::sourceToString(to),
                    [to](backend::AudioBackend& b) { return b.stop(to); });
                if (!cleanup.ok()) {
                    LOG_WARN("[Coordinator] Cleanup of {} after failed start: {}",
                             state::sourceToString(to), cleanup.message);
                }
            }

            SourceId restored = SourceId::None;
            if (from != SourceId::None) {
                auto restart =
                    startSource(from, current.routingMode, current.equalizerEnabled, "restart");
                if (restart.ok()) {
                    restored = from;
                } else {
                    LOG_ERROR("[Coordinator] Could not restore {}: {}",
                              state::sourceToString(from), restart.message);
                }
            }

            StateUpdate update;
            update.activeSource = restored;
            update.pluginState = pluginStateFor(restored);
            commitFailure(job, update, started.code, started.message, state::sourceToString(to));
            return;
        }
    }

    StateUpdate update;
    update.activeSource = to;
    update.pluginState = pluginStateFor(to);
    if (from != SourceId::None) {
        // Metadata of a source that is no longer playing is dropped on a completed switch
        update.clearMetadata.push_back(from);
        std::lock_guard<std::mutex> lock(reportMutex_);
        reportedPluginState_.erase(from);
    }
    commitSuccess(job, update, "source_changed");
}

backend::BackendResult TransitionCoordinator::startSource(SourceId source, RoutingMode mode,
                                                          bool equalizerEnabled,
                                                          const char* verb) {
    const std::string name = state::sourceToString(source);
    auto started = transitionInvoker_.invoke(
        verb + (" " + name), [source, mode, equalizerEnabled](backend::AudioBackend& b) {
            return b.start(source, mode, equalizerEnabled);
        });
    if (started.code == ErrorCode::BACKEND_TIMEOUT) {
        transitionInvoker_.defer("stop " + name,
                                 [source](backend::AudioBackend& b) { return b.stop(source); });
    }
    return started;
}

void TransitionCoordinator::runOutputChange(const Job& job) {
    const SystemState current = committer_.snapshot();

    RoutingMode targetMode = current.routingMode;
    bool targetEq = current.equalizerEnabled;
    RoutingMode previousMode = current.routingMode;
    bool previousEq = current.equalizerEnabled;
    if (job.kind == JobKind::Routing) {
        targetMode = modeFromFlag(job.toFlag);
        previousMode = modeFromFlag(job.fromFlag);
    } else {
        targetEq = job.toFlag;
        previousEq = job.fromFlag;
    }

    auto reconfigure = [this](RoutingMode mode, bool eq) {
        return transitionInvoker_.invoke(
            std::string("reconfigure output ") + state::routingModeToString(mode) +
                (eq ? "+eq" : ""),
            [mode, eq](backend::AudioBackend& b) { return b.reconfigureOutput(mode, eq); });
    };
    auto revertOutput = [&]() {
        auto reverted = reconfigure(previousMode, previousEq);
        if (!reverted.ok()) {
            LOG_ERROR("[Coordinator] Could not revert output configuration: {}",
                      reverted.message);
        }
    };

    auto configured = reconfigure(targetMode, targetEq);
    if (!configured.ok()) {
        revertOutput();
        commitFailure(job, StateUpdate{}, configured.code, configured.message, "output");
        return;
    }

    // The active source's pipeline has to be re-pointed at the new output
    const SourceId active = current.activeSource;
    if (active != SourceId::None) {
        auto restarted = transitionInvoker_.invoke(
            std::string("stop ") + state::sourceToString(active),
            [active](backend::AudioBackend& b) { return b.stop(active); });
        if (restarted.ok()) {
            restarted = startSource(active, targetMode, targetEq, "start");
        }
        if (!restarted.ok()) {
            revertOutput();
            auto recovered = startSource(active, previousMode, previousEq, "restart");
            StateUpdate update;
            if (!recovered.ok()) {
                LOG_ERROR("[Coordinator] Could not restore {}: {}", state::sourceToString(active),
                          recovered.message);
                update.activeSource = SourceId::None;
                update.pluginState = PluginState::Inactive;
            }
            commitFailure(job, update, restarted.code, restarted.message,
                          state::sourceToString(active));
            return;
        }
    }

    StateUpdate update;
    update.routingMode = targetMode;
    update.equalizerEnabled = targetEq;
    commitSuccess(job, update,
                  job.kind == JobKind::Routing ? "routing_changed" : "equalizer_changed");

    if (!options_.routingSettingsFile.empty()) {
        RoutingSettings settings;
        settings.multiroom = targetMode == RoutingMode::Multiroom;
        settings.equalizer = targetEq;
        if (!saveRoutingSettings(options_.routingSettingsFile, settings)) {
            LOG_WARN("[Coordinator] Could not save routing settings to {}",
                     options_.routingSettingsFile.string());
        }
    }
}

// ============================================================
// Terminal commits
// ============================================================

namespace {

events::TransitionKind toTransitionKind(bool source, bool routing) {
    if (source) {
        return events::TransitionKind::Source;
    }
    return routing ? events::TransitionKind::Routing : events::TransitionKind::Equalizer;
}

}  // namespace

void TransitionCoordinator::commitSuccess(const Job& job, const StateUpdate& base,
                                          const std::string& reason) {
    StateUpdate update = base;
    update.transitioning = false;
    update.clearError = true;

    const auto kind = toTransitionKind(job.kind == JobKind::Source, job.kind == JobKind::Routing);
    std::string from;
    std::string to;
    if (job.kind == JobKind::Source) {
        from = state::sourceToString(job.fromSource);
        to = state::sourceToString(job.toSource);
    } else if (job.kind == JobKind::Routing) {
        from = state::routingModeToString(modeFromFlag(job.fromFlag));
        to = state::routingModeToString(modeFromFlag(job.toFlag));
    } else {
        from = equalizerName(job.fromFlag);
        to = equalizerName(job.toFlag);
    }

    committer_.commit(update, [&](const SystemState& snapshot) {
        return std::vector<events::Event>{
            events::makeStateChanged(snapshot, reason),
            events::makeTransitionEvent(events::EventKind::SystemTransitionComplete, kind, from,
                                        to, snapshot)};
    });
    LOG_INFO("[Coordinator] {} transition {} -> {} complete",
             events::transitionKindToString(kind), from, to);
}

void TransitionCoordinator::commitFailure(const Job& job, StateUpdate update, ErrorCode code,
                                          const std::string& message,
                                          const std::string& failedComponent) {
    ErrorDescriptor error;
    error.code = code;
    error.message = message;
    error.source = failedComponent;
    error.timestampMs = events::nowMs();

    update.transitioning = false;
    update.error = error;

    const auto kind = toTransitionKind(job.kind == JobKind::Source, job.kind == JobKind::Routing);
    committer_.commit(update, [&](const SystemState& snapshot) {
        return std::vector<events::Event>{events::makeErrorEvent(error, kind, snapshot),
                                          events::makeStateChanged(snapshot, "transition_failed")};
    });
    LOG_ERROR("[Coordinator] {} transition failed ({}): {}", events::transitionKindToString(kind),
              errorCodeToString(code), message);
}

// ============================================================
// Shutdown
// ============================================================

void TransitionCoordinator::shutdown() {
    if (shutDown_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(jobMutex_);
        stopping_ = true;
    }
    jobCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    stopPlaybackWorker();

    const SystemState current = committer_.snapshot();
    if (current.activeSource != SourceId::None) {
        const SourceId active = current.activeSource;
        auto stopped = transitionInvoker_.invoke(
            std::string("stop ") + state::sourceToString(active),
            [active](backend::AudioBackend& b) { return b.stop(active); });
        if (!stopped.ok()) {
            LOG_WARN("[Coordinator] Stopping {} on shutdown failed: {}",
                     state::sourceToString(active), stopped.message);
        }
    }

    StateUpdate update;
    update.activeSource = SourceId::None;
    update.pluginState = PluginState::Inactive;
    update.transitioning = false;
    committer_.commit(update, [](const SystemState& snapshot) {
        return std::vector<events::Event>{events::makeStateChanged(snapshot, "shutdown")};
    });
    LOG_INFO("[Coordinator] Shut down");
}

}  // namespace roomcast::coordinator
