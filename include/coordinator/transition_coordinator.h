#pragma once

#include "backend/audio_backend.h"
#include "backend/backend_invoker.h"
#include "coordinator/request_result.h"
#include "coordinator/state_committer.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace roomcast::coordinator {

struct CoordinatorOptions {
    std::chrono::milliseconds backendTimeout{8000};
    // Where completed routing / equalizer changes are saved; empty = do not persist
    std::filesystem::path routingSettingsFile;
};

/**
 * @brief One-transition-at-a-time state machine for source, routing and
 * equalizer changes.
 *
 * Requests are checked and marked `transitioning` synchronously; the backend
 * work runs on a single worker thread. Outcome broadcasts:
 *   success: transition_start, state_changed, transition_complete
 *   failure: transition_start, error, state_changed (with `error` set)
 *
 * Playback commands and metadata/plugin-state reports bypass the transition
 * lock. Playback commands run in arrival order on their own worker thread.
 */
class TransitionCoordinator {
   public:
    TransitionCoordinator(StateCommitter& committer, std::shared_ptr<backend::AudioBackend> backend,
                          CoordinatorOptions options = {});
    ~TransitionCoordinator();

    TransitionCoordinator(const TransitionCoordinator&) = delete;
    TransitionCoordinator& operator=(const TransitionCoordinator&) = delete;

    // Switch to @p target; SourceId::None tears the active source down
    RequestResult requestSourceChange(state::SourceId target);
    RequestResult requestRoutingModeChange(bool multiroom);
    RequestResult requestEqualizerChange(bool enabled);

    // Re-apply the current routing and equalizer flags to the backend (startup)
    RequestResult requestOutputSync();

    // Forwarded to the active source's backend; returns before the command ran.
    // Busy when kMaxQueuedPlayback commands are already waiting.
    RequestResult requestPlayback(state::SourceId source, backend::PlaybackCommand command,
                                  const nlohmann::json& data);

    RequestResult dismissError();

    void reportMetadata(state::SourceId source, const state::PlaybackMetadata& metadata);
    void reportPluginState(state::SourceId source, state::PluginState pluginState);

    // Block until no transition is queued or running
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    /**
     * @brief Stop accepting transitions, let the in-flight one finish, stop the
     * active source and reset it to none.
     */
    void shutdown();

    static constexpr size_t kMaxQueuedPlayback = 16;

   private:
    enum class JobKind : uint8_t { Source, Routing, Equalizer };

    struct Job {
        JobKind kind = JobKind::Source;
        state::SourceId fromSource = state::SourceId::None;
        state::SourceId toSource = state::SourceId::None;
        bool fromFlag = false;
        bool toFlag = false;
    };

    struct PlaybackJob {
        state::SourceId source = state::SourceId::None;
        backend::PlaybackCommand command = backend::PlaybackCommand::Play;
        nlohmann::json data;
    };

    RequestResult submit(const Job& job);

    void workerLoop();
    void execute(const Job& job);
    void runSourceChange(const Job& job);
    void runOutputChange(const Job& job);
    void playbackLoop();
    void stopPlaybackWorker();

    // A start that timed out may still complete later; queue a stop behind it
    backend::BackendResult startSource(state::SourceId source, state::RoutingMode mode,
                                       bool equalizerEnabled, const char* verb);

    void commitSuccess(const Job& job, const state::StateUpdate& update, const std::string& reason);
    void commitFailure(const Job& job, state::StateUpdate update, ErrorCode code,
                       const std::string& message, const std::string& failedComponent);

    state::PluginState pluginStateFor(state::SourceId source) const;

    StateCommitter& committer_;
    std::shared_ptr<backend::AudioBackend> backend_;
    CoordinatorOptions options_;
    backend::BackendInvoker transitionInvoker_;
    backend::BackendInvoker controlInvoker_;

    std::mutex jobMutex_;
    std::condition_variable jobCv_;
    std::optional<Job> pendingJob_;
    bool executing_ = false;
    bool stopping_ = false;
    std::thread worker_;

    std::mutex playbackMutex_;
    std::condition_variable playbackCv_;
    std::deque<PlaybackJob> playbackQueue_;
    bool playbackStopping_ = false;
    std::thread playbackWorker_;

    mutable std::mutex reportMutex_;
    std::map<state::SourceId, state::PluginState> reportedPluginState_;

    std::atomic<bool> shutDown_{false};
};

}  // namespace roomcast::coordinator
