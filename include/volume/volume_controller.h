#pragma once

#include "backend/audio_backend.h"
#include "backend/backend_invoker.h"
#include "coordinator/request_result.h"
#include "coordinator/state_committer.h"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace roomcast::volume {

struct VolumeOptions {
    int step = 5;
    std::chrono::milliseconds coalesceWindow{50};
    int hardwareMin = 0;
    int hardwareMax = 65;
    std::chrono::milliseconds backendTimeout{8000};
    // Empty = do not persist
    std::filesystem::path lastVolumeFile;
};

// Linear map of display 0..100 onto [hardwareMin, hardwareMax]
int toHardwareLevel(int displayLevel, int hardwareMin, int hardwareMax);

/**
 * @brief Read a persisted volume.
 * @return std::nullopt if missing, unreadable, out of 0..100 or older than @p maxAge
 */
std::optional<int> loadLastVolume(const std::filesystem::path& path, std::chrono::seconds maxAge);

// Atomic write (temp file + rename)
bool saveLastVolume(const std::filesystem::path& path, int level);

/**
 * @brief System volume with a single coalescing policy.
 *
 * Requests update the intended value immediately and return. A sender thread
 * hands the intended value to the backend at most once per coalescing window:
 * the first request after a quiet period goes out at once, later ones are
 * folded, and one trailing send always carries the final value. The store is
 * updated (and volume.volume_changed published) after the backend applied it.
 * Not subject to the transition lock.
 */
class VolumeController {
   public:
    VolumeController(coordinator::StateCommitter& committer,
                     std::shared_ptr<backend::AudioBackend> backend, VolumeOptions options);
    ~VolumeController();

    VolumeController(const VolumeController&) = delete;
    VolumeController& operator=(const VolumeController&) = delete;

    coordinator::RequestResult setVolume(int level, bool showBar);

    // Missing @p delta means @p clientSteps times the configured step
    coordinator::RequestResult adjustVolume(std::optional<int> delta,
                                            std::optional<int> clientSteps, bool showBar);

    coordinator::RequestResult setMuted(bool muted);

    // Block until every accepted request reached the backend
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    void stop();

   private:
    coordinator::RequestResult markDirtyLocked(const state::VolumeState& target, bool showBar);
    void senderLoop();

    coordinator::StateCommitter& committer_;
    VolumeOptions options_;
    backend::BackendInvoker invoker_;

    std::mutex mutex_;
    std::condition_variable cv_;
    state::VolumeState desired_;
    state::VolumeState applied_;
    bool showBar_ = false;
    bool dirty_ = false;
    bool sending_ = false;
    bool stopping_ = false;
    std::thread sender_;
};

}  // namespace roomcast::volume
