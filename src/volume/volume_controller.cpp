#include "volume/volume_controller.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <vector>

namespace roomcast::volume {

using coordinator::RequestResult;

int toHardwareLevel(int displayLevel, int hardwareMin, int hardwareMax) {
    int clamped =
        std::clamp(displayLevel, DaemonConstants::VOLUME_MIN, DaemonConstants::VOLUME_MAX);
    double span = static_cast<double>(hardwareMax - hardwareMin);
    return hardwareMin + static_cast<int>(std::lround(span * clamped / DaemonConstants::VOLUME_MAX));
}

std::optional<int> loadLastVolume(const std::filesystem::path& path, std::chrono::seconds maxAge) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        LOG_WARN("[Volume] Cannot stat {}: {}", path.string(), ec.message());
        return std::nullopt;
    }
    auto age = std::filesystem::file_time_type::clock::now() - modified;
    if (age > maxAge) {
        LOG_INFO("[Volume] Ignoring stale last volume in {}", path.string());
        return std::nullopt;
    }

    std::ifstream in(path);
    int level = 0;
    if (!(in >> level)) {
        LOG_WARN("[Volume] Unreadable last volume file {}", path.string());
        return std::nullopt;
    }
    if (level < DaemonConstants::VOLUME_MIN || level > DaemonConstants::VOLUME_MAX) {
        LOG_WARN("[Volume] Last volume {} out of range, ignoring", level);
        return std::nullopt;
    }
    return level;
}

bool saveLastVolume(const std::filesystem::path& path, int level) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return false;
        }
        out << level << '\n';
        if (!out.flush()) {
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    return !ec;
}

VolumeController::VolumeController(coordinator::StateCommitter& committer,
                                   std::shared_ptr<backend::AudioBackend> backend,
                                   VolumeOptions options)
    : committer_(committer),
      options_(std::move(options)),
      invoker_(std::move(backend), options_.backendTimeout, "volume") {
    desired_ = committer_.snapshot().volume;
    applied_ = desired_;
    sender_ = std::thread(&VolumeController::senderLoop, this);
}

VolumeController::~VolumeController() {
    stop();
}

void VolumeController::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (sender_.joinable()) {
        sender_.join();
    }
}

RequestResult VolumeController::setVolume(int level, bool showBar) {
    if (level < DaemonConstants::VOLUME_MIN || level > DaemonConstants::VOLUME_MAX) {
        return RequestResult::invalid(ErrorCode::VALIDATION_INVALID_VOLUME,
                                      "Volume must be within 0..100");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state::VolumeState target = desired_;
    target.level = level;
    return markDirtyLocked(target, showBar);
}

RequestResult VolumeController::adjustVolume(std::optional<int> delta,
                                             std::optional<int> clientSteps, bool showBar) {
    // 64-bit so extreme deltas clamp instead of overflowing
    int64_t change = 0;
    if (delta) {
        change = *delta;
    } else if (clientSteps) {
        change = static_cast<int64_t>(*clientSteps) * options_.step;
    } else {
        return RequestResult::invalid(ErrorCode::IPC_INVALID_PARAMS,
                                      "delta or client_steps is required");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state::VolumeState target = desired_;
    target.level = static_cast<int>(std::clamp<int64_t>(desired_.level + change,
                                                        DaemonConstants::VOLUME_MIN,
                                                        DaemonConstants::VOLUME_MAX));
    return markDirtyLocked(target, showBar);
}

RequestResult VolumeController::setMuted(bool muted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dirty_ && desired_.muted == muted) {
        return RequestResult::noop();
    }
    state::VolumeState target = desired_;
    target.muted = muted;
    return markDirtyLocked(target, false);
}

RequestResult VolumeController::markDirtyLocked(const state::VolumeState& target, bool showBar) {
    if (stopping_) {
        return RequestResult::invalid(ErrorCode::IPC_DAEMON_NOT_RUNNING, "Shutting down");
    }
    desired_ = target;
    showBar_ = showBar_ || showBar;
    dirty_ = true;
    cv_.notify_all();
    return RequestResult::accepted();
}

bool VolumeController::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !dirty_ && !sending_; });
}

void VolumeController::senderLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || dirty_; });
        if (!dirty_) {
            break;
        }

        const state::VolumeState target = desired_;
        const bool showBar = showBar_;
        dirty_ = false;
        showBar_ = false;
        sending_ = true;
        const auto sendStart = std::chrono::steady_clock::now();
        lock.unlock();

        const int hardware = toHardwareLevel(target.level, options_.hardwareMin, options_.hardwareMax);
        auto result = invoker_.invoke("set volume", [hardware, muted = target.muted](
                                                         backend::AudioBackend& b) {
            return b.setVolume(hardware, muted);
        });

        if (result.ok()) {
            state::StateUpdate update;
            update.volume = target;
            committer_.commit(update, [&](const state::SystemState& snapshot) {
                return std::vector<events::Event>{events::makeVolumeChanged(
                    target, snapshot.multiroomEnabled(), showBar, options_.step)};
            });
            if (!options_.lastVolumeFile.empty() &&
                !saveLastVolume(options_.lastVolumeFile, target.level)) {
                LOG_EVERY_N(WARN, 20, "[Volume] Could not persist volume to {}",
                            options_.lastVolumeFile.string());
            }
        } else {
            LOG_WARN("[Volume] Backend rejected volume {}: {}", target.level, result.message);
        }

        lock.lock();
        if (result.ok()) {
            applied_ = target;
        } else if (!dirty_) {
            desired_ = applied_;
        }
        sending_ = false;
        cv_.notify_all();

        // At most one backend call per window; a stop request cuts the wait short
        cv_.wait_until(lock, sendStart + options_.coalesceWindow, [this] { return stopping_; });
    }
}

}  // namespace roomcast::volume
