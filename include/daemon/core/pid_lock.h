#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace roomcast::daemon_core {

/**
 * @brief Exclusive flock() on a PID file, held for the daemon's lifetime.
 *
 * The file carries the owner's PID and is unlinked on release.
 */
class PidLock {
   public:
    // std::nullopt if another process holds the lock or the file cannot be opened
    static std::optional<PidLock> tryAcquire(const std::string& path);

    // PID written by the current holder, 0 if unknown
    static pid_t readOwner(const std::string& path);

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;

    ~PidLock();

    const std::string& path() const {
        return path_;
    }

   private:
    PidLock(std::string path, int fd);

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
};

}  // namespace roomcast::daemon_core
