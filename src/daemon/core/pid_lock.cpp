#include "daemon/core/pid_lock.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace roomcast::daemon_core {

pid_t PidLock::readOwner(const std::string& path) {
    std::ifstream pidfile(path);
    pid_t pid = 0;
    if (!(pidfile >> pid)) {
        return 0;
    }
    return pid;
}

std::optional<PidLock> PidLock::tryAcquire(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("Cannot open PID file {}: {}", path, strerror(errno));
        return std::nullopt;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(fd);
        if (err != EWOULDBLOCK) {
            LOG_ERROR("Cannot lock PID file {}: {}", path, strerror(err));
            return std::nullopt;
        }
        pid_t owner = readOwner(path);
        if (owner > 0) {
            LOG_ERROR("roomcastd is already running (PID {})", owner);
        } else {
            LOG_ERROR("roomcastd is already running (lock held on {})", path);
        }
        return std::nullopt;
    }

    if (ftruncate(fd, 0) < 0) {
        LOG_WARN("Cannot truncate PID file {}", path);
    }
    dprintf(fd, "%d\n", getpid());
    fsync(fd);

    return PidLock(path, fd);
}

PidLock::PidLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

PidLock::PidLock(PidLock&& other) noexcept : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

PidLock::~PidLock() {
    release();
}

void PidLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // Unlink while still holding the lock so a waiting process never locks a dead inode
    if (!path_.empty()) {
        unlink(path_.c_str());
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

}  // namespace roomcast::daemon_core
