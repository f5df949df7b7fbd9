#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace roomcast::shutdown_manager {

ShutdownManager::ShutdownManager() {
    controller_.setSignalState(&GracefulShutdown::getGlobalSignalState());
    controller_.setLogCallback([](const char* message) { LOG_INFO("{}", message); });
    controller_.setStopCallback([this](GracefulShutdown::Controller::Action) {
        if (stopCallback_) {
            stopCallback_();
        }
    });
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, GracefulShutdown::signalHandler);
    std::signal(SIGTERM, GracefulShutdown::signalHandler);
    std::signal(SIGHUP, GracefulShutdown::signalHandler);
}

void ShutdownManager::setStopCallback(std::function<void()> cb) {
    stopCallback_ = std::move(cb);
}

void ShutdownManager::notifyReady() {
#ifdef HAVE_SYSTEMD
    if (!readyNotified_) {
        sendReadyNotify();
    }
#endif
}

bool ShutdownManager::tick() {
    controller_.processPendingSignals();
    bool running = isRunning();
    if (running && readyNotified_) {
        sendWatchdog();
    }
    return running;
}

bool ShutdownManager::waitAndTick(std::chrono::milliseconds interval) {
    {
        std::unique_lock<std::mutex> lock(waitMutex_);
        waitCv_.wait_for(lock, interval, [this] { return stopRequested_; });
    }
    return tick();
}

void ShutdownManager::requestStop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = true;
    }
    waitCv_.notify_all();
}

void ShutdownManager::runShutdownSequence() {
    if (sequenceRan_) {
        return;
    }
    sequenceRan_ = true;

    LOG_INFO("Shutting down...");
#ifdef HAVE_SYSTEMD
    sendStoppingNotify();
#endif
}

void ShutdownManager::reset() {
    sequenceRan_ = false;
    readyNotified_ = false;
    stoppingNotified_ = false;
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = false;
    }
    controller_.reset();
    GracefulShutdown::getGlobalSignalState().reset();
}

bool ShutdownManager::isRunning() const {
    if (!controller_.isRunning()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(waitMutex_);
    return !stopRequested_;
}

bool ShutdownManager::isReloadRequested() const {
    return controller_.isReloadRequested();
}

void ShutdownManager::sendWatchdog() {
#ifdef HAVE_SYSTEMD
    sd_notify(0, "WATCHDOG=1");
#endif
}

#ifdef HAVE_SYSTEMD
void ShutdownManager::sendReadyNotify() {
    sd_notify(0, "READY=1\nSTATUS=Serving requests...\n");
    readyNotified_ = true;
    LOG_INFO("systemd: Notified READY=1");
}

void ShutdownManager::sendStoppingNotify() {
    if (!stoppingNotified_) {
        sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
        stoppingNotified_ = true;
        LOG_INFO("systemd: Notified STOPPING=1");
    }
}
#endif

}  // namespace roomcast::shutdown_manager
