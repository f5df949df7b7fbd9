#pragma once

#include "graceful_shutdown.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace roomcast::shutdown_manager {

/**
 * @brief Owns signal installation and the daemon loop's wait/tick cycle.
 *
 * systemd READY/STOPPING/WATCHDOG notifications are sent when built with
 * HAVE_SYSTEMD.
 */
class ShutdownManager {
   public:
    ShutdownManager();

    void installSignalHandlers();

    // Called when a shutdown or reload signal is processed
    void setStopCallback(std::function<void()> cb);

    void notifyReady();

    // Polls pending signals; returns true while the daemon should keep running
    bool tick();

    // Sleeps up to `interval` (woken early by requestStop) then ticks
    bool waitAndTick(std::chrono::milliseconds interval);

    // Programmatic stop (tests, fatal startup errors)
    void requestStop();

    void runShutdownSequence();

    // Reset between reload iterations
    void reset();

    bool isRunning() const;
    bool isReloadRequested() const;

   private:
    void sendWatchdog();
#ifdef HAVE_SYSTEMD
    void sendReadyNotify();
    void sendStoppingNotify();
#endif

    GracefulShutdown::Controller controller_;
    std::function<void()> stopCallback_;

    mutable std::mutex waitMutex_;
    std::condition_variable waitCv_;
    bool stopRequested_{false};

    bool readyNotified_{false};
    bool stoppingNotified_{false};
    bool sequenceRan_{false};
};

}  // namespace roomcast::shutdown_manager
