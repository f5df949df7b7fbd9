#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace roomcast::GracefulShutdown {

// ========== Signal State ==========
// Set by the signal handler, polled by the daemon loop.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t received = 0;  // last signal number

    void reset() {
        shutdown = 0;
        reload = 0;
        received = 0;
    }
};

// ========== Controller ==========
// Turns pending signal flags into a stop or reload decision. Testable without
// real signal delivery.

class Controller {
   public:
    enum class Action { NONE, SHUTDOWN, RELOAD };

    // Invoked once per processed signal, before the loop exits (stop sources, wake waiters)
    using StopCallback = std::function<void(Action)>;
    using LogCallback = std::function<void(const char*)>;

    Controller() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setStopCallback(StopCallback cb) {
        stopCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Returns true if a signal was processed. Shutdown takes priority over reload.
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }
    bool isReloadRequested() const {
        return reloadRequested_.load();
    }

    // Back to running, no reload pending (start of each daemon loop iteration)
    void reset() {
        running_ = true;
        reloadRequested_ = false;
        lastAction_ = Action::NONE;
    }

    int getLastSignal() const {
        return lastSignal_;
    }
    Action getLastAction() const {
        return lastAction_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};

    StopCallback stopCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
    Action lastAction_ = Action::NONE;
};

// ========== Signal Handler ==========
// Async-signal-safe: only sets flags on the global SignalState.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

}  // namespace roomcast::GracefulShutdown
