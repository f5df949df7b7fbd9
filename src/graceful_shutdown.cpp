#include "graceful_shutdown.h"

#include <cstdio>

namespace roomcast::GracefulShutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    if (sig == SIGHUP) {
        g_signalState.reload = 1;
    } else {
        g_signalState.shutdown = 1;
    }
}

bool Controller::processPendingSignals() {
    if (!signalState_) {
        return false;
    }

    lastAction_ = Action::NONE;
    char message[96];

    if (signalState_->shutdown) {
        // A reload queued behind the shutdown would restart the daemon loop
        signalState_->shutdown = 0;
        signalState_->reload = 0;
        lastAction_ = Action::SHUTDOWN;
        lastSignal_ = signalState_->received;
        std::snprintf(message, sizeof(message), "Signal %d: stopping roomcastd", lastSignal_);
    } else if (signalState_->reload) {
        signalState_->reload = 0;
        lastAction_ = Action::RELOAD;
        lastSignal_ = signalState_->received;
        std::snprintf(message, sizeof(message), "Signal %d: reloading configuration",
                      lastSignal_);
    } else {
        return false;
    }

    if (logCallback_) {
        logCallback_(message);
    }
    reloadRequested_ = (lastAction_ == Action::RELOAD);
    running_ = false;
    if (stopCallback_) {
        stopCallback_(lastAction_);
    }
    return true;
}

}  // namespace roomcast::GracefulShutdown
