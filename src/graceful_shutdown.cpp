#include "graceful_shutdown.h"

#include <cstdio>

namespace prerender::graceful_shutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    switch (sig) {
    case SIGHUP:
        g_signalState.reload = 1;
        break;
    case SIGUSR1:
        g_signalState.evict = 1;
        break;
    default:
        g_signalState.shutdown = 1;
        break;
    }
}

void Controller::log(const char* message) const {
    if (logCallback_) {
        logCallback_(message);
    }
}

void Controller::stop(const char* message) {
    log(message);
    running_ = false;
    if (wakeCallback_) {
        wakeCallback_();
    }
}

Controller::Action Controller::processPendingSignals() {
    if (!signalState_) {
        return Action::NONE;
    }

    Action action = Action::NONE;
    char buf[96];

    if (signalState_->evict) {
        signalState_->evict = 0;
        action = Action::EVICT;
        log("Received SIGUSR1, requesting an eviction pass");
        if (evictCallback_) {
            evictCallback_();
        }
    }

    if (signalState_->shutdown) {
        signalState_->shutdown = 0;
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        // A stop request cancels any reload still pending.
        reloadRequested_ = false;
        std::snprintf(buf, sizeof(buf), "Received signal %d, stopping after the current step",
                      lastSignal_);
        stop(buf);
        return Action::SHUTDOWN;
    }

    if (signalState_->reload) {
        signalState_->reload = 0;
        lastSignal_ = signalState_->received;
        reloadRequested_ = true;
        std::snprintf(buf, sizeof(buf), "Received SIGHUP, starting a new session");
        stop(buf);
        return Action::RELOAD;
    }

    return action;
}

}  // namespace prerender::graceful_shutdown
