#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace prerender::graceful_shutdown {

// Written by the signal handler, consumed by the render loop thread.
struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t evict = 0;     // SIGUSR1: run an eviction pass now
    volatile sig_atomic_t received = 0;  // last signal number

    void reset() {
        shutdown = 0;
        reload = 0;
        evict = 0;
        received = 0;
    }
};

// Maps pending signal flags to what the daemon should do next.
//
//   SHUTDOWN  stop after the current step, exit
//   RELOAD    stop after the current step, start a new session
//   EVICT     keep rendering, ask the eviction worker for an extra pass
//
// Shutdown wins over reload; an eviction request is served alongside either.
class Controller {
   public:
    enum class Action { NONE, SHUTDOWN, RELOAD, EVICT };

    using Callback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    // Invoked when the loop has to stop (so sleeps end early).
    void setWakeCallback(Callback cb) {
        wakeCallback_ = std::move(cb);
    }
    void setEvictCallback(Callback cb) {
        evictCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Consumes pending flags. Returns the strongest action taken.
    Action processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }
    bool isReloadRequested() const {
        return reloadRequested_.load();
    }
    int lastSignal() const {
        return lastSignal_;
    }

    // New session: running, no reload pending.
    void rearm() {
        running_ = true;
        reloadRequested_ = false;
    }

   private:
    void log(const char* message) const;
    void stop(const char* message);

    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};
    int lastSignal_ = 0;

    Callback wakeCallback_;
    Callback evictCallback_;
    LogCallback logCallback_;
};

// Async-signal-safe: only sets flags in the global state.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

}  // namespace prerender::graceful_shutdown
