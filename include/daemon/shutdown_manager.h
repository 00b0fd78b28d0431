#pragma once

#include "graceful_shutdown.h"

#include <atomic>
#include <functional>
#include <string>

namespace prerender::shutdown_manager {

// Owns signal handling and the systemd conversation for one process.
// The render loop calls tick() between steps; nothing is interrupted
// mid-transcode.
class ShutdownManager {
   public:
    struct Dependencies {
        std::atomic<bool>* runningFlag = nullptr;
        std::atomic<bool>* reloadFlag = nullptr;
    };

    explicit ShutdownManager(Dependencies deps);

    // SIGINT, SIGTERM, SIGHUP, SIGUSR1; SIGPIPE ignored.
    void installSignalHandlers();

    void setWakeCallback(std::function<void()> cb);
    void setEvictCallback(std::function<void()> cb);

    void notifyReady();
    void notifyStatus(const std::string& status);

    // Applies pending signals to the flags and pets the watchdog.
    graceful_shutdown::Controller::Action tick();

    void runShutdownSequence();

    // Called at the start of every session.
    void reset();

    bool isRunning() const;
    bool isReloadRequested() const;

   private:
    Dependencies deps_;
    graceful_shutdown::Controller controller_;
    std::function<void()> wakeCallback_;
    std::function<void()> evictCallback_;

    bool readyNotified_{false};
    bool stopping_{false};
};

}  // namespace prerender::shutdown_manager
