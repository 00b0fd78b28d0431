#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>
#include <stdexcept>
#include <utility>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace prerender::shutdown_manager {

namespace {

void sendNotify(const std::string& message) {
#ifdef HAVE_SYSTEMD
    sd_notify(0, message.c_str());
#else
    (void)message;
#endif
}

}  // namespace

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.runningFlag || !deps_.reloadFlag) {
        throw std::invalid_argument("ShutdownManager requires running/reload flags");
    }

    controller_.setSignalState(&graceful_shutdown::getGlobalSignalState());
    controller_.setLogCallback([](const char* message) { LOG_INFO("{}", message); });
    controller_.setWakeCallback([this]() {
        if (wakeCallback_) {
            wakeCallback_();
        }
    });
    controller_.setEvictCallback([this]() {
        if (evictCallback_) {
            evictCallback_();
        }
    });
}

void ShutdownManager::installSignalHandlers() {
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGUSR1}) {
        std::signal(sig, graceful_shutdown::signalHandler);
    }
    // curl and ffmpeg children may close pipes early.
    std::signal(SIGPIPE, SIG_IGN);
}

void ShutdownManager::setWakeCallback(std::function<void()> cb) {
    wakeCallback_ = std::move(cb);
}

void ShutdownManager::setEvictCallback(std::function<void()> cb) {
    evictCallback_ = std::move(cb);
}

void ShutdownManager::notifyReady() {
    if (readyNotified_) {
        return;
    }
    readyNotified_ = true;
    sendNotify("READY=1\nSTATUS=Rendering");
    LOG_DEBUG("Service manager notified: ready");
}

void ShutdownManager::notifyStatus(const std::string& status) {
    sendNotify("STATUS=" + status);
}

graceful_shutdown::Controller::Action ShutdownManager::tick() {
    auto action = controller_.processPendingSignals();
    if (action == graceful_shutdown::Controller::Action::SHUTDOWN ||
        action == graceful_shutdown::Controller::Action::RELOAD) {
        deps_.runningFlag->store(false);
        deps_.reloadFlag->store(controller_.isReloadRequested());
    }
    if (readyNotified_ && controller_.isRunning()) {
        sendNotify("WATCHDOG=1");
    }
    return action;
}

void ShutdownManager::runShutdownSequence() {
    if (stopping_) {
        return;
    }
    stopping_ = true;
    LOG_INFO("{}", controller_.isReloadRequested() ? "Ending session for reload"
                                                   : "Shutting down...");
    sendNotify(controller_.isReloadRequested() ? "RELOADING=1\nSTATUS=Reloading"
                                               : "STOPPING=1\nSTATUS=Shutting down");
}

void ShutdownManager::reset() {
    stopping_ = false;
    controller_.rearm();
    deps_.runningFlag->store(true);
    deps_.reloadFlag->store(false);
    graceful_shutdown::getGlobalSignalState().reset();
    if (readyNotified_) {
        sendNotify("READY=1\nSTATUS=Rendering");
    }
}

bool ShutdownManager::isRunning() const {
    return controller_.isRunning();
}

bool ShutdownManager::isReloadRequested() const {
    return controller_.isReloadRequested();
}

}  // namespace prerender::shutdown_manager
