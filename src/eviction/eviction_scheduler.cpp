#include "eviction/eviction_scheduler.h"

#include "logging/logger.h"

namespace prerender::eviction {

EvictionScheduler::EvictionScheduler(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.clock) {
        deps_.clock = [] { return queue::Clock::now(); };
    }
}

EvictionScheduler::~EvictionScheduler() {
    stop();
}

bool EvictionScheduler::isRunning() const {
    return !deps_.runningFlag || deps_.runningFlag->load(std::memory_order_acquire);
}

void EvictionScheduler::start() {
    if (workerRunning_.exchange(true)) {
        return;
    }
    workerThread_ = std::thread(&EvictionScheduler::workerLoop, this);
}

void EvictionScheduler::stop() {
    bool wasRunning = workerRunning_.exchange(false);
    cv_.notify_all();
    if (wasRunning && workerThread_.joinable()) {
        workerThread_.join();
    }
}

void EvictionScheduler::requestPass() {
    passRequested_.store(true, std::memory_order_release);
    cv_.notify_all();
}

std::vector<EvictionReport> EvictionScheduler::runPass() {
    std::lock_guard<std::mutex> passLock(passMutex_);
    std::vector<EvictionReport> reports;
    if (!deps_.manager) {
        return reports;
    }

    reports.push_back(deps_.manager->runAgePolicy(deps_.clock()));
    if (reports.back().ok()) {
        reports.push_back(deps_.manager->runDiskQuotaPolicy());
    }
    if (reports.back().ok()) {
        reports.push_back(deps_.manager->runWorkingDirectorySweep());
    }

    for (const auto& report : reports) {
        if (!report.ok() && isFatal(report.errorCode)) {
            LOG_CRITICAL("Eviction {} pass failed: {} ({})", policyName(report.policy),
                         report.errorMessage, errorCodeToString(report.errorCode));
            ErrorCode expected = ErrorCode::OK;
            fatalError_.compare_exchange_strong(expected, report.errorCode);
        } else if (!report.evictedSequenceNumbers.empty()) {
            LOG_INFO("Eviction {}: {} segments, {} bytes", policyName(report.policy),
                     report.evictedSequenceNumbers.size(), report.freedBytes);
        }
    }

    if (deps_.onPass) {
        deps_.onPass(reports);
    }
    return reports;
}

void EvictionScheduler::workerLoop() {
    while (workerRunning_.load(std::memory_order_acquire) && isRunning()) {
        runPass();
        if (fatalError() != ErrorCode::OK) {
            break;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, deps_.interval, [this]() {
            return !workerRunning_.load(std::memory_order_acquire) || !isRunning() ||
                   passRequested_.load(std::memory_order_acquire);
        });
        passRequested_.store(false, std::memory_order_release);
    }
    LOG_DEBUG("Eviction scheduler stopped");
}

}  // namespace prerender::eviction
