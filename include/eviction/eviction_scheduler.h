#pragma once

#include "core/error_codes.h"
#include "eviction/eviction_manager.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace prerender::eviction {

// Runs the eviction policies on their own thread, independent of the
// render loop's cadence.
class EvictionScheduler {
   public:
    struct Dependencies {
        EvictionManager* manager = nullptr;
        std::atomic<bool>* runningFlag = nullptr;
        std::chrono::milliseconds interval{30000};
        std::function<queue::Clock::time_point()> clock;
        // Called after every pass with the three policy reports.
        std::function<void(const std::vector<EvictionReport>&)> onPass;
    };

    explicit EvictionScheduler(Dependencies deps);
    ~EvictionScheduler();

    void start();
    void stop();
    void requestPass();

    // Age, disk, sweep. Stops at the first fatal error.
    std::vector<EvictionReport> runPass();

    // OK until a pass hits a fatal error; then that error, sticky.
    ErrorCode fatalError() const {
        return fatalError_.load(std::memory_order_acquire);
    }

   private:
    bool isRunning() const;
    void workerLoop();

    Dependencies deps_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> workerRunning_{false};
    std::atomic<bool> passRequested_{false};
    std::atomic<ErrorCode> fatalError_{ErrorCode::OK};
    std::mutex passMutex_;
    std::thread workerThread_;
};

}  // namespace prerender::eviction
