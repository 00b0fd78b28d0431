#pragma once

#include "core/config_loader.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace prerender::daemon_app {

// Shared with the render loop and the eviction worker.
struct ControlFlags {
    std::atomic<bool> running{true};
    std::atomic<bool> reloadRequested{false};
};

// Survives a SIGHUP reload. The instance id stays fixed for the process so
// segment names and the lock file keep one owner across sessions.
struct RuntimeState {
    AppConfig config;
    ControlFlags flags;
    std::string instanceId;
    std::uint64_t sessions = 0;  // started so far, including the current one
};

}  // namespace prerender::daemon_app
