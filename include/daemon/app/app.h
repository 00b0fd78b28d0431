#pragma once

#include "daemon/app/runtime_state.h"

#include <optional>
#include <string>

namespace prerender::shutdown_manager {
class ShutdownManager;
}

namespace prerender::daemon_app {

struct AppOverrides {
    std::optional<std::string> logLevel;
    bool once = false;  // render at most one segment, exit when idle
};

class App {
   public:
    App(RuntimeState& state, std::string configFilePath);

    // Runs sessions until stopped. Returns the process exit code.
    int run(const AppOverrides& overrides);

   private:
    // One configuration session; ends on stop, reload or a fatal error.
    ErrorCode runSession(const AppOverrides& overrides,
                         shutdown_manager::ShutdownManager& shutdownManager);

    RuntimeState& state_;
    std::string configFilePath_;
};

}  // namespace prerender::daemon_app
