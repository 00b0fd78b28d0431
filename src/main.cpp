#include "core/config_loader.h"
#include "daemon/app/app.h"
#include "daemon/app/runtime_state.h"
#include "logging/logger.h"

#include <exception>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* programName) {
    std::cout << "Pre-render scheduler for a live-stream pipeline" << std::endl;
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config <path>     Configuration file (default: "
              << prerender::DEFAULT_CONFIG_FILE << ")" << std::endl;
    std::cout << "  -l, --log-level <lvl>   trace|debug|info|warn|error|critical|off"
              << std::endl;
    std::cout << "      --once              Render at most one segment, then exit" << std::endl;
    std::cout << "  -h, --help              Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment variables PRERENDER_<NAME> override configuration values."
              << std::endl;
    std::cout << "SIGHUP reloads the configuration, SIGUSR1 runs an eviction pass now,"
              << std::endl;
    std::cout << "SIGINT/SIGTERM stop the daemon." << std::endl;
}

struct CommandLine {
    std::string configPath = prerender::DEFAULT_CONFIG_FILE;
    prerender::daemon_app::AppOverrides overrides;
    bool showHelp = false;
};

bool parseArguments(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.showHelp = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if ((arg == "--log-level" || arg == "-l") && i + 1 < argc) {
            cli.overrides.logLevel = std::string(argv[++i]);
        } else if (arg == "--once") {
            cli.overrides.once = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseArguments(argc, argv, cli)) {
        printUsage(argv[0]);
        return 2;
    }
    if (cli.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    // stderr only until the config file has been read
    prerender::logging::initializeEarly();

    try {
        prerender::daemon_app::RuntimeState state;
        prerender::daemon_app::App app(state, cli.configPath);
        int exitCode = app.run(cli.overrides);
        prerender::logging::shutdown();
        return exitCode;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        prerender::logging::shutdown();
        return 1;
    }
}
