#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace prerender {
namespace logging {

namespace {

constexpr const char* kLoggerName = "prerender";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;

constexpr spdlog::level::level_enum kSpdlogLevels[] = {
    spdlog::level::trace, spdlog::level::debug,    spdlog::level::info, spdlog::level::warn,
    spdlog::level::err,   spdlog::level::critical, spdlog::level::off};

constexpr const char* kLevelNames[] = {"trace", "debug",    "info", "warn",
                                       "error", "critical", "off"};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return kSpdlogLevels[static_cast<std::size_t>(level)];
}

// Caller holds g_init_mutex.
void install(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level,
             const std::string& pattern) {
    if (g_logger) {
        g_logger->flush();
        spdlog::drop(kLoggerName);
    }
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    g_logger->set_level(level);
    g_logger->set_pattern(pattern);
    g_logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(g_logger);
}

}  // namespace

bool initialize(const LogConfig& config, const std::string& instanceTag) {
    auto level = toSpdlogLevel(config.level);
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        try {
            std::vector<spdlog::sink_ptr> sinks;
            if (config.consoleOutput) {
                auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                if (!config.coloredOutput) {
                    console->set_color_mode(spdlog::color_mode::never);
                }
                sinks.push_back(console);
            }
            if (!config.filePath.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.filePath, config.maxFileSize, config.maxBackups));
            }
            install(std::move(sinks), level, taggedPattern(config.pattern, instanceTag));
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
            return false;
        }
    }

    LOG_DEBUG("Logging at level {}", levelToString(config.level));
    if (!config.filePath.empty()) {
        LOG_INFO("Log file: {} (rotates at {}MB, keeps {})", config.filePath,
                 config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        return true;
    }
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        install(std::move(sinks), spdlog::level::info, LogConfig{}.pattern);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    spdlog::shutdown();
    g_logger.reset();
}

void flush() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    auto index = static_cast<std::size_t>(level);
    return index < std::size(kLevelNames) ? kLevelNames[index] : "info";
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    for (std::size_t i = 0; i < std::size(kLevelNames); ++i) {
        if (lower == kLevelNames[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

std::string taggedPattern(const std::string& pattern, const std::string& tag) {
    if (tag.empty()) {
        return pattern;
    }
    auto pos = pattern.find("%v");
    if (pos == std::string::npos) {
        return pattern + " [" + tag + "]";
    }
    std::string out = pattern;
    out.insert(pos, "[" + tag + "] ");
    return out;
}

}  // namespace logging
}  // namespace prerender
