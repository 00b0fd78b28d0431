/**
 * @file logger.h
 * @brief spdlog front end for the pre-render daemon
 *
 * The render loop, the eviction worker and the startup code share the
 * "prerender" logger. Several daemons may write segments into one media
 * directory, so every line carries the instance id once it is known.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace prerender {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

// "logging" section of config.json (parsed by the config loader).
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * @brief Build the sinks and install the shared logger
 *
 * Replaces whatever was installed before, including the early stderr
 * logger. instanceTag, when set, is prefixed to every message.
 *
 * @return false if a sink could not be created (e.g. unwritable log file)
 */
bool initialize(const LogConfig& config, const std::string& instanceTag = std::string());

// stderr only; covers config parsing and the PID lock.
bool initializeEarly();

// Flushes pending messages and drops the logger.
void shutdown();

void flush();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; unknown names map to Info.
LogLevel stringToLevel(std::string_view str);

// Inserts "[tag] " in front of the message field of a pattern.
std::string taggedPattern(const std::string& pattern, const std::string& tag);

}  // namespace logging
}  // namespace prerender

#include <spdlog/spdlog.h>

#define PRERENDER_LOG_AT(macro, ...)                   \
    do {                                               \
        auto logger = prerender::logging::getLogger(); \
        if (logger)                                    \
            macro(logger, __VA_ARGS__);                \
    } while (0)

#define LOG_TRACE(...) PRERENDER_LOG_AT(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) PRERENDER_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) PRERENDER_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) PRERENDER_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) PRERENDER_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) PRERENDER_LOG_AT(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// Idle polls and repeated per-track failures would otherwise flood the log.
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
