#include "core/config_loader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace prerender {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> normalizeExtensions(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    for (const auto& ext : raw) {
        std::string normalized = normalizeExtension(ext);
        if (normalized.empty()) {
            continue;
        }
        if (std::find(out.begin(), out.end(), normalized) == out.end()) {
            out.push_back(normalized);
        }
    }
    return out;
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> out;
    std::string current;
    for (char c : value) {
        if (c == ',' || c == ' ') {
            if (!current.empty()) {
                out.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

bool parseBool(const std::string& value, bool& out) {
    std::string lower = toLower(value);
    if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parseEnvDouble(const char* name, double& target, std::string& error) {
    if (const char* env = std::getenv(name)) {
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(env, &end);
        if (end && end != env && *end == '\0' && errno == 0) {
            target = value;
            return true;
        }
        error = std::string("Environment variable ") + name + " is not a number: " + env;
        return false;
    }
    return true;
}

bool parseEnvInt(const char* name, int& target, std::string& error) {
    if (const char* env = std::getenv(name)) {
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(env, &end, 10);
        if (end && end != env && *end == '\0' && errno == 0) {
            target = static_cast<int>(value);
            return true;
        }
        error = std::string("Environment variable ") + name + " is not an integer: " + env;
        return false;
    }
    return true;
}

void applyEnvString(const char* name, std::string& target) {
    if (const char* env = std::getenv(name)) {
        target = env;
    }
}

}  // namespace

std::string normalizeExtension(const std::string& ext) {
    std::string lower = toLower(ext);
    while (!lower.empty() && lower.front() == '.') {
        lower.erase(lower.begin());
    }
    return lower;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_WARN("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("allowedExtensions") && j["allowedExtensions"].is_array()) {
            outConfig.allowedExtensions =
                normalizeExtensions(j["allowedExtensions"].get<std::vector<std::string>>());
        }
        if (j.contains("tempPath")) {
            outConfig.tempPath = j["tempPath"].get<std::string>();
        }
        if (j.contains("mediaPath")) {
            outConfig.mediaPath = j["mediaPath"].get<std::string>();
        }
        if (j.contains("playlistSourceUrl")) {
            outConfig.playlistSourceUrl = j["playlistSourceUrl"].get<std::string>();
        }
        if (j.contains("fontUrl")) {
            outConfig.fontUrl = j["fontUrl"].get<std::string>();
        }
        if (j.contains("startupVideoUrl")) {
            outConfig.startupVideoUrl = j["startupVideoUrl"].get<std::string>();
        }
        if (j.contains("gasTankLimitSeconds")) {
            outConfig.gasTankLimitSeconds = j["gasTankLimitSeconds"].get<double>();
        }
        if (j.contains("targetSpeedMultiplier")) {
            outConfig.targetSpeedMultiplier = j["targetSpeedMultiplier"].get<double>();
        }
        if (j.contains("workingDirectory")) {
            outConfig.workingDirectory = j["workingDirectory"].get<std::string>();
        }
        if (j.contains("manifestPath")) {
            outConfig.manifestPath = j["manifestPath"].get<std::string>();
        }
        if (j.contains("playlistRotationEntries")) {
            outConfig.playlistRotationEntries = j["playlistRotationEntries"].get<size_t>();
        }
        if (j.contains("idlePollSeconds")) {
            outConfig.idlePollSeconds = j["idlePollSeconds"].get<int>();
        }
        if (j.contains("evictionIntervalSeconds")) {
            outConfig.evictionIntervalSeconds = j["evictionIntervalSeconds"].get<int>();
        }
        if (j.contains("retryDelaySeconds")) {
            outConfig.retryDelaySeconds = j["retryDelaySeconds"].get<int>();
        }
        if (j.contains("maxSegmentAgeSeconds")) {
            outConfig.maxSegmentAgeSeconds = j["maxSegmentAgeSeconds"].get<double>();
        }
        if (j.contains("diskUsageThreshold")) {
            outConfig.diskUsageThreshold = j["diskUsageThreshold"].get<double>();
        }
        if (j.contains("maxTrackSeconds")) {
            outConfig.maxTrackSeconds = j["maxTrackSeconds"].get<double>();
        }
        if (j.contains("adaptiveQuality")) {
            outConfig.adaptiveQuality = j["adaptiveQuality"].get<bool>();
        }
        if (j.contains("statsFilePath")) {
            outConfig.statsFilePath = j["statsFilePath"].get<std::string>();
        }
        if (j.contains("pidFilePath")) {
            outConfig.pidFilePath = j["pidFilePath"].get<std::string>();
        }

        if (j.contains("tools") && j["tools"].is_object()) {
            const auto& tools = j["tools"];
            outConfig.tools.ffmpeg = tools.value("ffmpeg", outConfig.tools.ffmpeg);
            outConfig.tools.ffprobe = tools.value("ffprobe", outConfig.tools.ffprobe);
            outConfig.tools.curl = tools.value("curl", outConfig.tools.curl);
            outConfig.tools.unzip = tools.value("unzip", outConfig.tools.unzip);
        }

        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& section = j["logging"];
            auto& log = outConfig.logging;
            if (section.contains("level")) {
                log.level = logging::stringToLevel(section["level"].get<std::string>());
            }
            log.filePath = section.value("filePath", log.filePath);
            log.maxFileSize = section.value("maxFileSize", log.maxFileSize);
            log.maxBackups = section.value("maxBackups", log.maxBackups);
            log.consoleOutput = section.value("consoleOutput", log.consoleOutput);
            log.coloredOutput = section.value("coloredOutput", log.coloredOutput);
            log.pattern = section.value("pattern", log.pattern);
        }

        if (verbose) {
            LOG_INFO("Config: loaded {} (gas tank {}s, target speed {}x, media {})",
                     configPath.string(), outConfig.gasTankLimitSeconds,
                     outConfig.targetSpeedMultiplier, outConfig.mediaPath);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool applyEnvOverrides(AppConfig& config, std::string& error) {
    if (const char* exts = std::getenv("PRERENDER_ALLOWED_EXTENSIONS")) {
        config.allowedExtensions = normalizeExtensions(splitList(exts));
    }
    applyEnvString("PRERENDER_TEMP_PATH", config.tempPath);
    applyEnvString("PRERENDER_MEDIA_PATH", config.mediaPath);
    applyEnvString("PRERENDER_PLAYLIST_SOURCE_URL", config.playlistSourceUrl);
    applyEnvString("PRERENDER_FONT_URL", config.fontUrl);
    applyEnvString("PRERENDER_STARTUP_VIDEO_URL", config.startupVideoUrl);
    applyEnvString("PRERENDER_WORKING_DIRECTORY", config.workingDirectory);
    applyEnvString("PRERENDER_STATS_FILE", config.statsFilePath);
    applyEnvString("PRERENDER_PID_FILE", config.pidFilePath);
    applyEnvString("PRERENDER_LOG_FILE", config.logging.filePath);
    if (const char* level = std::getenv("PRERENDER_LOG_LEVEL")) {
        config.logging.level = logging::stringToLevel(level);
    }

    if (!parseEnvDouble("PRERENDER_GAS_TANK_LIMIT_SECONDS", config.gasTankLimitSeconds, error)) {
        return false;
    }
    if (!parseEnvDouble("PRERENDER_TARGET_SPEED_MULTIPLIER", config.targetSpeedMultiplier,
                        error)) {
        return false;
    }
    if (!parseEnvDouble("PRERENDER_MAX_TRACK_SECONDS", config.maxTrackSeconds, error)) {
        return false;
    }
    if (!parseEnvInt("PRERENDER_IDLE_POLL_SECONDS", config.idlePollSeconds, error)) {
        return false;
    }
    if (!parseEnvInt("PRERENDER_EVICTION_INTERVAL_SECONDS", config.evictionIntervalSeconds,
                     error)) {
        return false;
    }
    if (const char* adaptive = std::getenv("PRERENDER_ADAPTIVE_QUALITY")) {
        if (!parseBool(adaptive, config.adaptiveQuality)) {
            error = "PRERENDER_ADAPTIVE_QUALITY must be true or false";
            return false;
        }
    }
    return true;
}

ErrorCode validateAppConfig(const AppConfig& config, std::string& error) {
    if (config.mediaPath.empty()) {
        error = "mediaPath must not be empty";
    } else if (config.tempPath.empty()) {
        error = "tempPath must not be empty";
    } else if (config.allowedExtensions.empty()) {
        error = "allowedExtensions must not be empty";
    } else if (config.gasTankLimitSeconds < 0.0) {
        error = "gasTankLimitSeconds must not be negative";
    } else if (config.targetSpeedMultiplier <= 0.0) {
        error = "targetSpeedMultiplier must be positive";
    } else if (config.playlistRotationEntries == 0) {
        error = "playlistRotationEntries must be at least 1";
    } else if (config.diskUsageThreshold <= 0.0 || config.diskUsageThreshold > 1.0) {
        error = "diskUsageThreshold must be in (0, 1]";
    } else if (config.maxSegmentAgeSeconds <= 0.0) {
        error = "maxSegmentAgeSeconds must be positive";
    } else if (config.maxTrackSeconds < 0.0) {
        error = "maxTrackSeconds must not be negative";
    } else if (config.idlePollSeconds <= 0 || config.evictionIntervalSeconds <= 0 ||
               config.retryDelaySeconds < 0) {
        error = "idle/eviction intervals must be positive and retry delay non-negative";
    } else {
        return ErrorCode::OK;
    }
    return ErrorCode::VALIDATION_INVALID_CONFIG;
}

}  // namespace prerender
