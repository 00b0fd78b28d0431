#ifndef PRERENDER_CORE_CONFIG_LOADER_H
#define PRERENDER_CORE_CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace prerender {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

// External binaries the daemon shells out to.
struct ToolPaths {
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    std::string curl = "curl";
    std::string unzip = "unzip";
};

// Resolved once at startup; read-only for the process lifetime.
struct AppConfig {
    std::vector<std::string> allowedExtensions = {"zip", "xm",  "it",  "s3m", "mod",
                                                  "mp3", "mp4", "flac", "m4a", "aac",
                                                  "flv", "3gp", "ogg", "ra",  "rm"};
    std::string tempPath = "/tmp/prerender";
    std::string mediaPath = "/media";
    std::string playlistSourceUrl;
    std::string fontUrl;
    std::string startupVideoUrl;
    double gasTankLimitSeconds = DaemonConstants::DEFAULT_GAS_TANK_LIMIT_SECONDS;
    double targetSpeedMultiplier = DaemonConstants::DEFAULT_TARGET_SPEED_MULTIPLIER;

    // Directory hygiene sweep
    std::string workingDirectory = ".";
    std::string manifestPath = "manifest";  // One allow-listed file name per line

    // Playlist rotation
    size_t playlistRotationEntries = DaemonConstants::DEFAULT_PLAYLIST_ROTATION_ENTRIES;

    // Cadence (seconds)
    int idlePollSeconds = DaemonConstants::DEFAULT_IDLE_POLL_SECONDS;
    int evictionIntervalSeconds = DaemonConstants::DEFAULT_EVICTION_INTERVAL_SECONDS;
    int retryDelaySeconds = DaemonConstants::DEFAULT_RETRY_DELAY_SECONDS;

    // Eviction thresholds (inclusive)
    double maxSegmentAgeSeconds = DaemonConstants::DEFAULT_MAX_SEGMENT_AGE_SECONDS;
    double diskUsageThreshold = DaemonConstants::DEFAULT_DISK_USAGE_THRESHOLD;

    // Tracks longer than this are rejected; 0 = half the gas tank limit
    double maxTrackSeconds = 0.0;

    // Step CRF/preset towards targetSpeedMultiplier between renders
    bool adaptiveQuality = false;

    ToolPaths tools;

    std::string statsFilePath;  // Empty = no stats file
    std::string pidFilePath = "prerender.pid";

    logging::LogConfig logging;

    // Effective track length cap.
    double effectiveMaxTrackSeconds() const {
        return maxTrackSeconds > 0.0 ? maxTrackSeconds : gasTankLimitSeconds / 2.0;
    }
};

// Lowercases and strips a leading '.' ("MP3" / ".mp3" -> "mp3").
std::string normalizeExtension(const std::string& ext);

// Returns false if the file is missing or malformed; outConfig then holds defaults.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

// Applies PRERENDER_<NAME> environment variables on top of the file values.
bool applyEnvOverrides(AppConfig& config, std::string& error);

// Range checks. Returns OK or VALIDATION_INVALID_CONFIG with a message in error.
ErrorCode validateAppConfig(const AppConfig& config, std::string& error);

}  // namespace prerender

#endif  // PRERENDER_CORE_CONFIG_LOADER_H
