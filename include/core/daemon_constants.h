#ifndef PRERENDER_CORE_DAEMON_CONSTANTS_H
#define PRERENDER_CORE_DAEMON_CONSTANTS_H

#include <cstddef>  // for size_t

// Common constants shared across daemon components

namespace DaemonConstants {

// Buffer ("gas tank") defaults
constexpr double DEFAULT_GAS_TANK_LIMIT_SECONDS = 3600.0;
constexpr double DEFAULT_TARGET_SPEED_MULTIPLIER = 2.0;

// Eviction thresholds
constexpr double DEFAULT_MAX_SEGMENT_AGE_SECONDS = 5400.0;  // 90 minutes
constexpr double DEFAULT_DISK_USAGE_THRESHOLD = 0.80;

// Loop cadence
constexpr int DEFAULT_IDLE_POLL_SECONDS = 60;
constexpr int DEFAULT_EVICTION_INTERVAL_SECONDS = 30;
constexpr int DEFAULT_RETRY_DELAY_SECONDS = 5;

// Playlist layout
constexpr const char* FFCONCAT_HEADER = "ffconcat version 1.0";
constexpr const char* ENTRY_PLAYLIST_NAME = "playlist0.txt";
constexpr const char* PLAYLIST_PREFIX = "playlist";
constexpr const char* PLAYLIST_SUFFIX = ".txt";
constexpr const char* STARTUP_VIDEO_NAME = "startup.flv";
constexpr size_t DEFAULT_PLAYLIST_ROTATION_ENTRIES = 1;

// Segment layout
constexpr const char* SEGMENT_PREFIX = "media-";
constexpr const char* SEGMENT_EXTENSION = ".flv";

// Render parameters (fixed, not yet configurable)
constexpr int RENDER_WIDTH = 1920;
constexpr int RENDER_HEIGHT = 1080;
constexpr int RENDER_FPS = 30;
constexpr int RENDER_AUDIO_RATE = 44100;
constexpr double RENDER_FADE_SECONDS = 5.0;
constexpr size_t METADATA_LINE_WIDTH = 80;
constexpr const char* FONT_FILE_NAME = "font.ttf";

}  // namespace DaemonConstants

#endif  // PRERENDER_CORE_DAEMON_CONSTANTS_H
