/**
 * @file test_config_loader.cpp
 * @brief Unit tests for config loader (JSON configuration + environment overrides)
 */

#include "core/config_loader.h"
#include "support/test_support.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace prerender;
using prerender::test::ScopedEnv;

class ConfigLoaderTest : public test::TempDirTest {
   protected:
    fs::path testConfigPath;

    void SetUp() override {
        TempDirTest::SetUp();
        testConfigPath = tempDir / "test_config.json";
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// loadAppConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    AppConfig config;
    EXPECT_FALSE(loadAppConfig("/nonexistent/path/config.json", config, false));
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    AppConfig config;
    config.mediaPath = "/somewhere/else";
    loadAppConfig("/nonexistent/path/config.json", config, false);

    EXPECT_EQ(config.mediaPath, "/media");
    EXPECT_EQ(config.tempPath, "/tmp/prerender");
    EXPECT_DOUBLE_EQ(config.gasTankLimitSeconds, 3600.0);
    EXPECT_DOUBLE_EQ(config.targetSpeedMultiplier, 2.0);
    EXPECT_DOUBLE_EQ(config.diskUsageThreshold, 0.80);
    EXPECT_DOUBLE_EQ(config.maxSegmentAgeSeconds, 5400.0);
    EXPECT_EQ(config.playlistRotationEntries, 1u);
    EXPECT_FALSE(config.adaptiveQuality);
    EXPECT_EQ(config.tools.ffmpeg, "ffmpeg");
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");

    AppConfig config;
    EXPECT_TRUE(loadAppConfig(testConfigPath, config, false));
}

TEST_F(ConfigLoaderTest, LoadFullConfig) {
    writeConfig(R"({
        "allowedExtensions": ["MP3", ".flac", "zip", "mp3"],
        "tempPath": "/var/tmp/render",
        "mediaPath": "/srv/media",
        "playlistSourceUrl": "https://example.org/list.txt",
        "fontUrl": "https://example.org/font.ttf",
        "startupVideoUrl": "https://example.org/startup.flv",
        "gasTankLimitSeconds": 1200,
        "targetSpeedMultiplier": 3.5,
        "workingDirectory": "/srv/work",
        "manifestPath": "keep.txt",
        "playlistRotationEntries": 4,
        "idlePollSeconds": 10,
        "evictionIntervalSeconds": 15,
        "retryDelaySeconds": 2,
        "maxSegmentAgeSeconds": 600,
        "diskUsageThreshold": 0.9,
        "maxTrackSeconds": 300,
        "adaptiveQuality": true,
        "statsFilePath": "/run/prerender/stats.json",
        "pidFilePath": "/run/prerender/prerender.pid",
        "tools": {"ffmpeg": "/opt/ffmpeg/bin/ffmpeg", "curl": "/usr/local/bin/curl"}
    })");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));

    EXPECT_EQ(config.allowedExtensions, (std::vector<std::string>{"mp3", "flac", "zip"}));
    EXPECT_EQ(config.tempPath, "/var/tmp/render");
    EXPECT_EQ(config.mediaPath, "/srv/media");
    EXPECT_EQ(config.playlistSourceUrl, "https://example.org/list.txt");
    EXPECT_EQ(config.fontUrl, "https://example.org/font.ttf");
    EXPECT_EQ(config.startupVideoUrl, "https://example.org/startup.flv");
    EXPECT_DOUBLE_EQ(config.gasTankLimitSeconds, 1200.0);
    EXPECT_DOUBLE_EQ(config.targetSpeedMultiplier, 3.5);
    EXPECT_EQ(config.workingDirectory, "/srv/work");
    EXPECT_EQ(config.manifestPath, "keep.txt");
    EXPECT_EQ(config.playlistRotationEntries, 4u);
    EXPECT_EQ(config.idlePollSeconds, 10);
    EXPECT_EQ(config.evictionIntervalSeconds, 15);
    EXPECT_EQ(config.retryDelaySeconds, 2);
    EXPECT_DOUBLE_EQ(config.maxSegmentAgeSeconds, 600.0);
    EXPECT_DOUBLE_EQ(config.diskUsageThreshold, 0.9);
    EXPECT_DOUBLE_EQ(config.maxTrackSeconds, 300.0);
    EXPECT_TRUE(config.adaptiveQuality);
    EXPECT_EQ(config.statsFilePath, "/run/prerender/stats.json");
    EXPECT_EQ(config.pidFilePath, "/run/prerender/prerender.pid");
    EXPECT_EQ(config.tools.ffmpeg, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(config.tools.ffprobe, "ffprobe");
    EXPECT_EQ(config.tools.curl, "/usr/local/bin/curl");
}

TEST_F(ConfigLoaderTest, LoadPartialConfigKeepsDefaults) {
    writeConfig(R"({"mediaPath": "/data/media"})");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.mediaPath, "/data/media");
    EXPECT_EQ(config.tempPath, "/tmp/prerender");
    EXPECT_DOUBLE_EQ(config.gasTankLimitSeconds, 3600.0);
}

TEST_F(ConfigLoaderTest, LoadInvalidJsonReturnsFalseWithDefaults) {
    writeConfig("{ invalid json }");

    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.mediaPath, "/media");
}

TEST_F(ConfigLoaderTest, LoadWrongTypeReturnsFalse) {
    writeConfig(R"({"gasTankLimitSeconds": "lots"})");

    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_DOUBLE_EQ(config.gasTankLimitSeconds, 3600.0);
}

TEST_F(ConfigLoaderTest, LoadLoggingSection) {
    writeConfig(R"({"logging": {"level": "DEBUG", "filePath": "/var/log/prerender.log",
                                "maxBackups": 2, "coloredOutput": false}})");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.logging.level, logging::LogLevel::Debug);
    EXPECT_EQ(config.logging.filePath, "/var/log/prerender.log");
    EXPECT_EQ(config.logging.maxBackups, 2u);
    EXPECT_FALSE(config.logging.coloredOutput);
    EXPECT_TRUE(config.logging.consoleOutput);
}

TEST_F(ConfigLoaderTest, UnknownLogLevelFallsBackToInfo) {
    writeConfig(R"({"logging": {"level": "chatty"}})");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.logging.level, logging::LogLevel::Info);
}

TEST(LoggerPattern, InstanceTagPrecedesMessage) {
    EXPECT_EQ(logging::taggedPattern("[%l] %v", "a1b2c3d4"), "[%l] [a1b2c3d4] %v");
    EXPECT_EQ(logging::taggedPattern("[%l] %v", ""), "[%l] %v");
    EXPECT_EQ(logging::taggedPattern("%l", "x"), "%l [x]");
}

TEST(LoggerLevel, NamesRoundTripAndAliases) {
    EXPECT_EQ(logging::stringToLevel(logging::levelToString(logging::LogLevel::Critical)),
              logging::LogLevel::Critical);
    EXPECT_EQ(logging::stringToLevel("warning"), logging::LogLevel::Warn);
    EXPECT_EQ(logging::stringToLevel("Off"), logging::LogLevel::Off);
}

// ============================================================
// Derived values
// ============================================================

TEST_F(ConfigLoaderTest, EffectiveMaxTrackDefaultsToHalfGasTank) {
    AppConfig config;
    config.gasTankLimitSeconds = 1000.0;
    EXPECT_DOUBLE_EQ(config.effectiveMaxTrackSeconds(), 500.0);

    config.maxTrackSeconds = 120.0;
    EXPECT_DOUBLE_EQ(config.effectiveMaxTrackSeconds(), 120.0);
}

TEST(NormalizeExtension, StripsDotAndLowercases) {
    EXPECT_EQ(normalizeExtension("MP3"), "mp3");
    EXPECT_EQ(normalizeExtension(".Flac"), "flac");
    EXPECT_EQ(normalizeExtension(""), "");
}

// ============================================================
// applyEnvOverrides tests
// ============================================================

TEST_F(ConfigLoaderTest, EnvOverridesReplaceFileValues) {
    ScopedEnv media("PRERENDER_MEDIA_PATH", "/env/media");
    ScopedEnv tank("PRERENDER_GAS_TANK_LIMIT_SECONDS", "900.5");
    ScopedEnv exts("PRERENDER_ALLOWED_EXTENSIONS", "MP3, .ogg,zip");
    ScopedEnv adaptive("PRERENDER_ADAPTIVE_QUALITY", "yes");
    ScopedEnv idle("PRERENDER_IDLE_POLL_SECONDS", "7");

    AppConfig config;
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(config, error)) << error;
    EXPECT_EQ(config.mediaPath, "/env/media");
    EXPECT_DOUBLE_EQ(config.gasTankLimitSeconds, 900.5);
    EXPECT_EQ(config.allowedExtensions, (std::vector<std::string>{"mp3", "ogg", "zip"}));
    EXPECT_TRUE(config.adaptiveQuality);
    EXPECT_EQ(config.idlePollSeconds, 7);
}

TEST_F(ConfigLoaderTest, EnvOverridesLogging) {
    ScopedEnv level("PRERENDER_LOG_LEVEL", "error");
    ScopedEnv file("PRERENDER_LOG_FILE", "/tmp/p.log");

    AppConfig config;
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(config, error)) << error;
    EXPECT_EQ(config.logging.level, logging::LogLevel::Error);
    EXPECT_EQ(config.logging.filePath, "/tmp/p.log");
}

TEST_F(ConfigLoaderTest, EnvOverridesLeaveUnsetValuesAlone) {
    ScopedEnv media("PRERENDER_MEDIA_PATH");
    ScopedEnv tank("PRERENDER_GAS_TANK_LIMIT_SECONDS");

    AppConfig config;
    config.mediaPath = "/from/file";
    std::string error;
    ASSERT_TRUE(applyEnvOverrides(config, error));
    EXPECT_EQ(config.mediaPath, "/from/file");
}

TEST_F(ConfigLoaderTest, EnvOverrideRejectsNonNumeric) {
    ScopedEnv speed("PRERENDER_TARGET_SPEED_MULTIPLIER", "fast");

    AppConfig config;
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(config, error));
    EXPECT_NE(error.find("PRERENDER_TARGET_SPEED_MULTIPLIER"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EnvOverrideRejectsBadBool) {
    ScopedEnv adaptive("PRERENDER_ADAPTIVE_QUALITY", "maybe");

    AppConfig config;
    std::string error;
    EXPECT_FALSE(applyEnvOverrides(config, error));
}

// ============================================================
// validateAppConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, DefaultsAreValid) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(validateAppConfig(config, error), ErrorCode::OK);
}

TEST_F(ConfigLoaderTest, ZeroGasTankIsValid) {
    AppConfig config;
    config.gasTankLimitSeconds = 0.0;
    std::string error;
    EXPECT_EQ(validateAppConfig(config, error), ErrorCode::OK);
}

TEST_F(ConfigLoaderTest, ValidationRejectsOutOfRangeValues) {
    std::string error;

    AppConfig threshold;
    threshold.diskUsageThreshold = 1.5;
    EXPECT_EQ(validateAppConfig(threshold, error), ErrorCode::VALIDATION_INVALID_CONFIG);

    AppConfig speed;
    speed.targetSpeedMultiplier = 0.0;
    EXPECT_EQ(validateAppConfig(speed, error), ErrorCode::VALIDATION_INVALID_CONFIG);

    AppConfig rotation;
    rotation.playlistRotationEntries = 0;
    EXPECT_EQ(validateAppConfig(rotation, error), ErrorCode::VALIDATION_INVALID_CONFIG);

    AppConfig extensions;
    extensions.allowedExtensions.clear();
    EXPECT_EQ(validateAppConfig(extensions, error), ErrorCode::VALIDATION_INVALID_CONFIG);
    EXPECT_EQ(error, "allowedExtensions must not be empty");

    AppConfig media;
    media.mediaPath.clear();
    EXPECT_EQ(validateAppConfig(media, error), ErrorCode::VALIDATION_INVALID_CONFIG);
}
