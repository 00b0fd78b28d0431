#include "daemon/app/startup_assets.h"

#include "logging/logger.h"

#include <system_error>

namespace prerender::daemon_app {

namespace {

bool nonEmptyFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && std::filesystem::file_size(path, ec) > 0 &&
           !ec;
}

}  // namespace

std::filesystem::path fontPathFor(const AppConfig& config) {
    return std::filesystem::path(config.workingDirectory) / DaemonConstants::FONT_FILE_NAME;
}

StartupAssets ensureStartupAssets(const AppConfig& config, media::IMediaFetcher& fetcher) {
    StartupAssets assets;
    assets.startupVideo =
        std::filesystem::path(config.mediaPath) / DaemonConstants::STARTUP_VIDEO_NAME;

    if (!nonEmptyFile(assets.startupVideo)) {
        if (config.startupVideoUrl.empty()) {
            assets.errorCode = ErrorCode::VALIDATION_FILE_NOT_FOUND;
            assets.errorMessage = assets.startupVideo.string() +
                                  " is missing and startupVideoUrl is not set";
            return assets;
        }
        auto fetched = fetcher.download(config.startupVideoUrl, assets.startupVideo);
        if (!fetched.ok()) {
            assets.errorCode = fetched.errorCode;
            assets.errorMessage = "cannot fetch startup video: " + fetched.errorMessage;
            return assets;
        }
        LOG_INFO("Startup video stored at {}", assets.startupVideo.string());
    }

    auto font = fontPathFor(config);
    if (nonEmptyFile(font)) {
        assets.fontFile = font;
    } else if (config.fontUrl.empty()) {
        LOG_WARN("No font at {} and fontUrl is not set; using the default overlay font",
                 font.string());
    } else {
        auto fetched = fetcher.download(config.fontUrl, font);
        if (fetched.ok()) {
            assets.fontFile = font;
        } else {
            LOG_WARN("Cannot fetch font from {}: {}", config.fontUrl, fetched.errorMessage);
        }
    }
    return assets;
}

}  // namespace prerender::daemon_app
