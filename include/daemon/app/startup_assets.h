#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "media/media_fetcher.h"

#include <filesystem>
#include <string>

namespace prerender::daemon_app {

struct StartupAssets {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::filesystem::path startupVideo;
    std::filesystem::path fontFile;  // empty when unavailable

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

std::filesystem::path fontPathFor(const AppConfig& config);

// Makes sure <mediaPath>/startup.flv and the overlay font exist, fetching
// what is missing. A missing startup clip without a URL is
// VALIDATION_FILE_NOT_FOUND and a failed download returns the fetch error;
// the caller treats both as fatal. No font only disables the overlay font.
StartupAssets ensureStartupAssets(const AppConfig& config, media::IMediaFetcher& fetcher);

}  // namespace prerender::daemon_app
