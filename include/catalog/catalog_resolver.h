#pragma once

#include "catalog/track_reference.h"
#include "core/error_codes.h"

#include <filesystem>
#include <string>
#include <vector>

namespace prerender::media {
class IMediaFetcher;
}

namespace prerender::catalog {

struct CatalogResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    Catalog catalog;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

// Parses a newline-separated URI list. Blank lines and '#' comments are
// skipped; entries whose extension is not allowed are dropped.
Catalog parseCatalog(const std::string& text, const std::vector<std::string>& allowedExtensions,
                     const std::string& sourceUrl = std::string());

// Downloads the playlist source and turns it into a Catalog.
class CatalogResolver {
   public:
    CatalogResolver(media::IMediaFetcher& fetcher, std::vector<std::string> allowedExtensions,
                    std::filesystem::path scratchDir);

    // CATALOG_SOURCE_UNREADABLE if the source cannot be fetched or read,
    // CATALOG_EMPTY if nothing playable survives filtering.
    CatalogResult resolve(const std::string& sourceUrl);

   private:
    media::IMediaFetcher& fetcher_;
    std::vector<std::string> allowedExtensions_;
    std::filesystem::path scratchDir_;
};

}  // namespace prerender::catalog
