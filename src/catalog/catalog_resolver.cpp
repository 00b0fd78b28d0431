#include "catalog/catalog_resolver.h"

#include "core/config_loader.h"
#include "logging/logger.h"
#include "media/media_fetcher.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace prerender::catalog {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

}  // namespace

Catalog parseCatalog(const std::string& text, const std::vector<std::string>& allowedExtensions,
                     const std::string& sourceUrl) {
    Catalog catalog;
    catalog.sourceUrl = sourceUrl;

    std::istringstream stream(text);
    std::string line;
    size_t skipped = 0;
    while (std::getline(stream, line)) {
        std::string uri = trim(line);
        if (uri.empty() || uri[0] == '#') {
            continue;
        }
        std::string ext = extensionOf(uri);
        bool allowed = !ext.empty() && std::find(allowedExtensions.begin(),
                                                 allowedExtensions.end(),
                                                 ext) != allowedExtensions.end();
        if (!allowed) {
            ++skipped;
            LOG_DEBUG("Catalog: skipping {} (extension '{}' not allowed)", uri, ext);
            continue;
        }
        catalog.entries.push_back(TrackReference{uri, ext, std::nullopt});
    }
    if (skipped > 0) {
        LOG_INFO("Catalog: {} entries filtered by extension", skipped);
    }
    return catalog;
}

CatalogResolver::CatalogResolver(media::IMediaFetcher& fetcher,
                                 std::vector<std::string> allowedExtensions,
                                 std::filesystem::path scratchDir)
    : fetcher_(fetcher),
      allowedExtensions_(std::move(allowedExtensions)),
      scratchDir_(std::move(scratchDir)) {
    for (auto& ext : allowedExtensions_) {
        ext = normalizeExtension(ext);
    }
}

CatalogResult CatalogResolver::resolve(const std::string& sourceUrl) {
    CatalogResult result;
    if (sourceUrl.empty()) {
        result.errorCode = ErrorCode::CATALOG_SOURCE_UNREADABLE;
        result.errorMessage = "playlist source URL is not configured";
        return result;
    }

    std::filesystem::path listPath = scratchDir_ / "catalog.txt";
    auto fetched = fetcher_.download(sourceUrl, listPath);
    if (!fetched.ok()) {
        result.errorCode = ErrorCode::CATALOG_SOURCE_UNREADABLE;
        result.errorMessage = "cannot fetch playlist source " + sourceUrl + ": " +
                              fetched.errorMessage;
        return result;
    }

    std::ifstream file(listPath);
    if (!file) {
        result.errorCode = ErrorCode::CATALOG_SOURCE_UNREADABLE;
        result.errorMessage = "cannot read downloaded playlist " + listPath.string();
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();
    std::error_code ec;
    std::filesystem::remove(listPath, ec);

    result.catalog = parseCatalog(buffer.str(), allowedExtensions_, sourceUrl);
    if (result.catalog.empty()) {
        result.errorCode = ErrorCode::CATALOG_EMPTY;
        result.errorMessage = "no playable entries in " + sourceUrl;
        return result;
    }
    LOG_INFO("Catalog resolved: {} entries from {}", result.catalog.size(), sourceUrl);
    return result;
}

}  // namespace prerender::catalog
