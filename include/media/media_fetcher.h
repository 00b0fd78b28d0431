#pragma once

#include "catalog/track_reference.h"
#include "core/error_codes.h"
#include "media/process_runner.h"

#include <filesystem>
#include <string>

namespace prerender::media {

struct FetchResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::filesystem::path localPath;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

class IMediaFetcher {
   public:
    virtual ~IMediaFetcher() = default;

    // Fetches a catalog entry into the scratch directory. For an archive
    // reference the archive itself is returned; extraction is separate.
    virtual FetchResult fetch(const catalog::TrackReference& track) = 0;

    // Downloads an arbitrary URL to dest (catalog source, font, startup clip).
    virtual FetchResult download(const std::string& url, const std::filesystem::path& dest) = 0;
};

// curl-backed fetcher. HTTP errors map to FETCH_NOT_FOUND, everything else
// to FETCH_NETWORK.
class CurlMediaFetcher : public IMediaFetcher {
   public:
    CurlMediaFetcher(IProcessRunner& runner, std::string curlPath,
                     std::filesystem::path scratchDir);

    FetchResult fetch(const catalog::TrackReference& track) override;
    FetchResult download(const std::string& url, const std::filesystem::path& dest) override;

   private:
    IProcessRunner& runner_;
    std::string curlPath_;
    std::filesystem::path scratchDir_;
};

// Percent-encodes characters outside the URI reserved/unreserved sets
// (spaces, non-ASCII bytes) while leaving existing escapes alone.
std::string encodeUri(const std::string& uri);

// Local file name for a fetched URI: decoded last path component with
// anything outside [A-Za-z0-9._-] replaced by '_'.
std::string localNameFor(const std::string& uri);

}  // namespace prerender::media
