#include "media/media_fetcher.h"

#include "logging/logger.h"

#include <cctype>
#include <system_error>

namespace prerender::media {

namespace {

// curl exit code for an HTTP status >= 400 with --fail.
constexpr int CURL_HTTP_RETURNED_ERROR = 22;
// Local file:// path that does not exist.
constexpr int CURL_FILE_COULDNT_READ_FILE = 37;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

}  // namespace

std::string encodeUri(const std::string& uri) {
    static const char* kHex = "0123456789ABCDEF";
    static const std::string kSafe = ":/?#[]@!$&'()*+,;=-._~%";
    std::string out;
    out.reserve(uri.size());
    for (unsigned char c : uri) {
        if (std::isalnum(c) || kSafe.find(static_cast<char>(c)) != std::string::npos) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string localNameFor(const std::string& uri) {
    std::string path = uri;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }
    auto slash = path.find_last_of('/');
    std::string name = percentDecode(slash == std::string::npos ? path : path.substr(slash + 1));
    for (auto& c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '-' && c != '_') {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..") {
        name = "download";
    }
    return name;
}

CurlMediaFetcher::CurlMediaFetcher(IProcessRunner& runner, std::string curlPath,
                                   std::filesystem::path scratchDir)
    : runner_(runner), curlPath_(std::move(curlPath)), scratchDir_(std::move(scratchDir)) {}

FetchResult CurlMediaFetcher::fetch(const catalog::TrackReference& track) {
    return download(track.uri, scratchDir_ / localNameFor(track.uri));
}

FetchResult CurlMediaFetcher::download(const std::string& url,
                                       const std::filesystem::path& dest) {
    FetchResult result;
    result.localPath = dest;

    std::error_code ec;
    if (dest.has_parent_path()) {
        std::filesystem::create_directories(dest.parent_path(), ec);
    }

    LOG_INFO("Downloading {}", url);
    auto proc = runner_.run({curlPath_, "--fail", "--silent", "--show-error", "--location",
                             "--output", dest.string(), encodeUri(url)});
    if (!proc.spawned) {
        result.errorCode = ErrorCode::FETCH_NETWORK;
        result.errorMessage = "cannot run " + curlPath_;
        return result;
    }
    if (proc.exitCode != 0) {
        std::filesystem::remove(dest, ec);
        result.errorCode = (proc.exitCode == CURL_HTTP_RETURNED_ERROR ||
                            proc.exitCode == CURL_FILE_COULDNT_READ_FILE)
                               ? ErrorCode::FETCH_NOT_FOUND
                               : ErrorCode::FETCH_NETWORK;
        result.errorMessage = "curl exited with " + std::to_string(proc.exitCode) + ": " +
                              proc.output;
        return result;
    }
    if (!std::filesystem::exists(dest, ec)) {
        result.errorCode = ErrorCode::FETCH_NETWORK;
        result.errorMessage = "curl reported success but " + dest.string() + " is missing";
        return result;
    }
    return result;
}

}  // namespace prerender::media
