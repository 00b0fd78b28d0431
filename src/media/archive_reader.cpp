#include "media/archive_reader.h"

#include "logging/logger.h"

#include <sstream>
#include <system_error>

namespace prerender::media {

std::string escapeUnzipPattern(const std::string& entry) {
    std::string out;
    out.reserve(entry.size());
    for (char c : entry) {
        if (c == '[' || c == ']' || c == '*' || c == '?' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

UnzipArchiveReader::UnzipArchiveReader(IProcessRunner& runner, std::string unzipPath)
    : runner_(runner), unzipPath_(std::move(unzipPath)) {}

ArchiveListing UnzipArchiveReader::list(const std::filesystem::path& archive) {
    ArchiveListing listing;
    auto proc = runner_.run({unzipPath_, "-Z1", archive.string()});
    if (!proc.ok()) {
        listing.errorCode = ErrorCode::FETCH_ARCHIVE;
        listing.errorMessage = "cannot list " + archive.string() + ": " + proc.output;
        return listing;
    }
    std::istringstream stream(proc.standardOutput);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            listing.entries.push_back(line);
        }
    }
    LOG_DEBUG("{} contains {} entries", archive.filename().string(), listing.entries.size());
    return listing;
}

ExtractResult UnzipArchiveReader::extract(const std::filesystem::path& archive,
                                          const std::string& entry,
                                          const std::filesystem::path& destDir) {
    ExtractResult result;
    std::error_code ec;
    std::filesystem::create_directories(destDir, ec);

    auto proc = runner_.run({unzipPath_, "-o", "-j", "-qq", archive.string(),
                             escapeUnzipPattern(entry), "-d", destDir.string()});
    if (!proc.ok()) {
        result.errorCode = ErrorCode::FETCH_ARCHIVE;
        result.errorMessage = "cannot extract " + entry + " from " + archive.string() + ": " +
                              proc.output;
        return result;
    }

    auto slash = entry.find_last_of('/');
    result.localPath = destDir / (slash == std::string::npos ? entry : entry.substr(slash + 1));
    if (!std::filesystem::exists(result.localPath, ec)) {
        result.errorCode = ErrorCode::FETCH_ARCHIVE;
        result.errorMessage = "extracted entry missing: " + result.localPath.string();
    }
    return result;
}

}  // namespace prerender::media
