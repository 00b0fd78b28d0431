#pragma once

#include "core/error_codes.h"
#include "media/process_runner.h"

#include <filesystem>
#include <string>
#include <vector>

namespace prerender::media {

struct ArchiveListing {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::vector<std::string> entries;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

struct ExtractResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::filesystem::path localPath;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

class IArchiveReader {
   public:
    virtual ~IArchiveReader() = default;
    virtual ArchiveListing list(const std::filesystem::path& archive) = 0;
    // Extracts one entry (path components dropped) into destDir.
    virtual ExtractResult extract(const std::filesystem::path& archive, const std::string& entry,
                                  const std::filesystem::path& destDir) = 0;
};

// Zip archives via Info-ZIP unzip. Failures are FETCH_ARCHIVE.
class UnzipArchiveReader : public IArchiveReader {
   public:
    UnzipArchiveReader(IProcessRunner& runner, std::string unzipPath);

    ArchiveListing list(const std::filesystem::path& archive) override;
    ExtractResult extract(const std::filesystem::path& archive, const std::string& entry,
                          const std::filesystem::path& destDir) override;

   private:
    IProcessRunner& runner_;
    std::string unzipPath_;
};

// Escapes unzip wildcard characters so an entry name matches literally.
std::string escapeUnzipPattern(const std::string& entry);

}  // namespace prerender::media
