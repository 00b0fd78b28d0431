#pragma once

#include "core/error_codes.h"
#include "media/media_probe.h"
#include "queue/segment.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace prerender::queue {

// A file recovery could not restore, and what was wrong with it.
struct RecoveryIssue {
    std::string fileName;
    ErrorCode errorCode = ErrorCode::OK;
};

struct RecoveryResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::vector<Segment> segments;  // oldest first, numbered from 1
    std::size_t corruptDeleted = 0;
    std::size_t partialsDeleted = 0;
    std::vector<RecoveryIssue> issues;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

// Rebuilds queue state from the media directory after a restart. Segments
// are ordered by modification time, then by name, so scanning the same
// directory twice yields the same queue.
class RecoveryScanner {
   public:
    RecoveryScanner(std::filesystem::path mediaDir, media::IMediaProbe& probe,
                    std::chrono::seconds stalePartialAge = std::chrono::hours(1));

    // STORAGE_UNAVAILABLE if the directory cannot be listed. Segment files
    // that fail to probe are deleted. Leftover partial commits older than
    // stalePartialAge are deleted too; younger ones may belong to another
    // instance still copying.
    RecoveryResult scan(Clock::time_point now = Clock::now());

   private:
    std::filesystem::path mediaDir_;
    media::IMediaProbe& probe_;
    std::chrono::seconds stalePartialAge_;
};

// Modification time of a file as a wall-clock time point.
bool fileModificationTime(const std::filesystem::path& path, Clock::time_point& out);

}  // namespace prerender::queue
