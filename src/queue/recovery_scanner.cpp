#include "queue/recovery_scanner.h"

#include "logging/logger.h"
#include "queue/segment_naming.h"

#include <algorithm>
#include <sys/stat.h>
#include <system_error>

namespace prerender::queue {

bool fileModificationTime(const std::filesystem::path& path, Clock::time_point& out) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    auto since = std::chrono::seconds(st.st_mtim.tv_sec) +
                 std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    out = Clock::time_point(std::chrono::duration_cast<Clock::duration>(since));
    return true;
}

RecoveryScanner::RecoveryScanner(std::filesystem::path mediaDir, media::IMediaProbe& probe,
                                 std::chrono::seconds stalePartialAge)
    : mediaDir_(std::move(mediaDir)), probe_(probe), stalePartialAge_(stalePartialAge) {}

RecoveryResult RecoveryScanner::scan(Clock::time_point now) {
    RecoveryResult result;

    std::error_code ec;
    std::filesystem::directory_iterator it(mediaDir_, ec);
    if (ec) {
        result.errorCode = ErrorCode::STORAGE_UNAVAILABLE;
        result.errorMessage = "cannot list " + mediaDir_.string() + ": " + ec.message();
        return result;
    }

    struct Candidate {
        std::filesystem::path path;
        Clock::time_point mtime;
    };
    std::vector<Candidate> candidates;

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        Clock::time_point mtime;
        if (!fileModificationTime(entry.path(), mtime)) {
            continue;
        }
        if (isPartialFileName(name)) {
            if (now - mtime >= stalePartialAge_) {
                std::filesystem::remove(entry.path(), ec);
                if (!ec) {
                    ++result.partialsDeleted;
                    LOG_INFO("Recovery: removed stale partial {}", name);
                }
            }
            continue;
        }
        if (isSegmentFileName(name)) {
            candidates.push_back({entry.path(), mtime});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.mtime != b.mtime) {
            return a.mtime < b.mtime;
        }
        return a.path.filename() < b.path.filename();
    });

    std::uint64_t sequence = 1;
    for (const auto& candidate : candidates) {
        auto probe = probe_.probe(candidate.path);
        if (!probe.ok()) {
            RecoveryIssue issue{candidate.path.filename().string(),
                                ErrorCode::RECOVERY_CORRUPT_FILE};
            LOG_WARN("Recovery: [{}] deleting unreadable segment {} ({})",
                     errorCodeToString(issue.errorCode), issue.fileName, probe.errorMessage);
            result.issues.push_back(std::move(issue));
            std::filesystem::remove(candidate.path, ec);
            if (ec && ec != std::errc::no_such_file_or_directory) {
                LOG_ERROR("Recovery: cannot delete {}: {}", candidate.path.string(),
                          ec.message());
            }
            ++result.corruptDeleted;
            continue;
        }
        Segment segment;
        segment.sequenceNumber = sequence++;
        segment.filePath = candidate.path;
        segment.durationSeconds = probe.durationSeconds;
        segment.committedAt = candidate.mtime;
        segment.sizeBytes = std::filesystem::file_size(candidate.path, ec);
        if (ec) {
            segment.sizeBytes = 0;
        }
        result.segments.push_back(std::move(segment));
    }

    LOG_INFO("Recovery: {} segments restored, {} corrupt deleted", result.segments.size(),
             result.corruptDeleted);
    return result;
}

}  // namespace prerender::queue
