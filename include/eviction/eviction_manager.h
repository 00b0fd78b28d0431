#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "eviction/storage_probe.h"
#include "queue/queue_state.h"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace prerender::eviction {

enum class EvictionPolicy { Age, DiskQuota, WorkingDirectory };

const char* policyName(EvictionPolicy policy);

struct EvictionReport {
    EvictionPolicy policy = EvictionPolicy::Age;
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::vector<std::uint64_t> evictedSequenceNumbers;
    std::vector<std::string> evictedFileNames;
    std::uint64_t freedBytes = 0;
    std::size_t sweptEntries = 0;  // working-directory sweep only
    bool quotaExhausted = false;   // over threshold with nothing left to evict
    double utilizationAfter = 0.0;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

// Deletes committed segments and stray working-directory files. Every
// pass starts by reconciling the queue against the disk, and a file that
// is already gone counts as deleted.
class EvictionManager {
   public:
    EvictionManager(const AppConfig& config, queue::QueueState& queue, IStorageProbe& storage,
                    std::vector<std::string> extraProtectedNames = {});

    // Segments with now - committedAt >= maxSegmentAgeSeconds.
    EvictionReport runAgePolicy(queue::Clock::time_point now);

    // Oldest first while utilisation >= diskUsageThreshold. EVICTION_IO if
    // the filesystem cannot be queried.
    EvictionReport runDiskQuotaPolicy();

    // Removes every working-directory entry not on the allow-list. Skipped
    // when the manifest is missing or the working directory holds the media.
    EvictionReport runWorkingDirectorySweep();

    // Manifest lines plus the daemon's own files.
    std::set<std::string> sweepAllowList() const;

   private:
    // False (with errorCode set) only for a real I/O failure.
    bool evictSegment(const queue::Segment& segment, EvictionReport& report);

    const AppConfig& config_;
    queue::QueueState& queue_;
    IStorageProbe& storage_;
    std::vector<std::string> extraProtectedNames_;
};

// remove(), treating "already gone" as success.
bool removeIfPresent(const std::filesystem::path& path, std::error_code& ec);

}  // namespace prerender::eviction
