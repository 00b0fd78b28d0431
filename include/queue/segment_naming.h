#pragma once

#include "queue/segment.h"

#include <cstdint>
#include <string>

namespace prerender::queue {

// Random 16 hex digit tag, fixed for the life of a process. Keeps file
// names unique when several instances share one media directory.
std::string makeInstanceId();

// media-<unix ms>-<instance>-<sequence>.flv
std::string makeSegmentFileName(const std::string& instanceId, std::uint64_t sequenceNumber,
                                Clock::time_point committedAt);

// True for names produced by makeSegmentFileName (any instance).
bool isSegmentFileName(const std::string& fileName);

// Commit in progress; never a segment.
std::string partialFileName(const std::string& segmentFileName);
bool isPartialFileName(const std::string& fileName);

}  // namespace prerender::queue
