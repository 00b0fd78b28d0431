#include "queue/segment_naming.h"

#include "core/daemon_constants.h"

#include <cinttypes>
#include <cstdio>
#include <random>

namespace prerender::queue {

namespace {

constexpr const char* PARTIAL_SUFFIX = ".partial";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string makeInstanceId() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016" PRIx64, gen());
    return buf;
}

std::string makeSegmentFileName(const std::string& instanceId, std::uint64_t sequenceNumber,
                                Clock::time_point committedAt) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  committedAt.time_since_epoch())
                  .count();
    return std::string(DaemonConstants::SEGMENT_PREFIX) + std::to_string(ms) + "-" + instanceId +
           "-" + std::to_string(sequenceNumber) + DaemonConstants::SEGMENT_EXTENSION;
}

bool isSegmentFileName(const std::string& fileName) {
    const std::string prefix = DaemonConstants::SEGMENT_PREFIX;
    const std::string ext = DaemonConstants::SEGMENT_EXTENSION;
    return fileName.size() > prefix.size() + ext.size() &&
           fileName.compare(0, prefix.size(), prefix) == 0 && endsWith(fileName, ext);
}

std::string partialFileName(const std::string& segmentFileName) {
    return segmentFileName + PARTIAL_SUFFIX;
}

bool isPartialFileName(const std::string& fileName) {
    return endsWith(fileName, PARTIAL_SUFFIX) &&
           isSegmentFileName(fileName.substr(0, fileName.size() - std::string(PARTIAL_SUFFIX).size()));
}

}  // namespace prerender::queue
