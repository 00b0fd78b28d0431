#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace prerender::queue {

using Clock = std::chrono::system_clock;

// A committed, playable media file. Immutable once committed.
struct Segment {
    std::uint64_t sequenceNumber = 0;
    std::filesystem::path filePath;
    double durationSeconds = 0.0;
    Clock::time_point committedAt{};
    std::uint64_t sizeBytes = 0;
};

}  // namespace prerender::queue
