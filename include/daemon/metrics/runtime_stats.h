#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace prerender::queue {
class QueueState;
}

namespace prerender::runtime_stats {

struct Dependencies {
    const AppConfig* config = nullptr;
    const queue::QueueState* queue = nullptr;
    std::string instanceId;
    std::size_t catalogEntries = 0;
};

void reset();

void recordCommit(double durationSeconds, double achievedSpeed);
void recordTrackFailure(ErrorCode code);
void recordEviction(const char* policy, std::size_t segments, std::uint64_t bytes);
void recordSweep(std::size_t entries);
void recordRecovery(std::size_t restored, std::size_t corruptDeleted);

std::size_t commitCount();
double renderedSeconds();
double lastAchievedSpeed();
std::size_t trackFailures();
std::size_t rejectedTracks();
std::size_t ageEvictions();
std::size_t diskEvictions();
std::size_t sweptEntries();

nlohmann::json collect(const Dependencies& deps);
bool writeStatsFile(const Dependencies& deps, const std::string& path);

}  // namespace prerender::runtime_stats
