#include "daemon/metrics/runtime_stats.h"

#include "core/atomic_file.h"
#include "queue/queue_state.h"

#include <atomic>
#include <chrono>
#include <cstring>

namespace prerender::runtime_stats {

namespace {

std::atomic<std::size_t> s_commits{0};
std::atomic<double> s_renderedSeconds{0.0};
std::atomic<double> s_lastSpeed{0.0};
std::atomic<std::size_t> s_trackFailures{0};
std::atomic<std::size_t> s_rejected{0};
std::atomic<std::size_t> s_fetchFailures{0};
std::atomic<std::size_t> s_renderFailures{0};
std::atomic<std::size_t> s_ageEvictions{0};
std::atomic<std::size_t> s_diskEvictions{0};
std::atomic<std::uint64_t> s_evictedBytes{0};
std::atomic<std::size_t> s_swept{0};
std::atomic<std::size_t> s_recovered{0};
std::atomic<std::size_t> s_corruptDeleted{0};

void addDouble(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta, std::memory_order_relaxed,
                                         std::memory_order_relaxed)) {}
}

std::int64_t unixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

void reset() {
    s_commits.store(0);
    s_renderedSeconds.store(0.0);
    s_lastSpeed.store(0.0);
    s_trackFailures.store(0);
    s_rejected.store(0);
    s_fetchFailures.store(0);
    s_renderFailures.store(0);
    s_ageEvictions.store(0);
    s_diskEvictions.store(0);
    s_evictedBytes.store(0);
    s_swept.store(0);
    s_recovered.store(0);
    s_corruptDeleted.store(0);
}

void recordCommit(double durationSeconds, double achievedSpeed) {
    s_commits.fetch_add(1, std::memory_order_relaxed);
    addDouble(s_renderedSeconds, durationSeconds);
    s_lastSpeed.store(achievedSpeed, std::memory_order_relaxed);
}

void recordTrackFailure(ErrorCode code) {
    s_trackFailures.fetch_add(1, std::memory_order_relaxed);
    if (code == ErrorCode::RENDER_TRACK_REJECTED) {
        s_rejected.fetch_add(1, std::memory_order_relaxed);
    } else if (isFetchError(code)) {
        s_fetchFailures.fetch_add(1, std::memory_order_relaxed);
    } else if (isRenderError(code)) {
        s_renderFailures.fetch_add(1, std::memory_order_relaxed);
    }
}

void recordEviction(const char* policy, std::size_t segments, std::uint64_t bytes) {
    if (std::strcmp(policy, "age") == 0) {
        s_ageEvictions.fetch_add(segments, std::memory_order_relaxed);
    } else {
        s_diskEvictions.fetch_add(segments, std::memory_order_relaxed);
    }
    s_evictedBytes.fetch_add(bytes, std::memory_order_relaxed);
}

void recordSweep(std::size_t entries) {
    s_swept.fetch_add(entries, std::memory_order_relaxed);
}

void recordRecovery(std::size_t restored, std::size_t corruptDeleted) {
    s_recovered.store(restored, std::memory_order_relaxed);
    s_corruptDeleted.store(corruptDeleted, std::memory_order_relaxed);
}

std::size_t commitCount() {
    return s_commits.load(std::memory_order_relaxed);
}

double renderedSeconds() {
    return s_renderedSeconds.load(std::memory_order_relaxed);
}

double lastAchievedSpeed() {
    return s_lastSpeed.load(std::memory_order_relaxed);
}

std::size_t trackFailures() {
    return s_trackFailures.load(std::memory_order_relaxed);
}

std::size_t rejectedTracks() {
    return s_rejected.load(std::memory_order_relaxed);
}

std::size_t ageEvictions() {
    return s_ageEvictions.load(std::memory_order_relaxed);
}

std::size_t diskEvictions() {
    return s_diskEvictions.load(std::memory_order_relaxed);
}

std::size_t sweptEntries() {
    return s_swept.load(std::memory_order_relaxed);
}

nlohmann::json collect(const Dependencies& deps) {
    nlohmann::json stats;
    stats["timestamp"] = unixSeconds();
    stats["instance_id"] = deps.instanceId;
    stats["catalog_entries"] = deps.catalogEntries;

    nlohmann::json queue;
    queue["segments"] = deps.queue ? deps.queue->size() : 0;
    queue["buffered_seconds"] = deps.queue ? deps.queue->bufferedDurationSeconds() : 0.0;
    queue["storage_bytes"] = deps.queue ? deps.queue->storageBytes() : 0;
    queue["gas_tank_limit_seconds"] = deps.config ? deps.config->gasTankLimitSeconds : 0.0;
    stats["queue"] = queue;

    nlohmann::json render;
    render["commits"] = commitCount();
    render["rendered_seconds"] = renderedSeconds();
    render["last_speed"] = lastAchievedSpeed();
    render["target_speed"] = deps.config ? deps.config->targetSpeedMultiplier : 0.0;
    render["track_failures"] = trackFailures();
    render["rejected"] = rejectedTracks();
    render["fetch_failures"] = s_fetchFailures.load(std::memory_order_relaxed);
    render["render_failures"] = s_renderFailures.load(std::memory_order_relaxed);
    stats["render"] = render;

    nlohmann::json eviction;
    eviction["age_segments"] = ageEvictions();
    eviction["disk_segments"] = diskEvictions();
    eviction["freed_bytes"] = s_evictedBytes.load(std::memory_order_relaxed);
    eviction["swept_entries"] = sweptEntries();
    stats["eviction"] = eviction;

    nlohmann::json recovery;
    recovery["restored"] = s_recovered.load(std::memory_order_relaxed);
    recovery["corrupt_deleted"] = s_corruptDeleted.load(std::memory_order_relaxed);
    stats["recovery"] = recovery;

    return stats;
}

bool writeStatsFile(const Dependencies& deps, const std::string& path) {
    std::string error;
    return atomic_file::replace(path, collect(deps).dump(2) + "\n", error);
}

}  // namespace prerender::runtime_stats
