#include "eviction/eviction_manager.h"

#include "logging/logger.h"

#include <fstream>
#include <spdlog/sinks/rotating_file_sink.h>

namespace prerender::eviction {

namespace {

// First path component of target below base, or empty if target is not
// strictly inside base.
std::string firstComponentInside(const std::filesystem::path& base,
                                 const std::filesystem::path& target) {
    std::error_code ec;
    auto b = std::filesystem::weakly_canonical(base, ec);
    if (ec) {
        return std::string();
    }
    auto t = std::filesystem::weakly_canonical(target, ec);
    if (ec) {
        return std::string();
    }
    auto rel = t.lexically_relative(b);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return std::string();
    }
    return rel.begin()->string();
}

bool sameDirectory(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    auto ca = std::filesystem::weakly_canonical(a, ec);
    if (ec) {
        return false;
    }
    auto cb = std::filesystem::weakly_canonical(b, ec);
    return !ec && ca == cb;
}

}  // namespace

const char* policyName(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::Age:
            return "age";
        case EvictionPolicy::DiskQuota:
            return "disk";
        case EvictionPolicy::WorkingDirectory:
            return "sweep";
    }
    return "unknown";
}

bool removeIfPresent(const std::filesystem::path& path, std::error_code& ec) {
    std::filesystem::remove(path, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        ec.clear();
    }
    return !ec;
}

EvictionManager::EvictionManager(const AppConfig& config, queue::QueueState& queue,
                                 IStorageProbe& storage,
                                 std::vector<std::string> extraProtectedNames)
    : config_(config),
      queue_(queue),
      storage_(storage),
      extraProtectedNames_(std::move(extraProtectedNames)) {}

bool EvictionManager::evictSegment(const queue::Segment& segment, EvictionReport& report) {
    std::error_code ec;
    if (!removeIfPresent(segment.filePath, ec)) {
        report.errorCode = ErrorCode::EVICTION_IO;
        report.errorMessage = "cannot delete " + segment.filePath.string() + ": " + ec.message();
        LOG_ERROR("Eviction ({}): {}", policyName(report.policy), report.errorMessage);
        return false;
    }
    queue_.remove(segment.sequenceNumber);
    report.evictedSequenceNumbers.push_back(segment.sequenceNumber);
    report.evictedFileNames.push_back(segment.filePath.filename().string());
    report.freedBytes += segment.sizeBytes;
    return true;
}

EvictionReport EvictionManager::runAgePolicy(queue::Clock::time_point now) {
    EvictionReport report;
    report.policy = EvictionPolicy::Age;
    queue_.reconcile();

    auto maxAge = std::chrono::duration<double>(config_.maxSegmentAgeSeconds);
    for (const auto& segment : queue_.snapshot()) {
        if (now - segment.committedAt < maxAge) {
            continue;
        }
        LOG_INFO("Evicting {} (older than {:.0f}s)", segment.filePath.filename().string(),
                 config_.maxSegmentAgeSeconds);
        if (!evictSegment(segment, report)) {
            break;
        }
    }
    return report;
}

EvictionReport EvictionManager::runDiskQuotaPolicy() {
    EvictionReport report;
    report.policy = EvictionPolicy::DiskQuota;
    queue_.reconcile();

    auto usage = storage_.usage(config_.mediaPath);
    while (true) {
        if (!usage) {
            report.errorCode = ErrorCode::EVICTION_IO;
            report.errorMessage = "cannot query storage usage of " + config_.mediaPath;
            return report;
        }
        report.utilizationAfter = usage->utilization();
        if (report.utilizationAfter < config_.diskUsageThreshold) {
            break;
        }
        auto oldest = queue_.oldest();
        if (!oldest) {
            report.quotaExhausted = true;
            LOG_WARN("Disk usage {:.1f}% >= {:.1f}% with no segments left to evict",
                     report.utilizationAfter * 100.0, config_.diskUsageThreshold * 100.0);
            break;
        }
        LOG_INFO("Evicting {} to free disk ({:.1f}% used)", oldest->filePath.filename().string(),
                 report.utilizationAfter * 100.0);
        if (!evictSegment(*oldest, report)) {
            return report;
        }
        usage = storage_.usage(config_.mediaPath);
    }
    return report;
}

std::set<std::string> EvictionManager::sweepAllowList() const {
    std::set<std::string> names;
    std::filesystem::path manifest(config_.manifestPath);
    if (manifest.is_relative()) {
        manifest = std::filesystem::path(config_.workingDirectory) / manifest;
    }
    std::ifstream in(manifest);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            names.insert(line);
        }
    }

    names.insert(std::filesystem::path(config_.manifestPath).filename().string());
    names.insert(DaemonConstants::FONT_FILE_NAME);
    names.insert(DEFAULT_CONFIG_FILE);
    if (!config_.pidFilePath.empty()) {
        names.insert(std::filesystem::path(config_.pidFilePath).filename().string());
    }
    if (!config_.statsFilePath.empty()) {
        names.insert(std::filesystem::path(config_.statsFilePath).filename().string());
        names.insert(std::filesystem::path(config_.statsFilePath).filename().string() + ".tmp");
    }
    if (!config_.logging.filePath.empty()) {
        // The live log and the backups the rotating sink renames it to.
        const auto& logPath = config_.logging.filePath;
        for (std::size_t index = 0; index <= config_.logging.maxBackups; ++index) {
            auto inside = firstComponentInside(
                config_.workingDirectory,
                spdlog::sinks::rotating_file_sink_mt::calc_filename(logPath, index));
            if (!inside.empty()) {
                names.insert(inside);
            }
        }
    }
    for (const auto* dir : {&config_.tempPath, &config_.mediaPath}) {
        auto inside = firstComponentInside(config_.workingDirectory, *dir);
        if (!inside.empty()) {
            names.insert(inside);
        }
    }
    for (const auto& extra : extraProtectedNames_) {
        if (!extra.empty()) {
            names.insert(extra);
        }
    }
    return names;
}

EvictionReport EvictionManager::runWorkingDirectorySweep() {
    EvictionReport report;
    report.policy = EvictionPolicy::WorkingDirectory;

    std::filesystem::path manifest(config_.manifestPath);
    if (manifest.is_relative()) {
        manifest = std::filesystem::path(config_.workingDirectory) / manifest;
    }
    std::error_code ec;
    if (!std::filesystem::exists(manifest, ec)) {
        LOG_ONCE(WARN, "No manifest at {}; working-directory sweep disabled", manifest.string());
        return report;
    }
    if (sameDirectory(config_.workingDirectory, config_.mediaPath)) {
        LOG_ONCE(WARN, "Working directory is the media directory; sweep disabled");
        return report;
    }

    auto allowed = sweepAllowList();
    std::filesystem::directory_iterator it(config_.workingDirectory, ec);
    if (ec) {
        report.errorCode = ErrorCode::EVICTION_IO;
        report.errorMessage = "cannot list " + config_.workingDirectory + ": " + ec.message();
        return report;
    }
    std::vector<std::filesystem::path> doomed;
    for (const auto& entry : it) {
        if (allowed.count(entry.path().filename().string()) == 0) {
            doomed.push_back(entry.path());
        }
    }
    for (const auto& path : doomed) {
        LOG_INFO("Removing errant file: {}", path.filename().string());
        std::filesystem::remove_all(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            report.errorCode = ErrorCode::EVICTION_IO;
            report.errorMessage = "cannot remove " + path.string() + ": " + ec.message();
            LOG_ERROR("Sweep: {}", report.errorMessage);
            return report;
        }
        ++report.sweptEntries;
    }
    return report;
}

}  // namespace prerender::eviction
