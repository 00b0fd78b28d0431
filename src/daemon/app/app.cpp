#include "daemon/app/app.h"

#include "catalog/catalog_resolver.h"
#include "catalog/track_selector.h"
#include "daemon/app/startup_assets.h"
#include "daemon/core/instance_lock.h"
#include "daemon/metrics/runtime_stats.h"
#include "daemon/render_loop.h"
#include "daemon/shutdown_manager.h"
#include "eviction/eviction_manager.h"
#include "eviction/eviction_scheduler.h"
#include "eviction/storage_probe.h"
#include "logging/logger.h"
#include "media/archive_reader.h"
#include "media/media_fetcher.h"
#include "media/media_probe.h"
#include "media/process_runner.h"
#include "media/render_adapter.h"
#include "playlist/playlist_writer.h"
#include "queue/queue_state.h"
#include "queue/recovery_scanner.h"
#include "queue/segment_naming.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace prerender::daemon_app {

namespace {

constexpr auto SLEEP_SLICE = std::chrono::milliseconds(250);

ErrorCode loadRuntimeConfig(RuntimeState& state, const std::string& configPath) {
    AppConfig config;
    if (!loadAppConfig(configPath, config)) {
        LOG_WARN("Continuing with defaults and environment overrides");
    }
    std::string error;
    if (!applyEnvOverrides(config, error)) {
        LOG_ERROR("Invalid environment override: {}", error);
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
    ErrorCode valid = validateAppConfig(config, error);
    if (valid != ErrorCode::OK) {
        LOG_ERROR("Invalid configuration: {}", error);
        return valid;
    }
    state.config = std::move(config);
    return ErrorCode::OK;
}

ErrorCode ensureDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec || !std::filesystem::is_directory(path, ec)) {
        LOG_CRITICAL("Cannot create directory {}: {}", path, ec.message());
        return ErrorCode::STORAGE_UNAVAILABLE;
    }
    return ErrorCode::OK;
}

std::string resolveInWorkingDirectory(const AppConfig& config, const std::string& path) {
    if (path.empty() || std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return (std::filesystem::path(config.workingDirectory) / path).string();
}

}  // namespace

App::App(RuntimeState& state, std::string configFilePath)
    : state_(state), configFilePath_(std::move(configFilePath)) {}

int App::run(const AppOverrides& overrides) {
    shutdown_manager::ShutdownManager::Dependencies shutdownDeps{&state_.flags.running,
                                                                 &state_.flags.reloadRequested};
    shutdown_manager::ShutdownManager shutdownManager(shutdownDeps);
    shutdownManager.installSignalHandlers();

    if (state_.instanceId.empty()) {
        state_.instanceId = queue::makeInstanceId();
    }

    int exitCode = 0;
    do {
        shutdownManager.reset();
        runtime_stats::reset();
        ++state_.sessions;

        ErrorCode result = runSession(overrides, shutdownManager);
        shutdownManager.runShutdownSequence();
        if (result != ErrorCode::OK) {
            LOG_CRITICAL("Exiting on fatal error {} ({})", errorCodeToString(result),
                         errorCodeToHex(result));
            exitCode = 1;
            break;
        }
        if (state_.flags.reloadRequested) {
            LOG_INFO("Reload requested. Restarting with updated config...");
        }
    } while (state_.flags.reloadRequested);

    LOG_INFO("Goodbye!");
    logging::flush();
    return exitCode;
}

ErrorCode App::runSession(const AppOverrides& overrides,
                          shutdown_manager::ShutdownManager& shutdownManager) {
    ErrorCode configured = loadRuntimeConfig(state_, configFilePath_);
    if (configured != ErrorCode::OK) {
        return configured;
    }
    if (overrides.logLevel) {
        state_.config.logging.level = logging::stringToLevel(*overrides.logLevel);
    }
    const AppConfig& config = state_.config;
    if (!logging::initialize(config.logging, state_.instanceId.substr(0, 8))) {
        logging::initializeEarly();
        LOG_WARN("Falling back to stderr logging");
    }

    LOG_INFO("========================================");
    LOG_INFO("  Pre-render scheduler (instance {}, session {})", state_.instanceId,
             state_.sessions);
    LOG_INFO("========================================");
    LOG_INFO("Media: {}  Temp: {}  Gas tank: {:.0f}s  Target speed: {:.2f}x", config.mediaPath,
             config.tempPath, config.gasTankLimitSeconds, config.targetSpeedMultiplier);

    auto instanceLock = daemon_core::InstanceLock::tryAcquire(
        resolveInWorkingDirectory(config, config.pidFilePath), state_.instanceId);
    if (!instanceLock) {
        return ErrorCode::VALIDATION_INSTANCE_LOCKED;
    }
    LOG_INFO("PID: {} (lock: {})", getpid(), instanceLock->path());

    for (const auto* dir : {&config.mediaPath, &config.tempPath}) {
        ErrorCode ready = ensureDirectory(*dir);
        if (ready != ErrorCode::OK) {
            return ready;
        }
    }
    const std::filesystem::path workDir =
        std::filesystem::path(config.tempPath) / ("work-" + state_.instanceId);

    auto interruptibleSleep = [&](std::chrono::milliseconds duration) {
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (state_.flags.running.load()) {
            shutdownManager.tick();
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline || !state_.flags.running.load()) {
                break;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(SLEEP_SLICE, deadline - now));
        }
    };

    media::PosixProcessRunner processRunner;
    media::CurlMediaFetcher fetcher(processRunner, config.tools.curl, config.tempPath);
    media::UnzipArchiveReader archiveReader(processRunner, config.tools.unzip);
    media::FfprobeMediaProbe probe(processRunner, config.tools.ffprobe);

    auto assets = ensureStartupAssets(config, fetcher);
    if (!assets.ok()) {
        LOG_CRITICAL("Startup assets unavailable: {}", assets.errorMessage);
        return assets.errorCode;
    }

    queue::QueueState queueState;
    queue::RecoveryScanner recovery(config.mediaPath, probe);

    catalog::CatalogResolver resolver(fetcher, config.allowedExtensions, config.tempPath);
    auto resolved = resolver.resolve(config.playlistSourceUrl);
    if (!resolved.ok()) {
        LOG_CRITICAL("Catalog unavailable: {}", resolved.errorMessage);
        return resolved.errorCode;
    }
    const catalog::Catalog trackCatalog = std::move(resolved.catalog);
    catalog::TrackSelector selector(config.allowedExtensions);

    playlist::PlaylistWriter playlistWriter(config.mediaPath, config.playlistRotationEntries);
    media::FfmpegRenderAdapter renderAdapter(config, processRunner, probe, workDir,
                                             assets.fontFile);

    runtime_stats::Dependencies statsDeps;
    statsDeps.config = &config;
    statsDeps.queue = &queueState;
    statsDeps.instanceId = state_.instanceId;
    statsDeps.catalogEntries = trackCatalog.size();
    const std::string statsPath = resolveInWorkingDirectory(config, config.statsFilePath);

    eviction::FilesystemStorageProbe storageProbe;
    std::vector<std::string> protectedNames = {
        std::filesystem::path(configFilePath_).filename().string()};
    eviction::EvictionManager evictionManager(config, queueState, storageProbe, protectedNames);

    eviction::EvictionScheduler::Dependencies schedulerDeps;
    schedulerDeps.manager = &evictionManager;
    schedulerDeps.runningFlag = &state_.flags.running;
    schedulerDeps.interval = std::chrono::seconds(config.evictionIntervalSeconds);
    schedulerDeps.onPass = [&](const std::vector<eviction::EvictionReport>& reports) {
        for (const auto& report : reports) {
            if (report.policy == eviction::EvictionPolicy::WorkingDirectory) {
                runtime_stats::recordSweep(report.sweptEntries);
            } else if (!report.evictedSequenceNumbers.empty()) {
                runtime_stats::recordEviction(eviction::policyName(report.policy),
                                              report.evictedSequenceNumbers.size(),
                                              report.freedBytes);
            }
        }
        // The render loop commits before it appends, so a snapshot taken
        // under the writer's lock covers every segment already listed.
        playlistWriter.pruneStale([&queueState]() {
            std::set<std::string> live;
            for (const auto& segment : queueState.snapshot()) {
                live.insert(segment.filePath.filename().string());
            }
            return live;
        });
        auto refreshed = playlistWriter.writeEntryPlaylist();
        if (!refreshed.ok()) {
            LOG_WARN("Entry playlist not updated: {}", refreshed.errorMessage);
        }
    };
    eviction::EvictionScheduler scheduler(schedulerDeps);

    daemon_render::RenderLoop::Dependencies loopDeps;
    loopDeps.config = &config;
    loopDeps.queue = &queueState;
    loopDeps.catalog = &trackCatalog;
    loopDeps.selector = &selector;
    loopDeps.fetcher = &fetcher;
    loopDeps.archiveReader = &archiveReader;
    loopDeps.renderAdapter = &renderAdapter;
    loopDeps.playlist = &playlistWriter;
    loopDeps.recovery = &recovery;
    loopDeps.runningFlag = &state_.flags.running;
    loopDeps.instanceId = state_.instanceId;
    loopDeps.sleep = interruptibleSleep;
    loopDeps.externalFatal = [&scheduler]() { return scheduler.fatalError(); };
    loopDeps.onStateChange = [&](daemon_render::LoopState) { shutdownManager.tick(); };
    loopDeps.onCommit = [&](const queue::Segment&) {
        auto entry = playlistWriter.writeEntryPlaylist();
        if (!entry.ok()) {
            LOG_WARN("Entry playlist not updated: {}", entry.errorMessage);
        }
        auto buffered = static_cast<long>(queueState.bufferedDurationSeconds());
        std::string status = "Buffered " + std::to_string(buffered) + "s in " +
                             std::to_string(queueState.size()) + " segments";
        shutdownManager.notifyStatus(status);
    };
    loopDeps.onCycle = [&]() {
        if (!statsPath.empty() && !runtime_stats::writeStatsFile(statsDeps, statsPath)) {
            LOG_EVERY_N(WARN, 100, "Cannot write stats file {}", statsPath);
        }
    };
    daemon_render::RenderLoop loop(loopDeps);

    ErrorCode recovered = loop.recover();
    if (recovered != ErrorCode::OK) {
        return recovered;
    }

    auto opened = playlistWriter.open();
    if (!opened.ok()) {
        return opened.errorCode;
    }
    auto entry = playlistWriter.writeEntryPlaylist();
    if (!entry.ok()) {
        return entry.errorCode;
    }

    // First pass before any render so a full disk is dealt with up front.
    scheduler.runPass();
    if (scheduler.fatalError() != ErrorCode::OK) {
        return scheduler.fatalError();
    }
    scheduler.start();

    shutdownManager.setWakeCallback([&scheduler]() { scheduler.requestPass(); });
    shutdownManager.setEvictCallback([&scheduler]() { scheduler.requestPass(); });
    shutdownManager.notifyReady();

    daemon_render::RunLimits limits;
    if (overrides.once) {
        limits.maxCommits = 1;
        limits.exitWhenIdle = true;
    }
    ErrorCode loopResult = loop.run(limits);
    if (loopResult == ErrorCode::OK) {
        loopResult = scheduler.fatalError();
    }

    state_.flags.running = false;
    scheduler.stop();
    shutdownManager.setWakeCallback(nullptr);
    shutdownManager.setEvictCallback(nullptr);

    std::error_code ec;
    std::filesystem::remove_all(workDir, ec);
    if (!statsPath.empty()) {
        runtime_stats::writeStatsFile(statsDeps, statsPath);
    }
    return loopResult;
}

}  // namespace prerender::daemon_app
