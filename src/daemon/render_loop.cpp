#include "daemon/render_loop.h"

#include "daemon/metrics/runtime_stats.h"
#include "logging/logger.h"
#include "queue/capacity_governor.h"
#include "queue/segment_naming.h"

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace prerender::daemon_render {

namespace {

void removeAllQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        LOG_WARN("Cannot clean up {}: {}", path.string(), ec.message());
    }
}

// rename(2), falling back to copy + rename through a partial name when the
// scratch directory sits on another filesystem.
bool moveIntoPlace(const std::filesystem::path& from, const std::filesystem::path& to,
                   std::string& errorMessage) {
    if (std::rename(from.c_str(), to.c_str()) == 0) {
        return true;
    }
    if (errno != EXDEV) {
        errorMessage = "cannot move " + from.string() + " to " + to.string();
        return false;
    }

    std::error_code ec;
    std::filesystem::path partial = to.parent_path() /
                                    queue::partialFileName(to.filename().string());
    std::filesystem::copy_file(from, partial, std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
        errorMessage = "cannot copy " + from.string() + " into " + partial.string() + ": " +
                       ec.message();
        std::filesystem::remove(partial, ec);
        return false;
    }
    if (std::rename(partial.c_str(), to.c_str()) != 0) {
        errorMessage = "cannot rename " + partial.string() + " to " + to.string();
        std::filesystem::remove(partial, ec);
        return false;
    }
    std::filesystem::remove(from, ec);
    return true;
}

}  // namespace

const char* loopStateName(LoopState state) {
    switch (state) {
        case LoopState::Recover:
            return "RECOVER";
        case LoopState::Idle:
            return "IDLE";
        case LoopState::Select:
            return "SELECT";
        case LoopState::Fetch:
            return "FETCH";
        case LoopState::Transcode:
            return "TRANSCODE";
        case LoopState::Commit:
            return "COMMIT";
        case LoopState::Stopped:
            return "STOPPED";
    }
    return "UNKNOWN";
}

RenderLoop::RenderLoop(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.config || !deps_.queue || !deps_.catalog || !deps_.selector || !deps_.fetcher ||
        !deps_.archiveReader || !deps_.renderAdapter || !deps_.playlist) {
        throw std::invalid_argument("RenderLoop requires config, queue, catalog, selector, "
                                    "fetcher, archive reader, render adapter and playlist");
    }
    if (!deps_.sleep) {
        deps_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (!deps_.clock) {
        deps_.clock = [] { return queue::Clock::now(); };
    }
}

bool RenderLoop::isRunning() const {
    return !deps_.runningFlag || deps_.runningFlag->load(std::memory_order_acquire);
}

void RenderLoop::setState(LoopState state) {
    LoopState previous = state_.exchange(state);
    if (previous != state) {
        LOG_DEBUG("Render loop: {} -> {}", loopStateName(previous), loopStateName(state));
    }
    if (deps_.onStateChange) {
        deps_.onStateChange(state);
    }
}

void RenderLoop::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0 && isRunning()) {
        deps_.sleep(duration);
    }
}

ErrorCode RenderLoop::recover() {
    setState(LoopState::Recover);
    if (!deps_.recovery) {
        return ErrorCode::OK;
    }
    auto result = deps_.recovery->scan(deps_.clock());
    if (!result.ok()) {
        LOG_CRITICAL("Recovery failed: {}", result.errorMessage);
        return result.errorCode;
    }
    runtime_stats::recordRecovery(result.segments.size(), result.corruptDeleted);
    deps_.queue->restore(std::move(result.segments));
    LOG_INFO("Recovered {} segments, {:.1f}s buffered", deps_.queue->size(),
             deps_.queue->bufferedDurationSeconds());
    return ErrorCode::OK;
}

ErrorCode RenderLoop::run(const RunLimits& limits) {
    ErrorCode exitCode = ErrorCode::OK;
    while (isRunning()) {
        if (deps_.externalFatal) {
            ErrorCode external = deps_.externalFatal();
            if (external != ErrorCode::OK) {
                exitCode = external;
                break;
            }
        }

        auto outcome = runCycle();
        if (deps_.onCycle) {
            deps_.onCycle();
        }
        if (outcome.errorCode != ErrorCode::OK && isFatal(outcome.errorCode)) {
            LOG_CRITICAL("Render loop stopping: {} ({})", outcome.errorMessage,
                         errorCodeToString(outcome.errorCode));
            exitCode = outcome.errorCode;
            break;
        }
        if (limits.maxCommits > 0 && commits_ >= limits.maxCommits) {
            break;
        }
        if (limits.exitWhenIdle && outcome.idled) {
            break;
        }
    }
    setState(LoopState::Stopped);
    return exitCode;
}

CycleOutcome RenderLoop::runCycle() {
    deps_.queue->reconcile();
    if (!queue::shouldRenderMore(*deps_.queue, *deps_.config)) {
        setState(LoopState::Idle);
        LOG_DEBUG("Buffer full ({:.1f}s >= {:.1f}s); idling {}s",
                  deps_.queue->bufferedDurationSeconds(), deps_.config->gasTankLimitSeconds,
                  deps_.config->idlePollSeconds);
        CycleOutcome outcome;
        outcome.idled = true;
        sleepFor(std::chrono::seconds(deps_.config->idlePollSeconds));
        return outcome;
    }
    return renderOneTrack();
}

CycleOutcome RenderLoop::trackFailure(ErrorCode code, const std::string& message,
                                      const std::string& uri) {
    CycleOutcome outcome;
    outcome.errorCode = code;
    outcome.errorMessage = message;
    if (isFatal(code)) {
        return outcome;
    }
    LOG_WARN("Track failed [{}]: {}", errorCodeToString(code), message);
    runtime_stats::recordTrackFailure(code);
    lastFailedUri_ = uri;
    setState(LoopState::Select);
    sleepFor(std::chrono::seconds(deps_.config->retryDelaySeconds));
    return outcome;
}

CycleOutcome RenderLoop::renderOneTrack() {
    setState(LoopState::Select);
    auto selection = deps_.selector->select(*deps_.catalog);
    if (selection.ok() && selection.track.uri == lastFailedUri_ && deps_.catalog->size() > 1) {
        // Give a just-failed candidate one chance to be skipped.
        selection = deps_.selector->select(*deps_.catalog);
    }
    if (!selection.ok()) {
        return trackFailure(selection.errorCode, selection.errorMessage, std::string());
    }
    const auto& track = selection.track;
    LOG_INFO("Selected {}", track.uri);

    std::vector<std::filesystem::path> cleanup;
    auto cleanupAll = [&cleanup]() {
        for (auto it = cleanup.rbegin(); it != cleanup.rend(); ++it) {
            removeAllQuietly(*it);
        }
    };

    if (!isRunning()) {
        return CycleOutcome{};
    }
    setState(LoopState::Fetch);
    std::filesystem::path input;
    std::string fetchError;
    ErrorCode fetched = fetchPlayable(track, input, fetchError, cleanup);
    if (fetched != ErrorCode::OK) {
        cleanupAll();
        return trackFailure(fetched, fetchError, track.uri);
    }

    if (!isRunning()) {
        cleanupAll();
        return CycleOutcome{};
    }
    setState(LoopState::Transcode);
    std::uint64_t sequence = deps_.queue->allocateSequenceNumber();
    std::filesystem::path output = std::filesystem::path(deps_.config->tempPath) /
                                   ("render-" + deps_.instanceId + "-" +
                                    std::to_string(sequence) + DaemonConstants::SEGMENT_EXTENSION);
    cleanup.push_back(output);
    auto render = deps_.renderAdapter->render(input, output);
    if (!render.ok()) {
        cleanupAll();
        return trackFailure(render.errorCode, render.errorMessage, track.uri);
    }

    setState(LoopState::Commit);
    CycleOutcome outcome;
    ErrorCode committed = commit(render, sequence, outcome);
    cleanupAll();
    if (committed != ErrorCode::OK) {
        outcome.errorCode = committed;
        return outcome;
    }
    lastFailedUri_.clear();
    return outcome;
}

ErrorCode RenderLoop::fetchPlayable(const catalog::TrackReference& track,
                                    std::filesystem::path& localPath, std::string& errorMessage,
                                    std::vector<std::filesystem::path>& cleanup) {
    auto fetched = deps_.fetcher->fetch(track);
    if (!fetched.ok()) {
        errorMessage = fetched.errorMessage;
        return fetched.errorCode;
    }
    localPath = fetched.localPath;
    cleanup.push_back(localPath);

    catalog::TrackReference current = track;
    for (int depth = 0; catalog::extensionOf(localPath.filename().string()) ==
                        catalog::ARCHIVE_EXTENSION;
         ++depth) {
        if (depth >= MAX_ARCHIVE_DEPTH) {
            errorMessage = "archive nesting deeper than " + std::to_string(MAX_ARCHIVE_DEPTH) +
                           " in " + track.uri;
            return ErrorCode::FETCH_ARCHIVE;
        }
        auto listing = deps_.archiveReader->list(localPath);
        if (!listing.ok()) {
            errorMessage = listing.errorMessage;
            return listing.errorCode;
        }
        auto choice = deps_.selector->chooseInnerEntry(current, listing.entries);
        if (!choice.ok()) {
            errorMessage = choice.errorMessage;
            return choice.errorCode;
        }
        LOG_INFO("Using {} from {}", choice.innerEntry, localPath.filename().string());

        auto extractDir = std::filesystem::path(deps_.config->tempPath) /
                          ("extract-" + deps_.instanceId + "-" + std::to_string(depth));
        removeAllQuietly(extractDir);
        cleanup.push_back(extractDir);
        auto extracted = deps_.archiveReader->extract(localPath, choice.innerEntry, extractDir);
        if (!extracted.ok()) {
            errorMessage = extracted.errorMessage;
            return extracted.errorCode;
        }
        current = choice.track;
        localPath = extracted.localPath;
    }
    return ErrorCode::OK;
}

ErrorCode RenderLoop::commit(const media::RenderResult& render, std::uint64_t sequenceNumber,
                             CycleOutcome& outcome) {
    outcome.achievedSpeed =
        render.wallClockSeconds > 0.0 ? render.durationSeconds / render.wallClockSeconds : 0.0;
    LOG_INFO("Rendered {:.1f}s in {:.1f}s: {:.2f}x (target {:.2f}x)", render.durationSeconds,
             render.wallClockSeconds, outcome.achievedSpeed,
             deps_.config->targetSpeedMultiplier);

    queue::Segment segment;
    segment.sequenceNumber = sequenceNumber;
    segment.committedAt = deps_.clock();
    segment.durationSeconds = render.durationSeconds;
    segment.filePath = std::filesystem::path(deps_.config->mediaPath) /
                       queue::makeSegmentFileName(deps_.instanceId, sequenceNumber,
                                                  segment.committedAt);

    std::string moveError;
    if (!moveIntoPlace(render.outputPath, segment.filePath, moveError)) {
        outcome.errorMessage = moveError;
        return ErrorCode::STORAGE_UNAVAILABLE;
    }
    std::error_code ec;
    segment.sizeBytes = std::filesystem::file_size(segment.filePath, ec);
    if (ec) {
        segment.sizeBytes = 0;
    }

    deps_.queue->commit(segment);
    auto appended = deps_.playlist->append(segment);
    if (!appended.ok()) {
        outcome.errorMessage = appended.errorMessage;
        return appended.errorCode;
    }

    ++commits_;
    outcome.committed = true;
    runtime_stats::recordCommit(segment.durationSeconds, outcome.achievedSpeed);
    deps_.renderAdapter->onSpeedMeasured(outcome.achievedSpeed);
    LOG_INFO("Committed {} (#{}, {:.1f}s); buffer now {:.1f}s",
             segment.filePath.filename().string(), segment.sequenceNumber,
             segment.durationSeconds, deps_.queue->bufferedDurationSeconds());
    if (deps_.onCommit) {
        deps_.onCommit(segment);
    }
    return ErrorCode::OK;
}

}  // namespace prerender::daemon_render
