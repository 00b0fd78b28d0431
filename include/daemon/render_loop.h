#pragma once

#include "catalog/track_reference.h"
#include "catalog/track_selector.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "media/archive_reader.h"
#include "media/media_fetcher.h"
#include "media/render_adapter.h"
#include "playlist/playlist_writer.h"
#include "queue/queue_state.h"
#include "queue/recovery_scanner.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace prerender::daemon_render {

enum class LoopState { Recover, Idle, Select, Fetch, Transcode, Commit, Stopped };

const char* loopStateName(LoopState state);

struct CycleOutcome {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    bool idled = false;
    bool committed = false;
    double achievedSpeed = 0.0;
};

struct RunLimits {
    std::size_t maxCommits = 0;  // 0 = unbounded
    bool exitWhenIdle = false;
};

// RECOVER -> (IDLE <-> SELECT -> FETCH -> TRANSCODE -> COMMIT) -> IDLE ...
// Per-track failures return to SELECT after a short delay; fatal errors
// end the loop and are returned to the caller.
class RenderLoop {
   public:
    struct Dependencies {
        const AppConfig* config = nullptr;
        queue::QueueState* queue = nullptr;
        const catalog::Catalog* catalog = nullptr;
        catalog::TrackSelector* selector = nullptr;
        media::IMediaFetcher* fetcher = nullptr;
        media::IArchiveReader* archiveReader = nullptr;
        media::IRenderAdapter* renderAdapter = nullptr;
        playlist::PlaylistWriter* playlist = nullptr;
        queue::RecoveryScanner* recovery = nullptr;
        std::atomic<bool>* runningFlag = nullptr;
        std::string instanceId;
        // Interruptible sleep. Defaults to std::this_thread::sleep_for.
        std::function<void(std::chrono::milliseconds)> sleep;
        std::function<queue::Clock::time_point()> clock;
        // Fatal error raised elsewhere (eviction thread), OK otherwise.
        std::function<ErrorCode()> externalFatal;
        // Called on every state change; used to poll signals.
        std::function<void(LoopState)> onStateChange;
        std::function<void(const queue::Segment&)> onCommit;
        std::function<void()> onCycle;
    };

    // Nested archives deeper than this are rejected.
    static constexpr int MAX_ARCHIVE_DEPTH = 4;

    explicit RenderLoop(Dependencies deps);

    // Rebuilds the queue from the media directory.
    ErrorCode recover();

    // One governor decision and at most one track.
    CycleOutcome runCycle();

    // Cycles until stopped, a fatal error, or a limit is reached.
    ErrorCode run(const RunLimits& limits = RunLimits());

    LoopState state() const {
        return state_.load();
    }

   private:
    bool isRunning() const;
    void setState(LoopState state);
    void sleepFor(std::chrono::milliseconds duration);

    CycleOutcome renderOneTrack();
    CycleOutcome trackFailure(ErrorCode code, const std::string& message,
                              const std::string& uri);
    ErrorCode fetchPlayable(const catalog::TrackReference& track,
                            std::filesystem::path& localPath, std::string& errorMessage,
                            std::vector<std::filesystem::path>& cleanup);
    ErrorCode commit(const media::RenderResult& render, std::uint64_t sequenceNumber,
                     CycleOutcome& outcome);

    Dependencies deps_;
    std::atomic<LoopState> state_{LoopState::Recover};
    std::string lastFailedUri_;
    std::size_t commits_ = 0;
};

}  // namespace prerender::daemon_render
