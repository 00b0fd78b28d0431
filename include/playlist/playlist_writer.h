#pragma once

#include "core/error_codes.h"
#include "queue/segment.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace prerender::playlist {

struct PlaylistResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

// Maintains the ffconcat playlists in the media directory.
//
//   playlist0.txt  entry point: startup clip, then the oldest numbered file
//   playlistN.txt  append-only; once sealed its last line links N+1
//
// Lines already written are never rewritten. Numbered files are created
// exclusively; a number taken by another writer sharing the directory is
// skipped. The active file stays flock()ed while this writer owns it, so a
// tail left behind by a dead writer can be told apart from a live one.
class PlaylistWriter {
   public:
    using LiveNamesFn = std::function<std::set<std::string>()>;

    PlaylistWriter(std::filesystem::path mediaDir, std::size_t rotationEntries);
    ~PlaylistWriter();

    PlaylistWriter(const PlaylistWriter&) = delete;
    PlaylistWriter& operator=(const PlaylistWriter&) = delete;

    // Creates a fresh active file after the highest existing number. An
    // unsealed tail nobody holds is linked to it; a tail owned by a live
    // writer is left alone.
    PlaylistResult open();

    // Appends one segment and rotates once the active file is full.
    PlaylistResult append(const queue::Segment& segment);

    // Deletes sealed playlists, oldest first, whose segments are all gone.
    // Stops at the first unsealed file or the first one still referencing a
    // live segment. liveNames is called with the writer locked, so a segment
    // appended before the call is always seen as live.
    std::size_t pruneStale(const LiveNamesFn& liveNames);

    // Rewrites playlist0.txt atomically.
    PlaylistResult writeEntryPlaylist();

    std::uint64_t activeNumber() const;
    std::size_t activeEntries() const;
    std::filesystem::path pathFor(std::uint64_t number) const;

    // Numbers of playlistN.txt files present (N >= 1), ascending.
    std::vector<std::uint64_t> existingNumbers() const;

    static std::optional<std::uint64_t> parsePlaylistNumber(const std::string& fileName);
    static std::string playlistName(std::uint64_t number);
    // Targets of the "file ..." lines, in order.
    static std::vector<std::string> readEntries(const std::filesystem::path& playlist);

   private:
    // Creates the first free file at or after `from`, locks it and writes
    // the header. On success `created` holds its number and fd.
    PlaylistResult createLocked(std::uint64_t from, std::uint64_t& created, int& fd);
    PlaylistResult linkOrphanTail(std::uint64_t tail, std::uint64_t next);
    PlaylistResult rotateLocked();
    void closeActive();

    std::filesystem::path mediaDir_;
    std::size_t rotationEntries_;
    mutable std::mutex mutex_;
    std::uint64_t activeNumber_ = 0;
    std::size_t activeEntries_ = 0;
    int activeFd_ = -1;
};

}  // namespace prerender::playlist
