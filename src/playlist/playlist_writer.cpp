#include "playlist/playlist_writer.h"

#include "core/atomic_file.h"
#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace prerender::playlist {

namespace {

std::string fileLine(const std::string& target) {
    return "file " + target;
}

PlaylistResult storageError(const std::string& message) {
    PlaylistResult result;
    result.errorCode = ErrorCode::STORAGE_UNAVAILABLE;
    result.errorMessage = message;
    LOG_ERROR("Playlist: {}", message);
    return result;
}

bool writeAll(int fd, const std::string& text) {
    const char* data = text.data();
    std::size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

bool lockFd(int fd, int operation) {
    while (::flock(fd, operation) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

bool startsWithHeader(const std::filesystem::path& playlist) {
    std::ifstream in(playlist);
    std::string first;
    return std::getline(in, first) && first.rfind(DaemonConstants::FFCONCAT_HEADER, 0) == 0;
}

}  // namespace

PlaylistWriter::PlaylistWriter(std::filesystem::path mediaDir, std::size_t rotationEntries)
    : mediaDir_(std::move(mediaDir)), rotationEntries_(std::max<std::size_t>(1, rotationEntries)) {}

PlaylistWriter::~PlaylistWriter() {
    closeActive();
}

std::string PlaylistWriter::playlistName(std::uint64_t number) {
    return std::string(DaemonConstants::PLAYLIST_PREFIX) + std::to_string(number) +
           DaemonConstants::PLAYLIST_SUFFIX;
}

std::optional<std::uint64_t> PlaylistWriter::parsePlaylistNumber(const std::string& fileName) {
    const std::string prefix = DaemonConstants::PLAYLIST_PREFIX;
    const std::string suffix = DaemonConstants::PLAYLIST_SUFFIX;
    if (fileName.size() <= prefix.size() + suffix.size() ||
        fileName.compare(0, prefix.size(), prefix) != 0 ||
        fileName.compare(fileName.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    std::string digits = fileName.substr(prefix.size(), fileName.size() - prefix.size() -
                                                            suffix.size());
    if (digits.empty() || digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return std::stoull(digits);
}

std::vector<std::string> PlaylistWriter::readEntries(const std::filesystem::path& playlist) {
    std::vector<std::string> entries;
    std::ifstream in(playlist);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind("file ", 0) == 0) {
            entries.push_back(line.substr(5));
        }
    }
    return entries;
}

std::filesystem::path PlaylistWriter::pathFor(std::uint64_t number) const {
    return mediaDir_ / playlistName(number);
}

std::vector<std::uint64_t> PlaylistWriter::existingNumbers() const {
    std::vector<std::uint64_t> numbers;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(mediaDir_, ec)) {
        auto number = parsePlaylistNumber(entry.path().filename().string());
        if (number && *number > 0) {
            numbers.push_back(*number);
        }
    }
    std::sort(numbers.begin(), numbers.end());
    return numbers;
}

PlaylistResult PlaylistWriter::createLocked(std::uint64_t from, std::uint64_t& created, int& fd) {
    for (std::uint64_t number = from;; ++number) {
        auto path = pathFor(number);
        int candidate = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC,
                               0644);
        if (candidate < 0) {
            if (errno == EEXIST) {
                LOG_DEBUG("Playlist: {} taken by another writer", playlistName(number));
                continue;
            }
            return storageError("cannot create " + path.string() + ": " + std::strerror(errno));
        }
        // Blocks only while another writer's open() inspects the empty file.
        if (!lockFd(candidate, LOCK_EX) ||
            !writeAll(candidate, std::string(DaemonConstants::FFCONCAT_HEADER) + "\n")) {
            int err = errno;
            ::unlink(path.c_str());
            ::close(candidate);
            return storageError("cannot initialise " + path.string() + ": " + std::strerror(err));
        }
        created = number;
        fd = candidate;
        return PlaylistResult{};
    }
}

PlaylistResult PlaylistWriter::linkOrphanTail(std::uint64_t tail, std::uint64_t next) {
    auto path = pathFor(tail);
    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return PlaylistResult{};
        }
        return storageError("cannot open " + path.string() + ": " + std::strerror(errno));
    }
    if (!lockFd(fd, LOCK_EX | LOCK_NB)) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            LOG_INFO("Playlist: {} belongs to a running writer, not linking it",
                     playlistName(tail));
            return PlaylistResult{};
        }
        return storageError("cannot lock " + path.string() + ": " + std::strerror(err));
    }

    PlaylistResult result;
    auto entries = readEntries(path);
    bool sealed = !entries.empty() && parsePlaylistNumber(entries.back()).has_value();
    if (!sealed && startsWithHeader(path)) {
        if (writeAll(fd, fileLine(playlistName(next)) + "\n")) {
            LOG_INFO("Playlist: linked {} to {}", playlistName(tail), playlistName(next));
        } else {
            result = storageError("write to " + path.string() + " failed: " +
                                  std::strerror(errno));
        }
    }
    ::close(fd);
    return result;
}

void PlaylistWriter::closeActive() {
    if (activeFd_ < 0) {
        return;
    }
    ::flock(activeFd_, LOCK_UN);
    ::close(activeFd_);
    activeFd_ = -1;
}

PlaylistResult PlaylistWriter::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeActive();
    activeNumber_ = 0;

    auto numbers = existingNumbers();
    std::uint64_t created = 0;
    int fd = -1;
    auto result = createLocked(numbers.empty() ? 1 : numbers.back() + 1, created, fd);
    if (!result.ok()) {
        return result;
    }

    if (!numbers.empty()) {
        auto linked = linkOrphanTail(numbers.back(), created);
        if (!linked.ok()) {
            ::close(fd);
            return linked;
        }
        LOG_INFO("Playlist: resuming after {}", playlistName(numbers.back()));
    }

    activeNumber_ = created;
    activeEntries_ = 0;
    activeFd_ = fd;
    LOG_INFO("Playlist: active file {}", playlistName(created));
    return result;
}

PlaylistResult PlaylistWriter::rotateLocked() {
    std::uint64_t next = 0;
    int fd = -1;
    auto created = createLocked(activeNumber_ + 1, next, fd);
    if (!created.ok()) {
        return created;
    }
    if (!writeAll(activeFd_, fileLine(playlistName(next)) + "\n")) {
        int err = errno;
        ::unlink(pathFor(next).c_str());
        ::close(fd);
        return storageError("cannot seal " + playlistName(activeNumber_) + ": " +
                            std::strerror(err));
    }
    LOG_DEBUG("Playlist: sealed {}, now writing {}", playlistName(activeNumber_),
              playlistName(next));
    closeActive();
    activeNumber_ = next;
    activeEntries_ = 0;
    activeFd_ = fd;
    return created;
}

PlaylistResult PlaylistWriter::append(const queue::Segment& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeFd_ < 0) {
        return storageError("append before open");
    }
    if (!writeAll(activeFd_, fileLine(segment.filePath.filename().string()) + "\n")) {
        return storageError("write to " + playlistName(activeNumber_) + " failed: " +
                            std::strerror(errno));
    }
    ++activeEntries_;
    if (activeEntries_ >= rotationEntries_) {
        return rotateLocked();
    }
    return PlaylistResult{};
}

std::size_t PlaylistWriter::pruneStale(const LiveNamesFn& liveNames) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto live = liveNames ? liveNames() : std::set<std::string>{};
    std::size_t pruned = 0;
    for (auto number : existingNumbers()) {
        if (number >= activeNumber_) {
            break;
        }
        auto entries = readEntries(pathFor(number));
        if (entries.empty() || !parsePlaylistNumber(entries.back())) {
            // Still being written, by this writer or another one.
            break;
        }
        bool anyLive = false;
        for (const auto& entry : entries) {
            if (parsePlaylistNumber(entry)) {
                continue;
            }
            std::error_code existsEc;
            if (live.count(entry) > 0 || std::filesystem::exists(mediaDir_ / entry, existsEc)) {
                anyLive = true;
                break;
            }
        }
        if (anyLive) {
            break;
        }
        std::error_code ec;
        std::filesystem::remove(pathFor(number), ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            LOG_WARN("Playlist: cannot remove {}: {}", playlistName(number), ec.message());
            break;
        }
        ++pruned;
        LOG_DEBUG("Playlist: pruned {}", playlistName(number));
    }
    return pruned;
}

PlaylistResult PlaylistWriter::writeEntryPlaylist() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto numbers = existingNumbers();
    if (numbers.empty()) {
        return storageError("no numbered playlist to point at");
    }

    std::string content = std::string(DaemonConstants::FFCONCAT_HEADER) + "\n" +
                          fileLine(DaemonConstants::STARTUP_VIDEO_NAME) + "\n" +
                          fileLine(playlistName(numbers.front())) + "\n";
    std::string error;
    if (!atomic_file::replace(mediaDir_ / DaemonConstants::ENTRY_PLAYLIST_NAME, content, error)) {
        return storageError(error);
    }
    return PlaylistResult{};
}

std::uint64_t PlaylistWriter::activeNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeNumber_;
}

std::size_t PlaylistWriter::activeEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeEntries_;
}

}  // namespace prerender::playlist
