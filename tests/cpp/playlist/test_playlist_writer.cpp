#include "playlist/playlist_writer.h"
#include "queue/queue_state.h"
#include "support/test_support.h"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

namespace fs = std::filesystem;
using namespace prerender;
using namespace prerender::playlist;
using prerender::test::readLines;

class PlaylistWriterTest : public test::TempDirTest {
   protected:
    queue::Segment segment(const std::string& name) {
        queue::Segment s;
        s.filePath = tempDir / name;
        s.durationSeconds = 10.0;
        return s;
    }

    static PlaylistWriter::LiveNamesFn liveNames(std::set<std::string> names) {
        return [names]() { return names; };
    }

    static PlaylistWriter::LiveNamesFn liveNamesOf(const queue::QueueState& queueState) {
        return [&queueState]() {
            std::set<std::string> names;
            for (const auto& s : queueState.snapshot()) {
                names.insert(s.filePath.filename().string());
            }
            return names;
        };
    }
};

// ============================================================
// Naming
// ============================================================

TEST(PlaylistNaming, ParsesNumberedPlaylists) {
    EXPECT_EQ(PlaylistWriter::playlistName(7), "playlist7.txt");
    EXPECT_EQ(PlaylistWriter::parsePlaylistNumber("playlist12.txt"), 12u);
    EXPECT_EQ(PlaylistWriter::parsePlaylistNumber("playlist0.txt"), 0u);
    EXPECT_FALSE(PlaylistWriter::parsePlaylistNumber("playlist.txt").has_value());
    EXPECT_FALSE(PlaylistWriter::parsePlaylistNumber("playlistA.txt").has_value());
    EXPECT_FALSE(PlaylistWriter::parsePlaylistNumber("media-1.flv").has_value());
}

// ============================================================
// Append-only behaviour
// ============================================================

TEST_F(PlaylistWriterTest, OpenCreatesFirstPlaylistWithHeader) {
    PlaylistWriter writer(tempDir, 100);
    ASSERT_TRUE(writer.open().ok());
    EXPECT_EQ(writer.activeNumber(), 1u);
    EXPECT_EQ(readLines(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"ffconcat version 1.0"}));
}

TEST_F(PlaylistWriterTest, EvictionNeverRewritesWrittenLines) {
    PlaylistWriter writer(tempDir, 100);
    ASSERT_TRUE(writer.open().ok());
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-2.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-3.flv")).ok());

    auto before = readLines(tempDir / "playlist1.txt");
    // Segment 2 is evicted by deleting its file; nothing touches the playlist.
    EXPECT_EQ(writer.pruneStale(liveNames({"media-1.flv", "media-3.flv"})), 0u);
    EXPECT_EQ(readLines(tempDir / "playlist1.txt"), before);

    ASSERT_TRUE(writer.append(segment("media-4.flv")).ok());
    EXPECT_EQ(readLines(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"ffconcat version 1.0", "file media-1.flv",
                                        "file media-2.flv", "file media-3.flv",
                                        "file media-4.flv"}));
    EXPECT_EQ(writer.activeEntries(), 4u);
}

TEST_F(PlaylistWriterTest, AppendBeforeOpenFails) {
    PlaylistWriter writer(tempDir, 1);
    EXPECT_EQ(writer.append(segment("media-1.flv")).errorCode, ErrorCode::STORAGE_UNAVAILABLE);
}

// ============================================================
// Rotation
// ============================================================

TEST_F(PlaylistWriterTest, RotationSealsWithLinkToNextFile) {
    PlaylistWriter writer(tempDir, 2);
    ASSERT_TRUE(writer.open().ok());
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-2.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-3.flv")).ok());

    EXPECT_EQ(writer.activeNumber(), 2u);
    EXPECT_EQ(readLines(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"ffconcat version 1.0", "file media-1.flv",
                                        "file media-2.flv", "file playlist2.txt"}));
    EXPECT_EQ(readLines(tempDir / "playlist2.txt"),
              (std::vector<std::string>{"ffconcat version 1.0", "file media-3.flv"}));
}

TEST_F(PlaylistWriterTest, SingleEntryRotationChainsEveryCommit) {
    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-2.flv")).ok());

    EXPECT_EQ(writer.activeNumber(), 3u);
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"media-1.flv", "playlist2.txt"}));
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist2.txt"),
              (std::vector<std::string>{"media-2.flv", "playlist3.txt"}));
    EXPECT_TRUE(PlaylistWriter::readEntries(tempDir / "playlist3.txt").empty());
}

// ============================================================
// Restart
// ============================================================

TEST_F(PlaylistWriterTest, ReopenResumesAfterHighestAndLinksTail) {
    {
        PlaylistWriter writer(tempDir, 100);
        ASSERT_TRUE(writer.open().ok());
        ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    }

    PlaylistWriter reopened(tempDir, 100);
    ASSERT_TRUE(reopened.open().ok());
    EXPECT_EQ(reopened.activeNumber(), 2u);
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"media-1.flv", "playlist2.txt"}));

    ASSERT_TRUE(reopened.append(segment("media-2.flv")).ok());
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist2.txt"),
              (std::vector<std::string>{"media-2.flv"}));
}

TEST_F(PlaylistWriterTest, ReopenDoesNotDuplicateExistingLink) {
    test::writeFile(tempDir / "playlist4.txt",
                    "ffconcat version 1.0\nfile media-9.flv\nfile playlist5.txt\n");

    PlaylistWriter writer(tempDir, 100);
    ASSERT_TRUE(writer.open().ok());
    EXPECT_EQ(writer.activeNumber(), 5u);
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist4.txt"),
              (std::vector<std::string>{"media-9.flv", "playlist5.txt"}));
}

// ============================================================
// Writers sharing one media directory
// ============================================================

TEST_F(PlaylistWriterTest, SharedDirectoryWritersNeverTouchEachOthersFiles) {
    PlaylistWriter first(tempDir, 1);
    PlaylistWriter second(tempDir, 1);
    ASSERT_TRUE(first.open().ok());
    ASSERT_TRUE(second.open().ok());
    EXPECT_EQ(first.activeNumber(), 1u);
    EXPECT_EQ(second.activeNumber(), 2u);

    ASSERT_TRUE(second.append(segment("media-1-abc-100.flv")).ok());
    ASSERT_TRUE(first.append(segment("media-1-def-1.flv")).ok());

    // playlist2 and playlist3 were taken, so the first writer skips to 4.
    EXPECT_EQ(second.activeNumber(), 3u);
    EXPECT_EQ(first.activeNumber(), 4u);
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"media-1-def-1.flv", "playlist4.txt"}));
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist2.txt"),
              (std::vector<std::string>{"media-1-abc-100.flv", "playlist3.txt"}));
    EXPECT_EQ(readLines(tempDir / "playlist3.txt"),
              (std::vector<std::string>{"ffconcat version 1.0"}));
    EXPECT_EQ(readLines(tempDir / "playlist4.txt"),
              (std::vector<std::string>{"ffconcat version 1.0"}));
}

TEST_F(PlaylistWriterTest, OpenNeverLinksTailHeldByRunningWriter) {
    auto earlier = std::make_unique<PlaylistWriter>(tempDir, 100);
    ASSERT_TRUE(earlier->open().ok());
    ASSERT_TRUE(earlier->append(segment("media-1.flv")).ok());

    PlaylistWriter alongside(tempDir, 100);
    ASSERT_TRUE(alongside.open().ok());
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"media-1.flv"}));

    earlier.reset();
    PlaylistWriter restarted(tempDir, 100);
    ASSERT_TRUE(restarted.open().ok());
    EXPECT_EQ(restarted.activeNumber(), 3u);
    // Only the highest tail is considered, and playlist2 is still held.
    EXPECT_TRUE(PlaylistWriter::readEntries(tempDir / "playlist2.txt").empty());
    EXPECT_EQ(PlaylistWriter::readEntries(tempDir / "playlist1.txt"),
              (std::vector<std::string>{"media-1.flv"}));
}

TEST_F(PlaylistWriterTest, PruneStopsAtPlaylistStillBeingWritten) {
    PlaylistWriter other(tempDir, 1);
    ASSERT_TRUE(other.open().ok());

    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-2.flv")).ok());

    EXPECT_EQ(writer.pruneStale(liveNames({})), 0u);
    EXPECT_TRUE(fs::exists(tempDir / "playlist1.txt"));
    EXPECT_TRUE(fs::exists(tempDir / "playlist2.txt"));
}

// ============================================================
// Pruning and entry playlist
// ============================================================

TEST_F(PlaylistWriterTest, PruneStopsAtFirstLivePlaylist) {
    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());
    for (int i = 1; i <= 4; ++i) {
        ASSERT_TRUE(writer.append(segment("media-" + std::to_string(i) + ".flv")).ok());
    }
    // media-1 and media-2 evicted; media-3 still live; media-4 live.
    EXPECT_EQ(writer.pruneStale(liveNames({"media-3.flv", "media-4.flv"})), 2u);
    EXPECT_FALSE(fs::exists(tempDir / "playlist1.txt"));
    EXPECT_FALSE(fs::exists(tempDir / "playlist2.txt"));
    EXPECT_TRUE(fs::exists(tempDir / "playlist3.txt"));
    EXPECT_TRUE(fs::exists(tempDir / "playlist5.txt"));
}

TEST_F(PlaylistWriterTest, PruneKeepsPlaylistWhoseSegmentIsStillOnDisk) {
    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());
    test::writeFile(tempDir / "media-1.flv", "FLV");
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-2.flv")).ok());

    EXPECT_EQ(writer.pruneStale(liveNames({})), 0u);
    EXPECT_TRUE(fs::exists(tempDir / "playlist1.txt"));
}

TEST_F(PlaylistWriterTest, PruneSeesSegmentCommittedBeforeTheCall) {
    queue::QueueState queueState;
    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());

    auto committed = segment("media-1.flv");
    committed.sequenceNumber = queueState.allocateSequenceNumber();
    queueState.commit(committed);
    ASSERT_TRUE(writer.append(committed).ok());

    EXPECT_EQ(writer.pruneStale(liveNamesOf(queueState)), 0u);
    EXPECT_TRUE(fs::exists(tempDir / "playlist1.txt"));
    EXPECT_EQ(queueState.size(), 1u);
}

TEST_F(PlaylistWriterTest, PruneDuringCommitsKeepsEveryLivePlaylist) {
    constexpr int kSegments = 200;
    queue::QueueState queueState;
    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());

    std::atomic<bool> done{false};
    std::atomic<int> appendFailures{0};
    std::thread renderer([&]() {
        for (int i = 1; i <= kSegments; ++i) {
            auto s = segment("media-" + std::to_string(i) + ".flv");
            s.sequenceNumber = queueState.allocateSequenceNumber();
            queueState.commit(s);
            if (!writer.append(s).ok()) {
                ++appendFailures;
            }
        }
        done = true;
    });

    std::size_t pruned = 0;
    while (!done) {
        pruned += writer.pruneStale(liveNamesOf(queueState));
    }
    renderer.join();
    pruned += writer.pruneStale(liveNamesOf(queueState));

    EXPECT_EQ(appendFailures.load(), 0);
    EXPECT_EQ(pruned, 0u);
    for (int n = 1; n <= kSegments; ++n) {
        EXPECT_TRUE(fs::exists(tempDir / PlaylistWriter::playlistName(n))) << n;
    }
}

TEST_F(PlaylistWriterTest, PruneNeverRemovesActivePlaylist) {
    PlaylistWriter writer(tempDir, 100);
    ASSERT_TRUE(writer.open().ok());
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    EXPECT_EQ(writer.pruneStale(liveNames({})), 0u);
    EXPECT_TRUE(fs::exists(tempDir / "playlist1.txt"));
}

TEST_F(PlaylistWriterTest, EntryPlaylistPointsAtStartupThenLowest) {
    PlaylistWriter writer(tempDir, 1);
    ASSERT_TRUE(writer.open().ok());
    ASSERT_TRUE(writer.append(segment("media-1.flv")).ok());
    ASSERT_TRUE(writer.append(segment("media-2.flv")).ok());
    writer.pruneStale(liveNames({"media-2.flv"}));

    ASSERT_TRUE(writer.writeEntryPlaylist().ok());
    EXPECT_EQ(readLines(tempDir / "playlist0.txt"),
              (std::vector<std::string>{"ffconcat version 1.0", "file startup.flv",
                                        "file playlist2.txt"}));
    EXPECT_FALSE(fs::exists(tempDir / "playlist0.txt.tmp"));
}

TEST_F(PlaylistWriterTest, EntryPlaylistWithoutNumberedFilesFails) {
    PlaylistWriter writer(tempDir, 1);
    EXPECT_EQ(writer.writeEntryPlaylist().errorCode, ErrorCode::STORAGE_UNAVAILABLE);
}
