#include "media/archive_reader.h"
#include "media/media_fetcher.h"
#include "support/test_support.h"

#include <algorithm>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace prerender;
using namespace prerender::media;
using prerender::test::FakeProcessRunner;

class MediaFetchTest : public test::TempDirTest {
   protected:
    FakeProcessRunner runner;

    // Behaves like curl: writes the --output file on success.
    void succeedWith(const std::string& body) {
        runner.handler = [body](const std::vector<std::string>& args) {
            for (std::size_t i = 0; i + 1 < args.size(); ++i) {
                if (args[i] == "--output") {
                    test::writeFile(args[i + 1], body);
                }
            }
            return FakeProcessRunner::exited(0);
        };
    }
};

// ============================================================
// URI helpers
// ============================================================

TEST(MediaFetcherNames, EncodeUriEscapesSpacesOnly) {
    EXPECT_EQ(encodeUri("https://host/a b.mp3?x=1&y=2"), "https://host/a%20b.mp3?x=1&y=2");
    EXPECT_EQ(encodeUri("https://host/already%20done.xm"), "https://host/already%20done.xm");
}

TEST(MediaFetcherNames, LocalNameIsDecodedAndSanitised) {
    EXPECT_EQ(localNameFor("https://host/dir/My%20Song%21.mp3?sig=1"), "My_Song_.mp3");
    EXPECT_EQ(localNameFor("https://host/dir/"), "download");
    EXPECT_EQ(localNameFor("https://host/dir/%2E%2E"), "download");
}

// ============================================================
// CurlMediaFetcher
// ============================================================

TEST_F(MediaFetchTest, FetchWritesIntoScratchDirectory) {
    succeedWith("payload");
    CurlMediaFetcher fetcher(runner, "curl", tempDir);

    auto result = fetcher.fetch({"https://host/songs/tune.xm", "xm", std::nullopt});
    ASSERT_TRUE(result.ok()) << result.errorMessage;
    EXPECT_EQ(result.localPath, tempDir / "tune.xm");
    EXPECT_EQ(test::readFile(result.localPath), "payload");

    ASSERT_EQ(runner.calls.size(), 1u);
    const auto& argv = runner.calls[0];
    EXPECT_EQ(argv.front(), "curl");
    EXPECT_EQ(argv.back(), "https://host/songs/tune.xm");
    EXPECT_NE(std::find(argv.begin(), argv.end(), "--fail"), argv.end());
    EXPECT_NE(std::find(argv.begin(), argv.end(), "--location"), argv.end());
}

TEST_F(MediaFetchTest, HttpErrorIsNotFound) {
    runner.handler = [](const std::vector<std::string>&) {
        return FakeProcessRunner::exited(22, "The requested URL returned error: 404");
    };
    CurlMediaFetcher fetcher(runner, "curl", tempDir);
    EXPECT_EQ(fetcher.fetch({"https://host/gone.mp3", "mp3", std::nullopt}).errorCode,
              ErrorCode::FETCH_NOT_FOUND);
}

TEST_F(MediaFetchTest, ConnectionFailureIsNetworkError) {
    runner.handler = [](const std::vector<std::string>& args) {
        test::writeFile(args[6], "half");
        return FakeProcessRunner::exited(7, "Failed to connect");
    };
    CurlMediaFetcher fetcher(runner, "curl", tempDir);
    auto result = fetcher.fetch({"https://host/a.mp3", "mp3", std::nullopt});
    EXPECT_EQ(result.errorCode, ErrorCode::FETCH_NETWORK);
    EXPECT_FALSE(fs::exists(tempDir / "a.mp3"));
}

TEST_F(MediaFetchTest, UnspawnableCurlIsNetworkError) {
    runner.handler = [](const std::vector<std::string>&) { return media::ProcessResult{}; };
    CurlMediaFetcher fetcher(runner, "curl", tempDir);
    EXPECT_EQ(fetcher.download("https://host/a.mp3", tempDir / "a.mp3").errorCode,
              ErrorCode::FETCH_NETWORK);
}

// ============================================================
// UnzipArchiveReader
// ============================================================

TEST(UnzipPattern, EscapesWildcards) {
    EXPECT_EQ(escapeUnzipPattern("songs/[demo] a*b?.xm"), "songs/\\[demo\\] a\\*b\\?.xm");
    EXPECT_EQ(escapeUnzipPattern("plain.mod"), "plain.mod");
}

TEST_F(MediaFetchTest, ListParsesOneEntryPerLine) {
    runner.handler = [](const std::vector<std::string>&) {
        return FakeProcessRunner::exited(0, "songs/\nsongs/a.xm\r\nb.mod\n");
    };
    UnzipArchiveReader reader(runner, "unzip");
    auto listing = reader.list(tempDir / "pack.zip");
    ASSERT_TRUE(listing.ok());
    EXPECT_EQ(listing.entries, (std::vector<std::string>{"songs/", "songs/a.xm", "b.mod"}));
    EXPECT_EQ(runner.calls[0], (std::vector<std::string>{"unzip", "-Z1",
                                                          (tempDir / "pack.zip").string()}));
}

TEST_F(MediaFetchTest, ListFailureIsArchiveError) {
    runner.handler = [](const std::vector<std::string>&) {
        return FakeProcessRunner::exited(9, "End-of-central-directory signature not found");
    };
    UnzipArchiveReader reader(runner, "unzip");
    EXPECT_EQ(reader.list(tempDir / "broken.zip").errorCode, ErrorCode::FETCH_ARCHIVE);
}

TEST_F(MediaFetchTest, ExtractJunksPathsIntoDestination) {
    fs::path dest = tempDir / "extract";
    runner.handler = [dest](const std::vector<std::string>&) {
        test::writeFile(dest / "a.xm", "module");
        return FakeProcessRunner::exited(0);
    };
    UnzipArchiveReader reader(runner, "unzip");
    auto result = reader.extract(tempDir / "pack.zip", "songs/a.xm", dest);
    ASSERT_TRUE(result.ok()) << result.errorMessage;
    EXPECT_EQ(result.localPath, dest / "a.xm");

    const auto& argv = runner.calls[0];
    EXPECT_EQ(argv[1], "-o");
    EXPECT_EQ(argv[2], "-j");
    EXPECT_EQ(argv[5], "songs/a.xm");
    EXPECT_EQ(argv.back(), dest.string());
}

TEST_F(MediaFetchTest, ExtractWithoutOutputIsArchiveError) {
    UnzipArchiveReader reader(runner, "unzip");
    auto result = reader.extract(tempDir / "pack.zip", "songs/a.xm", tempDir / "extract");
    EXPECT_EQ(result.errorCode, ErrorCode::FETCH_ARCHIVE);
}
