#include "media/media_probe.h"
#include "support/test_support.h"

#include <gtest/gtest.h>

using namespace prerender;
using namespace prerender::media;
using prerender::test::FakeProcessRunner;

// ============================================================
// parseFfprobeJson
// ============================================================

TEST(ParseFfprobeJson, ReadsFormatDurationAndTags) {
    auto result = parseFfprobeJson(R"({
        "streams": [{"codec_type": "audio", "duration": "200.0"}],
        "format": {
            "format_name": "mod",
            "duration": "187.250000",
            "tags": {"TITLE": "Space Debris", "Artist": "Captain", "comment": "line1\nline2"}
        }
    })");
    ASSERT_TRUE(result.ok()) << result.errorMessage;
    EXPECT_DOUBLE_EQ(result.durationSeconds, 187.25);
    EXPECT_EQ(result.formatName, "mod");
    EXPECT_EQ(result.title, "Space Debris");
    EXPECT_EQ(result.artist, "Captain");
    EXPECT_EQ(result.comment, "line1\nline2");
    EXPECT_TRUE(result.hasAudio);
    EXPECT_FALSE(result.hasVideo);
}

TEST(ParseFfprobeJson, FallsBackToStreamDuration) {
    auto result = parseFfprobeJson(R"({
        "streams": [{"codec_type": "video"}, {"codec_type": "audio", "duration": 42.5}],
        "format": {"format_name": "flv"}
    })");
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.durationSeconds, 42.5);
    EXPECT_TRUE(result.hasVideo);
    EXPECT_TRUE(result.title.empty());
}

TEST(ParseFfprobeJson, MissingDurationFails) {
    auto result = parseFfprobeJson(R"({"streams": [], "format": {"duration": "0.000"}})");
    EXPECT_EQ(result.errorCode, ErrorCode::RENDER_PROBE_FAILED);
}

TEST(ParseFfprobeJson, InvalidJsonFails) {
    EXPECT_EQ(parseFfprobeJson("not json").errorCode, ErrorCode::RENDER_PROBE_FAILED);
    EXPECT_EQ(parseFfprobeJson("").errorCode, ErrorCode::RENDER_PROBE_FAILED);
}

// ============================================================
// parseLastProgressTime
// ============================================================

TEST(ParseLastProgressTime, UsesLastStamp) {
    std::string log =
        "size=N/A time=00:00:10.00 bitrate=N/A speed=20x\r"
        "size=N/A time=00:03:05.50 bitrate=N/A speed=25x\n";
    auto t = parseLastProgressTime(log);
    ASSERT_TRUE(t.has_value());
    EXPECT_DOUBLE_EQ(*t, 185.5);
}

TEST(ParseLastProgressTime, SkipsUnavailableStamp) {
    auto t = parseLastProgressTime("time=01:00:00.00 speed=1x\ntime=N/A\n");
    ASSERT_TRUE(t.has_value());
    EXPECT_DOUBLE_EQ(*t, 3600.0);
}

TEST(ParseLastProgressTime, NoStampIsNullopt) {
    EXPECT_FALSE(parseLastProgressTime("Output #0, null\n").has_value());
}

// ============================================================
// FfprobeMediaProbe
// ============================================================

TEST(FfprobeMediaProbe, RunsFfprobeWithJsonOutput) {
    FakeProcessRunner runner;
    runner.handler = [](const std::vector<std::string>&) {
        return FakeProcessRunner::exited(0, R"({"format": {"duration": "12.0"}})");
    };
    FfprobeMediaProbe probe(runner, "/usr/bin/ffprobe");
    auto result = probe.probe("/media/x.flv");
    ASSERT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(result.durationSeconds, 12.0);
    EXPECT_EQ(runner.calls[0],
              (std::vector<std::string>{"/usr/bin/ffprobe", "-v", "quiet", "-print_format",
                                        "json", "-show_format", "-show_streams",
                                        "/media/x.flv"}));
}

TEST(FfprobeMediaProbe, StderrWarningsDoNotBreakParsing) {
    FakeProcessRunner runner;
    runner.handler = [](const std::vector<std::string>&) {
        return FakeProcessRunner::exited(0, R"({"format": {"duration": "7.5"}})",
                                         "[mp3 @ 0x1] Estimating duration from bitrate\n");
    };
    FfprobeMediaProbe probe(runner, "ffprobe");
    auto result = probe.probe("/media/x.mp3");
    ASSERT_TRUE(result.ok()) << result.errorMessage;
    EXPECT_DOUBLE_EQ(result.durationSeconds, 7.5);
}

TEST(FfprobeMediaProbe, NonZeroExitFails) {
    FakeProcessRunner runner;
    runner.handler = [](const std::vector<std::string>&) {
        return FakeProcessRunner::exited(1);
    };
    FfprobeMediaProbe probe(runner, "ffprobe");
    EXPECT_EQ(probe.probe("/media/x.flv").errorCode, ErrorCode::RENDER_PROBE_FAILED);
}
