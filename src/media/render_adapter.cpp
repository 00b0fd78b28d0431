#include "media/render_adapter.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"
#include "media/metadata_card.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <system_error>

namespace prerender::media {

namespace {

constexpr const char* VIDEO_BITRATE = "4.5M";
constexpr const char* VIDEO_BUFSIZE = "9M";
constexpr const char* AUDIO_BITRATE = "128k";
constexpr int CARD_FONT_SIZE = 24;
constexpr double CARD_SCROLL_SECONDS = 50.0;

std::string escapeWith(const std::string& in, const std::string& special) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string formatSeconds(double seconds) {
    std::ostringstream os;
    os.precision(3);
    os << std::fixed << seconds;
    return os.str();
}

void removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace

std::string escapeFilterPath(const std::string& path) {
    // Option level first, then filtergraph level.
    return escapeWith(escapeWith(path, "\\':"), "\\'[],;");
}

FfmpegRenderAdapter::FfmpegRenderAdapter(const AppConfig& config, IProcessRunner& runner,
                                         IMediaProbe& probe, std::filesystem::path workDir,
                                         std::filesystem::path fontFile)
    : config_(config),
      runner_(runner),
      probe_(probe),
      workDir_(std::move(workDir)),
      fontFile_(std::move(fontFile)),
      ladder_(config.targetSpeedMultiplier) {}

std::vector<std::string> FfmpegRenderAdapter::trimCommand(const std::filesystem::path& input,
                                                          const std::filesystem::path& aacOut) const {
    return {config_.tools.ffmpeg,
            "-nostdin",
            "-i",
            input.string(),
            "-y",
            "-loglevel",
            "warning",
            "-nostats",
            "-hide_banner",
            "-af",
            "silenceremove=start_periods=1:stop_periods=1:detection=peak",
            "-ar",
            std::to_string(DaemonConstants::RENDER_AUDIO_RATE),
            "-c:a",
            "aac",
            "-b:a",
            AUDIO_BITRATE,
            aacOut.string()};
}

std::vector<std::string> FfmpegRenderAdapter::measureCommand(
    const std::filesystem::path& aac) const {
    return {config_.tools.ffmpeg, "-nostdin", "-hide_banner", "-nostats", "-loglevel", "info",
            "-i",                 aac.string(), "-f",         "null",     "-c",        "copy",
            "-"};
}

std::vector<std::string> FfmpegRenderAdapter::visualiseCommand(
    const std::filesystem::path& aac, const std::filesystem::path& cardFile,
    double durationSeconds, const std::filesystem::path& output) const {
    using namespace DaemonConstants;
    double fadeOutStart = std::max(0.0, durationSeconds - RENDER_FADE_SECONDS);

    std::ostringstream graph;
    graph << "[0:a]showcqt=sono_h=0:axis=0:s=" << RENDER_WIDTH << "x" << RENDER_HEIGHT
          << ":fps=" << RENDER_FPS << ":bar_h=" << RENDER_HEIGHT
          << ":cscheme=1|0|1|0|1|0:csp=bt470bg,hflip,drawtext=";
    std::error_code ec;
    if (!fontFile_.empty() && std::filesystem::exists(fontFile_, ec)) {
        graph << "fontfile=" << escapeFilterPath(fontFile_.string()) << ":";
    }
    graph << "fontsize=" << CARD_FONT_SIZE << ":fontcolor=white:x=20"
          << ":y=h-mod(max(t-0.0\\,0)*(h+th)/" << formatSeconds(CARD_SCROLL_SECONDS)
          << "\\,(h+th))"
          << ":textfile=" << escapeFilterPath(cardFile.string())
          << ",fade=t=in:st=0:d=" << formatSeconds(RENDER_FADE_SECONDS)
          << ",fade=t=out:st=" << formatSeconds(fadeOutStart)
          << ":d=" << formatSeconds(RENDER_FADE_SECONDS) << "[out]";

    return {config_.tools.ffmpeg,
            "-nostdin",
            "-i",
            aac.string(),
            "-y",
            "-loglevel",
            "warning",
            "-nostats",
            "-hide_banner",
            "-filter_complex",
            graph.str(),
            "-map",
            "[out]",
            "-map",
            "0:a",
            "-c:v",
            "libx264",
            "-x264-params",
            "nal-hrd=cbr:force-cfr=1",
            "-b:v",
            VIDEO_BITRATE,
            "-preset",
            ladder_.preset(),
            "-tune",
            "fastdecode",
            "-crf",
            std::to_string(ladder_.crf()),
            "-maxrate",
            VIDEO_BITRATE,
            "-minrate",
            VIDEO_BITRATE,
            "-bufsize",
            VIDEO_BUFSIZE,
            "-ar",
            std::to_string(RENDER_AUDIO_RATE),
            "-c:a",
            "copy",
            "-g",
            "4",
            "-f",
            "flv",
            output.string()};
}

RenderResult FfmpegRenderAdapter::render(const std::filesystem::path& input,
                                         const std::filesystem::path& output) {
    auto started = std::chrono::steady_clock::now();

    RenderResult result;
    ProbeResult source = probe_.probe(input);
    if (!source.ok()) {
        result.errorCode = ErrorCode::RENDER_TRACK_REJECTED;
        result.errorMessage = "no duration: " + source.errorMessage;
    } else if (source.title.empty()) {
        result.errorCode = ErrorCode::RENDER_TRACK_REJECTED;
        result.errorMessage = "no title tag";
    } else if (source.durationSeconds > config_.effectiveMaxTrackSeconds()) {
        result.errorCode = ErrorCode::RENDER_TRACK_REJECTED;
        result.errorMessage = "duration " + formatSeconds(source.durationSeconds) +
                              "s exceeds " + formatSeconds(config_.effectiveMaxTrackSeconds()) +
                              "s";
    }
    if (!result.ok()) {
        LOG_INFO("Rejecting {}: {}", input.filename().string(), result.errorMessage);
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(workDir_, ec);
    std::string stem = output.stem().string();
    std::filesystem::path aac = workDir_ / (stem + ".aac");
    std::filesystem::path card = workDir_ / (stem + ".txt");

    LOG_INFO("Rendering {} ({:.1f}s, \"{}\") -> {}", input.filename().string(),
             source.durationSeconds, source.title, output.filename().string());
    result = renderStages(input, output, source, aac, card);

    removeQuietly(aac);
    removeQuietly(card);
    if (!result.ok()) {
        removeQuietly(output);
    }
    result.wallClockSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return result;
}

RenderResult FfmpegRenderAdapter::renderStages(const std::filesystem::path& input,
                                               const std::filesystem::path& output,
                                               const ProbeResult& source,
                                               const std::filesystem::path& aac,
                                               const std::filesystem::path& card) {
    RenderResult result;
    result.title = source.title;

    auto trimArgs = trimCommand(input, aac);
    auto trim = runner_.run(trimArgs);
    if (!trim.ok()) {
        result.errorCode = ErrorCode::RENDER_FAILED;
        result.errorMessage = "silence trim failed: " + trim.output;
        LOG_WARN("[{}] exit {}: {}", errorCodeToString(result.errorCode), trim.exitCode,
                 describeCommand(trimArgs));
        return result;
    }

    auto measure = runner_.run(measureCommand(aac));
    auto trimmedDuration = measure.ok() ? parseLastProgressTime(measure.output) : std::nullopt;
    if (!trimmedDuration || *trimmedDuration <= 0.0) {
        result.errorCode = ErrorCode::RENDER_TRACK_REJECTED;
        result.errorMessage = "no duration after silence trim";
        return result;
    }
    LOG_DEBUG("Trimmed duration {:.2f}s (was {:.2f}s)", *trimmedDuration,
              source.durationSeconds);

    TrackMetadata metadata;
    metadata.title = source.title;
    metadata.artist = source.artist;
    metadata.comments = source.comment;
    metadata.filename = input.filename().string();
    if (!writeMetadataCard(card,
                           composeMetadataCard(metadata, DaemonConstants::METADATA_LINE_WIDTH))) {
        result.errorCode = ErrorCode::RENDER_FAILED;
        result.errorMessage = "cannot write metadata card " + card.string();
        return result;
    }

    auto visualiseArgs = visualiseCommand(aac, card, *trimmedDuration, output);
    auto visualise = runner_.run(visualiseArgs);
    if (!visualise.ok()) {
        result.errorCode = ErrorCode::RENDER_FAILED;
        result.errorMessage = "visualiser encode failed: " + visualise.output;
        LOG_WARN("[{}] exit {}: {}", errorCodeToString(result.errorCode), visualise.exitCode,
                 describeCommand(visualiseArgs));
        return result;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(output, ec);
    if (ec || size == 0) {
        result.errorCode = ErrorCode::RENDER_PROBE_FAILED;
        result.errorMessage = "empty output " + output.string();
        return result;
    }
    ProbeResult rendered = probe_.probe(output);
    if (!rendered.ok() || !rendered.hasVideo) {
        result.errorCode = ErrorCode::RENDER_PROBE_FAILED;
        result.errorMessage = "output failed validation: " +
                              (rendered.ok() ? std::string("no video stream")
                                             : rendered.errorMessage);
        return result;
    }

    result.outputPath = output;
    result.durationSeconds = rendered.durationSeconds;
    return result;
}

void FfmpegRenderAdapter::onSpeedMeasured(double achievedSpeed) {
    if (config_.adaptiveQuality) {
        ladder_.observe(achievedSpeed);
    }
}

}  // namespace prerender::media
