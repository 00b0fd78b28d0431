#include "media/media_probe.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace prerender::media {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string findTag(const nlohmann::json& tags, const std::string& key) {
    if (!tags.is_object()) {
        return std::string();
    }
    for (auto it = tags.begin(); it != tags.end(); ++it) {
        if (lower(it.key()) == key && it.value().is_string()) {
            return it.value().get<std::string>();
        }
    }
    return std::string();
}

// ffprobe emits numbers as strings ("123.456000").
std::optional<double> numberField(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto& v = obj[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str()) {
            return d;
        }
    }
    return std::nullopt;
}

}  // namespace

ProbeResult parseFfprobeJson(const std::string& json) {
    ProbeResult result;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        result.errorCode = ErrorCode::RENDER_PROBE_FAILED;
        result.errorMessage = std::string("invalid ffprobe output: ") + e.what();
        return result;
    }

    const nlohmann::json empty = nlohmann::json::object();
    const auto& format = j.contains("format") ? j["format"] : empty;

    std::optional<double> duration = numberField(format, "duration");
    if (j.contains("streams") && j["streams"].is_array()) {
        for (const auto& stream : j["streams"]) {
            std::string type = stream.value("codec_type", "");
            if (type == "audio") {
                result.hasAudio = true;
            } else if (type == "video") {
                result.hasVideo = true;
            }
            if (!duration) {
                duration = numberField(stream, "duration");
            }
        }
    }

    result.formatName = format.value("format_name", "");
    if (format.contains("tags")) {
        result.title = findTag(format["tags"], "title");
        result.artist = findTag(format["tags"], "artist");
        result.comment = findTag(format["tags"], "comment");
    }

    if (!duration || *duration <= 0.0) {
        result.errorCode = ErrorCode::RENDER_PROBE_FAILED;
        result.errorMessage = "no positive duration reported";
        return result;
    }
    result.durationSeconds = *duration;
    return result;
}

std::optional<double> parseLastProgressTime(const std::string& ffmpegLog) {
    auto pos = ffmpegLog.rfind("time=");
    while (pos != std::string::npos) {
        int h = 0, m = 0;
        double s = 0.0;
        if (std::sscanf(ffmpegLog.c_str() + pos + 5, "%d:%d:%lf", &h, &m, &s) == 3) {
            return h * 3600.0 + m * 60.0 + s;
        }
        if (pos == 0) {
            break;
        }
        pos = ffmpegLog.rfind("time=", pos - 1);
    }
    return std::nullopt;
}

FfprobeMediaProbe::FfprobeMediaProbe(IProcessRunner& runner, std::string ffprobePath)
    : runner_(runner), ffprobePath_(std::move(ffprobePath)) {}

ProbeResult FfprobeMediaProbe::probe(const std::filesystem::path& file) {
    auto proc = runner_.run({ffprobePath_, "-v", "quiet", "-print_format", "json",
                             "-show_format", "-show_streams", file.string()});
    if (!proc.ok()) {
        ProbeResult result;
        result.errorCode = ErrorCode::RENDER_PROBE_FAILED;
        result.errorMessage = "ffprobe failed on " + file.string();
        return result;
    }
    auto result = parseFfprobeJson(proc.standardOutput);
    if (!result.ok()) {
        LOG_DEBUG("Probe of {} failed: {}", file.string(), result.errorMessage);
    }
    return result;
}

}  // namespace prerender::media
