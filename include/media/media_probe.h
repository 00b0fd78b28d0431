#pragma once

#include "core/error_codes.h"
#include "media/process_runner.h"

#include <filesystem>
#include <optional>
#include <string>

namespace prerender::media {

struct ProbeResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    double durationSeconds = 0.0;
    std::string formatName;
    std::string title;
    std::string artist;
    std::string comment;
    bool hasAudio = false;
    bool hasVideo = false;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

class IMediaProbe {
   public:
    virtual ~IMediaProbe() = default;
    // RENDER_PROBE_FAILED when the file is unreadable or has no duration.
    virtual ProbeResult probe(const std::filesystem::path& file) = 0;
};

class FfprobeMediaProbe : public IMediaProbe {
   public:
    FfprobeMediaProbe(IProcessRunner& runner, std::string ffprobePath);

    ProbeResult probe(const std::filesystem::path& file) override;

   private:
    IProcessRunner& runner_;
    std::string ffprobePath_;
};

// Parses `ffprobe -print_format json -show_format -show_streams` output.
// Tag lookup is case-insensitive.
ProbeResult parseFfprobeJson(const std::string& json);

// Last "time=HH:MM:SS.xx" progress stamp in an ffmpeg log, in seconds.
std::optional<double> parseLastProgressTime(const std::string& ffmpegLog);

}  // namespace prerender::media
