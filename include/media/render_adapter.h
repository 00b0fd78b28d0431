#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "media/media_probe.h"
#include "media/process_runner.h"
#include "media/quality_ladder.h"

#include <filesystem>
#include <string>
#include <vector>

namespace prerender::media {

struct RenderResult {
    ErrorCode errorCode = ErrorCode::OK;
    std::string errorMessage;
    std::filesystem::path outputPath;
    double durationSeconds = 0.0;   // of the rendered output
    double wallClockSeconds = 0.0;  // time spent rendering
    std::string title;

    bool ok() const {
        return errorCode == ErrorCode::OK;
    }
};

class IRenderAdapter {
   public:
    virtual ~IRenderAdapter() = default;

    // Renders input into a playable segment at output. On failure no file
    // is left at output.
    virtual RenderResult render(const std::filesystem::path& input,
                                const std::filesystem::path& output) = 0;

    // Feedback after each committed render.
    virtual void onSpeedMeasured(double achievedSpeed) {
        (void)achievedSpeed;
    }
};

// Two ffmpeg passes: silence trim to AAC, then a constant-Q spectrum
// visualiser with the metadata card scrolled over it, H.264 CBR in FLV.
class FfmpegRenderAdapter : public IRenderAdapter {
   public:
    FfmpegRenderAdapter(const AppConfig& config, IProcessRunner& runner, IMediaProbe& probe,
                        std::filesystem::path workDir, std::filesystem::path fontFile);

    RenderResult render(const std::filesystem::path& input,
                        const std::filesystem::path& output) override;
    void onSpeedMeasured(double achievedSpeed) override;

    const QualityLadder& qualityLadder() const {
        return ladder_;
    }

    // Argument vectors, exposed for tests.
    std::vector<std::string> trimCommand(const std::filesystem::path& input,
                                         const std::filesystem::path& aacOut) const;
    std::vector<std::string> measureCommand(const std::filesystem::path& aac) const;
    std::vector<std::string> visualiseCommand(const std::filesystem::path& aac,
                                              const std::filesystem::path& cardFile,
                                              double durationSeconds,
                                              const std::filesystem::path& output) const;

   private:
    RenderResult renderStages(const std::filesystem::path& input,
                              const std::filesystem::path& output, const ProbeResult& source,
                              const std::filesystem::path& aac,
                              const std::filesystem::path& card);

    const AppConfig& config_;
    IProcessRunner& runner_;
    IMediaProbe& probe_;
    std::filesystem::path workDir_;
    std::filesystem::path fontFile_;
    QualityLadder ladder_;
};

// Escapes a path for use as a filter option value inside -filter_complex.
std::string escapeFilterPath(const std::string& path);

}  // namespace prerender::media
