#pragma once

#include <array>
#include <string>

namespace prerender::media {

// x264 CRF and preset stepped one notch per render so that the achieved
// speed converges on the target. Starts at the best CRF and fastest preset.
class QualityLadder {
   public:
    static constexpr int MIN_CRF = 17;
    static constexpr int MAX_CRF = 28;
    static constexpr double PRESET_HYSTERESIS = 0.5;
    static constexpr std::array<const char*, 9> PRESETS = {
        "ultrafast", "superfast", "veryfast", "faster", "fast",
        "medium",    "slow",      "slower",   "veryslow"};

    explicit QualityLadder(double targetSpeed);

    // Below target: raise CRF (cheaper); above: lower it. The preset moves
    // only outside target +/- PRESET_HYSTERESIS.
    void observe(double achievedSpeed);

    int crf() const {
        return crf_;
    }
    std::size_t presetIndex() const {
        return presetIndex_;
    }
    std::string preset() const {
        return PRESETS[presetIndex_];
    }

   private:
    double targetSpeed_;
    int crf_ = MIN_CRF;
    std::size_t presetIndex_ = 0;
};

}  // namespace prerender::media
