#include "media/quality_ladder.h"

#include "logging/logger.h"

#include <algorithm>

namespace prerender::media {

QualityLadder::QualityLadder(double targetSpeed) : targetSpeed_(targetSpeed) {}

void QualityLadder::observe(double achievedSpeed) {
    if (achievedSpeed < targetSpeed_) {
        ++crf_;
    } else if (achievedSpeed > targetSpeed_) {
        --crf_;
    }
    crf_ = std::clamp(crf_, MIN_CRF, MAX_CRF);

    if (achievedSpeed < targetSpeed_ - PRESET_HYSTERESIS && presetIndex_ > 0) {
        --presetIndex_;
    } else if (achievedSpeed > targetSpeed_ + PRESET_HYSTERESIS &&
               presetIndex_ + 1 < PRESETS.size()) {
        ++presetIndex_;
    }
    LOG_INFO("Quality ladder: speed {:.2f}x (target {:.2f}x) -> crf {} preset {}", achievedSpeed,
             targetSpeed_, crf_, preset());
}

}  // namespace prerender::media
