#pragma once

#include "core/config_loader.h"
#include "queue/queue_state.h"

namespace prerender::queue {

// Render another track only while the buffer is strictly below the limit.
// A render that overshoots is fine; the next check says stop.
inline bool shouldRenderMore(double bufferedSeconds, double gasTankLimitSeconds) {
    return bufferedSeconds < gasTankLimitSeconds;
}

inline bool shouldRenderMore(const QueueState& queue, const AppConfig& config) {
    return shouldRenderMore(queue.bufferedDurationSeconds(), config.gasTankLimitSeconds);
}

}  // namespace prerender::queue
