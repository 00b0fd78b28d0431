#include "queue/queue_state.h"

#include "logging/logger.h"

#include <algorithm>
#include <system_error>

namespace prerender::queue {

std::uint64_t QueueState::allocateSequenceNumber() {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSequence_++;
}

void QueueState::commit(const Segment& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    segments_.push_back(segment);
    nextSequence_ = std::max(nextSequence_, segment.sequenceNumber + 1);
}

void QueueState::restore(std::vector<Segment> segments) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::stable_sort(segments.begin(), segments.end(), [](const Segment& a, const Segment& b) {
        return a.sequenceNumber < b.sequenceNumber;
    });
    segments_ = std::move(segments);
    nextSequence_ = segments_.empty() ? 1 : segments_.back().sequenceNumber + 1;
}

bool QueueState::remove(std::uint64_t sequenceNumber) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(segments_.begin(), segments_.end(), [&](const Segment& s) {
        return s.sequenceNumber == sequenceNumber;
    });
    if (it == segments_.end()) {
        return false;
    }
    segments_.erase(it);
    return true;
}

std::size_t QueueState::reconcile(const ExistsFn& exists) {
    ExistsFn check = exists;
    if (!check) {
        check = [](const std::filesystem::path& p) {
            std::error_code ec;
            return std::filesystem::exists(p, ec);
        };
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto before = segments_.size();
    segments_.erase(std::remove_if(segments_.begin(), segments_.end(),
                                   [&](const Segment& s) {
                                       if (check(s.filePath)) {
                                           return false;
                                       }
                                       LOG_WARN("Segment {} vanished from disk; dropping it",
                                                s.filePath.filename().string());
                                       return true;
                                   }),
                    segments_.end());
    return before - segments_.size();
}

std::vector<Segment> QueueState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_;
}

std::optional<Segment> QueueState::oldest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (segments_.empty()) {
        return std::nullopt;
    }
    return segments_.front();
}

std::size_t QueueState::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.size();
}

bool QueueState::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.empty();
}

double QueueState::bufferedDurationSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& s : segments_) {
        total += s.durationSeconds;
    }
    return total;
}

std::uint64_t QueueState::storageBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& s : segments_) {
        total += s.sizeBytes;
    }
    return total;
}

}  // namespace prerender::queue
