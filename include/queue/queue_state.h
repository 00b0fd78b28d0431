#pragma once

#include "queue/segment.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace prerender::queue {

// Committed segments in commit order, shared by the render loop and the
// eviction thread. Aggregates are derived on demand, never cached.
class QueueState {
   public:
    using ExistsFn = std::function<bool(const std::filesystem::path&)>;

    QueueState() = default;
    QueueState(const QueueState&) = delete;
    QueueState& operator=(const QueueState&) = delete;

    // Next unused sequence number. Strictly increasing.
    std::uint64_t allocateSequenceNumber();

    // Appends; the segment's sequence number must come from
    // allocateSequenceNumber (or recovery).
    void commit(const Segment& segment);

    // Replaces the whole queue (startup recovery) and continues numbering
    // after the largest sequence number present.
    void restore(std::vector<Segment> segments);

    bool remove(std::uint64_t sequenceNumber);

    // Drops entries whose backing file has disappeared. Returns the
    // number dropped.
    std::size_t reconcile(const ExistsFn& exists = ExistsFn());

    std::vector<Segment> snapshot() const;
    std::optional<Segment> oldest() const;
    std::size_t size() const;
    bool empty() const;

    double bufferedDurationSeconds() const;
    std::uint64_t storageBytes() const;

   private:
    mutable std::mutex mutex_;
    std::vector<Segment> segments_;
    std::uint64_t nextSequence_ = 1;
};

}  // namespace prerender::queue
