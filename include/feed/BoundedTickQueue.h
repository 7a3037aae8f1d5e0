#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "common/Types.h"

namespace tickpilot {
namespace feed {

// Fixed-capacity FIFO shared by the feed thread (producer) and whichever
// context consumes ticks. push() never blocks: when full, the oldest tick is
// dropped to admit the newest.
class BoundedTickQueue {
public:
    explicit BoundedTickQueue(std::size_t capacity);

    // true if an older tick had to be evicted
    bool push(Tick tick);

    std::optional<Tick> tryPop();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::uint64_t evictedCount() const;

    void clear();

private:
    const std::size_t capacity_;
    std::deque<Tick> items_;
    std::uint64_t evicted_ = 0;
    mutable std::mutex mutex_;
};

} // namespace feed
} // namespace tickpilot
