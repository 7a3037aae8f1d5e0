#include "feed/BoundedTickQueue.h"

#include <stdexcept>
#include <utility>

namespace tickpilot {
namespace feed {

BoundedTickQueue::BoundedTickQueue(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("BoundedTickQueue capacity must be positive");
    }
}

bool BoundedTickQueue::push(Tick tick) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool evicted = false;
    if (items_.size() >= capacity_) {
        items_.pop_front();
        ++evicted_;
        evicted = true;
    }
    items_.push_back(std::move(tick));
    return evicted;
}

std::optional<Tick> BoundedTickQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    Tick tick = std::move(items_.front());
    items_.pop_front();
    return tick;
}

std::size_t BoundedTickQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::uint64_t BoundedTickQueue::evictedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

void BoundedTickQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

} // namespace feed
} // namespace tickpilot
