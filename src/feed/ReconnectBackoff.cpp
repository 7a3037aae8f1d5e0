#include "feed/ReconnectBackoff.h"

#include <algorithm>

namespace tickpilot {
namespace feed {

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds initial_delay,
                                   std::chrono::milliseconds max_delay,
                                   int max_attempts)
    : initial_(initial_delay)
    , max_(std::max(max_delay, initial_delay))
    , max_attempts_(max_attempts)
    , current_(initial_delay) {}

std::optional<std::chrono::milliseconds> ReconnectBackoff::nextDelay() {
    if (exhausted()) {
        return std::nullopt;
    }
    ++attempts_;
    const auto delay = current_;
    current_ = std::min(max_, current_ * 2);
    return delay;
}

void ReconnectBackoff::reset() {
    attempts_ = 0;
    current_ = initial_;
}

} // namespace feed
} // namespace tickpilot
