#include "common/RateLimiter.h"
#include <algorithm>

namespace tickpilot {
namespace common {

WindowRateLimiter::WindowRateLimiter(std::chrono::milliseconds window, int max_per_window)
    : window_(window)
    , max_per_window_(std::max(1, max_per_window))
{}

bool WindowRateLimiter::tryAcquire(const std::string& key, SteadyClock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = windows_.find(key);
    if (it == windows_.end()) {
        it = windows_.emplace(key, RateLimitWindow(max_per_window_)).first;
    }
    auto& state = it->second;

    resetWindowIfNeeded(state, now);

    if (state.current_count < state.max_per_window) {
        state.current_count++;
        suppressed_[key] = 0;
        return true;
    }

    suppressed_[key]++;
    return false;
}

int WindowRateLimiter::suppressedSinceLast(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = suppressed_.find(key);
    return it == suppressed_.end() ? 0 : it->second;
}

void WindowRateLimiter::resetWindowIfNeeded(RateLimitWindow& state, SteadyClock::time_point now) {
    if (!state.started) {
        state.started = true;
        state.window_start = now;
        state.current_count = 0;
        return;
    }

    if (now - state.window_start >= window_) {
        state.current_count = 0;
        state.window_start = now;
    }
}

EveryNthLimiter::EveryNthLimiter(int every_n)
    : every_n_(std::max(1, every_n))
{}

bool EveryNthLimiter::tryAcquire(const std::string& key) {
    const long long seen = counters_[key]++;
    return (seen % every_n_) == 0;
}

long long EveryNthLimiter::occurrences(const std::string& key) const {
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
}

} // namespace common
} // namespace tickpilot
