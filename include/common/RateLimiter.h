#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>

namespace tickpilot {
namespace common {

using SteadyClock = std::chrono::steady_clock;

// Per-key window state
struct RateLimitWindow {
    int max_per_window;
    int current_count;
    SteadyClock::time_point window_start;
    bool started;

    explicit RateLimitWindow(int max_req = 1)
        : max_per_window(max_req)
        , current_count(0)
        , started(false)
    {}
};

// Time-based limiter: at most max_per_window acquisitions per key inside each
// wall-clock window. Driven only by elapsed time, never by event counts.
class WindowRateLimiter {
public:
    explicit WindowRateLimiter(std::chrono::milliseconds window, int max_per_window = 1);

    // non-blocking; false means "suppress"
    bool tryAcquire(const std::string& key, SteadyClock::time_point now = SteadyClock::now());

    // acquisitions refused since the key's last successful acquire
    int suppressedSinceLast(const std::string& key) const;

    std::chrono::milliseconds window() const { return window_; }

private:
    void resetWindowIfNeeded(RateLimitWindow& state, SteadyClock::time_point now);

    std::chrono::milliseconds window_;
    int max_per_window_;
    std::map<std::string, RateLimitWindow> windows_;
    std::map<std::string, int> suppressed_;
    mutable std::mutex mutex_;
};

// Count-based limiter: lets the 1st, (N+1)th, (2N+1)th ... occurrence of each
// key through. The counter belongs to whoever calls tryAcquire; it is not
// shared across threads and is never advanced from anywhere else.
class EveryNthLimiter {
public:
    explicit EveryNthLimiter(int every_n);

    bool tryAcquire(const std::string& key);

    long long occurrences(const std::string& key) const;

    int everyN() const { return every_n_; }

private:
    int every_n_;
    std::map<std::string, long long> counters_;
};

} // namespace common
} // namespace tickpilot
