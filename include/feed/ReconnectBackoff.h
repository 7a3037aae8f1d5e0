#pragma once

#include <chrono>
#include <optional>

namespace tickpilot {
namespace feed {

// Capped exponential backoff: initial, 2x, 4x ... up to max_delay, for at
// most max_attempts attempts. Not thread-safe; owned by the feed thread.
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::milliseconds initial_delay,
                     std::chrono::milliseconds max_delay,
                     int max_attempts);

    // Delay to wait before the next attempt, counting the attempt.
    // nullopt once max_attempts have been used.
    std::optional<std::chrono::milliseconds> nextDelay();

    void reset();

    int attempts() const { return attempts_; }
    int maxAttempts() const { return max_attempts_; }
    bool exhausted() const { return attempts_ >= max_attempts_; }

    // delay the next attempt would use
    std::chrono::milliseconds currentDelay() const { return current_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    int max_attempts_;
    int attempts_ = 0;
    std::chrono::milliseconds current_;
};

} // namespace feed
} // namespace tickpilot
