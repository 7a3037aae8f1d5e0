#pragma once

#include <chrono>
#include <map>
#include <mutex>

#include "common/RateLimiter.h"
#include "core/model/DiagnosticTypes.h"

namespace tickpilot {
namespace core {

struct DiagnosticAdmission {
    bool emit = false;
    long long suppressed = 0;   // dropped since the previous emit of this type
};

// Thins noisy diagnostic events per event type, either by occurrence count
// or by wall-clock window. The mode is fixed at construction and the other
// clock is never consulted.
//
// ENTRY_ACCEPTED, EXIT_TRIGGERED and the FEED_* events always pass and never
// touch a counter, so in COUNT mode only the tick path advances the count.
class DiagnosticRateLimiter {
public:
    // every_n is used in COUNT mode, window in TIME mode
    DiagnosticRateLimiter(DiagnosticLimitMode mode, int every_n, std::chrono::milliseconds window);

    DiagnosticRateLimiter(const DiagnosticRateLimiter&) = delete;
    DiagnosticRateLimiter& operator=(const DiagnosticRateLimiter&) = delete;

    DiagnosticAdmission admit(DiagnosticEventType type,
                              common::SteadyClock::time_point now = common::SteadyClock::now());

    DiagnosticLimitMode mode() const { return mode_; }

    static bool alwaysEmitted(DiagnosticEventType type);

private:
    DiagnosticLimitMode mode_;
    common::EveryNthLimiter count_limiter_;
    common::WindowRateLimiter time_limiter_;
    std::map<DiagnosticEventType, long long> pending_suppressed_;
    std::mutex mutex_;
};

} // namespace core
} // namespace tickpilot
