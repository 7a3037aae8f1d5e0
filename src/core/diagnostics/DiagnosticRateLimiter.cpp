#include "core/diagnostics/DiagnosticRateLimiter.h"

namespace tickpilot {
namespace core {

DiagnosticRateLimiter::DiagnosticRateLimiter(DiagnosticLimitMode mode,
                                             int every_n,
                                             std::chrono::milliseconds window)
    : mode_(mode)
    , count_limiter_(every_n)
    , time_limiter_(window, 1)
{}

bool DiagnosticRateLimiter::alwaysEmitted(DiagnosticEventType type) {
    switch (type) {
        case DiagnosticEventType::ENTRY_ACCEPTED:
        case DiagnosticEventType::EXIT_TRIGGERED:
        case DiagnosticEventType::FEED_RECONNECT:
        case DiagnosticEventType::FEED_RECOVERED:
        case DiagnosticEventType::FEED_UNRECOVERABLE:
            return true;
        default:
            return false;
    }
}

DiagnosticAdmission DiagnosticRateLimiter::admit(DiagnosticEventType type,
                                                 common::SteadyClock::time_point now) {
    DiagnosticAdmission admission;
    if (alwaysEmitted(type)) {
        admission.emit = true;
        return admission;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = toString(type);
    const bool pass = mode_ == DiagnosticLimitMode::COUNT
        ? count_limiter_.tryAcquire(key)
        : time_limiter_.tryAcquire(key, now);

    long long& pending = pending_suppressed_[type];
    if (!pass) {
        ++pending;
        return admission;
    }

    admission.emit = true;
    admission.suppressed = pending;
    pending = 0;
    return admission;
}

} // namespace core
} // namespace tickpilot
