#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IDiagnosticSink.h"
#include "core/diagnostics/DiagnosticRateLimiter.h"

namespace tickpilot {
namespace core {

struct DiagnosticCounts {
    long long emitted = 0;
    long long suppressed = 0;
};

// Front door for diagnostic events: rate limit, stamp, fan out to sinks.
// A sink that refuses an event is reported once and otherwise ignored;
// diagnostics never change trading control flow.
class DiagnosticRecorder {
public:
    DiagnosticRecorder(std::string instrument, std::unique_ptr<DiagnosticRateLimiter> limiter);

    void addSink(std::shared_ptr<IDiagnosticSink> sink);

    // true when the event went out to the sinks
    bool record(DiagnosticEventType type,
                const std::string& code,
                nlohmann::json payload = nlohmann::json::object(),
                long long ts_ms = 0);

    std::map<DiagnosticEventType, DiagnosticCounts> counts() const;

private:
    std::string instrument_;
    std::unique_ptr<DiagnosticRateLimiter> limiter_;
    std::vector<std::shared_ptr<IDiagnosticSink>> sinks_;
    std::map<DiagnosticEventType, DiagnosticCounts> counts_;
    std::atomic<bool> sink_failure_reported_{false};
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace tickpilot
