#include "core/diagnostics/DiagnosticRecorder.h"
#include "common/Logger.h"
#include "common/Types.h"

#include <chrono>

namespace tickpilot {
namespace core {

DiagnosticRecorder::DiagnosticRecorder(std::string instrument,
                                       std::unique_ptr<DiagnosticRateLimiter> limiter)
    : instrument_(std::move(instrument))
    , limiter_(std::move(limiter))
{}

void DiagnosticRecorder::addSink(std::shared_ptr<IDiagnosticSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

bool DiagnosticRecorder::record(DiagnosticEventType type,
                                const std::string& code,
                                nlohmann::json payload,
                                long long ts_ms) {
    const DiagnosticAdmission admission = limiter_->admit(type);

    std::vector<std::shared_ptr<IDiagnosticSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& c = counts_[type];
        if (!admission.emit) {
            c.suppressed++;
            return false;
        }
        c.emitted++;
        sinks = sinks_;
    }

    DiagnosticEvent event;
    event.ts_ms = ts_ms > 0 ? ts_ms : toEpochMs(std::chrono::system_clock::now());
    event.type = type;
    event.instrument = instrument_;
    event.code = code;
    event.payload = std::move(payload);
    event.suppressed = admission.suppressed;

    for (const auto& sink : sinks) {
        if (!sink->append(event) && !sink_failure_reported_.exchange(true)) {
            LOG_WARN("Diagnostic sink refused an event ({}); further failures are not reported",
                     toString(type));
        }
    }
    return true;
}

std::map<DiagnosticEventType, DiagnosticCounts> DiagnosticRecorder::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

} // namespace core
} // namespace tickpilot
