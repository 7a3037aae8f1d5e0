#include "core/diagnostics/LoggingDiagnosticSink.h"
#include "common/Logger.h"

namespace tickpilot {
namespace core {

LoggingDiagnosticSink::LoggingDiagnosticSink(std::size_t keep_recent)
    : keep_recent_(keep_recent)
{}

bool LoggingDiagnosticSink::append(const DiagnosticEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    DiagnosticEvent stored = event;
    stored.seq = ++last_seq_;

    const std::string payload = stored.payload.empty() ? std::string() : " " + stored.payload.dump();
    switch (stored.type) {
        case DiagnosticEventType::FEED_UNRECOVERABLE:
            LOG_ERROR("[diag#{}] {} {} {}{}", stored.seq, toString(stored.type),
                      stored.instrument, stored.code, payload);
            break;
        case DiagnosticEventType::FEED_RECONNECT:
        case DiagnosticEventType::TICK_SKIPPED:
            LOG_WARN("[diag#{}] {} {} {}{} (suppressed {})", stored.seq, toString(stored.type),
                     stored.instrument, stored.code, payload, stored.suppressed);
            break;
        case DiagnosticEventType::ENTRY_ACCEPTED:
        case DiagnosticEventType::EXIT_TRIGGERED:
        case DiagnosticEventType::FEED_RECOVERED:
            LOG_INFO("[diag#{}] {} {} {}{}", stored.seq, toString(stored.type),
                     stored.instrument, stored.code, payload);
            break;
        default:
            LOG_DEBUG("[diag#{}] {} {} {}{} (suppressed {})", stored.seq, toString(stored.type),
                      stored.instrument, stored.code, payload, stored.suppressed);
            break;
    }

    recent_.push_back(std::move(stored));
    while (recent_.size() > keep_recent_) {
        recent_.pop_front();
    }
    return true;
}

std::vector<DiagnosticEvent> LoggingDiagnosticSink::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiagnosticEvent> out;
    for (const auto& event : recent_) {
        if (event.seq >= seq_inclusive) {
            out.push_back(event);
        }
    }
    return out;
}

std::uint64_t LoggingDiagnosticSink::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace tickpilot
