#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace tickpilot {
namespace core {

enum class DiagnosticEventType {
    ENTRY_BLOCKED,        // a gating filter failed
    ENTRY_REJECTED,       // gates passed, an indicator rule failed
    ENTRY_ACCEPTED,
    EXIT_TRIGGERED,
    FEED_RECONNECT,
    FEED_RECOVERED,
    FEED_UNRECOVERABLE,
    TICK_SKIPPED
};

// How noisy events are thinned out. One clock per mode, never mixed.
enum class DiagnosticLimitMode {
    COUNT,   // every Nth occurrence, counted in the tick path
    TIME     // at most once per wall-clock window
};

struct DiagnosticEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    DiagnosticEventType type = DiagnosticEventType::TICK_SKIPPED;
    std::string instrument;
    std::string code;          // failing check / exit cause / short tag
    nlohmann::json payload = nlohmann::json::object();
    long long suppressed = 0;  // occurrences dropped by the limiter since the last emit
};

const char* toString(DiagnosticEventType type);
DiagnosticEventType diagnosticTypeFromString(const std::string& value);

} // namespace core
} // namespace tickpilot
