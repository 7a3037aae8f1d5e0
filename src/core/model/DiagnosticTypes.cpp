#include "core/model/DiagnosticTypes.h"

namespace tickpilot {
namespace core {

const char* toString(DiagnosticEventType type) {
    switch (type) {
        case DiagnosticEventType::ENTRY_BLOCKED: return "ENTRY_BLOCKED";
        case DiagnosticEventType::ENTRY_REJECTED: return "ENTRY_REJECTED";
        case DiagnosticEventType::ENTRY_ACCEPTED: return "ENTRY_ACCEPTED";
        case DiagnosticEventType::EXIT_TRIGGERED: return "EXIT_TRIGGERED";
        case DiagnosticEventType::FEED_RECONNECT: return "FEED_RECONNECT";
        case DiagnosticEventType::FEED_RECOVERED: return "FEED_RECOVERED";
        case DiagnosticEventType::FEED_UNRECOVERABLE: return "FEED_UNRECOVERABLE";
        case DiagnosticEventType::TICK_SKIPPED: return "TICK_SKIPPED";
    }
    return "TICK_SKIPPED";
}

DiagnosticEventType diagnosticTypeFromString(const std::string& value) {
    if (value == "ENTRY_BLOCKED") return DiagnosticEventType::ENTRY_BLOCKED;
    if (value == "ENTRY_REJECTED") return DiagnosticEventType::ENTRY_REJECTED;
    if (value == "ENTRY_ACCEPTED") return DiagnosticEventType::ENTRY_ACCEPTED;
    if (value == "EXIT_TRIGGERED") return DiagnosticEventType::EXIT_TRIGGERED;
    if (value == "FEED_RECONNECT") return DiagnosticEventType::FEED_RECONNECT;
    if (value == "FEED_RECOVERED") return DiagnosticEventType::FEED_RECOVERED;
    if (value == "FEED_UNRECOVERABLE") return DiagnosticEventType::FEED_UNRECOVERABLE;
    return DiagnosticEventType::TICK_SKIPPED;
}

} // namespace core
} // namespace tickpilot
