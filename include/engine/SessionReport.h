#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/diagnostics/DiagnosticRecorder.h"
#include "feed/FeedAdapter.h"
#include "risk/RiskManager.h"

namespace tickpilot {
namespace engine {

// Final account of one session, produced once by SessionController::stop()
struct SessionReport {
    std::string terminal_message;        // "stopped: ..."
    std::string instrument;
    ConsumptionMode mode = ConsumptionMode::POLL;
    Timestamp started_at;
    Timestamp ended_at;

    // tick path
    std::uint64_t ticks_dispatched = 0;
    std::uint64_t ticks_processed = 0;
    std::uint64_t ticks_skipped = 0;     // malformed (no price / no timestamp)
    std::uint64_t tick_errors = 0;       // exceptions while handling a tick
    int max_error_streak = 0;

    // connectivity
    feed::FeedStats feed_stats;
    feed::FeedStatus final_feed_status = feed::FeedStatus::DISCONNECTED;
    std::string feed_failure_reason;

    // account
    double initial_capital = 0.0;
    double final_capital = 0.0;
    double realized_pnl = 0.0;
    std::vector<risk::Position> ledger;  // closed positions in close order

    std::map<core::DiagnosticEventType, core::DiagnosticCounts> diagnostics;
};

// Where the report goes when a session ends
class ISessionReporter {
public:
    virtual ~ISessionReporter() = default;

    virtual bool publish(const SessionReport& report) = 0;
};

} // namespace engine
} // namespace tickpilot
