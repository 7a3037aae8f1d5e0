#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tickpilot {
namespace risk {

// Exit triggers evaluated by RiskManager::onTick, in configurable order
enum class ExitCause {
    STOP_LOSS,
    TRAILING_STOP,
    TAKE_PROFIT,
    STRATEGY_SIGNAL
};

// Why a position (or part of it) was closed
enum class CloseReason {
    STOP_LOSS,
    TRAILING_STOP,
    TAKE_PROFIT,
    STRATEGY_SIGNAL,
    SESSION_END,
    SESSION_STOP
};

const char* toString(ExitCause cause);
const char* toString(CloseReason reason);
std::optional<ExitCause> exitCauseFromString(const std::string& value);

// Lot/tick parameters. Kept optional so a missing value is detected at
// open() instead of being replaced with 1.
struct InstrumentConfig {
    std::string symbol;
    std::string exchange;
    std::optional<double> lot_size;
    std::optional<double> tick_size;
};

// One rung of the take-profit ladder, relative to entry
struct TakeProfitRule {
    double points;       // distance from entry in price units
    double fraction;     // fraction of the initial quantity

    TakeProfitRule(double p = 0.0, double f = 0.0) : points(p), fraction(f) {}
};

struct RiskConfig {
    double base_sl_points = 15.0;
    std::vector<TakeProfitRule> take_profit_ladder;

    bool use_trail_stop = true;
    double trail_activation_points = 5.0;
    double trail_distance_points = 7.0;

    double risk_per_trade_percent = 1.0;
    double max_position_value_percent = 100.0;
    double commission_percent = 0.0;

    std::vector<ExitCause> exit_precedence{
        ExitCause::STOP_LOSS,
        ExitCause::TRAILING_STOP,
        ExitCause::TAKE_PROFIT,
        ExitCause::STRATEGY_SIGNAL
    };
};

} // namespace risk
} // namespace tickpilot
