#include "risk/RiskConfig.h"

namespace tickpilot {
namespace risk {

const char* toString(ExitCause cause) {
    switch (cause) {
        case ExitCause::STOP_LOSS: return "STOP_LOSS";
        case ExitCause::TRAILING_STOP: return "TRAILING_STOP";
        case ExitCause::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitCause::STRATEGY_SIGNAL: return "STRATEGY_SIGNAL";
    }
    return "STOP_LOSS";
}

const char* toString(CloseReason reason) {
    switch (reason) {
        case CloseReason::STOP_LOSS: return "STOP_LOSS";
        case CloseReason::TRAILING_STOP: return "TRAILING_STOP";
        case CloseReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case CloseReason::STRATEGY_SIGNAL: return "STRATEGY_SIGNAL";
        case CloseReason::SESSION_END: return "SESSION_END";
        case CloseReason::SESSION_STOP: return "SESSION_STOP";
    }
    return "STOP_LOSS";
}

std::optional<ExitCause> exitCauseFromString(const std::string& value) {
    if (value == "STOP_LOSS") return ExitCause::STOP_LOSS;
    if (value == "TRAILING_STOP") return ExitCause::TRAILING_STOP;
    if (value == "TAKE_PROFIT") return ExitCause::TAKE_PROFIT;
    if (value == "STRATEGY_SIGNAL") return ExitCause::STRATEGY_SIGNAL;
    return std::nullopt;
}

} // namespace risk
} // namespace tickpilot
