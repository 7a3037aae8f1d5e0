#pragma once

#include "common/Types.h"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tickpilot {
namespace strategy {

// Individually attributable entry checks. Gates are the cheap filters that
// run first; the rest are indicator rules.
enum class EntryCheck {
    CONSECUTIVE_TICKS,
    SESSION_WINDOW,
    NO_TRADE_BUFFER,
    DAILY_TRADE_CAP,
    EMA_CROSSOVER,
    MACD,
    VWAP,
    RSI,
    HTF_TREND,
    ATR,
    MOMENTUM,
    VOLUME,
    VARIANCE
};

inline const char* toString(EntryCheck check) {
    switch (check) {
        case EntryCheck::CONSECUTIVE_TICKS: return "CONSECUTIVE_TICKS";
        case EntryCheck::SESSION_WINDOW: return "SESSION_WINDOW";
        case EntryCheck::NO_TRADE_BUFFER: return "NO_TRADE_BUFFER";
        case EntryCheck::DAILY_TRADE_CAP: return "DAILY_TRADE_CAP";
        case EntryCheck::EMA_CROSSOVER: return "EMA_CROSSOVER";
        case EntryCheck::MACD: return "MACD";
        case EntryCheck::VWAP: return "VWAP";
        case EntryCheck::RSI: return "RSI";
        case EntryCheck::HTF_TREND: return "HTF_TREND";
        case EntryCheck::ATR: return "ATR";
        case EntryCheck::MOMENTUM: return "MOMENTUM";
        case EntryCheck::VOLUME: return "VOLUME";
        case EntryCheck::VARIANCE: return "VARIANCE";
    }
    return "UNKNOWN";
}

inline bool isGate(EntryCheck check) {
    return check == EntryCheck::CONSECUTIVE_TICKS ||
           check == EntryCheck::SESSION_WINDOW ||
           check == EntryCheck::NO_TRADE_BUFFER ||
           check == EntryCheck::DAILY_TRADE_CAP;
}

struct CheckResult {
    EntryCheck check;
    bool passed;
    std::string detail;

    CheckResult(EntryCheck c, bool p, std::string d = "")
        : check(c), passed(p), detail(std::move(d)) {}
};

// Outcome of one entry evaluation
struct EntryEvaluation {
    PositionSide direction = PositionSide::LONG;
    std::vector<CheckResult> checks;     // in evaluation order
    bool gates_passed = false;

    bool accepted() const {
        if (!gates_passed) return false;
        for (const auto& c : checks) {
            if (!c.passed) return false;
        }
        return true;
    }

    const CheckResult* firstFailure() const {
        for (const auto& c : checks) {
            if (!c.passed) return &c;
        }
        return nullptr;
    }
};

// Copy of the incremental state, safe to read from any thread
struct IndicatorSnapshot {
    std::optional<double> last_price;
    std::optional<double> ema_fast;
    std::optional<double> ema_slow;
    std::optional<double> macd;
    std::optional<double> macd_signal;
    std::optional<double> vwap;
    std::optional<double> rsi;
    std::optional<double> htf_ema;
    std::optional<double> atr;
    std::optional<double> volume_mean;
    std::optional<double> price_stddev;
    int consecutive_up = 0;
    int consecutive_down = 0;
    int trades_today = 0;
    long long ticks_seen = 0;

    bool operator==(const IndicatorSnapshot& o) const {
        return last_price == o.last_price && ema_fast == o.ema_fast && ema_slow == o.ema_slow &&
               macd == o.macd && macd_signal == o.macd_signal && vwap == o.vwap && rsi == o.rsi &&
               htf_ema == o.htf_ema && atr == o.atr && volume_mean == o.volume_mean &&
               price_stddev == o.price_stddev && consecutive_up == o.consecutive_up &&
               consecutive_down == o.consecutive_down && trades_today == o.trades_today &&
               ticks_seen == o.ticks_seen;
    }
    bool operator!=(const IndicatorSnapshot& o) const { return !(*this == o); }
};

// Receives every finished entry evaluation (diagnostics only)
using EvaluationListener = std::function<void(const Tick&, const EntryEvaluation&)>;

// Decision engine interface. onTick updates indicators, then evaluates entry
// (no position) or strategy exits (open position). Stop-loss, take-profit and
// trailing stops are not a strategy's business.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    // Ticks without price or timestamp are ignored: no signal, no state change.
    virtual std::optional<Signal> onTick(const Tick& tick, std::optional<PositionSide> open_position) = 0;

    // A position was opened from this strategy's signal (counts toward the daily cap)
    virtual void onPositionOpened(const Signal& signal) = 0;

    // The position slot is free again
    virtual void onPositionClosed() = 0;

    // Inside the end-of-session flatten buffer (or past the session end)
    virtual bool shouldFlattenForSession(Timestamp ts) const = 0;

    virtual IndicatorSnapshot indicatorSnapshot() const = 0;

    virtual void setEvaluationListener(EvaluationListener listener) = 0;
};

} // namespace strategy
} // namespace tickpilot
