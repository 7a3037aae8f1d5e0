#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"
#include "analytics/IncrementalIndicators.h"
#include <mutex>
#include <optional>

namespace tickpilot {
namespace strategy {

// Tick-driven trend follower: a run of favorable ticks, inside the session
// window and under the daily cap, confirmed by whichever indicator rules
// are enabled. All indicator state is updated in O(1) per tick.
class TickTrendStrategy : public IStrategy {
public:
    TickTrendStrategy(const StrategyConfig& config,
                      const SessionWindowConfig& session,
                      double tick_size);

    std::optional<Signal> onTick(const Tick& tick, std::optional<PositionSide> open_position) override;
    void onPositionOpened(const Signal& signal) override;
    void onPositionClosed() override;
    bool shouldFlattenForSession(Timestamp ts) const override;
    IndicatorSnapshot indicatorSnapshot() const override;
    void setEvaluationListener(EvaluationListener listener) override;

    // session-local minute of day and day number for a timestamp
    int minuteOfDay(Timestamp ts) const;
    long long sessionDay(Timestamp ts) const;

private:
    void rollSessionDay(Timestamp ts);
    void updateIndicators(double price, std::optional<double> volume);
    void updateRuns(double price);

    EntryEvaluation evaluateEntry(double price, Timestamp ts, std::optional<double> volume) const;
    std::optional<Signal> evaluateExit(PositionSide side, double price, double prev_price, Timestamp ts) const;

    double noiseThreshold(double prev_price) const;

    StrategyConfig config_;
    SessionWindowConfig session_;
    double tick_size_;

    mutable std::mutex mutex_;

    analytics::IncrementalEMA ema_fast_;
    analytics::IncrementalEMA ema_slow_;
    analytics::IncrementalMACD macd_;
    analytics::SessionVWAP vwap_;
    analytics::WilderRSI rsi_;
    analytics::IncrementalEMA htf_ema_;
    analytics::TickATR atr_;
    analytics::RollingStats volume_stats_;
    analytics::RollingStats price_stats_;

    std::optional<double> last_price_;
    int consecutive_up_ = 0;
    int consecutive_down_ = 0;
    double up_run_start_ = 0.0;
    double down_run_start_ = 0.0;

    std::optional<long long> current_day_;
    int trades_today_ = 0;
    long long ticks_seen_ = 0;

    EvaluationListener evaluation_listener_;
};

} // namespace strategy
} // namespace tickpilot
