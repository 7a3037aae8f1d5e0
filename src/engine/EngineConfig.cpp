#include "engine/EngineConfig.h"

#include <string>

namespace tickpilot {
namespace engine {

std::vector<std::string> SessionConfig::validate() const {
    std::vector<std::string> errors;

    if (instrument.symbol.empty()) {
        errors.push_back("instrument.symbol must not be empty");
    }
    if (!instrument.lot_size || *instrument.lot_size <= 0.0) {
        errors.push_back("instrument.lot_size must be positive");
    }
    if (!instrument.tick_size || *instrument.tick_size <= 0.0) {
        errors.push_back("instrument.tick_size must be positive");
    }
    if (initial_capital <= 0.0) {
        errors.push_back("capital.initial_capital must be positive");
    }

    if (feed.queue_capacity == 0) {
        errors.push_back("feed.queue_capacity must be positive");
    }
    if (feed.silence_threshold.count() <= 0) {
        errors.push_back("feed.silence_threshold_ms must be positive");
    }
    if (feed.backoff_initial.count() <= 0 || feed.backoff_max < feed.backoff_initial) {
        errors.push_back("feed.backoff_initial_ms must be positive and <= backoff_max_ms");
    }
    if (feed.max_reconnect_attempts <= 0) {
        errors.push_back("feed.max_reconnect_attempts must be positive");
    }
    if (feed.normalizer.price_divisor <= 0.0) {
        errors.push_back("feed.normalizer.price_divisor must be positive");
    }

    if (risk.base_sl_points <= 0.0) {
        errors.push_back("risk.base_sl_points must be positive");
    }
    double previous_points = 0.0;
    double fraction_sum = 0.0;
    for (const auto& rule : risk.take_profit_ladder) {
        if (rule.points <= previous_points) {
            errors.push_back("risk.take_profit ladder must be strictly ascending and positive");
            break;
        }
        if (rule.fraction <= 0.0 || rule.fraction > 1.0) {
            errors.push_back("risk.take_profit fractions must be in (0, 1]");
            break;
        }
        previous_points = rule.points;
        fraction_sum += rule.fraction;
    }
    if (fraction_sum > 1.0 + 1e-9) {
        errors.push_back("risk.take_profit fractions must not sum above 1");
    }
    if (risk.use_trail_stop &&
        (risk.trail_activation_points <= 0.0 || risk.trail_distance_points <= 0.0)) {
        errors.push_back("risk trailing activation/distance must be positive when trailing is enabled");
    }
    if (risk.risk_per_trade_percent <= 0.0 || risk.max_position_value_percent <= 0.0) {
        errors.push_back("risk.risk_per_trade_percent and max_position_value_percent must be positive");
    }
    if (risk.exit_precedence.size() != 4) {
        errors.push_back("risk.exit_precedence must list all four exit causes once");
    }

    if (strategy.use_ema_crossover && strategy.fast_ema >= strategy.slow_ema) {
        errors.push_back("strategy.fast_ema must be less than strategy.slow_ema");
    }
    if (strategy.use_macd && strategy.macd_fast >= strategy.macd_slow) {
        errors.push_back("strategy.macd_fast must be less than strategy.macd_slow");
    }
    if (strategy.use_consecutive_ticks && strategy.consecutive_ticks_required <= 0) {
        errors.push_back("strategy.consecutive_ticks_required must be positive");
    }
    if (strategy.use_rsi_filter && strategy.rsi_oversold >= strategy.rsi_overbought) {
        errors.push_back("strategy.rsi_oversold must be below strategy.rsi_overbought");
    }
    if (strategy.volume_window <= 0 || strategy.variance_window <= 1) {
        errors.push_back("strategy.volume_window must be > 0 and variance_window > 1");
    }

    const int start = session.start_hour * 60 + session.start_min;
    const int end = session.end_hour * 60 + session.end_min;
    if (start >= end) {
        errors.push_back("session start must be before session end");
    }
    if (session.max_trades_per_day <= 0) {
        errors.push_back("session.max_trades_per_day must be positive");
    }

    if (limits.error_streak_threshold <= 0) {
        errors.push_back("limits.error_streak_threshold must be positive");
    }
    if (limits.diagnostic_every_n <= 0 || limits.diagnostic_window.count() <= 0) {
        errors.push_back("limits diagnostic_every_n and diagnostic_window_ms must be positive");
    }

    return errors;
}

} // namespace engine
} // namespace tickpilot
