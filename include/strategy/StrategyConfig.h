#pragma once

namespace tickpilot {
namespace strategy {

// Entry/exit rule parameters. Every field is required in the config file;
// the in-class values only exist so tests can build a config in code.
struct StrategyConfig {
    // EMA crossover
    bool use_ema_crossover = true;
    int fast_ema = 9;
    int slow_ema = 21;

    // MACD
    bool use_macd = false;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;

    // Session VWAP
    bool use_vwap = false;

    // RSI (Wilder)
    bool use_rsi_filter = false;
    int rsi_length = 14;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;

    // Higher-timeframe trend EMA
    bool use_htf_trend = false;
    int htf_period = 20;

    // ATR volatility floor
    bool use_atr = false;
    int atr_len = 14;
    double min_atr_points = 0.0;

    // Consecutive favorable ticks
    bool use_consecutive_ticks = true;
    int consecutive_ticks_required = 3;
    bool noise_filter_enabled = true;
    double noise_filter_percentage = 0.0001;   // 0.01%
    double noise_filter_min_ticks = 1.0;

    // Momentum over the current favorable run
    bool use_momentum = false;
    double momentum_threshold_points = 0.0;

    // Volume confirmation: tick volume >= rolling mean * multiplier
    bool use_volume_confirmation = false;
    int volume_window = 20;
    double volume_multiplier = 1.0;

    // Variance confirmation: rolling stddev of price >= floor
    bool use_variance_filter = false;
    int variance_window = 20;
    double min_stddev_points = 0.0;

    bool allow_short = false;

    // Strategy-driven exits
    bool exit_on_decline = false;
    bool exit_on_opposite_crossover = true;
};

// Trading window in session-local time
struct SessionWindowConfig {
    int start_hour = 9;
    int start_min = 15;
    int end_hour = 15;
    int end_min = 30;
    int utc_offset_minutes = 0;          // session-local = UTC + offset
    int no_trade_start_minutes = 0;      // no entries right after the open
    int no_trade_end_minutes = 0;        // no entries right before the close
    int flatten_before_end_minutes = 0;  // force exit this long before the close
    int max_trades_per_day = 25;
};

} // namespace strategy
} // namespace tickpilot
