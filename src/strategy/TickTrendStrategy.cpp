#include "strategy/TickTrendStrategy.h"
#include "common/Logger.h"
#include <algorithm>
#include <sstream>
#include <utility>

namespace tickpilot {
namespace strategy {

namespace {
std::string fmt2(double v) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << v;
    return oss.str();
}

bool favors(PositionSide side, double lhs, double rhs) {
    return side == PositionSide::LONG ? lhs > rhs : lhs < rhs;
}
}

TickTrendStrategy::TickTrendStrategy(const StrategyConfig& config,
                                     const SessionWindowConfig& session,
                                     double tick_size)
    : config_(config)
    , session_(session)
    , tick_size_(tick_size)
    , ema_fast_(config.fast_ema)
    , ema_slow_(config.slow_ema)
    , macd_(config.macd_fast, config.macd_slow, config.macd_signal)
    , rsi_(config.rsi_length)
    , htf_ema_(config.htf_period)
    , atr_(config.atr_len)
    , volume_stats_(static_cast<std::size_t>(std::max(1, config.volume_window)))
    , price_stats_(static_cast<std::size_t>(std::max(2, config.variance_window)))
{
}

int TickTrendStrategy::minuteOfDay(Timestamp ts) const {
    const long long total = toEpochMs(ts) / 60000 + session_.utc_offset_minutes;
    return static_cast<int>(((total % 1440) + 1440) % 1440);
}

long long TickTrendStrategy::sessionDay(Timestamp ts) const {
    const long long total = toEpochMs(ts) / 60000 + session_.utc_offset_minutes;
    return total >= 0 ? total / 1440 : (total - 1439) / 1440;
}

double TickTrendStrategy::noiseThreshold(double prev_price) const {
    return std::max(tick_size_ * config_.noise_filter_min_ticks,
                    prev_price * config_.noise_filter_percentage);
}

std::optional<Signal> TickTrendStrategy::onTick(const Tick& tick, std::optional<PositionSide> open_position) {
    if (!tick.isComplete()) {
        return std::nullopt;
    }

    const double price = *tick.price();
    const Timestamp ts = *tick.timestamp();

    std::optional<Signal> signal;
    std::optional<EntryEvaluation> evaluation;
    EvaluationListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        rollSessionDay(ts);
        const auto prev_price = last_price_;
        updateIndicators(price, tick.volume());
        updateRuns(price);
        last_price_ = price;
        ++ticks_seen_;

        if (open_position) {
            if (prev_price) {
                signal = evaluateExit(*open_position, price, *prev_price, ts);
            }
        } else {
            evaluation = evaluateEntry(price, ts, tick.volume());
            if (evaluation->accepted()) {
                std::string reason;
                for (const auto& c : evaluation->checks) {
                    if (!reason.empty()) reason += "+";
                    reason += toString(c.check);
                }
                const auto action = evaluation->direction == PositionSide::LONG
                    ? SignalAction::ENTER_LONG : SignalAction::ENTER_SHORT;
                signal = Signal(action, price, reason, ts);
            }
            listener = evaluation_listener_;
        }
    }

    if (evaluation && listener) {
        listener(tick, *evaluation);
    }
    return signal;
}

void TickTrendStrategy::rollSessionDay(Timestamp ts) {
    const long long day = sessionDay(ts);
    if (current_day_ && *current_day_ == day) {
        return;
    }
    if (current_day_) {
        LOG_INFO("New session day: daily trade count reset ({} trades yesterday)", trades_today_);
    }
    current_day_ = day;
    trades_today_ = 0;
    vwap_.reset();
}

void TickTrendStrategy::updateIndicators(double price, std::optional<double> volume) {
    if (config_.use_ema_crossover || config_.exit_on_opposite_crossover) {
        ema_fast_.update(price);
        ema_slow_.update(price);
    }
    if (config_.use_macd) {
        macd_.update(price);
    }
    if (config_.use_vwap) {
        vwap_.update(price, volume);
    }
    if (config_.use_rsi_filter) {
        rsi_.update(price);
    }
    if (config_.use_htf_trend) {
        htf_ema_.update(price);
    }
    if (config_.use_atr) {
        atr_.update(price);
    }
    if (config_.use_volume_confirmation && volume) {
        volume_stats_.update(*volume);
    }
    if (config_.use_variance_filter) {
        price_stats_.update(price);
    }
}

void TickTrendStrategy::updateRuns(double price) {
    if (!last_price_) {
        return;
    }
    const double prev = *last_price_;
    const double delta = price - prev;
    const double threshold = config_.noise_filter_enabled ? noiseThreshold(prev) : 0.0;

    if (delta > threshold) {
        if (consecutive_up_ == 0) {
            up_run_start_ = prev;
        }
        ++consecutive_up_;
        consecutive_down_ = 0;
    } else if (delta < -threshold) {
        if (consecutive_down_ == 0) {
            down_run_start_ = prev;
        }
        ++consecutive_down_;
        consecutive_up_ = 0;
    } else if (!config_.noise_filter_enabled) {
        // flat tick breaks both runs when there is no noise band
        consecutive_up_ = 0;
        consecutive_down_ = 0;
    }
}

EntryEvaluation TickTrendStrategy::evaluateEntry(double price, Timestamp ts, std::optional<double> volume) const {
    EntryEvaluation eval;
    const int required = config_.consecutive_ticks_required;

    // direction
    if (config_.use_consecutive_ticks) {
        if (consecutive_up_ >= required) {
            eval.direction = PositionSide::LONG;
        } else if (config_.allow_short && consecutive_down_ >= required) {
            eval.direction = PositionSide::SHORT;
        } else if (config_.allow_short && consecutive_down_ > consecutive_up_) {
            eval.direction = PositionSide::SHORT;
        }
    } else if (config_.allow_short && ema_fast_.value() && ema_slow_.value() &&
               *ema_fast_.value() < *ema_slow_.value()) {
        eval.direction = PositionSide::SHORT;
    }
    const PositionSide side = eval.direction;
    const bool is_long = side == PositionSide::LONG;

    // ---- gates ----
    if (config_.use_consecutive_ticks) {
        const int run = is_long ? consecutive_up_ : consecutive_down_;
        eval.checks.emplace_back(EntryCheck::CONSECUTIVE_TICKS, run >= required,
                                 std::to_string(run) + "/" + std::to_string(required) +
                                 (is_long ? " rises" : " falls"));
    }

    const int minute = minuteOfDay(ts);
    const int start = session_.start_hour * 60 + session_.start_min;
    const int end = session_.end_hour * 60 + session_.end_min;
    const bool in_session = minute >= start && minute < end;
    eval.checks.emplace_back(EntryCheck::SESSION_WINDOW, in_session,
                             "minute " + std::to_string(minute) + " in [" + std::to_string(start) +
                             "," + std::to_string(end) + ")");

    const int entry_cutoff = end - std::max(session_.no_trade_end_minutes, session_.flatten_before_end_minutes);
    const bool outside_buffers = minute >= start + session_.no_trade_start_minutes && minute < entry_cutoff;
    eval.checks.emplace_back(EntryCheck::NO_TRADE_BUFFER, outside_buffers,
                             "entries allowed in [" + std::to_string(start + session_.no_trade_start_minutes) +
                             "," + std::to_string(entry_cutoff) + ")");

    eval.checks.emplace_back(EntryCheck::DAILY_TRADE_CAP, trades_today_ < session_.max_trades_per_day,
                             std::to_string(trades_today_) + "/" + std::to_string(session_.max_trades_per_day));

    eval.gates_passed = true;
    for (const auto& c : eval.checks) {
        if (!c.passed) {
            eval.gates_passed = false;
        }
    }
    if (!eval.gates_passed) {
        return eval;
    }

    // ---- indicator rules ----
    if (config_.use_ema_crossover) {
        const auto fast = ema_fast_.value();
        const auto slow = ema_slow_.value();
        const bool ok = fast && slow && favors(side, *fast, *slow);
        eval.checks.emplace_back(EntryCheck::EMA_CROSSOVER, ok,
                                 fast && slow ? "fast " + fmt2(*fast) + " slow " + fmt2(*slow) : "warming up");
    }

    if (config_.use_macd) {
        const auto& m = macd_.value();
        const bool ok = macd_.hasValue() && favors(side, m.macd, m.signal);
        eval.checks.emplace_back(EntryCheck::MACD, ok, "macd " + fmt2(m.macd) + " signal " + fmt2(m.signal));
    }

    if (config_.use_vwap) {
        const auto vwap = vwap_.value();
        const bool ok = vwap && favors(side, price, *vwap);
        eval.checks.emplace_back(EntryCheck::VWAP, ok, vwap ? "vwap " + fmt2(*vwap) : "no vwap");
    }

    if (config_.use_rsi_filter) {
        const auto rsi = rsi_.value();
        const bool ok = rsi && *rsi > config_.rsi_oversold && *rsi < config_.rsi_overbought;
        eval.checks.emplace_back(EntryCheck::RSI, ok, rsi ? "rsi " + fmt2(*rsi) : "warming up");
    }

    if (config_.use_htf_trend) {
        const auto htf = htf_ema_.value();
        const bool ok = htf && favors(side, price, *htf);
        eval.checks.emplace_back(EntryCheck::HTF_TREND, ok, htf ? "htf ema " + fmt2(*htf) : "warming up");
    }

    if (config_.use_atr) {
        const auto atr = atr_.value();
        const bool ok = atr && *atr >= config_.min_atr_points;
        eval.checks.emplace_back(EntryCheck::ATR, ok, atr ? "atr " + fmt2(*atr) : "warming up");
    }

    if (config_.use_momentum) {
        const double move = is_long ? price - up_run_start_ : down_run_start_ - price;
        const int run = is_long ? consecutive_up_ : consecutive_down_;
        const bool ok = run > 0 && move >= config_.momentum_threshold_points;
        eval.checks.emplace_back(EntryCheck::MOMENTUM, ok,
                                 "move " + fmt2(run > 0 ? move : 0.0) + " >= " + fmt2(config_.momentum_threshold_points));
    }

    if (config_.use_volume_confirmation) {
        const auto mean = volume_stats_.mean();
        const bool ok = volume && mean && *volume >= *mean * config_.volume_multiplier;
        eval.checks.emplace_back(EntryCheck::VOLUME, ok,
                                 volume ? "volume " + fmt2(*volume) + " mean " + (mean ? fmt2(*mean) : "n/a")
                                        : "tick has no volume");
    }

    if (config_.use_variance_filter) {
        const auto sd = price_stats_.stddev();
        const bool ok = sd && *sd >= config_.min_stddev_points;
        eval.checks.emplace_back(EntryCheck::VARIANCE, ok, sd ? "stddev " + fmt2(*sd) : "warming up");
    }

    return eval;
}

std::optional<Signal> TickTrendStrategy::evaluateExit(PositionSide side, double price, double prev_price, Timestamp ts) const {
    const bool is_long = side == PositionSide::LONG;

    if (config_.exit_on_decline) {
        const bool adverse = is_long ? price < prev_price : price > prev_price;
        if (adverse) {
            return Signal(SignalAction::CLOSE, price,
                          std::string(is_long ? "decline " : "rise ") + fmt2(prev_price) + " -> " + fmt2(price), ts);
        }
    }

    if (config_.exit_on_opposite_crossover) {
        const auto fast = ema_fast_.value();
        const auto slow = ema_slow_.value();
        if (fast && slow && favors(is_long ? PositionSide::SHORT : PositionSide::LONG, *fast, *slow)) {
            return Signal(SignalAction::CLOSE, price,
                          "opposite crossover: fast " + fmt2(*fast) + " slow " + fmt2(*slow), ts);
        }
    }

    return std::nullopt;
}

void TickTrendStrategy::onPositionOpened(const Signal& signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    rollSessionDay(signal.timestamp);
    ++trades_today_;
    LOG_INFO("Trade {}/{} today: {} @ {:.2f}", trades_today_, session_.max_trades_per_day,
             toString(signal.action), signal.price);
}

void TickTrendStrategy::onPositionClosed() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_up_ = 0;
    consecutive_down_ = 0;
}

bool TickTrendStrategy::shouldFlattenForSession(Timestamp ts) const {
    const int minute = minuteOfDay(ts);
    const int end = session_.end_hour * 60 + session_.end_min;
    return minute >= end - session_.flatten_before_end_minutes;
}

IndicatorSnapshot TickTrendStrategy::indicatorSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    IndicatorSnapshot s;
    s.last_price = last_price_;
    s.ema_fast = ema_fast_.value();
    s.ema_slow = ema_slow_.value();
    if (macd_.hasValue()) {
        s.macd = macd_.value().macd;
        s.macd_signal = macd_.value().signal;
    }
    s.vwap = vwap_.value();
    s.rsi = rsi_.value();
    s.htf_ema = htf_ema_.value();
    s.atr = atr_.value();
    s.volume_mean = volume_stats_.mean();
    s.price_stddev = price_stats_.stddev();
    s.consecutive_up = consecutive_up_;
    s.consecutive_down = consecutive_down_;
    s.trades_today = trades_today_;
    s.ticks_seen = ticks_seen_;
    return s;
}

void TickTrendStrategy::setEvaluationListener(EvaluationListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    evaluation_listener_ = std::move(listener);
}

} // namespace strategy
} // namespace tickpilot
