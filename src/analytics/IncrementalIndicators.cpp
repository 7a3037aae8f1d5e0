#include "analytics/IncrementalIndicators.h"

#include <algorithm>
#include <cmath>

namespace tickpilot {
namespace analytics {

// ===== EMA =====

IncrementalEMA::IncrementalEMA(int period)
    : period_(std::max(1, period))
    , alpha_(2.0 / (static_cast<double>(period_) + 1.0)) {}

double IncrementalEMA::update(double price) {
    if (!value_) {
        value_ = price;
    } else {
        value_ = alpha_ * price + (1.0 - alpha_) * *value_;
    }
    ++samples_;
    return *value_;
}

void IncrementalEMA::reset() {
    value_.reset();
    samples_ = 0;
}

// ===== MACD =====

IncrementalMACD::IncrementalMACD(int fast, int slow, int signal_period)
    : fast_(fast)
    , slow_(slow)
    , signal_(signal_period) {}

IncrementalMACD::Result IncrementalMACD::update(double price) {
    const double fast = fast_.update(price);
    const double slow = slow_.update(price);
    last_.macd = fast - slow;
    last_.signal = signal_.update(last_.macd);
    last_.histogram = last_.macd - last_.signal;
    return last_;
}

// ===== VWAP =====

double SessionVWAP::update(double price, std::optional<double> volume) {
    const double weight = (volume && *volume > 0.0) ? *volume : 1.0;
    price_volume_sum_ += price * weight;
    volume_sum_ += weight;
    return price_volume_sum_ / volume_sum_;
}

std::optional<double> SessionVWAP::value() const {
    if (volume_sum_ <= 0.0) {
        return std::nullopt;
    }
    return price_volume_sum_ / volume_sum_;
}

void SessionVWAP::reset() {
    price_volume_sum_ = 0.0;
    volume_sum_ = 0.0;
}

// ===== RSI =====

WilderRSI::WilderRSI(int period)
    : period_(std::max(1, period)) {}

std::optional<double> WilderRSI::update(double price) {
    if (!prev_price_) {
        prev_price_ = price;
        return std::nullopt;
    }

    const double change = price - *prev_price_;
    prev_price_ = price;
    const double gain = change > 0 ? change : 0.0;
    const double loss = change < 0 ? -change : 0.0;

    if (changes_ < period_) {
        // seed phase: simple average of the first `period` changes
        avg_gain_ += gain / period_;
        avg_loss_ += loss / period_;
    } else {
        avg_gain_ = (avg_gain_ * (period_ - 1) + gain) / period_;
        avg_loss_ = (avg_loss_ * (period_ - 1) + loss) / period_;
    }
    ++changes_;
    return value();
}

std::optional<double> WilderRSI::value() const {
    if (!isReady()) {
        return std::nullopt;
    }
    if (avg_loss_ < 0.0000001) {
        return avg_gain_ < 0.0000001 ? 50.0 : 100.0;
    }
    const double rs = avg_gain_ / avg_loss_;
    return 100.0 - (100.0 / (1.0 + rs));
}

// ===== ATR =====

TickATR::TickATR(int period)
    : period_(std::max(1, period)) {}

std::optional<double> TickATR::update(double price) {
    if (!prev_price_) {
        prev_price_ = price;
        return std::nullopt;
    }

    const double tr = std::abs(price - *prev_price_);
    prev_price_ = price;

    if (ranges_ < period_) {
        atr_ += tr / period_;
    } else {
        atr_ = (atr_ * (period_ - 1) + tr) / period_;
    }
    ++ranges_;
    return value();
}

std::optional<double> TickATR::value() const {
    if (ranges_ < period_) {
        return std::nullopt;
    }
    return atr_;
}

// ===== Rolling mean / variance =====

RollingStats::RollingStats(std::size_t window)
    : window_(std::max<std::size_t>(1, window)) {}

void RollingStats::update(double value) {
    values_.push_back(value);
    sum_ += value;
    sum_sq_ += value * value;
    if (values_.size() > window_) {
        const double old = values_.front();
        values_.pop_front();
        sum_ -= old;
        sum_sq_ -= old * old;
    }
}

std::optional<double> RollingStats::mean() const {
    if (values_.empty()) {
        return std::nullopt;
    }
    return sum_ / static_cast<double>(values_.size());
}

std::optional<double> RollingStats::variance() const {
    const std::size_t n = values_.size();
    if (n < 2) {
        return std::nullopt;
    }
    const double m = sum_ / static_cast<double>(n);
    const double var = (sum_sq_ - static_cast<double>(n) * m * m) / static_cast<double>(n - 1);
    // running sums can drift slightly negative on flat series
    return std::max(0.0, var);
}

std::optional<double> RollingStats::stddev() const {
    auto var = variance();
    if (!var) {
        return std::nullopt;
    }
    return std::sqrt(*var);
}

void RollingStats::reset() {
    values_.clear();
    sum_ = 0.0;
    sum_sq_ = 0.0;
}

} // namespace analytics
} // namespace tickpilot
