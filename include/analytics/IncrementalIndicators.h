#pragma once

#include <cstddef>
#include <deque>
#include <optional>

namespace tickpilot {
namespace analytics {

// Streaming indicators: each update() is O(1) and nothing re-reads history.
// Seeding follows the usual exponential convention: the first sample becomes
// the initial average.

// EMA with alpha = 2 / (period + 1)
class IncrementalEMA {
public:
    explicit IncrementalEMA(int period);

    double update(double price);

    std::optional<double> value() const { return value_; }
    int period() const { return period_; }
    std::size_t samples() const { return samples_; }
    // at least `period` samples seen
    bool isWarm() const { return samples_ >= static_cast<std::size_t>(period_); }

    void reset();

private:
    int period_;
    double alpha_;
    std::optional<double> value_;
    std::size_t samples_ = 0;
};

class IncrementalMACD {
public:
    struct Result {
        double macd;        // fast EMA - slow EMA
        double signal;      // EMA of macd
        double histogram;   // macd - signal

        Result() : macd(0), signal(0), histogram(0) {}
    };

    IncrementalMACD(int fast = 12, int slow = 26, int signal_period = 9);

    Result update(double price);

    const Result& value() const { return last_; }
    bool hasValue() const { return fast_.value().has_value(); }

private:
    IncrementalEMA fast_;
    IncrementalEMA slow_;
    IncrementalEMA signal_;
    Result last_;
};

// Cumulative volume-weighted average price; reset at each session open
class SessionVWAP {
public:
    // ticks with no volume still count with unit weight so a volume-less feed
    // degrades to a running mean instead of no value
    double update(double price, std::optional<double> volume);

    std::optional<double> value() const;
    void reset();

private:
    double price_volume_sum_ = 0.0;
    double volume_sum_ = 0.0;
};

// Relative Strength Index with Wilder smoothing.
// The first `period` changes seed simple averages.
class WilderRSI {
public:
    explicit WilderRSI(int period = 14);

    std::optional<double> update(double price);

    std::optional<double> value() const;
    bool isReady() const { return changes_ >= period_; }

private:
    int period_;
    std::optional<double> prev_price_;
    int changes_ = 0;
    double avg_gain_ = 0.0;
    double avg_loss_ = 0.0;
};

// ATR on ticks: true range is |price - previous price|, Wilder-smoothed
class TickATR {
public:
    explicit TickATR(int period = 14);

    std::optional<double> update(double price);

    std::optional<double> value() const;

private:
    int period_;
    std::optional<double> prev_price_;
    int ranges_ = 0;
    double atr_ = 0.0;
};

// Mean and variance over the last `window` samples, via running sums
class RollingStats {
public:
    explicit RollingStats(std::size_t window);

    void update(double value);

    bool isFull() const { return values_.size() >= window_; }
    std::size_t count() const { return values_.size(); }
    std::optional<double> mean() const;
    // sample variance (n - 1)
    std::optional<double> variance() const;
    std::optional<double> stddev() const;

    void reset();

private:
    std::size_t window_;
    std::deque<double> values_;
    double sum_ = 0.0;
    double sum_sq_ = 0.0;
};

} // namespace analytics
} // namespace tickpilot
