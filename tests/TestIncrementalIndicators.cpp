#include "analytics/IncrementalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace tickpilot::analytics;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

// full recomputation from the start of the series
double batchEma(const std::vector<double>& prices, int period) {
    const double alpha = 2.0 / (period + 1.0);
    double ema = prices.front();
    for (std::size_t i = 1; i < prices.size(); ++i) {
        ema = alpha * prices[i] + (1.0 - alpha) * ema;
    }
    return ema;
}
}

int main() {
    {
        IncrementalEMA ema(3);
        assert(!ema.value());
        assert(near(ema.update(10.0), 10.0));
        assert(near(ema.update(20.0), 15.0));
        assert(!ema.isWarm());
        assert(near(ema.update(30.0), 22.5));
        assert(ema.isWarm());
        assert(ema.samples() == 3);
        ema.reset();
        assert(!ema.value());
        assert(ema.samples() == 0);
    }

    // streaming value matches a recomputation over the whole history
    {
        const std::vector<double> prices = {100, 101.5, 99.25, 102, 103.75, 103, 101, 104.5, 105, 104};
        IncrementalEMA ema(5);
        std::vector<double> history;
        for (double p : prices) {
            history.push_back(p);
            ema.update(p);
            assert(near(*ema.value(), batchEma(history, 5)));
        }
    }

    {
        IncrementalMACD macd(3, 6, 4);
        assert(!macd.hasValue());
        for (int i = 0; i < 20; ++i) {
            auto r = macd.update(50.0);
            assert(near(r.macd, 0.0) && near(r.signal, 0.0) && near(r.histogram, 0.0));
        }
        // a rising series pulls the fast EMA above the slow one
        for (int i = 1; i <= 10; ++i) {
            macd.update(50.0 + i);
        }
        assert(macd.value().macd > 0.0);
        assert(near(macd.value().histogram, macd.value().macd - macd.value().signal));
    }

    {
        SessionVWAP vwap;
        assert(!vwap.value());
        vwap.update(100.0, 10.0);
        assert(near(vwap.update(110.0, 30.0), 107.5));
        vwap.reset();
        // no volume: unit weight
        vwap.update(10.0, std::nullopt);
        assert(near(vwap.update(20.0, 0.0), 15.0));
    }

    {
        WilderRSI rsi(2);
        assert(!rsi.update(1.0));
        assert(!rsi.update(2.0));
        assert(near(*rsi.update(3.0), 100.0));
        assert(near(*rsi.update(2.0), 50.0));
    }

    {
        WilderRSI flat(3);
        for (int i = 0; i < 5; ++i) {
            flat.update(7.0);
        }
        assert(near(*flat.value(), 50.0));
    }

    {
        TickATR atr(2);
        assert(!atr.update(10.0));
        assert(!atr.update(11.0));
        assert(near(*atr.update(13.0), 1.5));
        assert(near(*atr.update(13.0), 0.75));
    }

    {
        RollingStats stats(3);
        assert(!stats.mean());
        stats.update(1.0);
        assert(!stats.variance());
        stats.update(2.0);
        stats.update(3.0);
        assert(stats.isFull());
        stats.update(4.0);
        assert(stats.count() == 3);
        assert(near(*stats.mean(), 3.0));
        assert(near(*stats.variance(), 1.0));
        assert(near(*stats.stddev(), 1.0));

        stats.reset();
        for (int i = 0; i < 10; ++i) {
            stats.update(0.1);
        }
        assert(*stats.variance() >= 0.0);
    }

    std::cout << "[TEST] IncrementalIndicators PASSED\n";
    return 0;
}
