#pragma once
// ===================================================================
// Instrument tick-size helpers
//
// The exchange only accepts prices on the instrument's tick grid, so
// every stop / take-profit level is snapped before it is stored.
// tick_size comes from the instrument config; there is no price-band
// table and no fallback value.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace tickpilot {
namespace common {

// round up to the tick grid (buy side / short stop)
inline double roundUpToTickSize(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::ceil(price / tick - 1e-9) * tick;
}

// round down to the tick grid (sell side / long stop)
inline double roundDownToTickSize(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::floor(price / tick + 1e-9) * tick;
}

// Price string with as many decimals as the tick needs
inline std::string priceToString(double price, double tick) {
    int decimals = 0;
    double t = tick;
    while (t > 0.0 && t < 1.0 && decimals < 8) {
        t *= 10.0;
        decimals++;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, price);
    return std::string(buf);
}

} // namespace common
} // namespace tickpilot
