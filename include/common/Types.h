#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tickpilot {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class PositionSide { LONG, SHORT };

// Consumption strategy, fixed for the lifetime of a session
enum class ConsumptionMode { POLL, CALLBACK };

// Fixed-shape tick record. Missing fields stay missing: callers must check
// the optionals instead of receiving a zero price or epoch timestamp.
class Tick {
public:
    Tick() = default;

    Tick(std::string instrument_id,
         std::optional<Timestamp> timestamp,
         std::optional<Price> price,
         std::optional<Volume> volume = std::nullopt,
         std::optional<std::uint64_t> sequence_hint = std::nullopt)
        : instrument_id_(std::move(instrument_id))
        , timestamp_(timestamp)
        , price_(price)
        , volume_(volume)
        , sequence_hint_(sequence_hint)
    {}

    const std::string& instrumentId() const { return instrument_id_; }
    std::optional<Timestamp> timestamp() const { return timestamp_; }
    std::optional<Price> price() const { return price_; }
    std::optional<Volume> volume() const { return volume_; }
    std::optional<std::uint64_t> sequenceHint() const { return sequence_hint_; }

    // price and timestamp are both required for a decision
    bool isComplete() const { return price_.has_value() && timestamp_.has_value(); }

private:
    std::string instrument_id_;
    std::optional<Timestamp> timestamp_;
    std::optional<Price> price_;
    std::optional<Volume> volume_;
    std::optional<std::uint64_t> sequence_hint_;
};

enum class SignalAction { ENTER_LONG, ENTER_SHORT, CLOSE };

// Decision output for one tick; never stored
struct Signal {
    SignalAction action;
    Price price;
    std::string reason;
    Timestamp timestamp;

    Signal()
        : action(SignalAction::CLOSE)
        , price(0.0)
    {}

    Signal(SignalAction a, Price p, std::string r, Timestamp ts)
        : action(a)
        , price(p)
        , reason(std::move(r))
        , timestamp(ts)
    {}

    bool isEntry() const { return action != SignalAction::CLOSE; }
};

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::ENTER_LONG: return "ENTER_LONG";
        case SignalAction::ENTER_SHORT: return "ENTER_SHORT";
        case SignalAction::CLOSE: return "CLOSE";
    }
    return "CLOSE";
}

inline const char* toString(PositionSide side) {
    return side == PositionSide::LONG ? "LONG" : "SHORT";
}

inline const char* toString(ConsumptionMode mode) {
    return mode == ConsumptionMode::POLL ? "POLL" : "CALLBACK";
}

inline long long toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp fromEpochMs(long long ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

} // namespace tickpilot
