#pragma once

#include "common/Types.h"
#include "risk/RiskConfig.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tickpilot {
namespace risk {

using PositionId = std::uint64_t;

enum class PositionStatus { OPEN, CLOSING, CLOSED };

const char* toString(PositionStatus status);

// One rung of the ladder as placed on a live position
struct TakeProfitLevel {
    double trigger_price;
    double fraction;        // of the initial quantity
    bool fired;

    TakeProfitLevel(double trigger = 0.0, double f = 0.0)
        : trigger_price(trigger), fraction(f), fired(false) {}
};

// A realized (partial or full) exit
struct Fill {
    double price;
    double quantity;
    CloseReason reason;
    Timestamp time;
    double pnl;             // gross minus exit commission
    double commission;

    Fill()
        : price(0), quantity(0), reason(CloseReason::STOP_LOSS)
        , pnl(0), commission(0) {}
};

struct Position {
    PositionId id;
    std::string instrument;
    PositionSide side;
    double entry_price;
    double initial_quantity;
    double quantity;            // still open
    double stop_loss;
    std::optional<double> trailing_stop_price;
    bool trailing_armed;
    double best_price;          // highest (long) / lowest (short) since entry
    std::vector<TakeProfitLevel> take_profit_levels;
    Timestamp opened_at;
    std::optional<Timestamp> closed_at;
    PositionStatus status;
    std::optional<CloseReason> close_reason;
    std::vector<Fill> fills;
    double entry_commission;
    double realized_pnl;        // fills minus entry commission
    std::string entry_reason;

    Position()
        : id(0), side(PositionSide::LONG), entry_price(0)
        , initial_quantity(0), quantity(0), stop_loss(0)
        , trailing_armed(false), best_price(0)
        , status(PositionStatus::OPEN)
        , entry_commission(0), realized_pnl(0)
    {}

    double direction() const { return side == PositionSide::LONG ? 1.0 : -1.0; }
};

enum class OpenError {
    NONE,
    POSITION_ALREADY_OPEN,
    INSUFFICIENT_CAPITAL,
    INVALID_INSTRUMENT_PARAMS,
    INVALID_SIGNAL
};

const char* toString(OpenError error);

struct OpenResult {
    bool success;
    PositionId id;
    OpenError error;
    std::string message;

    static OpenResult ok(PositionId id) { return {true, id, OpenError::NONE, ""}; }
    static OpenResult failure(OpenError code, std::string msg) { return {false, 0, code, std::move(msg)}; }
};

// Inputs to position sizing; missing lot/tick size is an error, never defaulted
struct SizingInputs {
    double available_capital = 0.0;
    std::optional<double> lot_size;
    std::optional<double> tick_size;
};

struct ExitEvent {
    PositionId id;
    ExitCause cause;
    CloseReason reason;
    double price;
    double quantity;
    double pnl;
    bool position_closed;
    int take_profit_level;      // -1 unless cause is TAKE_PROFIT
};

struct TickOutcome {
    std::vector<ExitEvent> exits;
    bool position_closed = false;
};

using PositionClosedListener = std::function<void(const Position&)>;

// Owner and only writer of the single active position. All methods are
// thread-safe; other contexts read through activeSnapshot()/ledger().
class RiskManager {
public:
    RiskManager(double initial_capital, const RiskConfig& config, const InstrumentConfig& instrument);

    // ===== position lifecycle =====

    // Sizes from current capital and the configured instrument
    OpenResult open(const Signal& signal);
    OpenResult open(const Signal& signal, const SizingInputs& sizing);

    // One pass over the open position in exit-precedence order; first match wins.
    // strategy_close_requested is the decision engine's CLOSE for this tick.
    TickOutcome onTick(const Tick& tick, bool strategy_close_requested = false);

    // Full close at `price`. False if id is not the active position.
    bool close(PositionId id, CloseReason reason, double price, Timestamp ts);

    // ===== queries =====
    bool hasOpenPosition() const;
    std::optional<PositionSide> openSide() const;
    std::optional<Position> activeSnapshot() const;
    std::vector<Position> ledger() const;
    double capital() const;
    double realizedPnl() const;
    SizingInputs currentSizingInputs() const;

    // position sizing only; quantity in instrument units (0 = cannot afford a lot)
    double calculateQuantity(double price, const SizingInputs& sizing) const;

    // Called after a position reaches CLOSED, outside the internal lock
    void setPositionClosedListener(PositionClosedListener listener);

    struct Statistics {
        int total_trades;
        int winning_trades;
        int losing_trades;
        double total_pnl;
        double win_rate;

        Statistics()
            : total_trades(0), winning_trades(0), losing_trades(0)
            , total_pnl(0), win_rate(0) {}
    };
    Statistics getStatistics() const;

private:
    void updateTrailing(Position& pos, double price);
    bool stopLossBreached(const Position& pos, double price) const;
    bool trailingBreached(const Position& pos, double price) const;
    bool takeProfitReached(const Position& pos, const TakeProfitLevel& level, double price) const;

    Fill realize(Position& pos, double price, double quantity, CloseReason reason, Timestamp ts);
    ExitEvent closeAll(Position& pos, ExitCause cause, CloseReason reason, double price, Timestamp ts);
    void archive(Position& pos, CloseReason reason, Timestamp ts);

    RiskConfig config_;
    InstrumentConfig instrument_;
    double initial_capital_;
    double capital_;
    double realized_pnl_;

    std::optional<Position> active_;
    std::vector<Position> ledger_;
    PositionId next_id_;

    PositionClosedListener closed_listener_;
    mutable std::recursive_mutex mutex_;
};

} // namespace risk
} // namespace tickpilot
