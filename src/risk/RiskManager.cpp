#include "risk/RiskManager.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include <algorithm>
#include <cmath>

namespace tickpilot {
namespace risk {

namespace {
constexpr double kQtyEpsilon = 1e-9;
constexpr double kFractionEpsilon = 1e-6;
}

const char* toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::OPEN: return "OPEN";
        case PositionStatus::CLOSING: return "CLOSING";
        case PositionStatus::CLOSED: return "CLOSED";
    }
    return "OPEN";
}

const char* toString(OpenError error) {
    switch (error) {
        case OpenError::NONE: return "NONE";
        case OpenError::POSITION_ALREADY_OPEN: return "POSITION_ALREADY_OPEN";
        case OpenError::INSUFFICIENT_CAPITAL: return "INSUFFICIENT_CAPITAL";
        case OpenError::INVALID_INSTRUMENT_PARAMS: return "INVALID_INSTRUMENT_PARAMS";
        case OpenError::INVALID_SIGNAL: return "INVALID_SIGNAL";
    }
    return "NONE";
}

RiskManager::RiskManager(double initial_capital, const RiskConfig& config, const InstrumentConfig& instrument)
    : config_(config)
    , instrument_(instrument)
    , initial_capital_(initial_capital)
    , capital_(initial_capital)
    , realized_pnl_(0.0)
    , next_id_(1)
{
    LOG_INFO("RiskManager initialized - {} initial capital {:.2f}", instrument_.symbol, initial_capital);
}

SizingInputs RiskManager::currentSizingInputs() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    SizingInputs sizing;
    sizing.available_capital = capital_;
    sizing.lot_size = instrument_.lot_size;
    sizing.tick_size = instrument_.tick_size;
    return sizing;
}

double RiskManager::calculateQuantity(double price, const SizingInputs& sizing) const {
    if (!sizing.lot_size || *sizing.lot_size <= 0.0 || price <= 0.0 || config_.base_sl_points <= 0.0) {
        return 0.0;
    }
    const double lot = *sizing.lot_size;
    const double risk_amount = sizing.available_capital * config_.risk_per_trade_percent / 100.0;
    const double max_value = sizing.available_capital * config_.max_position_value_percent / 100.0;

    const double lots_by_risk = risk_amount / (config_.base_sl_points * lot);
    const double lots_by_value = max_value / (price * lot);
    const double lots = std::floor(std::min(lots_by_risk, lots_by_value) + kQtyEpsilon);
    return lots > 0.0 ? lots * lot : 0.0;
}

OpenResult RiskManager::open(const Signal& signal) {
    return open(signal, currentSizingInputs());
}

OpenResult RiskManager::open(const Signal& signal, const SizingInputs& sizing) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!signal.isEntry()) {
        return OpenResult::failure(OpenError::INVALID_SIGNAL, "open() needs an entry signal");
    }
    // check-and-set under the same lock that close() takes
    if (active_) {
        LOG_WARN("{} already has an open position (id {})", instrument_.symbol, active_->id);
        return OpenResult::failure(OpenError::POSITION_ALREADY_OPEN, "a position is already open");
    }
    if (!sizing.lot_size || *sizing.lot_size <= 0.0) {
        LOG_ERROR("{} entry refused: lot size missing or non-positive", instrument_.symbol);
        return OpenResult::failure(OpenError::INVALID_INSTRUMENT_PARAMS, "lot size is missing or non-positive");
    }
    if (!sizing.tick_size || *sizing.tick_size <= 0.0) {
        LOG_ERROR("{} entry refused: tick size missing or non-positive", instrument_.symbol);
        return OpenResult::failure(OpenError::INVALID_INSTRUMENT_PARAMS, "tick size is missing or non-positive");
    }
    if (signal.price <= 0.0) {
        return OpenResult::failure(OpenError::INVALID_SIGNAL, "entry price must be positive");
    }

    const double quantity = calculateQuantity(signal.price, sizing);
    if (quantity <= 0.0) {
        LOG_WARN("{} entry blocked: capital {:.2f} does not cover one lot ({} @ {:.2f}, SL {:.2f} pts)",
                 instrument_.symbol, sizing.available_capital, *sizing.lot_size, signal.price, config_.base_sl_points);
        return OpenResult::failure(OpenError::INSUFFICIENT_CAPITAL, "capital does not cover one lot");
    }

    const double tick = *sizing.tick_size;
    Position pos;
    pos.id = next_id_++;
    pos.instrument = instrument_.symbol;
    pos.side = signal.action == SignalAction::ENTER_LONG ? PositionSide::LONG : PositionSide::SHORT;
    pos.entry_price = signal.price;
    pos.initial_quantity = quantity;
    pos.quantity = quantity;
    pos.best_price = signal.price;
    pos.opened_at = signal.timestamp;
    pos.entry_reason = signal.reason;
    pos.status = PositionStatus::OPEN;

    const bool is_long = pos.side == PositionSide::LONG;
    pos.stop_loss = is_long
        ? common::roundDownToTickSize(signal.price - config_.base_sl_points, tick)
        : common::roundUpToTickSize(signal.price + config_.base_sl_points, tick);

    for (const auto& rule : config_.take_profit_ladder) {
        const double trigger = is_long
            ? common::roundUpToTickSize(signal.price + rule.points, tick)
            : common::roundDownToTickSize(signal.price - rule.points, tick);
        pos.take_profit_levels.emplace_back(trigger, rule.fraction);
    }

    pos.entry_commission = config_.commission_percent / 100.0 * signal.price * quantity;
    pos.realized_pnl = -pos.entry_commission;
    capital_ -= pos.entry_commission;
    realized_pnl_ -= pos.entry_commission;

    LOG_INFO("Position entered: {} | id={} | side={} | qty={} | entry={} | commission={:.2f}",
             pos.instrument, pos.id, toString(pos.side), pos.quantity,
             common::priceToString(pos.entry_price, tick), pos.entry_commission);
    LOG_INFO("   risk plan: SL={} | TP levels={} | trail={}",
             common::priceToString(pos.stop_loss, tick), pos.take_profit_levels.size(),
             config_.use_trail_stop ? "on" : "off");

    active_ = pos;
    return OpenResult::ok(pos.id);
}

void RiskManager::updateTrailing(Position& pos, double price) {
    const bool is_long = pos.side == PositionSide::LONG;
    pos.best_price = is_long ? std::max(pos.best_price, price) : std::min(pos.best_price, price);

    if (!config_.use_trail_stop) {
        return;
    }

    if (!pos.trailing_armed) {
        const double favorable = (price - pos.entry_price) * pos.direction();
        if (favorable < config_.trail_activation_points) {
            return;
        }
        pos.trailing_armed = true;
        LOG_INFO("{} trailing stop armed at {:.2f} (activation {:.2f} pts)",
                 pos.instrument, price, config_.trail_activation_points);
    }

    const double candidate = pos.best_price - pos.direction() * config_.trail_distance_points;
    if (!pos.trailing_stop_price) {
        pos.trailing_stop_price = candidate;
    } else if (is_long ? candidate > *pos.trailing_stop_price : candidate < *pos.trailing_stop_price) {
        // only ever tightens
        pos.trailing_stop_price = candidate;
    }
}

bool RiskManager::stopLossBreached(const Position& pos, double price) const {
    return pos.side == PositionSide::LONG ? price <= pos.stop_loss : price >= pos.stop_loss;
}

bool RiskManager::trailingBreached(const Position& pos, double price) const {
    if (!pos.trailing_armed || !pos.trailing_stop_price) {
        return false;
    }
    return pos.side == PositionSide::LONG ? price <= *pos.trailing_stop_price
                                          : price >= *pos.trailing_stop_price;
}

bool RiskManager::takeProfitReached(const Position& pos, const TakeProfitLevel& level, double price) const {
    return pos.side == PositionSide::LONG ? price >= level.trigger_price : price <= level.trigger_price;
}

Fill RiskManager::realize(Position& pos, double price, double quantity, CloseReason reason, Timestamp ts) {
    Fill fill;
    fill.price = price;
    fill.quantity = quantity;
    fill.reason = reason;
    fill.time = ts;
    fill.commission = config_.commission_percent / 100.0 * price * quantity;
    fill.pnl = (price - pos.entry_price) * quantity * pos.direction() - fill.commission;

    pos.quantity = std::max(0.0, pos.quantity - quantity);
    if (pos.quantity < kQtyEpsilon) {
        pos.quantity = 0.0;
    }
    pos.realized_pnl += fill.pnl;
    pos.fills.push_back(fill);
    capital_ += fill.pnl;
    realized_pnl_ += fill.pnl;

    Logger::getInstance().logTrade(pos.instrument, toString(pos.side), pos.entry_price, price,
                                   quantity, fill.pnl, toString(reason));
    return fill;
}

ExitEvent RiskManager::closeAll(Position& pos, ExitCause cause, CloseReason reason, double price, Timestamp ts) {
    pos.status = PositionStatus::CLOSING;
    const double qty = pos.quantity;
    const Fill fill = realize(pos, price, qty, reason, ts);
    ExitEvent event{pos.id, cause, reason, price, qty, fill.pnl, true, -1};
    archive(pos, reason, ts);
    return event;
}

void RiskManager::archive(Position& pos, CloseReason reason, Timestamp ts) {
    pos.status = PositionStatus::CLOSED;
    pos.close_reason = reason;
    pos.closed_at = ts;

    LOG_INFO("Position exited: {} | id={} | pnl {:.2f} | reason={} | capital {:.2f}",
             pos.instrument, pos.id, pos.realized_pnl, toString(reason), capital_);

    ledger_.push_back(pos);
    active_.reset();
}

TickOutcome RiskManager::onTick(const Tick& tick, bool strategy_close_requested) {
    TickOutcome outcome;
    std::optional<Position> closed;
    PositionClosedListener listener;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!active_ || active_->status != PositionStatus::OPEN || !tick.price()) {
            return outcome;
        }

        Position& pos = *active_;
        const double price = *tick.price();
        const Timestamp ts = tick.timestamp() ? *tick.timestamp() : std::chrono::system_clock::now();

        updateTrailing(pos, price);

        bool matched = false;
        for (ExitCause cause : config_.exit_precedence) {
            switch (cause) {
                case ExitCause::STOP_LOSS:
                    if (stopLossBreached(pos, price)) {
                        LOG_WARN("{} stop-loss hit: {:.2f} vs {:.2f}", pos.instrument, price, pos.stop_loss);
                        outcome.exits.push_back(closeAll(pos, cause, CloseReason::STOP_LOSS, price, ts));
                        matched = true;
                    }
                    break;

                case ExitCause::TRAILING_STOP:
                    if (trailingBreached(pos, price)) {
                        LOG_INFO("{} trailing stop hit: {:.2f} vs {:.2f}", pos.instrument, price, *pos.trailing_stop_price);
                        outcome.exits.push_back(closeAll(pos, cause, CloseReason::TRAILING_STOP, price, ts));
                        matched = true;
                    }
                    break;

                case ExitCause::TAKE_PROFIT: {
                    const double lot = instrument_.lot_size.value_or(0.0);
                    // the last rung sweeps lot-rounding residue only when the ladder exits everything
                    double ladder_total = 0.0;
                    for (const auto& l : pos.take_profit_levels) {
                        ladder_total += l.fraction;
                    }
                    const bool ladder_covers_all = ladder_total >= 1.0 - kFractionEpsilon;

                    for (std::size_t i = 0; i < pos.take_profit_levels.size(); ++i) {
                        auto& level = pos.take_profit_levels[i];
                        if (level.fired || !takeProfitReached(pos, level, price)) {
                            continue;
                        }
                        level.fired = true;

                        const bool last_unfired = std::none_of(
                            pos.take_profit_levels.begin(), pos.take_profit_levels.end(),
                            [](const TakeProfitLevel& l) { return !l.fired; });
                        double qty = pos.quantity;
                        if (!(last_unfired && ladder_covers_all) && lot > 0.0) {
                            const double lots = std::floor(level.fraction * pos.initial_quantity / lot + kQtyEpsilon);
                            qty = std::min(pos.quantity, lots * lot);
                        }
                        if (qty <= 0.0) {
                            LOG_WARN("{} take-profit {} reached but its fraction rounds to zero lots", pos.instrument, i + 1);
                            continue;
                        }
                        matched = true;

                        LOG_INFO("{} take-profit {} hit: {:.2f} >= {:.2f}, closing {}",
                                 pos.instrument, i + 1, price, level.trigger_price, qty);
                        const Fill fill = realize(pos, price, qty, CloseReason::TAKE_PROFIT, ts);
                        const bool done = pos.quantity <= 0.0;
                        outcome.exits.push_back(ExitEvent{pos.id, cause, CloseReason::TAKE_PROFIT,
                                                          price, qty, fill.pnl, done, static_cast<int>(i)});
                        if (done) {
                            archive(pos, CloseReason::TAKE_PROFIT, ts);
                            break;
                        }
                    }
                    break;
                }

                case ExitCause::STRATEGY_SIGNAL:
                    if (strategy_close_requested) {
                        LOG_INFO("{} strategy exit at {:.2f}", pos.instrument, price);
                        outcome.exits.push_back(closeAll(pos, cause, CloseReason::STRATEGY_SIGNAL, price, ts));
                        matched = true;
                    }
                    break;
            }
            if (matched) {
                break;
            }
        }

        if (!active_) {
            outcome.position_closed = true;
            closed = ledger_.back();
            listener = closed_listener_;
        }
    }

    if (closed && listener) {
        listener(*closed);
    }
    return outcome;
}

bool RiskManager::close(PositionId id, CloseReason reason, double price, Timestamp ts) {
    std::optional<Position> closed;
    PositionClosedListener listener;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!active_ || active_->id != id) {
            LOG_WARN("close({}) ignored: no such open position", id);
            return false;
        }
        LOG_INFO("{} closing position {} at {:.2f} ({})", active_->instrument, id, price, toString(reason));
        closeAll(*active_, ExitCause::STRATEGY_SIGNAL, reason, price, ts);
        closed = ledger_.back();
        listener = closed_listener_;
    }

    if (listener) {
        listener(*closed);
    }
    return true;
}

bool RiskManager::hasOpenPosition() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return active_.has_value();
}

std::optional<PositionSide> RiskManager::openSide() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->side;
}

std::optional<Position> RiskManager::activeSnapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return active_;
}

std::vector<Position> RiskManager::ledger() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ledger_;
}

double RiskManager::capital() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return capital_;
}

double RiskManager::realizedPnl() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return realized_pnl_;
}

void RiskManager::setPositionClosedListener(PositionClosedListener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    closed_listener_ = std::move(listener);
}

RiskManager::Statistics RiskManager::getStatistics() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statistics stats;
    for (const auto& pos : ledger_) {
        stats.total_trades++;
        stats.total_pnl += pos.realized_pnl;
        if (pos.realized_pnl > 0.0) {
            stats.winning_trades++;
        } else {
            stats.losing_trades++;
        }
    }
    if (stats.total_trades > 0) {
        stats.win_rate = static_cast<double>(stats.winning_trades) / stats.total_trades;
    }
    return stats;
}

} // namespace risk
} // namespace tickpilot
