#include "engine/SessionController.h"

#include "common/Logger.h"
#include "core/diagnostics/LoggingDiagnosticSink.h"
#include "core/state/DiagnosticJournalJsonl.h"
#include "network/FileReplayFeedSource.h"
#include "network/TickNormalizer.h"
#include "network/WebSocketFeedSource.h"

#include <stdexcept>
#include <thread>
#include <utility>

namespace tickpilot {
namespace engine {

SessionController::SessionController(const SessionConfig& config,
                                     std::unique_ptr<feed::FeedAdapter> adapter,
                                     std::unique_ptr<ISessionReporter> reporter)
    : config_(config)
    , adapter_(std::move(adapter))
    , reporter_(std::move(reporter))
    , strategy_(config.strategy, config.session, config.instrument.tick_size.value_or(0.0))
    , risk_(config.initial_capital, config.risk, config.instrument)
    , diagnostics_(config.instrument.symbol,
                   std::make_unique<core::DiagnosticRateLimiter>(config.limits.diagnostic_limit_mode,
                                                                 config.limits.diagnostic_every_n,
                                                                 config.limits.diagnostic_window))
    , started_at_(std::chrono::system_clock::now())
{
    if (!adapter_) {
        throw std::invalid_argument("SessionController requires a feed adapter");
    }

    diagnostics_.addSink(std::make_shared<core::LoggingDiagnosticSink>());
    if (!config_.logging.diagnostics_journal.empty()) {
        diagnostics_.addSink(std::make_shared<core::DiagnosticJournalJsonl>(config_.logging.diagnostics_journal));
    }

    strategy_.setEvaluationListener([this](const Tick& tick, const strategy::EntryEvaluation& evaluation) {
        onEvaluation(tick, evaluation);
    });
    risk_.setPositionClosedListener([this](const risk::Position&) {
        strategy_.onPositionClosed();
    });
    adapter_->setEventListener([this](core::DiagnosticEventType type, const std::string& detail) {
        onFeedEvent(type, detail);
    });

    dispatcher_ = makeTickDispatcher(config_.feed.consumption_mode, *adapter_,
                                     [this](const Tick& tick) { handleTick(tick); },
                                     stop_requested_, config_.feed.heartbeat_interval);
}

SessionController::~SessionController() {
    if (started_.load()) {
        stop();
    } else {
        adapter_->disconnect();
    }
}

std::unique_ptr<feed::FeedAdapter> SessionController::buildFeedAdapter(const SessionConfig& config) {
    std::unique_ptr<network::IFeedSource> source;
    if (config.feed.source == feed::FeedSourceKind::WEBSOCKET) {
        source = std::make_unique<network::WebSocketFeedSource>(config.feed.websocket,
                                                                config.feed.source_poll_timeout,
                                                                config.feed.queue_capacity);
    } else {
        source = std::make_unique<network::FileReplayFeedSource>(config.feed.replay,
                                                                 config.feed.normalizer,
                                                                 config.instrument.symbol);
    }

    network::TickNormalizer normalizer(config.feed.normalizer, config.instrument.symbol);
    return std::make_unique<feed::FeedAdapter>(std::move(source), std::move(normalizer), config.feed);
}

void SessionController::addDiagnosticSink(std::shared_ptr<core::IDiagnosticSink> sink) {
    if (started_.load()) {
        throw std::logic_error("diagnostic sinks must be added before start()");
    }
    diagnostics_.addSink(std::move(sink));
}

network::ConnectResult SessionController::start() {
    if (started_.load()) {
        return network::ConnectResult::failure(network::ConnectError::ALREADY_CONNECTED,
                                               "session already started");
    }

    LOG_INFO("========================================");
    LOG_INFO("Session start: {} ({}) mode={} capital={:.2f}",
             config_.instrument.symbol, config_.instrument.exchange,
             toString(config_.feed.consumption_mode), config_.initial_capital);
    LOG_INFO("========================================");

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        started_at_ = std::chrono::system_clock::now();
    }

    // dispatcher decides: a callback for CALLBACK mode, none for POLL
    auto result = adapter_->connect(dispatcher_->adapterCallback());
    started_ = true;
    if (!result.success) {
        requestStop("stopped: feed connect failed: " + result.message);
    }
    return result;
}

bool SessionController::pollOnce(std::chrono::steady_clock::time_point now) {
    if (stopped_.load() || stop_requested_.load()) {
        return false;
    }

    const bool feed_done = adapter_->finished();
    dispatcher_->pump(now);

    if (adapter_->failed()) {
        requestStop("stopped: " + adapter_->failureReason());
        return false;
    }
    if (feed_done && (mode() == ConsumptionMode::CALLBACK || adapter_->queuedTicks() == 0)) {
        requestStop("stopped: feed completed");
        return false;
    }
    return !stop_requested_.load();
}

SessionReport SessionController::run() {
    if (!started_.load()) {
        auto result = start();
        if (!result.success) {
            return stop();
        }
    }

    while (pollOnce()) {
        std::this_thread::sleep_for(config_.feed.poll_interval);
    }
    return stop();
}

void SessionController::requestStop(const std::string& terminal_message) {
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (terminal_message_.empty()) {
            terminal_message_ = terminal_message;
            first = true;
        }
    }
    stop_requested_ = true;
    if (first) {
        LOG_WARN("Session stop requested: {}", terminal_message);
    }
}

std::string SessionController::terminalMessage() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return terminal_message_;
}

SessionReport SessionController::stop() {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (final_report_) {
            return *final_report_;
        }
    }

    requestStop();

    {
        // any tick in flight finishes first; nothing is handled after this
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        stopped_ = true;

        if (auto pos = risk_.activeSnapshot()) {
            double price = pos->entry_price;
            if (auto last = adapter_->lastPrice()) {
                price = *last;
            } else if (auto seen = strategy_.indicatorSnapshot().last_price) {
                price = *seen;
            }
            const Timestamp ts = last_tick_ts_ ? *last_tick_ts_ : std::chrono::system_clock::now();
            LOG_WARN("Closing open position {} on session stop at {:.2f}", pos->id, price);
            if (risk_.close(pos->id, risk::CloseReason::SESSION_STOP, price, ts)) {
                nlohmann::json payload;
                payload["position_id"] = pos->id;
                payload["price"] = price;
                payload["quantity"] = pos->quantity;
                diagnostics_.record(core::DiagnosticEventType::EXIT_TRIGGERED,
                                    risk::toString(risk::CloseReason::SESSION_STOP), payload, toEpochMs(ts));
            }
        }
    }

    adapter_->disconnect();

    SessionReport report = buildReport();

    LOG_INFO("========================================");
    LOG_INFO("Session end: {}", report.terminal_message);
    LOG_INFO("   ticks processed {} | skipped {} | errors {} | reconnects {}",
             report.ticks_processed, report.ticks_skipped, report.tick_errors, report.feed_stats.reconnects);
    LOG_INFO("   trades {} | realized pnl {:.2f} | capital {:.2f}",
             report.ledger.size(), report.realized_pnl, report.final_capital);
    LOG_INFO("========================================");
    Logger::getInstance().flush();

    if (reporter_ && !reporter_->publish(report)) {
        LOG_ERROR("Session report could not be published");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    final_report_ = report;
    return report;
}

void SessionController::handleTick(const Tick& tick) {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (stopped_.load()) {
        return;
    }

    if (!tick.isComplete()) {
        ++ticks_skipped_;
        const bool missing_price = !tick.price();
        nlohmann::json payload;
        if (tick.sequenceHint()) {
            payload["seq"] = *tick.sequenceHint();
        }
        diagnostics_.record(core::DiagnosticEventType::TICK_SKIPPED,
                            missing_price ? "MISSING_PRICE" : "MISSING_TIMESTAMP", payload);
        registerFailure(missing_price ? "tick without price" : "tick without timestamp");
        return;
    }

    try {
        processTick(tick);
        ++ticks_processed_;
        error_streak_ = 0;
    } catch (const std::exception& e) {
        ++tick_errors_;
        LOG_ERROR("Tick handling failed: {}", e.what());
        registerFailure(e.what());
    }
}

void SessionController::processTick(const Tick& tick) {
    const double price = *tick.price();
    const Timestamp ts = *tick.timestamp();
    last_tick_ts_ = ts;

    const auto open_side = risk_.openSide();
    const auto signal = strategy_.onTick(tick, open_side);

    if (!open_side) {
        if (signal && signal->isEntry()) {
            const auto result = risk_.open(*signal);
            if (result.success) {
                strategy_.onPositionOpened(*signal);
            } else {
                nlohmann::json payload;
                payload["price"] = price;
                payload["message"] = result.message;
                diagnostics_.record(core::DiagnosticEventType::ENTRY_REJECTED,
                                    toString(result.error), payload, toEpochMs(ts));
            }
        }
        // exits start with the next tick
        return;
    }

    if (strategy_.shouldFlattenForSession(ts)) {
        if (auto pos = risk_.activeSnapshot()) {
            LOG_INFO("Session end buffer reached: flattening position {} at {:.2f}", pos->id, price);
            if (risk_.close(pos->id, risk::CloseReason::SESSION_END, price, ts)) {
                nlohmann::json payload;
                payload["position_id"] = pos->id;
                payload["price"] = price;
                payload["quantity"] = pos->quantity;
                diagnostics_.record(core::DiagnosticEventType::EXIT_TRIGGERED,
                                    risk::toString(risk::CloseReason::SESSION_END), payload, toEpochMs(ts));
            }
        }
        return;
    }

    const bool close_requested = signal && signal->action == SignalAction::CLOSE;
    const auto outcome = risk_.onTick(tick, close_requested);
    for (const auto& exit : outcome.exits) {
        recordExit(exit, toEpochMs(ts));
    }
}

void SessionController::registerFailure(const std::string& what) {
    const int streak = ++error_streak_;
    if (streak > max_error_streak_) {
        max_error_streak_ = streak;
    }
    if (streak > config_.limits.error_streak_threshold) {
        LOG_ERROR("Error streak {} over threshold {} (last: {})",
                  streak, config_.limits.error_streak_threshold, what);
        requestStop("stopped: error streak exceeded");
    }
}

void SessionController::onEvaluation(const Tick& tick, const strategy::EntryEvaluation& evaluation) {
    const long long ts_ms = tick.timestamp() ? toEpochMs(*tick.timestamp()) : 0;
    nlohmann::json payload;
    payload["price"] = tick.price() ? nlohmann::json(*tick.price()) : nlohmann::json(nullptr);
    payload["direction"] = toString(evaluation.direction);

    if (evaluation.accepted()) {
        nlohmann::json checks = nlohmann::json::array();
        for (const auto& c : evaluation.checks) {
            checks.push_back(toString(c.check));
        }
        payload["checks"] = checks;
        diagnostics_.record(core::DiagnosticEventType::ENTRY_ACCEPTED,
                            toString(evaluation.direction), payload, ts_ms);
        return;
    }

    const strategy::CheckResult* failed = evaluation.firstFailure();
    if (failed) {
        payload["detail"] = failed->detail;
    }
    diagnostics_.record(evaluation.gates_passed ? core::DiagnosticEventType::ENTRY_REJECTED
                                                : core::DiagnosticEventType::ENTRY_BLOCKED,
                        failed ? toString(failed->check) : "UNKNOWN", payload, ts_ms);
}

void SessionController::onFeedEvent(core::DiagnosticEventType type, const std::string& detail) {
    nlohmann::json payload;
    payload["detail"] = detail;
    diagnostics_.record(type, core::toString(type), payload);

    if (type == core::DiagnosticEventType::FEED_UNRECOVERABLE) {
        requestStop("stopped: " + detail);
    }
}

void SessionController::recordExit(const risk::ExitEvent& exit, long long ts_ms) {
    nlohmann::json payload;
    payload["position_id"] = exit.id;
    payload["cause"] = risk::toString(exit.cause);
    payload["price"] = exit.price;
    payload["quantity"] = exit.quantity;
    payload["pnl"] = exit.pnl;
    payload["position_closed"] = exit.position_closed;
    if (exit.take_profit_level >= 0) {
        payload["take_profit_level"] = exit.take_profit_level + 1;
    }
    diagnostics_.record(core::DiagnosticEventType::EXIT_TRIGGERED,
                        risk::toString(exit.reason), payload, ts_ms);
}

SessionReport SessionController::buildReport() const {
    SessionReport report;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        report.terminal_message = terminal_message_;
        report.started_at = started_at_;
    }
    report.instrument = config_.instrument.symbol;
    report.mode = config_.feed.consumption_mode;
    report.ended_at = std::chrono::system_clock::now();

    report.ticks_dispatched = dispatcher_->dispatched();
    report.ticks_processed = ticks_processed_.load();
    report.ticks_skipped = ticks_skipped_.load();
    report.tick_errors = tick_errors_.load();
    report.max_error_streak = max_error_streak_;

    report.feed_stats = adapter_->stats();
    report.final_feed_status = adapter_->connectionState().status;
    report.feed_failure_reason = adapter_->failureReason();

    report.initial_capital = config_.initial_capital;
    report.final_capital = risk_.capital();
    report.realized_pnl = risk_.realizedPnl();
    report.ledger = risk_.ledger();
    report.diagnostics = diagnostics_.counts();
    return report;
}

} // namespace engine
} // namespace tickpilot
