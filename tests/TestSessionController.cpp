#include "core/diagnostics/LoggingDiagnosticSink.h"
#include "engine/JsonSessionReporter.h"
#include "engine/SessionController.h"
#include "support/ScriptedFeedSource.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;
using namespace tickpilot;
using tickpilot::core::DiagnosticEventType;
using tickpilot::engine::SessionConfig;
using tickpilot::engine::SessionController;
using tickpilot::engine::SessionReport;
using tickpilot::testing::ScriptState;
using tickpilot::testing::ScriptedFeedSource;
using tickpilot::testing::kBaseTsMs;
using tickpilot::testing::tickPayload;
using tickpilot::testing::waitFor;

namespace {

// two round trips: 103 -> 99 and 102 -> 101
const std::vector<double> kRoundTrips = {100, 101, 103, 99, 100, 102, 104, 101};

SessionConfig baseConfig(ConsumptionMode mode) {
    SessionConfig config;
    config.instrument.symbol = "TEST";
    config.instrument.exchange = "NSE";
    config.instrument.lot_size = 1.0;
    config.instrument.tick_size = 0.05;
    config.initial_capital = 100000.0;

    config.feed.consumption_mode = mode;
    config.feed.poll_interval = 1ms;
    config.feed.queue_capacity = 100;

    config.strategy.use_ema_crossover = false;
    config.strategy.exit_on_opposite_crossover = false;
    config.strategy.use_consecutive_ticks = true;
    config.strategy.consecutive_ticks_required = 2;
    config.strategy.noise_filter_enabled = false;
    config.strategy.exit_on_decline = true;

    config.session.start_hour = 0;
    config.session.start_min = 0;
    config.session.end_hour = 23;
    config.session.end_min = 59;

    config.risk.base_sl_points = 15.0;
    config.risk.use_trail_stop = false;
    config.risk.take_profit_ladder = {risk::TakeProfitRule(50.0, 1.0)};

    config.limits.error_streak_threshold = 3;
    config.limits.diagnostic_every_n = 1;
    return config;
}

std::unique_ptr<feed::FeedAdapter> scriptedAdapter(const std::shared_ptr<ScriptState>& state,
                                                   const SessionConfig& config) {
    return std::make_unique<feed::FeedAdapter>(std::make_unique<ScriptedFeedSource>(state),
                                               network::TickNormalizer(config.feed.normalizer, "TEST"),
                                               config.feed);
}

class CapturingReporter : public engine::ISessionReporter {
public:
    explicit CapturingReporter(std::shared_ptr<std::vector<SessionReport>> out) : out_(std::move(out)) {}
    bool publish(const SessionReport& report) override {
        out_->push_back(report);
        return true;
    }

private:
    std::shared_ptr<std::vector<SessionReport>> out_;
};

std::shared_ptr<ScriptState> finiteScript(const std::vector<double>& prices, long long start_ms = kBaseTsMs) {
    auto state = std::make_shared<ScriptState>();
    state->finite = true;
    for (std::size_t i = 0; i < prices.size(); ++i) {
        state->push(tickPayload(prices[i], start_ms + static_cast<long long>(i) * 1000));
    }
    return state;
}

SessionReport runScript(ConsumptionMode mode, const std::vector<double>& prices) {
    auto config = baseConfig(mode);
    auto state = finiteScript(prices);
    auto published = std::make_shared<std::vector<SessionReport>>();
    SessionController session(config, scriptedAdapter(state, config),
                              std::make_unique<CapturingReporter>(published));
    auto report = session.run();
    assert(published->size() == 1);
    return report;
}

}

int main() {
    // both consumption modes produce the same trades
    {
        auto poll = runScript(ConsumptionMode::POLL, kRoundTrips);
        auto callback = runScript(ConsumptionMode::CALLBACK, kRoundTrips);

        for (const auto* report : {&poll, &callback}) {
            assert(report->terminal_message == "stopped: feed completed");
            assert(report->ticks_processed == kRoundTrips.size());
            assert(report->ticks_dispatched == kRoundTrips.size());
            assert(report->ledger.size() == 2);
        }
        assert(poll.mode == ConsumptionMode::POLL);
        assert(callback.mode == ConsumptionMode::CALLBACK);

        const auto& first = poll.ledger[0];
        assert(first.side == PositionSide::LONG);
        assert(first.entry_price == 103.0);
        assert(first.fills.size() == 1 && first.fills[0].price == 99.0);
        assert(*first.close_reason == risk::CloseReason::STRATEGY_SIGNAL);
        assert(poll.ledger[1].entry_price == 102.0);
        assert(poll.ledger[1].fills[0].price == 101.0);

        for (std::size_t i = 0; i < poll.ledger.size(); ++i) {
            const auto& a = poll.ledger[i];
            const auto& b = callback.ledger[i];
            assert(a.entry_price == b.entry_price);
            assert(a.initial_quantity == b.initial_quantity);
            assert(a.fills[0].price == b.fills[0].price);
            assert(a.realized_pnl == b.realized_pnl);
            assert(*a.close_reason == *b.close_reason);
        }
        assert(poll.final_capital == callback.final_capital);
        assert(poll.diagnostics[DiagnosticEventType::ENTRY_ACCEPTED].emitted == 2);
        assert(poll.diagnostics[DiagnosticEventType::EXIT_TRIGGERED].emitted == 2);
    }

    // a malformed tick: no decision, no indicator change, streak +1
    {
        auto config = baseConfig(ConsumptionMode::POLL);
        auto state = std::make_shared<ScriptState>();
        SessionController session(config, scriptedAdapter(state, config));
        auto diagnostics = std::make_shared<core::LoggingDiagnosticSink>();
        session.addDiagnosticSink(diagnostics);
        assert(session.start().success);
        assert(session.isRunning());

        session.handleTick(Tick("TEST", fromEpochMs(kBaseTsMs), 100.0));
        session.handleTick(Tick("TEST", fromEpochMs(kBaseTsMs + 1000), 101.0));
        const auto before = session.indicatorSnapshot();
        assert(session.errorStreak() == 0);

        session.handleTick(Tick("TEST", fromEpochMs(kBaseTsMs + 2000), std::nullopt));
        assert(session.errorStreak() == 1);
        assert(session.indicatorSnapshot() == before);
        assert(!session.activePosition());
        assert(session.ticksSkipped() == 1);

        auto events = diagnostics->readFrom(1);
        assert(!events.empty());
        assert(events.back().type == DiagnosticEventType::TICK_SKIPPED);
        assert(events.back().code == "MISSING_PRICE");

        session.handleTick(Tick("TEST", std::nullopt, 102.0));
        assert(session.errorStreak() == 2);
        assert(diagnostics->readFrom(1).back().code == "MISSING_TIMESTAMP");

        // a good tick clears the streak
        session.handleTick(Tick("TEST", fromEpochMs(kBaseTsMs + 3000), 102.0));
        assert(session.errorStreak() == 0);
        assert(session.ticksProcessed() == 3);

        bool threw = false;
        try {
            session.addDiagnosticSink(std::make_shared<core::LoggingDiagnosticSink>());
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        session.stop();
    }

    // too many bad ticks in a row stop the session
    {
        auto config = baseConfig(ConsumptionMode::POLL);
        auto state = std::make_shared<ScriptState>();
        for (int i = 0; i < 6; ++i) {
            state->push(testing::pricelessPayload(kBaseTsMs + i));
        }
        SessionController session(config, scriptedAdapter(state, config));
        auto report = session.run();
        assert(report.terminal_message == "stopped: error streak exceeded");
        assert(report.max_error_streak == 4);
        assert(report.ticks_skipped == 4);
        assert(report.ticks_processed == 0);
        assert(!session.isRunning());
    }

    // an orderly stop closes the open position with SESSION_STOP
    {
        auto config = baseConfig(ConsumptionMode::POLL);
        auto state = std::make_shared<ScriptState>();
        auto published = std::make_shared<std::vector<SessionReport>>();
        SessionController session(config, scriptedAdapter(state, config),
                                  std::make_unique<CapturingReporter>(published));
        assert(session.start().success);

        for (int i = 0; i < 3; ++i) {
            state->push(tickPayload(kRoundTrips[i], kBaseTsMs + i * 1000));
        }
        assert(waitFor([&] {
            session.pollOnce();
            return session.ticksProcessed() == 3;
        }));
        auto open = session.activePosition();
        assert(open && open->entry_price == 103.0);
        assert(open->status == risk::PositionStatus::OPEN);

        auto report = session.stop();
        assert(report.terminal_message == "stopped: requested");
        assert(report.ledger.size() == 1);
        assert(*report.ledger[0].close_reason == risk::CloseReason::SESSION_STOP);
        assert(report.ledger[0].fills[0].price == 103.0);
        assert(toEpochMs(*report.ledger[0].closed_at) == kBaseTsMs + 2000);
        assert(!session.activePosition());
        assert(!session.pollOnce());

        // idempotent; the report is published once
        auto again = session.stop();
        assert(again.ledger.size() == 1);
        assert(published->size() == 1);
    }

    // the session-end buffer flattens with SESSION_END
    {
        auto config = baseConfig(ConsumptionMode::POLL);
        config.session.end_hour = 10;
        config.session.end_min = 5;
        config.session.flatten_before_end_minutes = 5;
        // three ticks at 09:59 UTC open a position, the 10:00 tick is inside the buffer
        auto state = finiteScript({100, 101, 103}, kBaseTsMs - 60000);
        state->push(tickPayload(104, kBaseTsMs));
        SessionController session(config, scriptedAdapter(state, config));
        auto report = session.run();
        assert(report.ledger.size() == 1);
        assert(*report.ledger[0].close_reason == risk::CloseReason::SESSION_END);
        assert(report.ledger[0].fills[0].price == 104.0);
    }

    // reconnects exhausted -> terminal message names the attempts
    {
        auto config = baseConfig(ConsumptionMode::CALLBACK);
        config.feed.backoff_initial = 10ms;
        config.feed.backoff_max = 20ms;
        config.feed.max_reconnect_attempts = 2;
        auto state = std::make_shared<ScriptState>();
        SessionController session(config, scriptedAdapter(state, config));
        assert(session.start().success);
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->fail_connects = 100;
            state->drop = true;
        }
        assert(waitFor([&] { return !session.pollOnce(); }));

        auto report = session.stop();
        assert(report.terminal_message == "stopped: feed unrecoverable after 2 attempts");
        assert(report.feed_failure_reason == "feed unrecoverable after 2 attempts");
        assert(report.feed_stats.reconnects == 2);
        assert(report.diagnostics[DiagnosticEventType::FEED_RECONNECT].emitted == 2);
        assert(report.diagnostics[DiagnosticEventType::FEED_UNRECOVERABLE].emitted == 1);
        assert(session.feedState().terminal);
    }

    {
        auto config = baseConfig(ConsumptionMode::POLL);
        auto state = std::make_shared<ScriptState>();
        state->fail_connects = 1;
        SessionController session(config, scriptedAdapter(state, config));
        auto result = session.start();
        assert(!result.success);
        assert(session.terminalMessage() == "stopped: feed connect failed: scripted connect failure");
        assert(!session.pollOnce());
        assert(session.stop().terminal_message == "stopped: feed connect failed: scripted connect failure");
    }

    {
        bool threw = false;
        try {
            SessionController session(baseConfig(ConsumptionMode::POLL), nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // JSON report on disk
    {
        const auto path = std::filesystem::temp_directory_path() / "tickpilot_report_test" / "report.json";
        std::filesystem::remove_all(path.parent_path());

        auto config = baseConfig(ConsumptionMode::POLL);
        auto state = finiteScript(kRoundTrips);
        {
            SessionController session(config, scriptedAdapter(state, config),
                                      std::make_unique<engine::JsonSessionReporter>(path));
            session.run();
        }

        std::ifstream in(path);
        assert(in.is_open());
        const auto raw = nlohmann::json::parse(in);
        assert(raw["terminal_message"] == "stopped: feed completed");
        assert(raw["instrument"] == "TEST");
        assert(raw["consumption_mode"] == "POLL");
        assert(raw["ticks"]["processed"] == kRoundTrips.size());
        assert(raw["ledger"].size() == 2);
        assert(raw["ledger"][0]["close_reason"] == "STRATEGY_SIGNAL");
        assert(raw["ledger"][0]["entry_price"] == 103.0);
        assert(raw["ledger"][0]["fills"].size() == 1);
        assert(raw["diagnostics"]["ENTRY_ACCEPTED"]["emitted"] == 2);
        assert(raw["account"]["initial_capital"] == 100000.0);
        assert(!std::filesystem::exists(path.string() + ".tmp"));

        std::filesystem::remove_all(path.parent_path());
    }

    std::cout << "[TEST] SessionController PASSED\n";
    return 0;
}
