#include "common/Config.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace tickpilot;
using nlohmann::json;

namespace {

const std::filesystem::path kExampleConfig =
    std::filesystem::path(TICKPILOT_SOURCE_DIR) / "config" / "session.example.json";

json exampleJson() {
    std::ifstream in(kExampleConfig);
    assert(in.is_open());
    return json::parse(in);
}

// path of the ConfigError raised for `root`, empty if it loads
std::string errorPath(const json& root, std::string* message = nullptr) {
    try {
        Config::fromJson(root);
    } catch (const ConfigError& e) {
        if (message) {
            *message = e.what();
        }
        return e.path();
    }
    return "";
}

}

int main() {
    // the shipped example is complete and valid
    {
        const auto cfg = Config::loadFile(kExampleConfig.string());
        assert(cfg.instrument.symbol == "NIFTY-FUT");
        assert(cfg.instrument.exchange == "NSE");
        assert(*cfg.instrument.lot_size == 50.0);
        assert(*cfg.instrument.tick_size == 0.05);
        assert(cfg.initial_capital == 1000000.0);

        assert(cfg.feed.source == feed::FeedSourceKind::FILE_REPLAY);
        assert(cfg.feed.consumption_mode == ConsumptionMode::POLL);
        assert(cfg.feed.queue_capacity == 1000);
        assert(cfg.feed.silence_threshold.count() == 30000);
        assert(cfg.feed.backoff_initial.count() == 1000);
        assert(cfg.feed.backoff_max.count() == 60000);
        assert(cfg.feed.max_reconnect_attempts == 5);
        assert(cfg.feed.replay.file_path == "data/sample_ticks.csv");
        assert(cfg.feed.replay.speed_mode == "FAST");
        assert(cfg.feed.normalizer.price_field == "price");

        assert(cfg.risk.base_sl_points == 15.0);
        assert(cfg.risk.take_profit_ladder.size() == 2);
        assert(cfg.risk.take_profit_ladder[1].points == 20.0);
        assert(cfg.risk.take_profit_ladder[1].fraction == 0.5);
        assert(cfg.risk.exit_precedence.front() == risk::ExitCause::STOP_LOSS);

        assert(cfg.strategy.fast_ema == 9 && cfg.strategy.slow_ema == 21);
        assert(cfg.strategy.consecutive_ticks_required == 3);

        assert(cfg.session.start_hour == 9 && cfg.session.start_min == 15);
        assert(cfg.session.end_hour == 15 && cfg.session.end_min == 30);
        assert(cfg.session.utc_offset_minutes == 330);
        assert(cfg.session.flatten_before_end_minutes == 10);

        assert(cfg.limits.error_streak_threshold == 7);
        assert(cfg.limits.diagnostic_limit_mode == core::DiagnosticLimitMode::COUNT);
        assert(cfg.limits.diagnostic_every_n == 100);
        assert(cfg.logging.diagnostics_journal == "logs/diagnostics.jsonl");
        assert(cfg.report.output_path == "results/session_report.json");
        assert(cfg.validate().empty());
    }

    // missing values name the dotted key; nothing is defaulted
    {
        auto root = exampleJson();
        root["risk"].erase("base_sl_points");
        assert(errorPath(root) == "risk.base_sl_points");

        root = exampleJson();
        root["instrument"].erase("lot_size");
        assert(errorPath(root) == "instrument.lot_size");

        root = exampleJson();
        root.erase("limits");
        assert(errorPath(root) == "limits");

        root = exampleJson();
        root["risk"]["take_profit"][1].erase("fraction");
        assert(errorPath(root) == "risk.take_profit[1].fraction");

        root = exampleJson();
        root["feed"]["replay"].erase("file_path");
        assert(errorPath(root) == "feed.replay.file_path");
    }

    // wrong types
    {
        auto root = exampleJson();
        root["strategy"]["fast_ema"] = "9";
        std::string message;
        assert(errorPath(root, &message) == "strategy.fast_ema");
        assert(message.find("wrong type") != std::string::npos);

        root = exampleJson();
        root["strategy"]["allow_short"] = 1;
        assert(errorPath(root) == "strategy.allow_short");

        root = exampleJson();
        root["risk"]["take_profit"] = json::object();
        assert(errorPath(root) == "risk.take_profit");

        root = exampleJson();
        root["feed"]["queue_capacity"] = 0;
        assert(errorPath(root) == "feed.queue_capacity");
    }

    // enumerations and clocks
    {
        auto root = exampleJson();
        root["feed"]["consumption_mode"] = "callback";
        assert(Config::fromJson(root).feed.consumption_mode == ConsumptionMode::CALLBACK);

        root["feed"]["consumption_mode"] = "PUSH";
        assert(errorPath(root) == "feed.consumption_mode");

        root = exampleJson();
        root["session"]["start"] = "9h15";
        assert(errorPath(root) == "session.start");
        root["session"]["start"] = "24:00";
        assert(errorPath(root) == "session.start");

        root = exampleJson();
        root["risk"]["exit_precedence"] = {"TAKE_PROFIT", "STOP_LOSS", "STRATEGY_SIGNAL", "TRAILING_STOP"};
        const auto cfg = Config::fromJson(root);
        assert(cfg.risk.exit_precedence[0] == risk::ExitCause::TAKE_PROFIT);
        assert(cfg.risk.exit_precedence[3] == risk::ExitCause::TRAILING_STOP);

        root["risk"]["exit_precedence"] = {"STOP_LOSS", "STOP_LOSS", "TAKE_PROFIT", "STRATEGY_SIGNAL"};
        assert(errorPath(root) == "risk.exit_precedence");
        root["risk"]["exit_precedence"] = {"STOP_LOSS", "MARGIN_CALL"};
        assert(errorPath(root) == "risk.exit_precedence");
        root["risk"]["exit_precedence"] = {"STOP_LOSS", "TAKE_PROFIT"};
        assert(errorPath(root) == "config");
    }

    // TIME mode needs a window instead of a count
    {
        auto root = exampleJson();
        root["limits"] = {
            {"error_streak_threshold", 3},
            {"diagnostic_limit_mode", "time"},
            {"diagnostic_window_ms", 2500}
        };
        const auto cfg = Config::fromJson(root);
        assert(cfg.limits.diagnostic_limit_mode == core::DiagnosticLimitMode::TIME);
        assert(cfg.limits.diagnostic_window.count() == 2500);

        root["limits"].erase("diagnostic_window_ms");
        assert(errorPath(root) == "limits.diagnostic_window_ms");
    }

    // cross-field validation
    {
        auto root = exampleJson();
        root["instrument"]["tick_size"] = 0;
        std::string message;
        assert(errorPath(root, &message) == "config");
        assert(message.find("instrument.tick_size must be positive") != std::string::npos);

        root = exampleJson();
        root["strategy"]["fast_ema"] = 30;
        root["session"]["end"] = "09:00";
        assert(errorPath(root, &message) == "config");
        assert(message.find("fast_ema must be less than") != std::string::npos);
        assert(message.find("session start must be before session end") != std::string::npos);

        root = exampleJson();
        root["risk"]["take_profit"] = {{{"points", 20}, {"fraction", 0.5}}, {{"points", 10}, {"fraction", 0.5}}};
        assert(errorPath(root, &message) == "config");
        assert(message.find("ascending") != std::string::npos);

        engine::SessionConfig empty;
        assert(!empty.validate().empty());
    }

    // websocket feeds need a host; the subscribe message may be inline JSON
    {
        auto root = exampleJson();
        root["feed"]["source"] = "WEBSOCKET";
        const auto cfg = Config::fromJson(root);
        assert(cfg.feed.source == feed::FeedSourceKind::WEBSOCKET);
        assert(cfg.feed.websocket.host == "stream.example-broker.com");
        assert(cfg.feed.websocket.target == "/v1/ticks");
        assert(cfg.feed.websocket.use_tls);
        assert(json::parse(cfg.feed.websocket.subscribe_payload)["action"] == "subscribe");

        root["feed"]["websocket"]["host"] = "  ";
        assert(errorPath(root) == "feed.websocket.host");
        root["feed"].erase("websocket");
        assert(errorPath(root) == "feed.websocket");
    }

    // file errors
    {
        const auto dir = std::filesystem::temp_directory_path();
        bool threw = false;
        try {
            Config::loadFile((dir / "tickpilot_missing_config.json").string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        const auto broken = dir / "tickpilot_broken_config.json";
        {
            std::ofstream out(broken, std::ios::trunc);
            out << "{ \"instrument\": ";
        }
        threw = false;
        try {
            Config::loadFile(broken.string());
        } catch (const ConfigError& e) {
            threw = std::string(e.what()).find("invalid JSON") != std::string::npos;
        }
        assert(threw);
        std::filesystem::remove(broken);
    }

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
