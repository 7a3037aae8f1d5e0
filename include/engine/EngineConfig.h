#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/model/DiagnosticTypes.h"
#include "feed/FeedConfig.h"
#include "risk/RiskConfig.h"
#include "strategy/StrategyConfig.h"

namespace tickpilot {
namespace engine {

struct LimitsConfig {
    int error_streak_threshold = 7;
    core::DiagnosticLimitMode diagnostic_limit_mode = core::DiagnosticLimitMode::COUNT;
    int diagnostic_every_n = 100;
    std::chrono::milliseconds diagnostic_window{5000};
};

struct LoggingConfig {
    std::string log_dir = "logs";
    std::string level = "info";
    std::string diagnostics_journal;     // empty: diagnostics only go to the log
};

struct ReportConfig {
    std::string output_path = "results/session_report.json";
};

// Everything a session needs, built once by Config and never mutated
struct SessionConfig {
    risk::InstrumentConfig instrument;
    feed::FeedConfig feed;
    double initial_capital = 0.0;
    risk::RiskConfig risk;
    strategy::StrategyConfig strategy;
    strategy::SessionWindowConfig session;
    LimitsConfig limits;
    LoggingConfig logging;
    ReportConfig report;

    // cross-field checks; empty result means valid
    std::vector<std::string> validate() const;
};

} // namespace engine
} // namespace tickpilot
