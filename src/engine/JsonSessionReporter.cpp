#include "engine/JsonSessionReporter.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace tickpilot {
namespace engine {

JsonSessionReporter::JsonSessionReporter(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json JsonSessionReporter::toJson(const risk::Position& position) {
    nlohmann::json raw;
    raw["id"] = position.id;
    raw["instrument"] = position.instrument;
    raw["side"] = toString(position.side);
    raw["entry_price"] = position.entry_price;
    raw["initial_quantity"] = position.initial_quantity;
    raw["quantity"] = position.quantity;
    raw["stop_loss"] = position.stop_loss;
    raw["trailing_stop_price"] = position.trailing_stop_price
        ? nlohmann::json(*position.trailing_stop_price) : nlohmann::json(nullptr);
    raw["opened_at_ms"] = toEpochMs(position.opened_at);
    raw["closed_at_ms"] = position.closed_at
        ? nlohmann::json(toEpochMs(*position.closed_at)) : nlohmann::json(nullptr);
    raw["status"] = risk::toString(position.status);
    raw["close_reason"] = position.close_reason
        ? nlohmann::json(risk::toString(*position.close_reason)) : nlohmann::json(nullptr);
    raw["entry_reason"] = position.entry_reason;
    raw["entry_commission"] = position.entry_commission;
    raw["realized_pnl"] = position.realized_pnl;

    nlohmann::json levels = nlohmann::json::array();
    for (const auto& level : position.take_profit_levels) {
        levels.push_back({
            {"trigger_price", level.trigger_price},
            {"fraction", level.fraction},
            {"fired", level.fired}
        });
    }
    raw["take_profit_levels"] = levels;

    nlohmann::json fills = nlohmann::json::array();
    for (const auto& fill : position.fills) {
        fills.push_back({
            {"price", fill.price},
            {"quantity", fill.quantity},
            {"reason", risk::toString(fill.reason)},
            {"time_ms", toEpochMs(fill.time)},
            {"pnl", fill.pnl},
            {"commission", fill.commission}
        });
    }
    raw["fills"] = fills;
    return raw;
}

nlohmann::json JsonSessionReporter::toJson(const SessionReport& report) {
    nlohmann::json raw;
    raw["terminal_message"] = report.terminal_message;
    raw["instrument"] = report.instrument;
    raw["consumption_mode"] = toString(report.mode);
    raw["started_at_ms"] = toEpochMs(report.started_at);
    raw["ended_at_ms"] = toEpochMs(report.ended_at);

    raw["ticks"] = {
        {"dispatched", report.ticks_dispatched},
        {"processed", report.ticks_processed},
        {"skipped", report.ticks_skipped},
        {"errors", report.tick_errors},
        {"max_error_streak", report.max_error_streak}
    };

    raw["feed"] = {
        {"final_status", feed::toString(report.final_feed_status)},
        {"failure_reason", report.feed_failure_reason},
        {"received", report.feed_stats.received},
        {"ticks", report.feed_stats.ticks},
        {"format_errors", report.feed_stats.format_errors},
        {"callback_errors", report.feed_stats.callback_errors},
        {"evicted", report.feed_stats.evicted},
        {"reconnects", report.feed_stats.reconnects}
    };

    raw["account"] = {
        {"initial_capital", report.initial_capital},
        {"final_capital", report.final_capital},
        {"realized_pnl", report.realized_pnl}
    };

    nlohmann::json ledger = nlohmann::json::array();
    for (const auto& position : report.ledger) {
        ledger.push_back(toJson(position));
    }
    raw["ledger"] = ledger;

    nlohmann::json diagnostics = nlohmann::json::object();
    for (const auto& entry : report.diagnostics) {
        diagnostics[core::toString(entry.first)] = {
            {"emitted", entry.second.emitted},
            {"suppressed", entry.second.suppressed}
        };
    }
    raw["diagnostics"] = diagnostics;
    return raw;
}

bool JsonSessionReporter::publish(const SessionReport& report) {
    const nlohmann::json raw = toJson(report);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Session report directory not writable: {} ({})",
                      file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot open session report for writing: {}", tmp_path.string());
            return false;
        }
        out << raw.dump(2);
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        LOG_INFO("Session report written: {}", file_path_.string());
        return true;
    }

    // rename over an existing file can fail on some filesystems
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        LOG_ERROR("Session report write failed: {} ({})", file_path_.string(), ec.message());
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    LOG_INFO("Session report written: {}", file_path_.string());
    return true;
}

} // namespace engine
} // namespace tickpilot
