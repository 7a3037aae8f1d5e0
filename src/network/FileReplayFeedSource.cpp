#include "network/FileReplayFeedSource.h"

#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

namespace tickpilot {
namespace network {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

// numeric cells become JSON numbers, anything else stays text so the
// normalizer reports it as missing
void putCell(nlohmann::json& payload, const std::string& field, const std::string& cell) {
    if (field.empty() || cell.empty()) {
        return;
    }
    char* end = nullptr;
    const double value = std::strtod(cell.c_str(), &end);
    if (end == cell.c_str() + cell.size()) {
        payload[field] = value;
    } else {
        payload[field] = cell;
    }
}

struct ColumnMap {
    int timestamp = 0;
    int price = 1;
    int volume = 2;
    int symbol = 3;
};
}

FileReplayFeedSource::FileReplayFeedSource(feed::ReplayConfig config,
                                           feed::NormalizerConfig field_names,
                                           std::string default_instrument)
    : config_(std::move(config))
    , field_names_(std::move(field_names))
    , default_instrument_(std::move(default_instrument))
    , delay_(delayForSpeed(config_.speed_mode)) {}

std::chrono::microseconds FileReplayFeedSource::delayForSpeed(const std::string& speed_mode) {
    if (speed_mode == "REALTIME") return std::chrono::microseconds(50000);
    if (speed_mode == "FAST") return std::chrono::microseconds(10000);
    if (speed_mode == "TURBO") return std::chrono::microseconds(2000);
    if (speed_mode == "MAX") return std::chrono::microseconds(100);
    return std::chrono::microseconds(0);
}

bool FileReplayFeedSource::loadRows(std::string& error) {
    std::ifstream file(config_.file_path);
    if (!file.is_open()) {
        error = "Failed to open replay file: " + config_.file_path;
        return false;
    }

    ColumnMap columns;
    bool first_line = true;
    std::string line;
    std::size_t skipped = 0;

    while (std::getline(file, line)) {
        auto row = splitRow(line);
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }

        if (first_line) {
            first_line = false;
            if (!row[0].empty() && !std::isdigit(static_cast<unsigned char>(row[0][0]))) {
                // header row: resolve columns by name
                columns = ColumnMap{-1, -1, -1, -1};
                for (std::size_t i = 0; i < row.size(); ++i) {
                    const std::string name = lowerCopy(row[i]);
                    const int idx = static_cast<int>(i);
                    if (name == "timestamp" || name == "time" || name == "ts") {
                        columns.timestamp = idx;
                    } else if (columns.price < 0 && (name == "price" || name == "close" || name == "ltp")) {
                        columns.price = idx;
                    } else if (name == "volume" || name == "qty") {
                        columns.volume = idx;
                    } else if (name == "symbol" || name == "instrument") {
                        columns.symbol = idx;
                    }
                }
                if (columns.price < 0) {
                    error = "Replay file has no price column: " + config_.file_path;
                    return false;
                }
                // price-only files are fine when ticks get stamped on arrival
                if (columns.timestamp < 0 && !field_names_.stamp_on_receive) {
                    error = "Replay file has no timestamp column: " + config_.file_path;
                    return false;
                }
                continue;
            }
        }

        if (columns.price >= static_cast<int>(row.size()) ||
            columns.timestamp >= static_cast<int>(row.size())) {
            ++skipped;
            continue;
        }

        nlohmann::json payload = nlohmann::json::object();
        if (columns.timestamp >= 0) {
            putCell(payload, field_names_.timestamp_field, row[columns.timestamp]);
        }
        putCell(payload, field_names_.price_field, row[columns.price]);
        if (columns.volume >= 0 && columns.volume < static_cast<int>(row.size())) {
            putCell(payload, field_names_.volume_field, row[columns.volume]);
        }
        std::string symbol = default_instrument_;
        if (columns.symbol >= 0 && columns.symbol < static_cast<int>(row.size()) && !row[columns.symbol].empty()) {
            symbol = row[columns.symbol];
        }
        if (!field_names_.instrument_field.empty()) {
            payload[field_names_.instrument_field] = symbol;
        }
        if (!field_names_.sequence_field.empty()) {
            payload[field_names_.sequence_field] = payloads_.size();
        }
        payloads_.push_back(payload.dump());
    }

    if (skipped > 0) {
        LOG_WARN("Replay file {}: skipped {} short rows", config_.file_path, skipped);
    }
    LOG_INFO("Loaded {} replay rows from {} (speed {})", payloads_.size(), config_.file_path, config_.speed_mode);
    return true;
}

ConnectResult FileReplayFeedSource::connect() {
    if (connected_.load()) {
        return ConnectResult::failure(ConnectError::ALREADY_CONNECTED, "replay already connected");
    }

    if (!loaded_) {
        std::ifstream probe(config_.file_path);
        if (!probe.is_open()) {
            return ConnectResult::failure(ConnectError::SOURCE_NOT_FOUND,
                                          "replay file not found: " + config_.file_path);
        }
        probe.close();

        std::string error;
        if (!loadRows(error)) {
            return ConnectResult::failure(ConnectError::INVALID_SOURCE, error);
        }
        loaded_ = true;
    }

    // a reconnect resumes after the last delivered row
    connected_ = true;
    exhausted_ = cursor_ >= payloads_.size();
    return ConnectResult::ok();
}

std::optional<RawMessage> FileReplayFeedSource::nextRawMessage() {
    if (!connected_.load() || cursor_ >= payloads_.size()) {
        if (loaded_ && cursor_ >= payloads_.size()) {
            exhausted_ = true;
        }
        return std::nullopt;
    }

    if (cursor_ > 0 && delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }

    RawMessage message(payloads_[cursor_], std::chrono::system_clock::now());
    ++cursor_;
    return message;
}

void FileReplayFeedSource::disconnect() {
    connected_ = false;
}

bool FileReplayFeedSource::exhausted() const {
    return exhausted_.load();
}

} // namespace network
} // namespace tickpilot
