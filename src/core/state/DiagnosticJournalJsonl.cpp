#include "core/state/DiagnosticJournalJsonl.h"

#include <algorithm>
#include <fstream>

namespace tickpilot {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

// malformed rows come back discarded and are skipped by the callers
nlohmann::json parseRow(const std::string& row) {
    return nlohmann::json::parse(row, nullptr, false);
}
}

DiagnosticJournalJsonl::DiagnosticJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const nlohmann::json line = parseRow(row);
        if (line.is_discarded() || !line.is_object()) {
            continue;
        }
        last_seq_ = (std::max)(last_seq_, parseSeq(line));
    }
}

bool DiagnosticJournalJsonl::append(const DiagnosticEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["instrument"] = event.instrument;
    line["code"] = event.code;
    line["suppressed"] = event.suppressed;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<DiagnosticEvent> DiagnosticJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DiagnosticEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        const nlohmann::json line = parseRow(row);
        if (line.is_discarded() || !line.is_object()) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        DiagnosticEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = diagnosticTypeFromString(line.value("type", std::string("TICK_SKIPPED")));
        event.instrument = line.value("instrument", std::string());
        event.code = line.value("code", std::string());
        event.suppressed = line.value("suppressed", 0LL);
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t DiagnosticJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace tickpilot
