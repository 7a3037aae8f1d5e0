#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "engine/SessionReport.h"

namespace tickpilot {
namespace engine {

// Writes the report as one pretty-printed JSON document (temp file + rename)
class JsonSessionReporter : public ISessionReporter {
public:
    explicit JsonSessionReporter(std::filesystem::path file_path);

    bool publish(const SessionReport& report) override;

    static nlohmann::json toJson(const SessionReport& report);
    static nlohmann::json toJson(const risk::Position& position);

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace engine
} // namespace tickpilot
