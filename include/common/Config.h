#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace tickpilot {

// Raised for a missing, ill-typed or inconsistent configuration value.
// path() is the dotted key, e.g. "risk.base_sl_points".
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& path, const std::string& message)
        : std::runtime_error(path + ": " + message)
        , path_(path)
    {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class Config {
public:
    // Reads and validates a session config file. Relative paths go through
    // PathUtils::resolveRelativePath.
    static engine::SessionConfig loadFile(const std::string& config_path);

    static engine::SessionConfig fromJson(const nlohmann::json& root);
};

} // namespace tickpilot
