#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>
#include <vector>

namespace tickpilot {

class Logger {
public:
    static Logger& getInstance();

    // console + rotating file, trade ledger as a daily file
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // Replaces the sinks of the main logger (used by tests to capture output).
    // Trade lines go to the same sinks.
    void initializeWithSinks(const std::vector<spdlog::sink_ptr>& sinks,
                             spdlog::level::level_enum level = spdlog::level::debug);

    void shutdown();

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    void logTrade(const std::string& instrument, const std::string& side,
                  double entry_price, double exit_price, double quantity,
                  double pnl, const std::string& reason);

    void flush();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tickpilot::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tickpilot::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tickpilot::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tickpilot::Logger::getInstance().error(__VA_ARGS__)

} // namespace tickpilot
