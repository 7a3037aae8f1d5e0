#include "common/Logger.h"
#include "common/Config.h"
#include "engine/JsonSessionReporter.h"
#include "engine/SessionController.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace tickpilot;

namespace {

// set by SIGINT/SIGTERM, polled by the orchestration loop
volatile std::sig_atomic_t g_stop_signal = 0;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_signal = 1;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --config <session.json> [--log-level <level>]\n";
}

}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_level_override;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            log_level_override = argv[++i];
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
    }

    if (config_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    engine::SessionConfig config;
    try {
        config = Config::loadFile(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Config load failed: " << e.what() << "\n";
        return 2;
    }

    try {
        Logger::getInstance().initialize(
            config.logging.log_dir,
            log_level_override.empty() ? config.logging.level : log_level_override);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::cout << "\n";
    std::cout << "=============================================\n";
    std::cout << "       TickPilot " << config.instrument.symbol << "\n";
    std::cout << "=============================================\n\n";

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exit_code = 0;
    try {
        auto reporter = std::make_unique<engine::JsonSessionReporter>(config.report.output_path);
        engine::SessionController session(config,
                                          engine::SessionController::buildFeedAdapter(config),
                                          std::move(reporter));

        const auto connected = session.start();
        if (connected.success) {
            while (session.pollOnce()) {
                if (g_stop_signal) {
                    LOG_INFO("Stop signal received");
                    session.requestStop("stopped: requested");
                    break;
                }
                std::this_thread::sleep_for(config.feed.poll_interval);
            }
        }

        const auto report = session.stop();
        std::cout << report.terminal_message << "\n";
        if (!connected.success || !report.feed_failure_reason.empty() ||
            report.terminal_message == "stopped: error streak exceeded") {
            exit_code = 1;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "stopped: " << e.what() << "\n";
        exit_code = 1;
    }

    Logger::getInstance().shutdown();
    return exit_code;
}
