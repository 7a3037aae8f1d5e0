#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IDiagnosticSink.h"
#include "core/diagnostics/DiagnosticRecorder.h"
#include "engine/EngineConfig.h"
#include "engine/SessionReport.h"
#include "engine/TickDispatcher.h"
#include "feed/FeedAdapter.h"
#include "risk/RiskManager.h"
#include "strategy/TickTrendStrategy.h"

namespace tickpilot {
namespace engine {

// One trading session for one instrument: feed -> dispatcher -> strategy ->
// risk manager. Owns run/stop and the error streak. Each session is a fresh
// object; nothing here outlives it.
class SessionController {
public:
    SessionController(const SessionConfig& config,
                      std::unique_ptr<feed::FeedAdapter> adapter,
                      std::unique_ptr<ISessionReporter> reporter = nullptr);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Builds the configured feed source behind a FeedAdapter
    static std::unique_ptr<feed::FeedAdapter> buildFeedAdapter(const SessionConfig& config);

    // Must be called before start()
    void addDiagnosticSink(std::shared_ptr<core::IDiagnosticSink> sink);

    // Connects the feed (callback bound iff mode is CALLBACK)
    network::ConnectResult start();

    // One orchestration-loop iteration. False once the session should stop.
    bool pollOnce(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Loops pollOnce() until a stop condition, then stop()
    SessionReport run();

    // Cooperative; callable from any thread, including the tick path.
    // The first reason recorded becomes the terminal message.
    void requestStop(const std::string& terminal_message = "stopped: requested");

    // Orderly shutdown: closes an open position (SESSION_STOP), disconnects
    // the feed, publishes the report. Idempotent. Not for the tick path.
    SessionReport stop();

    // Single entry point for both consumption modes
    void handleTick(const Tick& tick);

    // ===== observability =====
    bool isRunning() const { return started_.load() && !stopped_.load(); }
    bool stopRequested() const { return stop_requested_.load(); }
    std::string terminalMessage() const;
    int errorStreak() const { return error_streak_.load(); }
    ConsumptionMode mode() const { return config_.feed.consumption_mode; }

    std::optional<risk::Position> activePosition() const { return risk_.activeSnapshot(); }
    std::vector<risk::Position> ledger() const { return risk_.ledger(); }
    strategy::IndicatorSnapshot indicatorSnapshot() const { return strategy_.indicatorSnapshot(); }
    feed::FeedConnectionState feedState() const { return adapter_->connectionState(); }

    std::uint64_t ticksProcessed() const { return ticks_processed_.load(); }
    std::uint64_t ticksSkipped() const { return ticks_skipped_.load(); }

private:
    void processTick(const Tick& tick);
    void registerFailure(const std::string& what);
    void onEvaluation(const Tick& tick, const strategy::EntryEvaluation& evaluation);
    void onFeedEvent(core::DiagnosticEventType type, const std::string& detail);
    void recordExit(const risk::ExitEvent& exit, long long ts_ms);
    SessionReport buildReport() const;

    SessionConfig config_;
    std::unique_ptr<feed::FeedAdapter> adapter_;
    std::unique_ptr<ISessionReporter> reporter_;

    strategy::TickTrendStrategy strategy_;
    risk::RiskManager risk_;
    core::DiagnosticRecorder diagnostics_;
    std::unique_ptr<TickDispatcher> dispatcher_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> stopped_{false};

    // serializes tick handling against the final close in stop()
    std::mutex tick_mutex_;
    std::atomic<int> error_streak_{0};
    int max_error_streak_ = 0;
    std::optional<Timestamp> last_tick_ts_;

    std::atomic<std::uint64_t> ticks_processed_{0};
    std::atomic<std::uint64_t> ticks_skipped_{0};
    std::atomic<std::uint64_t> tick_errors_{0};

    std::mutex stop_mutex_;
    mutable std::mutex state_mutex_;
    std::string terminal_message_;
    Timestamp started_at_;
    std::optional<SessionReport> final_report_;
};

} // namespace engine
} // namespace tickpilot
