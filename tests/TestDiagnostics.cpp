#include "common/Logger.h"
#include "core/diagnostics/DiagnosticRateLimiter.h"
#include "core/diagnostics/DiagnosticRecorder.h"
#include "core/diagnostics/LoggingDiagnosticSink.h"
#include "core/state/DiagnosticJournalJsonl.h"
#include "support/ScriptedFeedSource.h"

#include <spdlog/sinks/ostream_sink.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

using namespace std::chrono_literals;
using namespace tickpilot::core;
using tickpilot::Logger;

namespace {

std::unique_ptr<DiagnosticRateLimiter> everyNth(int n) {
    return std::make_unique<DiagnosticRateLimiter>(DiagnosticLimitMode::COUNT, n, 1000ms);
}

class RefusingSink : public IDiagnosticSink {
public:
    bool append(const DiagnosticEvent&) override { ++attempts; return false; }
    std::vector<DiagnosticEvent> readFrom(std::uint64_t) override { return {}; }
    std::uint64_t lastSeq() const override { return 0; }
    int attempts = 0;
};

}

int main() {
    // COUNT: 1st, (N+1)th, (2N+1)th ... per event type
    {
        DiagnosticRateLimiter limiter(DiagnosticLimitMode::COUNT, 3, 1000ms);
        std::vector<bool> emitted;
        std::vector<long long> suppressed;
        for (int i = 0; i < 7; ++i) {
            auto a = limiter.admit(DiagnosticEventType::ENTRY_BLOCKED);
            emitted.push_back(a.emit);
            suppressed.push_back(a.suppressed);
        }
        assert(emitted == std::vector<bool>({true, false, false, true, false, false, true}));
        assert(suppressed[0] == 0);
        assert(suppressed[3] == 2);
        assert(suppressed[6] == 2);

        // separate counter per type
        assert(limiter.admit(DiagnosticEventType::ENTRY_REJECTED).emit);
        assert(!limiter.admit(DiagnosticEventType::ENTRY_REJECTED).emit);
    }

    // always-emitted types bypass the limiter and never advance a count
    {
        DiagnosticRateLimiter limiter(DiagnosticLimitMode::COUNT, 2, 1000ms);
        assert(limiter.admit(DiagnosticEventType::TICK_SKIPPED).emit);
        for (int i = 0; i < 50; ++i) {
            auto a = limiter.admit(DiagnosticEventType::FEED_RECONNECT);
            assert(a.emit && a.suppressed == 0);
            assert(limiter.admit(DiagnosticEventType::EXIT_TRIGGERED).emit);
            assert(limiter.admit(DiagnosticEventType::ENTRY_ACCEPTED).emit);
        }
        assert(!limiter.admit(DiagnosticEventType::TICK_SKIPPED).emit);
        assert(limiter.admit(DiagnosticEventType::TICK_SKIPPED).emit);

        assert(DiagnosticRateLimiter::alwaysEmitted(DiagnosticEventType::FEED_UNRECOVERABLE));
        assert(DiagnosticRateLimiter::alwaysEmitted(DiagnosticEventType::FEED_RECOVERED));
        assert(!DiagnosticRateLimiter::alwaysEmitted(DiagnosticEventType::ENTRY_BLOCKED));
    }

    // TIME: elapsed wall-clock only, however many events arrive
    {
        DiagnosticRateLimiter limiter(DiagnosticLimitMode::TIME, 1, 1000ms);
        assert(limiter.mode() == DiagnosticLimitMode::TIME);
        const auto t0 = std::chrono::steady_clock::now();
        assert(limiter.admit(DiagnosticEventType::ENTRY_BLOCKED, t0).emit);
        for (int i = 1; i <= 20; ++i) {
            assert(!limiter.admit(DiagnosticEventType::ENTRY_BLOCKED, t0 + std::chrono::milliseconds(i * 10)).emit);
        }
        assert(!limiter.admit(DiagnosticEventType::ENTRY_BLOCKED, t0 + 999ms).emit);
        auto next = limiter.admit(DiagnosticEventType::ENTRY_BLOCKED, t0 + 1000ms);
        assert(next.emit);
        assert(next.suppressed == 21);
    }

    // recorder -> logging sink: counts, sequence numbers, suppressed totals
    {
        DiagnosticRecorder recorder("NIFTY", everyNth(2));
        auto sink = std::make_shared<LoggingDiagnosticSink>(2);
        recorder.addSink(sink);

        for (int i = 0; i < 5; ++i) {
            const bool out = recorder.record(DiagnosticEventType::TICK_SKIPPED, "MISSING_PRICE",
                                             {{"n", i}}, 1000 + i);
            assert(out == (i % 2 == 0));
        }
        assert(recorder.record(DiagnosticEventType::EXIT_TRIGGERED, "STOP_LOSS"));

        auto counts = recorder.counts();
        assert(counts[DiagnosticEventType::TICK_SKIPPED].emitted == 3);
        assert(counts[DiagnosticEventType::TICK_SKIPPED].suppressed == 2);
        assert(counts[DiagnosticEventType::EXIT_TRIGGERED].emitted == 1);

        assert(sink->lastSeq() == 4);
        // only the last two are kept in memory
        auto recent = sink->readFrom(1);
        assert(recent.size() == 2);
        assert(recent[0].seq == 3);
        assert(recent[0].type == DiagnosticEventType::TICK_SKIPPED);
        assert(recent[0].suppressed == 1);
        assert(recent[0].payload["n"] == 4);
        assert(recent[0].ts_ms == 1004);
        assert(recent[0].instrument == "NIFTY");
        assert(recent[1].code == "STOP_LOSS");
        assert(recent[1].ts_ms > 0);
        assert(sink->readFrom(4).size() == 1);
    }

    // JSONL journal persists across instances and skips unreadable rows
    {
        const auto path = std::filesystem::temp_directory_path() / "tickpilot_diag_test" / "diagnostics.jsonl";
        std::filesystem::remove_all(path.parent_path());

        {
            auto journal = std::make_shared<DiagnosticJournalJsonl>(path);
            assert(journal->lastSeq() == 0);
            DiagnosticRecorder recorder("NIFTY", everyNth(1));
            recorder.addSink(journal);
            recorder.record(DiagnosticEventType::ENTRY_BLOCKED, "SESSION_WINDOW", {{"minute", 540}}, 10);
            recorder.record(DiagnosticEventType::ENTRY_ACCEPTED, "CONSECUTIVE_TICKS", nlohmann::json::object(), 20);
            assert(journal->lastSeq() == 2);
            assert(journal->path() == path);
        }

        {
            std::ofstream out(path, std::ios::app);
            out << "{broken row\n";
        }

        DiagnosticJournalJsonl reopened(path);
        assert(reopened.lastSeq() == 2);
        DiagnosticEvent event;
        event.ts_ms = 30;
        event.type = DiagnosticEventType::FEED_RECONNECT;
        event.instrument = "NIFTY";
        event.code = "attempt 1";
        assert(reopened.append(event));
        assert(reopened.lastSeq() == 3);

        auto all = reopened.readFrom(1);
        assert(all.size() == 3);
        assert(all[0].type == DiagnosticEventType::ENTRY_BLOCKED);
        assert(all[0].code == "SESSION_WINDOW");
        assert(all[0].payload["minute"] == 540);
        assert(all[0].ts_ms == 10);
        assert(all[2].seq == 3);
        assert(all[2].type == DiagnosticEventType::FEED_RECONNECT);

        auto tail = reopened.readFrom(2);
        assert(tail.size() == 2);
        assert(tail[0].type == DiagnosticEventType::ENTRY_ACCEPTED);

        std::filesystem::remove_all(path.parent_path());
    }

    // a refusing sink is reported once and does not affect the others
    {
        std::ostringstream captured;
        auto log_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        Logger::getInstance().initializeWithSinks({log_sink});

        DiagnosticRecorder recorder("NIFTY", everyNth(1));
        auto refusing = std::make_shared<RefusingSink>();
        auto logging = std::make_shared<LoggingDiagnosticSink>();
        recorder.addSink(refusing);
        recorder.addSink(logging);

        for (int i = 0; i < 3; ++i) {
            assert(recorder.record(DiagnosticEventType::ENTRY_REJECTED, "RSI"));
        }
        assert(refusing->attempts == 3);
        assert(logging->lastSeq() == 3);

        Logger::getInstance().flush();
        assert(tickpilot::testing::countOccurrences(captured.str(), "Diagnostic sink refused") == 1);
        assert(tickpilot::testing::countOccurrences(captured.str(), "ENTRY_REJECTED NIFTY RSI") == 3);
        Logger::getInstance().shutdown();
    }

    {
        const DiagnosticEventType all[] = {
            DiagnosticEventType::ENTRY_BLOCKED, DiagnosticEventType::ENTRY_REJECTED,
            DiagnosticEventType::ENTRY_ACCEPTED, DiagnosticEventType::EXIT_TRIGGERED,
            DiagnosticEventType::FEED_RECONNECT, DiagnosticEventType::FEED_RECOVERED,
            DiagnosticEventType::FEED_UNRECOVERABLE, DiagnosticEventType::TICK_SKIPPED};
        for (auto type : all) {
            assert(diagnosticTypeFromString(toString(type)) == type);
        }
        assert(diagnosticTypeFromString("NOPE") == DiagnosticEventType::TICK_SKIPPED);
    }

    std::cout << "[TEST] Diagnostics PASSED\n";
    return 0;
}
