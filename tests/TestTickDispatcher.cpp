#include "common/Logger.h"
#include "engine/TickDispatcher.h"
#include "support/ScriptedFeedSource.h"

#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace tickpilot;
using tickpilot::engine::makeTickDispatcher;
using tickpilot::feed::FeedAdapter;
using tickpilot::testing::ScriptState;
using tickpilot::testing::ScriptedFeedSource;
using tickpilot::testing::kBaseTsMs;
using tickpilot::testing::tickPayload;
using tickpilot::testing::waitFor;

namespace {
std::unique_ptr<FeedAdapter> makeAdapter(const std::shared_ptr<ScriptState>& state) {
    feed::FeedConfig config;
    return std::make_unique<FeedAdapter>(std::make_unique<ScriptedFeedSource>(state),
                                         network::TickNormalizer(config.normalizer, "TEST"),
                                         config);
}
}

int main() {
    // POLL drains the queue in order on the calling thread
    {
        auto state = std::make_shared<ScriptState>();
        auto adapter = makeAdapter(state);
        std::atomic<bool> stop{false};
        std::vector<double> seen;
        std::thread::id sink_thread;

        auto dispatcher = makeTickDispatcher(ConsumptionMode::POLL, *adapter,
            [&](const Tick& tick) {
                seen.push_back(*tick.price());
                sink_thread = std::this_thread::get_id();
            },
            stop, 60000ms);
        assert(dispatcher->mode() == ConsumptionMode::POLL);
        assert(!dispatcher->adapterCallback());
        assert(adapter->connect(dispatcher->adapterCallback()).success);
        assert(!adapter->hasCallback());

        for (int i = 1; i <= 4; ++i) {
            state->push(tickPayload(i, kBaseTsMs + i));
        }
        assert(waitFor([&] { return adapter->queuedTicks() == 4; }));

        assert(dispatcher->pump(std::chrono::steady_clock::now()) == 4);
        assert(seen == std::vector<double>({1, 2, 3, 4}));
        assert(sink_thread == std::this_thread::get_id());
        assert(dispatcher->dispatched() == 4);
        assert(dispatcher->pump(std::chrono::steady_clock::now()) == 0);

        // a stop request leaves queued ticks alone
        state->push(tickPayload(5, kBaseTsMs + 5));
        assert(waitFor([&] { return adapter->queuedTicks() == 1; }));
        stop = true;
        assert(dispatcher->pump(std::chrono::steady_clock::now()) == 0);
        assert(seen.size() == 4);
        adapter->disconnect();
    }

    // CALLBACK runs the sink on the feed thread; pump only heartbeats
    {
        auto state = std::make_shared<ScriptState>();
        auto adapter = makeAdapter(state);
        std::atomic<bool> stop{false};
        std::mutex seen_mutex;
        std::vector<double> seen;
        std::thread::id sink_thread;

        auto dispatcher = makeTickDispatcher(ConsumptionMode::CALLBACK, *adapter,
            [&](const Tick& tick) {
                std::lock_guard<std::mutex> lock(seen_mutex);
                seen.push_back(*tick.price());
                sink_thread = std::this_thread::get_id();
            },
            stop, 60000ms);
        assert(dispatcher->mode() == ConsumptionMode::CALLBACK);
        assert(adapter->connect(dispatcher->adapterCallback()).success);
        assert(adapter->hasCallback());

        for (int i = 1; i <= 3; ++i) {
            state->push(tickPayload(i, kBaseTsMs + i));
        }
        assert(waitFor([&] { return dispatcher->dispatched() == 3; }));
        assert(dispatcher->pump(std::chrono::steady_clock::now()) == 0);
        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            assert(seen == std::vector<double>({1, 2, 3}));
            assert(sink_thread != std::this_thread::get_id());
        }

        stop = true;
        state->push(tickPayload(4, kBaseTsMs + 4));
        assert(waitFor([&] { return adapter->stats().ticks == 4; }));
        adapter->disconnect();
        assert(dispatcher->dispatched() == 3);
    }

    // heartbeat is limited by elapsed time only
    {
        std::ostringstream captured;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        Logger::getInstance().initializeWithSinks({sink});

        auto state = std::make_shared<ScriptState>();
        auto adapter = makeAdapter(state);
        std::atomic<bool> stop{false};
        auto dispatcher = makeTickDispatcher(ConsumptionMode::POLL, *adapter,
                                             [](const Tick&) {}, stop, 1000ms);

        const auto t0 = std::chrono::steady_clock::now();
        dispatcher->pump(t0);
        dispatcher->pump(t0 + 10ms);
        dispatcher->pump(t0 + 999ms);
        dispatcher->pump(t0 + 1000ms);
        dispatcher->pump(t0 + 1500ms);

        Logger::getInstance().flush();
        assert(testing::countOccurrences(captured.str(), "Heartbeat [POLL]") == 2);
        Logger::getInstance().shutdown();
    }

    std::cout << "[TEST] TickDispatcher PASSED\n";
    return 0;
}
