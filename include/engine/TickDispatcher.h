#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "common/RateLimiter.h"
#include "common/Types.h"
#include "feed/FeedAdapter.h"

namespace tickpilot {
namespace engine {

// The single tick-handling entry point both strategies feed
using TickSink = std::function<void(const Tick&)>;

// Consumption strategy. Exactly one instance exists per session.
class TickDispatcher {
public:
    TickDispatcher(feed::FeedAdapter& adapter,
                   TickSink sink,
                   const std::atomic<bool>& stop_requested,
                   std::chrono::milliseconds heartbeat_interval);
    virtual ~TickDispatcher() = default;

    virtual ConsumptionMode mode() const = 0;

    // Callback to bind at FeedAdapter::connect(); nullopt for polling
    virtual std::optional<feed::TickHandler> adapterCallback() = 0;

    // One orchestration-loop iteration. Returns ticks dispatched by this call.
    virtual std::size_t pump(std::chrono::steady_clock::time_point now) = 0;

    std::uint64_t dispatched() const { return dispatched_.load(); }

protected:
    void dispatch(const Tick& tick);
    void heartbeat(std::chrono::steady_clock::time_point now);

    feed::FeedAdapter& adapter_;
    TickSink sink_;
    const std::atomic<bool>& stop_requested_;
    std::atomic<std::uint64_t> dispatched_{0};

private:
    common::WindowRateLimiter heartbeat_limiter_;
};

// Orchestration loop drains the queue; ticks run on the orchestration context
class PollTickDispatcher : public TickDispatcher {
public:
    using TickDispatcher::TickDispatcher;

    ConsumptionMode mode() const override { return ConsumptionMode::POLL; }
    std::optional<feed::TickHandler> adapterCallback() override { return std::nullopt; }
    std::size_t pump(std::chrono::steady_clock::time_point now) override;
};

// Feed thread calls straight into the sink; the loop only heartbeats
class CallbackTickDispatcher : public TickDispatcher {
public:
    using TickDispatcher::TickDispatcher;

    ConsumptionMode mode() const override { return ConsumptionMode::CALLBACK; }
    std::optional<feed::TickHandler> adapterCallback() override;
    std::size_t pump(std::chrono::steady_clock::time_point now) override;
};

std::unique_ptr<TickDispatcher> makeTickDispatcher(ConsumptionMode mode,
                                                   feed::FeedAdapter& adapter,
                                                   TickSink sink,
                                                   const std::atomic<bool>& stop_requested,
                                                   std::chrono::milliseconds heartbeat_interval);

} // namespace engine
} // namespace tickpilot
