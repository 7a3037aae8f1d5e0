#include "engine/TickDispatcher.h"

#include "common/Logger.h"

#include <utility>

namespace tickpilot {
namespace engine {

TickDispatcher::TickDispatcher(feed::FeedAdapter& adapter,
                               TickSink sink,
                               const std::atomic<bool>& stop_requested,
                               std::chrono::milliseconds heartbeat_interval)
    : adapter_(adapter)
    , sink_(std::move(sink))
    , stop_requested_(stop_requested)
    , heartbeat_limiter_(heartbeat_interval) {}

void TickDispatcher::dispatch(const Tick& tick) {
    ++dispatched_;
    sink_(tick);
}

void TickDispatcher::heartbeat(std::chrono::steady_clock::time_point now) {
    if (!heartbeat_limiter_.tryAcquire("heartbeat", now)) {
        return;
    }
    const auto state = adapter_.connectionState();
    const auto price = adapter_.lastPrice();
    LOG_INFO("Heartbeat [{}]: {} ticks dispatched, feed {}, last price {}",
             toString(mode()), dispatched_.load(), feed::toString(state.status),
             price ? std::to_string(*price) : std::string("n/a"));
}

std::size_t PollTickDispatcher::pump(std::chrono::steady_clock::time_point now) {
    std::size_t count = 0;
    while (!stop_requested_.load()) {
        auto tick = adapter_.nextTick();
        if (!tick) {
            break;
        }
        dispatch(*tick);
        ++count;
    }
    heartbeat(now);
    return count;
}

std::optional<feed::TickHandler> CallbackTickDispatcher::adapterCallback() {
    return feed::TickHandler([this](const Tick& tick) {
        if (stop_requested_.load()) {
            return;
        }
        dispatch(tick);
    });
}

std::size_t CallbackTickDispatcher::pump(std::chrono::steady_clock::time_point now) {
    heartbeat(now);
    return 0;
}

std::unique_ptr<TickDispatcher> makeTickDispatcher(ConsumptionMode mode,
                                                   feed::FeedAdapter& adapter,
                                                   TickSink sink,
                                                   const std::atomic<bool>& stop_requested,
                                                   std::chrono::milliseconds heartbeat_interval) {
    if (mode == ConsumptionMode::CALLBACK) {
        return std::make_unique<CallbackTickDispatcher>(adapter, std::move(sink), stop_requested, heartbeat_interval);
    }
    return std::make_unique<PollTickDispatcher>(adapter, std::move(sink), stop_requested, heartbeat_interval);
}

} // namespace engine
} // namespace tickpilot
