#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "common/RateLimiter.h"
#include "common/Types.h"
#include "core/model/DiagnosticTypes.h"
#include "feed/BoundedTickQueue.h"
#include "feed/FeedConfig.h"
#include "feed/ReconnectBackoff.h"
#include "network/IFeedSource.h"
#include "network/TickNormalizer.h"

namespace tickpilot {
namespace feed {

enum class FeedStatus {
    DISCONNECTED,
    CONNECTING,
    STREAMING,
    SILENT,
    RECONNECTING
};

const char* toString(FeedStatus status);

// Read-only view for observability
struct FeedConnectionState {
    FeedStatus status = FeedStatus::DISCONNECTED;
    std::optional<Timestamp> last_tick_at;
    int consecutive_failures = 0;
    std::chrono::milliseconds backoff{0};
    bool terminal = false;
};

struct FeedStats {
    std::uint64_t received = 0;          // raw messages read from the source
    std::uint64_t ticks = 0;             // decoded ticks handed downstream
    std::uint64_t format_errors = 0;
    std::uint64_t callback_errors = 0;
    std::uint64_t evicted = 0;
    std::uint64_t reconnects = 0;        // reconnect attempts started
};

using TickHandler = std::function<void(const Tick&)>;

// Connectivity transitions (reconnect, recovered, unrecoverable), called on the feed thread
using FeedEventListener = std::function<void(core::DiagnosticEventType, const std::string& detail)>;

// Owns the FeedSource lifecycle and its receive thread.
//
// Every decoded tick is enqueued; when connect() was given a callback it is
// also passed to that callback on the receive thread. The callback binding is
// fixed by the first successful connect() and never touched by reconnects.
class FeedAdapter {
public:
    FeedAdapter(std::unique_ptr<network::IFeedSource> source,
                network::TickNormalizer normalizer,
                const FeedConfig& config);
    ~FeedAdapter();

    FeedAdapter(const FeedAdapter&) = delete;
    FeedAdapter& operator=(const FeedAdapter&) = delete;

    // Must be called before connect()
    void setEventListener(FeedEventListener listener);

    network::ConnectResult connect(std::optional<TickHandler> callback = std::nullopt);

    // non-blocking; nullopt only means the queue is empty
    std::optional<Tick> nextTick();

    std::optional<Price> lastPrice() const;

    void disconnect();

    // Triggers a reconnect when the feed has been silent past the threshold.
    // Returns true only for the call that started it.
    bool checkLiveness(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    FeedConnectionState connectionState() const;
    FeedStats stats() const;

    bool hasCallback() const { return binding_ == Binding::CALLBACK; }

    // finite source fully read and every message processed
    bool finished() const { return finished_.load(); }

    // reconnect attempts exhausted; terminal
    bool failed() const { return failed_.load(); }
    std::string failureReason() const;

    std::size_t queuedTicks() const { return queue_.size(); }

private:
    enum class Binding { UNBOUND, NO_CALLBACK, CALLBACK };

    void receiveLoop();
    void handleRawMessage(const network::RawMessage& message);
    void requestReconnect(const std::string& reason);
    void runReconnect();
    bool sleepInterruptible(std::chrono::milliseconds delay);
    void setStatus(FeedStatus status);
    void emitEvent(core::DiagnosticEventType type, const std::string& detail);

    std::unique_ptr<network::IFeedSource> source_;
    network::TickNormalizer normalizer_;
    FeedConfig config_;
    BoundedTickQueue queue_;

    Binding binding_ = Binding::UNBOUND;
    TickHandler callback_;
    FeedEventListener listener_;

    std::atomic<bool> running_{false};
    std::atomic<bool> reconnecting_{false};
    std::atomic<bool> awaiting_recovery_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> failed_{false};
    std::thread receive_thread_;

    // steady-clock ms of the last tick (or of the last (re)connect)
    std::atomic<long long> last_activity_ms_{0};

    mutable std::mutex state_mutex_;
    FeedStatus status_ = FeedStatus::DISCONNECTED;
    std::optional<Timestamp> last_tick_at_;
    std::optional<Price> last_price_;
    std::string reconnect_reason_;
    std::string failure_reason_;
    int consecutive_failures_ = 0;
    ReconnectBackoff backoff_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> format_errors_{0};
    std::atomic<std::uint64_t> callback_errors_{0};
    std::atomic<std::uint64_t> reconnects_{0};

    common::WindowRateLimiter warn_limiter_;
};

} // namespace feed
} // namespace tickpilot
