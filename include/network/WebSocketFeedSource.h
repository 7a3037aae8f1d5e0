#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "common/RateLimiter.h"
#include "feed/FeedConfig.h"
#include "network/IFeedSource.h"

namespace tickpilot {
namespace network {

// Live market-data socket (ws or wss) built on Boost.Beast.
// connect() resolves, handshakes and starts a reader thread; frames wait in a
// capped inbox (oldest dropped first) until nextRawMessage() picks them up.
// No reconnect logic lives here: a dropped socket only flips isConnected()
// and FeedAdapter decides.
class WebSocketFeedSource : public IFeedSource {
public:
    WebSocketFeedSource(feed::WebSocketConfig config,
                        std::chrono::milliseconds poll_timeout,
                        std::size_t inbox_capacity);
    ~WebSocketFeedSource() override;

    ConnectResult connect() override;
    std::optional<RawMessage> nextRawMessage() override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }
    std::string name() const override;

    // frames evicted because the consumer fell behind
    std::uint64_t droppedFrames() const;
    std::size_t pendingFrames() const;

private:
    struct Stream;

    void readLoop();
    void pushMessage(std::string payload);
    std::string bearerToken() const;

    feed::WebSocketConfig config_;
    std::chrono::milliseconds poll_timeout_;

    std::unique_ptr<Stream> stream_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::thread reader_thread_;

    const std::size_t inbox_capacity_;
    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<RawMessage> inbox_;
    std::uint64_t dropped_frames_ = 0;
    common::WindowRateLimiter drop_warn_limiter_;
};

} // namespace network
} // namespace tickpilot
