#include "feed/FeedAdapter.h"

#include "common/Logger.h"

#include <stdexcept>
#include <utility>

namespace {
long long steadyMs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

const std::string kFormatWarnKey = "format";
const std::string kCallbackWarnKey = "callback";
}

namespace tickpilot {
namespace feed {

const char* toString(FeedStatus status) {
    switch (status) {
        case FeedStatus::DISCONNECTED: return "DISCONNECTED";
        case FeedStatus::CONNECTING: return "CONNECTING";
        case FeedStatus::STREAMING: return "STREAMING";
        case FeedStatus::SILENT: return "SILENT";
        case FeedStatus::RECONNECTING: return "RECONNECTING";
    }
    return "DISCONNECTED";
}

FeedAdapter::FeedAdapter(std::unique_ptr<network::IFeedSource> source,
                         network::TickNormalizer normalizer,
                         const FeedConfig& config)
    : source_(std::move(source))
    , normalizer_(std::move(normalizer))
    , config_(config)
    , queue_(config.queue_capacity)
    , backoff_(config.backoff_initial, config.backoff_max, config.max_reconnect_attempts)
    , warn_limiter_(std::chrono::milliseconds(5000))
{
    if (!source_) {
        throw std::invalid_argument("FeedAdapter requires a feed source");
    }
}

FeedAdapter::~FeedAdapter() {
    disconnect();
}

void FeedAdapter::setEventListener(FeedEventListener listener) {
    if (binding_ != Binding::UNBOUND) {
        throw std::logic_error("FeedAdapter event listener must be set before connect()");
    }
    listener_ = std::move(listener);
}

network::ConnectResult FeedAdapter::connect(std::optional<TickHandler> callback) {
    if (running_.load()) {
        return network::ConnectResult::failure(network::ConnectError::ALREADY_CONNECTED,
                                               "feed adapter already connected");
    }
    if (binding_ != Binding::UNBOUND) {
        return network::ConnectResult::failure(network::ConnectError::CALLBACK_ALREADY_BOUND,
                                               "tick callback binding is fixed after the first connect");
    }
    if (callback && !*callback) {
        throw std::invalid_argument("FeedAdapter::connect given an empty callback");
    }

    setStatus(FeedStatus::CONNECTING);
    auto result = source_->connect();
    if (!result.success) {
        setStatus(FeedStatus::DISCONNECTED);
        LOG_ERROR("Feed connect failed [{}]: {} ({})", source_->name(), result.message,
                  network::toString(result.error));
        return result;
    }

    if (callback) {
        callback_ = std::move(*callback);
        binding_ = Binding::CALLBACK;
    } else {
        binding_ = Binding::NO_CALLBACK;
    }

    last_activity_ms_ = steadyMs(std::chrono::steady_clock::now());
    setStatus(FeedStatus::STREAMING);
    running_ = true;
    receive_thread_ = std::thread(&FeedAdapter::receiveLoop, this);

    LOG_INFO("Feed connected: {} (callback: {}, queue capacity: {})",
             source_->name(), binding_ == Binding::CALLBACK ? "yes" : "no", queue_.capacity());
    return result;
}

std::optional<Tick> FeedAdapter::nextTick() {
    return queue_.tryPop();
}

std::optional<Price> FeedAdapter::lastPrice() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_price_;
}

void FeedAdapter::disconnect() {
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
    }
    stop_cv_.notify_all();

    if (receive_thread_.joinable()) {
        if (receive_thread_.get_id() == std::this_thread::get_id()) {
            // called from inside the tick callback; the owner joins later
            return;
        }
        receive_thread_.join();
    }

    if (binding_ != Binding::UNBOUND) {
        source_->disconnect();
    }
    setStatus(FeedStatus::DISCONNECTED);
}

void FeedAdapter::receiveLoop() {
    auto last_liveness_check = std::chrono::steady_clock::now();

    while (running_.load()) {
        if (reconnecting_.load()) {
            runReconnect();
            last_liveness_check = std::chrono::steady_clock::now();
            continue;
        }

        auto message = source_->nextRawMessage();
        if (message) {
            handleRawMessage(*message);
        } else if (source_->exhausted()) {
            finished_ = true;
            setStatus(FeedStatus::DISCONNECTED);
            LOG_INFO("Feed completed: {} ({} messages)", source_->name(), received_.load());
            break;
        } else if (!source_->isConnected()) {
            requestReconnect("connection lost");
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - last_liveness_check >= config_.liveness_check_interval) {
            last_liveness_check = now;
            checkLiveness(now);
        }
    }
}

void FeedAdapter::handleRawMessage(const network::RawMessage& message) {
    ++received_;

    auto result = normalizer_.normalize(message);
    if (!result.tick) {
        ++format_errors_;
        const int dropped = warn_limiter_.suppressedSinceLast(kFormatWarnKey);
        if (warn_limiter_.tryAcquire(kFormatWarnKey)) {
            LOG_WARN("Feed format error: {} ({} similar suppressed)", result.error, dropped);
        }
        return;
    }

    const Tick& tick = *result.tick;
    last_activity_ms_ = steadyMs(std::chrono::steady_clock::now());

    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (tick.price()) {
            last_price_ = tick.price();
        }
        last_tick_at_ = tick.timestamp() ? tick.timestamp() : std::optional<Timestamp>(message.received_at);
        status_ = FeedStatus::STREAMING;
        if (awaiting_recovery_.load()) {
            backoff_.reset();
            consecutive_failures_ = 0;
            awaiting_recovery_ = false;
            recovered = true;
        }
    }
    if (recovered) {
        LOG_INFO("Feed recovered: first tick after reconnect, backoff reset");
        emitEvent(core::DiagnosticEventType::FEED_RECOVERED, source_->name());
    }

    ++ticks_;
    queue_.push(tick);

    if (binding_ == Binding::CALLBACK) {
        try {
            callback_(tick);
        } catch (const std::exception& e) {
            ++callback_errors_;
            const int dropped = warn_limiter_.suppressedSinceLast(kCallbackWarnKey);
            if (warn_limiter_.tryAcquire(kCallbackWarnKey)) {
                LOG_ERROR("Tick callback failed: {} ({} similar suppressed)", e.what(), dropped);
            }
        } catch (...) {
            ++callback_errors_;
            const int dropped = warn_limiter_.suppressedSinceLast(kCallbackWarnKey);
            if (warn_limiter_.tryAcquire(kCallbackWarnKey)) {
                LOG_ERROR("Tick callback failed with a non-standard exception ({} similar suppressed)", dropped);
            }
        }
    }
}

bool FeedAdapter::checkLiveness(std::chrono::steady_clock::time_point now) {
    if (!running_.load() || finished_.load() || failed_.load() || reconnecting_.load()) {
        return false;
    }

    const long long silent_for = steadyMs(now) - last_activity_ms_.load();
    if (silent_for < config_.silence_threshold.count()) {
        return false;
    }

    bool expected = false;
    if (!reconnecting_.compare_exchange_strong(expected, true)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = FeedStatus::SILENT;
        reconnect_reason_ = "no tick for " + std::to_string(silent_for) + " ms";
        ++consecutive_failures_;
    }
    LOG_WARN("Feed silent for {} ms (threshold {} ms)", silent_for, config_.silence_threshold.count());
    return true;
}

void FeedAdapter::requestReconnect(const std::string& reason) {
    bool expected = false;
    if (!reconnecting_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = FeedStatus::RECONNECTING;
        reconnect_reason_ = reason;
        ++consecutive_failures_;
    }
    LOG_WARN("Feed {}: {}", source_->name(), reason);
}

void FeedAdapter::runReconnect() {
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        reason = reconnect_reason_;
        status_ = FeedStatus::RECONNECTING;
    }

    while (running_.load()) {
        std::optional<std::chrono::milliseconds> delay;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            delay = backoff_.nextDelay();
            attempt = backoff_.attempts();
        }

        if (!delay) {
            const std::string message = "feed unrecoverable after " +
                std::to_string(config_.max_reconnect_attempts) + " attempts";
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                status_ = FeedStatus::DISCONNECTED;
                failure_reason_ = message;
            }
            source_->disconnect();
            failed_ = true;
            running_ = false;
            LOG_ERROR("Feed {}: {} ({})", source_->name(), message, reason);
            emitEvent(core::DiagnosticEventType::FEED_UNRECOVERABLE, message);
            break;
        }

        ++reconnects_;
        LOG_WARN("Feed reconnect attempt {}/{} in {} ms ({})",
                 attempt, config_.max_reconnect_attempts, delay->count(), reason);
        emitEvent(core::DiagnosticEventType::FEED_RECONNECT,
                  "attempt " + std::to_string(attempt) + " after " + std::to_string(delay->count()) + " ms");

        if (!sleepInterruptible(*delay)) {
            break;
        }

        source_->disconnect();
        setStatus(FeedStatus::CONNECTING);
        auto result = source_->connect();
        if (result.success) {
            last_activity_ms_ = steadyMs(std::chrono::steady_clock::now());
            awaiting_recovery_ = true;
            setStatus(FeedStatus::STREAMING);
            LOG_INFO("Feed reconnected: {} (attempt {})", source_->name(), attempt);
            break;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++consecutive_failures_;
            status_ = FeedStatus::RECONNECTING;
        }
        reason = result.message;
        LOG_WARN("Feed reconnect attempt {} failed: {}", attempt, result.message);
    }

    reconnecting_ = false;
}

bool FeedAdapter::sleepInterruptible(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

void FeedAdapter::setStatus(FeedStatus status) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    status_ = status;
}

void FeedAdapter::emitEvent(core::DiagnosticEventType type, const std::string& detail) {
    if (!listener_) {
        return;
    }
    try {
        listener_(type, detail);
    } catch (const std::exception& e) {
        LOG_WARN("Feed event listener failed: {}", e.what());
    } catch (...) {
        LOG_WARN("Feed event listener failed with a non-standard exception");
    }
}

FeedConnectionState FeedAdapter::connectionState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    FeedConnectionState state;
    state.status = status_;
    state.last_tick_at = last_tick_at_;
    state.consecutive_failures = consecutive_failures_;
    state.backoff = backoff_.currentDelay();
    state.terminal = failed_.load();
    return state;
}

FeedStats FeedAdapter::stats() const {
    FeedStats s;
    s.received = received_.load();
    s.ticks = ticks_.load();
    s.format_errors = format_errors_.load();
    s.callback_errors = callback_errors_.load();
    s.evicted = queue_.evictedCount();
    s.reconnects = reconnects_.load();
    return s;
}

std::string FeedAdapter::failureReason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_reason_;
}

} // namespace feed
} // namespace tickpilot
