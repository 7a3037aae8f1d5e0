#include "network/WebSocketFeedSource.h"

#include "common/Logger.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <sys/socket.h>

#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <utility>

namespace tickpilot {
namespace network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

struct WebSocketFeedSource::Stream {
    net::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tlsv12_client};
    std::unique_ptr<websocket::stream<beast::ssl_stream<tcp::socket>>> tls;
    std::unique_ptr<websocket::stream<tcp::socket>> plain;

    tcp::socket& lowest() {
        if (tls) {
            return beast::get_lowest_layer(*tls);
        }
        return beast::get_lowest_layer(*plain);
    }
};

namespace {
// Which step of connect() failed, for the ConnectResult code
enum class Stage { RESOLVE, TRANSPORT, HANDSHAKE };

template<class WsStream>
void upgradeAndSubscribe(WsStream& ws, const feed::WebSocketConfig& config, const std::string& bearer) {
    ws.set_option(websocket::stream_base::decorator(
        [bearer](websocket::request_type& req) {
            if (!bearer.empty()) {
                req.set(beast::http::field::authorization, "Bearer " + bearer);
            }
            req.set(beast::http::field::user_agent, "TickPilot/1.0");
        }
    ));

    ws.handshake(config.host, config.target);

    if (!config.subscribe_payload.empty()) {
        ws.write(net::buffer(config.subscribe_payload));
    }
}

template<class WsStream>
void readFrames(WsStream& ws,
                const std::atomic<bool>& running,
                const std::function<void(std::string)>& on_frame) {
    beast::flat_buffer buffer;

    while (running.load()) {
        boost::system::error_code ec;
        ws.read(buffer, ec);
        if (!ec) {
            on_frame(beast::buffers_to_string(buffer.cdata()));
            buffer.consume(buffer.size());
        } else if (!running.load()) {
            break;
        } else if (ec == websocket::error::closed) {
            throw std::runtime_error("market WS closed by server");
        } else {
            throw std::runtime_error("market WS read failed: " + ec.message());
        }
    }
}
}

WebSocketFeedSource::WebSocketFeedSource(feed::WebSocketConfig config,
                                         std::chrono::milliseconds poll_timeout,
                                         std::size_t inbox_capacity)
    : config_(std::move(config))
    , poll_timeout_(poll_timeout)
    , inbox_capacity_(inbox_capacity)
    , drop_warn_limiter_(std::chrono::milliseconds(5000))
{
    if (inbox_capacity_ == 0) {
        throw std::invalid_argument("WebSocketFeedSource inbox capacity must be positive");
    }
}

WebSocketFeedSource::~WebSocketFeedSource() {
    disconnect();
}

std::string WebSocketFeedSource::name() const {
    return std::string(config_.use_tls ? "wss://" : "ws://") + config_.host + ":" + config_.port + config_.target;
}

std::string WebSocketFeedSource::bearerToken() const {
    if (config_.bearer_token_env.empty()) {
        return "";
    }
    const char* value = std::getenv(config_.bearer_token_env.c_str());
    return value ? std::string(value) : std::string();
}

ConnectResult WebSocketFeedSource::connect() {
    if (connected_.load()) {
        return ConnectResult::failure(ConnectError::ALREADY_CONNECTED, "market WS already connected");
    }

    // previous socket may have dropped on its own; release it first
    disconnect();
    {
        // frames from the old socket are stale by now
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.clear();
    }

    Stage stage = Stage::RESOLVE;
    try {
        auto stream = std::make_unique<Stream>();

        tcp::resolver resolver(stream->ioc);
        auto results = resolver.resolve(config_.host, config_.port);

        stage = Stage::TRANSPORT;
        const std::string bearer = bearerToken();
        if (config_.use_tls) {
            stream->ssl_ctx.set_default_verify_paths();
            stream->ssl_ctx.set_verify_mode(ssl::verify_peer);
            stream->tls = std::make_unique<websocket::stream<beast::ssl_stream<tcp::socket>>>(
                stream->ioc, stream->ssl_ctx);

            net::connect(stream->tls->next_layer().next_layer(), results.begin(), results.end());
            if (!SSL_set_tlsext_host_name(stream->tls->next_layer().native_handle(), config_.host.c_str())) {
                throw std::runtime_error("market WS SNI setup failed");
            }
            stream->tls->next_layer().set_verify_callback(ssl::host_name_verification(config_.host));
            stream->tls->next_layer().handshake(ssl::stream_base::client);

            stage = Stage::HANDSHAKE;
            upgradeAndSubscribe(*stream->tls, config_, bearer);
        } else {
            stream->plain = std::make_unique<websocket::stream<tcp::socket>>(stream->ioc);
            net::connect(stream->plain->next_layer(), results.begin(), results.end());

            stage = Stage::HANDSHAKE;
            upgradeAndSubscribe(*stream->plain, config_, bearer);
        }

        stream_ = std::move(stream);
    } catch (const std::exception& e) {
        const ConnectError code = stage == Stage::RESOLVE ? ConnectError::SOURCE_NOT_FOUND
                                : stage == Stage::TRANSPORT ? ConnectError::CONNECTION_FAILED
                                : ConnectError::HANDSHAKE_FAILED;
        LOG_WARN("Market WS connect failed ({}): {}", toString(code), e.what());
        return ConnectResult::failure(code, e.what());
    }

    connected_ = true;
    running_ = true;
    reader_thread_ = std::thread(&WebSocketFeedSource::readLoop, this);
    LOG_INFO("Market WS connected: {}", name());
    return ConnectResult::ok();
}

void WebSocketFeedSource::readLoop() {
    auto on_frame = [this](std::string payload) { pushMessage(std::move(payload)); };
    try {
        if (stream_->tls) {
            readFrames(*stream_->tls, running_, on_frame);
        } else {
            readFrames(*stream_->plain, running_, on_frame);
        }
    } catch (const std::exception& e) {
        if (running_.load()) {
            LOG_WARN("Market WS disconnected: {}", e.what());
        }
    }

    connected_ = false;
    inbox_cv_.notify_all();
}

void WebSocketFeedSource::pushMessage(std::string payload) {
    std::uint64_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (inbox_.size() >= inbox_capacity_) {
            inbox_.pop_front();
            dropped = ++dropped_frames_;
        }
        inbox_.emplace_back(std::move(payload), std::chrono::system_clock::now());
    }
    inbox_cv_.notify_one();

    if (dropped > 0 && drop_warn_limiter_.tryAcquire("inbox")) {
        LOG_WARN("Market WS consumer behind, {} stale frame(s) dropped so far", dropped);
    }
}

std::uint64_t WebSocketFeedSource::droppedFrames() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return dropped_frames_;
}

std::size_t WebSocketFeedSource::pendingFrames() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_.size();
}

std::optional<RawMessage> WebSocketFeedSource::nextRawMessage() {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait_for(lock, poll_timeout_, [this] {
        return !inbox_.empty() || !connected_.load();
    });
    if (inbox_.empty()) {
        return std::nullopt;
    }
    RawMessage message = std::move(inbox_.front());
    inbox_.pop_front();
    return message;
}

void WebSocketFeedSource::disconnect() {
    running_ = false;

    if (stream_) {
        // unblocks the reader's synchronous read
        ::shutdown(stream_->lowest().native_handle(), SHUT_RDWR);
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    if (stream_) {
        boost::system::error_code ec;
        stream_->lowest().close(ec);
        if (ec) {
            LOG_WARN("Market WS close warning: {}", ec.message());
        }
        stream_.reset();
        LOG_INFO("Market WS stopped");
    }

    connected_ = false;
    inbox_cv_.notify_all();
}

} // namespace network
} // namespace tickpilot
