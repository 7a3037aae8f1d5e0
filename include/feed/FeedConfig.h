#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "common/Types.h"

namespace tickpilot {
namespace feed {

enum class FeedSourceKind { WEBSOCKET, FILE_REPLAY };

// Feed-specific payload translation
struct NormalizerConfig {
    std::string price_field = "price";
    std::string timestamp_field = "timestamp";   // epoch milliseconds
    std::string volume_field = "volume";
    std::string instrument_field = "symbol";
    std::string sequence_field = "seq";
    double price_divisor = 1.0;                  // e.g. 100 for a feed quoting in paise
    bool stamp_on_receive = false;               // use arrival time when the feed sends none
};

struct WebSocketConfig {
    std::string host;
    std::string port = "443";
    std::string target = "/";
    bool use_tls = true;
    std::string subscribe_payload;               // sent verbatim after the handshake
    std::string bearer_token_env;                // env var holding a pre-issued token
};

struct ReplayConfig {
    std::string file_path;
    std::string speed_mode = "INSTANT";          // REALTIME | FAST | TURBO | MAX | INSTANT
};

struct FeedConfig {
    FeedSourceKind source = FeedSourceKind::FILE_REPLAY;
    ConsumptionMode consumption_mode = ConsumptionMode::POLL;
    std::size_t queue_capacity = 1000;

    std::chrono::milliseconds silence_threshold{30000};
    std::chrono::milliseconds liveness_check_interval{1000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{60000};
    int max_reconnect_attempts = 5;

    std::chrono::milliseconds poll_interval{5};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds source_poll_timeout{100};

    NormalizerConfig normalizer;
    WebSocketConfig websocket;
    ReplayConfig replay;
};

} // namespace feed
} // namespace tickpilot
