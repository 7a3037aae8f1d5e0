#pragma once

#include <optional>
#include <string>
#include <utility>

#include "common/Types.h"

namespace tickpilot {
namespace network {

// One undecoded message exactly as the feed delivered it
struct RawMessage {
    std::string payload;
    Timestamp received_at;

    RawMessage() = default;
    RawMessage(std::string p, Timestamp ts) : payload(std::move(p)), received_at(ts) {}
};

enum class ConnectError {
    NONE,
    ALREADY_CONNECTED,
    SOURCE_NOT_FOUND,    // replay file missing / host unresolvable
    INVALID_SOURCE,      // source exists but cannot be read as ticks
    CONNECTION_FAILED,   // tcp or tls failure
    HANDSHAKE_FAILED,
    CALLBACK_ALREADY_BOUND
};

struct ConnectResult {
    bool success;
    ConnectError error;
    std::string message;

    static ConnectResult ok() { return {true, ConnectError::NONE, ""}; }
    static ConnectResult failure(ConnectError code, std::string msg) {
        return {false, code, std::move(msg)};
    }
};

inline const char* toString(ConnectError error) {
    switch (error) {
        case ConnectError::NONE: return "NONE";
        case ConnectError::ALREADY_CONNECTED: return "ALREADY_CONNECTED";
        case ConnectError::SOURCE_NOT_FOUND: return "SOURCE_NOT_FOUND";
        case ConnectError::INVALID_SOURCE: return "INVALID_SOURCE";
        case ConnectError::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ConnectError::HANDSHAKE_FAILED: return "HANDSHAKE_FAILED";
        case ConnectError::CALLBACK_ALREADY_BOUND: return "CALLBACK_ALREADY_BOUND";
    }
    return "NONE";
}

// Where raw market data comes from. Implementations are driven by a single
// reader (FeedAdapter's receive thread); connect/disconnect may be called
// again after a failure.
class IFeedSource {
public:
    virtual ~IFeedSource() = default;

    virtual ConnectResult connect() = 0;

    // Returns the next message, or nullopt if none arrived within the
    // source's short poll timeout. nullopt is not a disconnect.
    virtual std::optional<RawMessage> nextRawMessage() = 0;

    virtual void disconnect() = 0;

    // false once the transport dropped on its own
    virtual bool isConnected() const = 0;

    // Finite sources report true after their last message was handed out
    virtual bool exhausted() const { return false; }

    virtual std::string name() const = 0;
};

} // namespace network
} // namespace tickpilot
