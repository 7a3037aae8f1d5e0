#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "feed/FeedConfig.h"
#include "network/IFeedSource.h"

namespace tickpilot {
namespace network {

// Outcome of translating one RawMessage
struct NormalizeResult {
    std::optional<Tick> tick;     // nullopt: payload could not be read at all
    std::string error;            // set when tick is nullopt
};

// Maps feed-specific payloads into Tick. Field names, units and price
// scaling never leave this class.
class TickNormalizer {
public:
    TickNormalizer(feed::NormalizerConfig config, std::string default_instrument);

    // A JSON object with a readable instrument always yields a Tick, even
    // when price or timestamp are missing; those stay empty in the Tick.
    NormalizeResult normalize(const RawMessage& message) const;

    const feed::NormalizerConfig& config() const { return config_; }

private:
    feed::NormalizerConfig config_;
    std::string default_instrument_;
};

} // namespace network
} // namespace tickpilot
