#include "network/TickNormalizer.h"

#include <cmath>
#include <cstdlib>
#include <utility>

#include <nlohmann/json.hpp>

namespace tickpilot {
namespace network {

namespace {
// number or numeric string; anything else is "absent"
std::optional<double> readNumber(const nlohmann::json& object, const std::string& field) {
    if (field.empty() || !object.contains(field)) {
        return std::nullopt;
    }
    const auto& value = object.at(field);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end == text.c_str() + text.size()) {
            return parsed;
        }
    }
    return std::nullopt;
}
}

TickNormalizer::TickNormalizer(feed::NormalizerConfig config, std::string default_instrument)
    : config_(std::move(config))
    , default_instrument_(std::move(default_instrument)) {}

NormalizeResult TickNormalizer::normalize(const RawMessage& message) const {
    NormalizeResult result;

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(message.payload);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("unparseable payload: ") + e.what();
        return result;
    }
    if (!payload.is_object()) {
        result.error = std::string("expected a JSON object, got ") + payload.type_name();
        return result;
    }

    std::string instrument = default_instrument_;
    if (!config_.instrument_field.empty() && payload.contains(config_.instrument_field) &&
        payload.at(config_.instrument_field).is_string()) {
        instrument = payload.at(config_.instrument_field).get<std::string>();
    }

    std::optional<Price> price;
    if (auto raw_price = readNumber(payload, config_.price_field)) {
        const double scaled = *raw_price / config_.price_divisor;
        if (std::isfinite(scaled) && scaled > 0.0) {
            price = scaled;
        }
    }

    std::optional<Timestamp> timestamp;
    if (auto raw_ts = readNumber(payload, config_.timestamp_field)) {
        if (std::isfinite(*raw_ts) && *raw_ts > 0.0) {
            timestamp = fromEpochMs(static_cast<long long>(*raw_ts));
        }
    } else if (config_.stamp_on_receive) {
        timestamp = message.received_at;
    }

    std::optional<Volume> volume;
    if (auto raw_volume = readNumber(payload, config_.volume_field)) {
        if (std::isfinite(*raw_volume) && *raw_volume >= 0.0) {
            volume = *raw_volume;
        }
    }

    std::optional<std::uint64_t> sequence;
    if (auto raw_seq = readNumber(payload, config_.sequence_field)) {
        if (*raw_seq >= 0.0) {
            sequence = static_cast<std::uint64_t>(*raw_seq);
        }
    }

    result.tick = Tick(std::move(instrument), timestamp, price, volume, sequence);
    return result;
}

} // namespace network
} // namespace tickpilot
