#include "network/TickNormalizer.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace tickpilot;
using tickpilot::network::RawMessage;
using tickpilot::network::TickNormalizer;

namespace {
RawMessage raw(const std::string& payload, long long received_ms = 5000) {
    return RawMessage(payload, fromEpochMs(received_ms));
}
}

int main() {
    feed::NormalizerConfig defaults;

    {
        TickNormalizer normalizer(defaults, "NIFTY");
        auto r = normalizer.normalize(raw(R"({"symbol":"BANKNIFTY","price":101.5,"timestamp":1700000000000,"volume":25,"seq":7})"));
        assert(r.tick);
        assert(r.error.empty());
        assert(r.tick->instrumentId() == "BANKNIFTY");
        assert(*r.tick->price() == 101.5);
        assert(toEpochMs(*r.tick->timestamp()) == 1700000000000LL);
        assert(*r.tick->volume() == 25.0);
        assert(*r.tick->sequenceHint() == 7u);
        assert(r.tick->isComplete());
    }

    // feed-specific names and paise scaling stay inside the normalizer
    {
        feed::NormalizerConfig cfg;
        cfg.price_field = "ltp";
        cfg.timestamp_field = "ts";
        cfg.volume_field = "qty";
        cfg.instrument_field = "";
        cfg.price_divisor = 100.0;
        TickNormalizer normalizer(cfg, "NIFTY");
        auto r = normalizer.normalize(raw(R"({"ltp":"2205025","ts":"1700000000123","qty":"3"})"));
        assert(r.tick);
        assert(r.tick->instrumentId() == "NIFTY");
        assert(std::fabs(*r.tick->price() - 22050.25) < 1e-9);
        assert(toEpochMs(*r.tick->timestamp()) == 1700000000123LL);
        assert(*r.tick->volume() == 3.0);
    }

    // missing or unusable fields stay missing instead of becoming zero
    {
        TickNormalizer normalizer(defaults, "NIFTY");
        auto no_price = normalizer.normalize(raw(R"({"timestamp":1700000000000})"));
        assert(no_price.tick);
        assert(!no_price.tick->price());
        assert(!no_price.tick->isComplete());

        auto bad_price = normalizer.normalize(raw(R"({"price":"abc","timestamp":1700000000000})"));
        assert(bad_price.tick && !bad_price.tick->price());

        auto zero_price = normalizer.normalize(raw(R"({"price":0,"timestamp":1700000000000})"));
        assert(zero_price.tick && !zero_price.tick->price());

        auto no_ts = normalizer.normalize(raw(R"({"price":10})"));
        assert(no_ts.tick && no_ts.tick->price() && !no_ts.tick->timestamp());
    }

    {
        feed::NormalizerConfig cfg;
        cfg.stamp_on_receive = true;
        TickNormalizer normalizer(cfg, "NIFTY");
        auto r = normalizer.normalize(raw(R"({"price":10})", 123456));
        assert(r.tick && r.tick->timestamp());
        assert(toEpochMs(*r.tick->timestamp()) == 123456);
    }

    // format errors
    {
        TickNormalizer normalizer(defaults, "NIFTY");
        auto garbage = normalizer.normalize(raw("not json"));
        assert(!garbage.tick);
        assert(!garbage.error.empty());

        auto array = normalizer.normalize(raw("[1,2,3]"));
        assert(!array.tick);
        assert(array.error.find("object") != std::string::npos);
    }

    std::cout << "[TEST] TickNormalizer PASSED\n";
    return 0;
}
