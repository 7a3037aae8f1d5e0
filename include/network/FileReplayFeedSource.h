#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "feed/FeedConfig.h"
#include "network/IFeedSource.h"

namespace tickpilot {
namespace network {

// Deterministic CSV replay behind the live feed interface.
// Columns: timestamp (epoch ms), price|close|ltp, optional volume, optional symbol.
// Each row is re-emitted as a JSON payload using the normalizer's field names
// so it takes the same decode path as live data.
class FileReplayFeedSource : public IFeedSource {
public:
    FileReplayFeedSource(feed::ReplayConfig config,
                         feed::NormalizerConfig field_names,
                         std::string default_instrument);

    ConnectResult connect() override;
    std::optional<RawMessage> nextRawMessage() override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }
    bool exhausted() const override;
    std::string name() const override { return "replay:" + config_.file_path; }

    std::size_t rowCount() const { return payloads_.size(); }

    // inter-tick delay for a speed mode name; unknown names map to INSTANT
    static std::chrono::microseconds delayForSpeed(const std::string& speed_mode);

private:
    bool loadRows(std::string& error);

    feed::ReplayConfig config_;
    feed::NormalizerConfig field_names_;
    std::string default_instrument_;
    std::chrono::microseconds delay_;

    std::vector<std::string> payloads_;
    std::size_t cursor_ = 0;
    bool loaded_ = false;
    std::atomic<bool> connected_{false};
    std::atomic<bool> exhausted_{false};
};

} // namespace network
} // namespace tickpilot
