#pragma once

#include <cstddef>
#include <deque>
#include <mutex>

#include "core/contracts/IDiagnosticSink.h"

namespace tickpilot {
namespace core {

// Writes each event as one log line. The most recent events are also kept
// in memory so they can be read back without a journal file.
class LoggingDiagnosticSink : public IDiagnosticSink {
public:
    explicit LoggingDiagnosticSink(std::size_t keep_recent = 256);

    bool append(const DiagnosticEvent& event) override;
    std::vector<DiagnosticEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

private:
    std::size_t keep_recent_;
    std::deque<DiagnosticEvent> recent_;
    std::uint64_t last_seq_ = 0;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace tickpilot
