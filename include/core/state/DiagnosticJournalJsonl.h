#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IDiagnosticSink.h"

namespace tickpilot {
namespace core {

// Append-only JSON-lines journal. Sequence numbers continue across restarts.
class DiagnosticJournalJsonl : public IDiagnosticSink {
public:
    explicit DiagnosticJournalJsonl(std::filesystem::path file_path);

    bool append(const DiagnosticEvent& event) override;
    std::vector<DiagnosticEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace tickpilot
