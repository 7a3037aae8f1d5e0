#pragma once

#include <cstdint>
#include <vector>

#include "core/model/DiagnosticTypes.h"

namespace tickpilot {
namespace core {

class IDiagnosticSink {
public:
    virtual ~IDiagnosticSink() = default;

    // Assigns seq; false when the event could not be recorded
    virtual bool append(const DiagnosticEvent& event) = 0;
    virtual std::vector<DiagnosticEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace tickpilot
