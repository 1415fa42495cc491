#pragma once

#include "call/call_types.hpp"
#include <cstdint>
#include <optional>

namespace voxcall {

// Per-turn latency markers, relative to the turn start.
// Local measurements fill each field at most once; a turn-complete summary
// may replace them once with server values, field by field, when present.
class LatencyTracker {
public:
    void startTurn(std::int64_t turnStartMs);

    void onPartialTranscript(std::int64_t arrivalMs);
    void onFinalTranscript(std::optional<std::int64_t> serverLatencyMs);
    void onAudioChunk(std::int64_t arrivalMs);
    void applySummary(const LatencyBreakdown& summary);

    const LatencyRecord& record() const { return record_; }
    std::optional<std::int64_t> turnStartMs() const { return turnStartMs_; }

private:
    std::optional<std::int64_t> turnStartMs_;
    LatencyRecord record_;
    bool summaryApplied_{false};
};

} // namespace voxcall
