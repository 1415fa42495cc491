#include "call/latency_tracker.hpp"

namespace voxcall {

void LatencyTracker::startTurn(std::int64_t turnStartMs) {
    turnStartMs_ = turnStartMs;
    record_ = LatencyRecord{};
    summaryApplied_ = false;
}

void LatencyTracker::onPartialTranscript(std::int64_t arrivalMs) {
    if (!turnStartMs_ || record_.sttPartialMs) return;
    record_.sttPartialMs = arrivalMs - *turnStartMs_;
}

void LatencyTracker::onFinalTranscript(std::optional<std::int64_t> serverLatencyMs) {
    if (!turnStartMs_ || record_.sttFinalMs || !serverLatencyMs) return;
    record_.sttFinalMs = serverLatencyMs;
}

void LatencyTracker::onAudioChunk(std::int64_t arrivalMs) {
    if (!turnStartMs_ || record_.firstAudioMs) return;
    record_.firstAudioMs = arrivalMs - *turnStartMs_;
}

void LatencyTracker::applySummary(const LatencyBreakdown& summary) {
    if (!turnStartMs_ || summaryApplied_) return;
    summaryApplied_ = true;
    if (summary.sttMs) record_.sttFinalMs = summary.sttMs;
    if (summary.firstAudioMs) record_.firstAudioMs = summary.firstAudioMs;
}

} // namespace voxcall
