#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxcall {

enum class CallPhase {
    Idle,
    Connecting,
    Connected,
    Listening,
    Ended
};

const char* toString(CallPhase phase);

using AudioChunk = std::vector<std::uint8_t>;

// Decoded audio, interleaved float samples in [-1, 1].
struct PcmBuffer {
    std::vector<float> samples;
    int sampleRate{0};
    int channels{1};
};

struct LatencyRecord {
    std::optional<std::int64_t> sttPartialMs;
    std::optional<std::int64_t> sttFinalMs;
    std::optional<std::int64_t> firstAudioMs;

    bool empty() const { return !sttPartialMs && !sttFinalMs && !firstAudioMs; }
};

struct LatencyBreakdown {
    std::optional<std::int64_t> sttMs;
    std::optional<std::int64_t> firstAudioMs;
};

struct TraceEvent {
    std::string event;
    std::string wallTime;                 // stamped locally on record
    std::optional<double> ts;             // server clock, seconds
    std::optional<std::string> turnId;
    std::optional<std::int64_t> latencyMs;
    std::optional<std::string> transcript;
    std::optional<LatencyBreakdown> latency;
};

struct SessionRecord {
    std::string id;
    std::string status;
    std::optional<std::string> createdAt;
    std::optional<std::string> endedAt;
};

// Turn-scoped transcript and response text.
struct Turn {
    std::string sttPartial;
    std::string sttFinal;
    bool finalReceived{false};
    std::string assistantText;
    bool assistantComplete{false};
    std::optional<std::int64_t> startedAtMs;

    void reset() { *this = Turn{}; }
};

} // namespace voxcall
