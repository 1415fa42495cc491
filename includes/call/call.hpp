#pragma once

#include "call/call_state_machine.hpp"
#include "call/call_types.hpp"
#include "call/latency_tracker.hpp"
#include "call/playback_queue.hpp"
#include "call/trace_log.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace voxcall {

// Everything that lives and dies with one call. Each component is handed
// this aggregate and touches only its own part of it.
struct Call {
    Call(AudioDecoder& decoder, AudioSink& sink);

    CallStateMachine state;
    std::optional<std::string> sessionId;
    Turn turn;
    LatencyTracker latency;
    TraceLog trace;
    PlaybackQueue playback;
    int turnsStarted{0};

    // Clears transcripts, assistant text, latency markers and queued audio,
    // then marks a new turn as started at nowMs.
    void openTurn(std::int64_t nowMs);
};

} // namespace voxcall
