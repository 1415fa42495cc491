#include "call/call.hpp"

namespace voxcall {

Call::Call(AudioDecoder& decoder, AudioSink& sink)
    : playback(decoder, sink) {
    playback.setSpeakingCallback([this](bool speaking) {
        state.setSpeaking(speaking);
    });
}

void Call::openTurn(std::int64_t nowMs) {
    turn.reset();
    turn.startedAtMs = nowMs;
    latency.startTurn(nowMs);
    playback.clear();
    ++turnsStarted;
}

} // namespace voxcall
