#pragma once

#include "call/call_types.hpp"
#include <functional>

namespace voxcall {

// Phase of one call. Every method is one transition; it returns false and
// changes nothing when the transition is not legal from the current phase.
// `speaking` is tracked beside the phase and never replaces it.
class CallStateMachine {
public:
    using PhaseCallback = std::function<void(CallPhase from, CallPhase to)>;

    CallPhase phase() const { return phase_; }
    bool isSpeaking() const { return speaking_; }
    bool isTerminal() const { return phase_ == CallPhase::Ended; }

    bool startCall();            // Idle -> Connecting
    bool channelEstablished();   // Connecting -> Connected
    bool channelFailed();        // Connecting -> Idle
    bool channelLost();          // Connected | Listening -> Idle
    bool beginCapture();         // Connected -> Listening
    bool endCapture();           // Listening -> Connected
    bool hangUp();               // any non-terminal -> Ended

    // Advisory; only held while Connected or Listening.
    void setSpeaking(bool speaking);

    // "Listening", "Connected (speaking)", ...
    std::string displayLabel() const;

    void setPhaseCallback(PhaseCallback callback) { phaseCallback_ = std::move(callback); }

private:
    CallPhase phase_{CallPhase::Idle};
    bool speaking_{false};
    PhaseCallback phaseCallback_;

    bool transition(CallPhase expected, CallPhase next);
    void enter(CallPhase next);
};

} // namespace voxcall
