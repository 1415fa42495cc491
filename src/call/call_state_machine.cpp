#include "call/call_state_machine.hpp"

namespace voxcall {

const char* toString(CallPhase phase) {
    switch (phase) {
        case CallPhase::Idle:       return "Idle";
        case CallPhase::Connecting: return "Connecting";
        case CallPhase::Connected:  return "Connected";
        case CallPhase::Listening:  return "Listening";
        case CallPhase::Ended:      return "Ended";
    }
    return "Unknown";
}

bool CallStateMachine::transition(CallPhase expected, CallPhase next) {
    if (phase_ != expected) {
        return false;
    }
    enter(next);
    return true;
}

void CallStateMachine::enter(CallPhase next) {
    const CallPhase from = phase_;
    phase_ = next;
    if (next != CallPhase::Connected && next != CallPhase::Listening) {
        speaking_ = false;
    }
    if (phaseCallback_) {
        phaseCallback_(from, next);
    }
}

bool CallStateMachine::startCall() {
    return transition(CallPhase::Idle, CallPhase::Connecting);
}

bool CallStateMachine::channelEstablished() {
    return transition(CallPhase::Connecting, CallPhase::Connected);
}

bool CallStateMachine::channelFailed() {
    return transition(CallPhase::Connecting, CallPhase::Idle);
}

bool CallStateMachine::channelLost() {
    if (phase_ != CallPhase::Connected && phase_ != CallPhase::Listening) {
        return false;
    }
    enter(CallPhase::Idle);
    return true;
}

bool CallStateMachine::beginCapture() {
    return transition(CallPhase::Connected, CallPhase::Listening);
}

bool CallStateMachine::endCapture() {
    return transition(CallPhase::Listening, CallPhase::Connected);
}

bool CallStateMachine::hangUp() {
    if (phase_ == CallPhase::Ended) {
        return false;
    }
    enter(CallPhase::Ended);
    return true;
}

void CallStateMachine::setSpeaking(bool speaking) {
    if (speaking && phase_ != CallPhase::Connected && phase_ != CallPhase::Listening) {
        return;
    }
    speaking_ = speaking;
}

std::string CallStateMachine::displayLabel() const {
    std::string label = toString(phase_);
    if (speaking_) {
        label += " (speaking)";
    }
    return label;
}

} // namespace voxcall
