#include "call/voice_client.hpp"
#include "storage/call_journal.hpp"
#include <iostream>

namespace voxcall {

struct VoiceClient::ActiveCall {
    explicit ActiveCall(VoiceClient& client)
        : call(client.decoder_, client.sink_)
        , capture(call, client.microphone_, client.channel_, client.loop_, client.errors_)
        , dispatcher(call, client.loop_, client.errors_) {}

    Call call;
    TurnCaptureController capture;
    ProtocolDispatcher dispatcher;
    bool turnJournaled{false};
};

VoiceClient::VoiceClient(EventLoop& loop,
                         ChannelManager& channel,
                         Microphone& microphone,
                         AudioDecoder& decoder,
                         AudioSink& sink,
                         CallJournal* journal)
    : loop_(loop)
    , channel_(channel)
    , microphone_(microphone)
    , decoder_(decoder)
    , sink_(sink)
    , journal_(journal)
    , errors_(loop) {
    errors_.setChangeCallback([this](const std::string&) { notify(); });
}

VoiceClient::~VoiceClient() {
    changeCallback_ = nullptr;
    hangUp();
}

bool VoiceClient::startCall() {
    if (active_) {
        const CallPhase current = active_->call.state.phase();
        if (current != CallPhase::Idle && current != CallPhase::Ended) {
            return false;
        }
    }

    errors_.clear();
    active_.reset();
    active_ = std::make_unique<ActiveCall>(*this);

    ActiveCall& active = *active_;
    active.call.state.setPhaseCallback([this](CallPhase, CallPhase) { notify(); });
    active.call.playback.setSpeakingCallback([this, &active](bool speaking) {
        active.call.state.setSpeaking(speaking);
        notify();
    });
    active.capture.setTurnOpeningCallback([this, &active]() {
        journalTurn();
        active.turnJournaled = false;
    });
    active.dispatcher.setSessionCallback([this](const std::string& sessionId) {
        if (journal_) journal_->beginCall(sessionId);
    });

    active.call.state.startCall();
    channel_.connect(*this);
    return true;
}

bool VoiceClient::beginTurn() {
    if (!active_) return false;
    return active_->capture.beginTurn();
}

bool VoiceClient::endTurn() {
    if (!active_) return false;
    return active_->capture.endTurn();
}

bool VoiceClient::hangUp() {
    if (!active_ || active_->call.state.isTerminal()) return false;

    ActiveCall& active = *active_;
    journalTurn();
    active.capture.abort();
    active.call.playback.clear();
    channel_.endCall();
    active.call.state.hangUp();
    journalCallEnd();
    return true;
}

CallPhase VoiceClient::phase() const {
    return active_ ? active_->call.state.phase() : CallPhase::Idle;
}

bool VoiceClient::speaking() const {
    return active_ && active_->call.state.isSpeaking();
}

bool VoiceClient::capturing() const {
    return active_ && active_->capture.capturing();
}

std::string VoiceClient::statusLabel() const {
    return active_ ? active_->call.state.displayLabel() : std::string(toString(CallPhase::Idle));
}

const Call* VoiceClient::call() const {
    return active_ ? &active_->call : nullptr;
}

void VoiceClient::onChannelOpen() {
    if (!active_) return;
    active_->call.state.channelEstablished();
}

void VoiceClient::onChannelMessage(const std::string& text) {
    if (!active_ || active_->call.state.isTerminal()) return;
    active_->dispatcher.dispatch(text);
    notify();
}

void VoiceClient::onChannelFailure(const std::string& reason) {
    channelDown(reason, CONNECT_FAILED_MESSAGE);
}

void VoiceClient::onChannelClosed(const std::string& reason) {
    channelDown(reason, CONNECTION_LOST_MESSAGE);
}

void VoiceClient::channelDown(const std::string& reason, const char* message) {
    if (!active_ || active_->call.state.isTerminal()) return;
    std::cerr << "Error: channel down: " << reason << std::endl;

    ActiveCall& active = *active_;
    channel_.shutdown();
    if (active.call.state.phase() == CallPhase::Connecting) {
        // Never connected: the call is discarded.
        active.call.state.channelFailed();
        active_.reset();
        errors_.show(CONNECT_FAILED_MESSAGE);
        return;
    }

    journalTurn();
    active.capture.abort();
    active.call.playback.clear();
    active.call.state.channelLost();
    journalCallEnd();
    errors_.show(message);
}

void VoiceClient::journalTurn() {
    if (!journal_ || !active_) return;
    ActiveCall& active = *active_;
    if (active.turnJournaled || !active.call.sessionId || !active.call.turn.startedAtMs) return;
    active.turnJournaled = true;
    journal_->logTurn(*active.call.sessionId, active.call.turn, active.call.latency.record());
}

void VoiceClient::journalCallEnd() {
    if (!journal_ || !active_ || !active_->call.sessionId) return;
    journal_->endCall(*active_->call.sessionId);
}

void VoiceClient::notify() {
    if (changeCallback_) changeCallback_();
}

} // namespace voxcall
