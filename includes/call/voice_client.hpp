#pragma once

#include "audio/audio_decoder.hpp"
#include "audio/audio_sink.hpp"
#include "audio/microphone.hpp"
#include "call/call.hpp"
#include "call/error_slot.hpp"
#include "call/protocol_dispatcher.hpp"
#include "call/turn_capture_controller.hpp"
#include "net/channel_manager.hpp"
#include "runtime/event_loop.hpp"
#include <functional>
#include <memory>
#include <string>

namespace voxcall {

class CallJournal;

// User-facing call control. Builds a fresh Call for every start, wires the
// channel into the dispatcher and tears everything down on hang-up or when
// the connection drops.
class VoiceClient : private ChannelManager::Listener {
public:
    static constexpr const char* CONNECT_FAILED_MESSAGE =
        "WebSocket connection failed. Is the backend running?";
    static constexpr const char* CONNECTION_LOST_MESSAGE =
        "Connection to the voice server was lost.";

    using ChangeCallback = std::function<void()>;

    VoiceClient(EventLoop& loop,
                ChannelManager& channel,
                Microphone& microphone,
                AudioDecoder& decoder,
                AudioSink& sink,
                CallJournal* journal = nullptr);
    ~VoiceClient() override;

    VoiceClient(const VoiceClient&) = delete;
    VoiceClient& operator=(const VoiceClient&) = delete;

    // Each returns false when it was a no-op.
    bool startCall();
    bool beginTurn();
    bool endTurn();
    bool hangUp();

    CallPhase phase() const;
    bool speaking() const;
    bool capturing() const;
    std::string statusLabel() const;

    // nullptr before the first call and after a failed connect.
    const Call* call() const;

    const ErrorSlot& errors() const { return errors_; }

    void setChangeCallback(ChangeCallback callback) { changeCallback_ = std::move(callback); }

private:
    struct ActiveCall;

    EventLoop& loop_;
    ChannelManager& channel_;
    Microphone& microphone_;
    AudioDecoder& decoder_;
    AudioSink& sink_;
    CallJournal* journal_;
    ErrorSlot errors_;
    std::unique_ptr<ActiveCall> active_;
    ChangeCallback changeCallback_;

    void onChannelOpen() override;
    void onChannelMessage(const std::string& text) override;
    void onChannelFailure(const std::string& reason) override;
    void onChannelClosed(const std::string& reason) override;

    void channelDown(const std::string& reason, const char* message);
    void journalTurn();
    void journalCallEnd();
    void notify();
};

} // namespace voxcall
