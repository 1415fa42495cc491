#pragma once

#include "audio/microphone.hpp"
#include "call/call.hpp"
#include "call/error_slot.hpp"
#include "net/channel.hpp"
#include "runtime/event_loop.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace voxcall {

// Owns the microphone for the duration of a turn and frames captured audio
// onto the channel.
class TurnCaptureController {
public:
    static constexpr const char* PERMISSION_DENIED_MESSAGE =
        "Microphone access denied. Please allow microphone access.";

    // Invoked just before the turn state is reset for a new turn.
    using TurnOpeningCallback = std::function<void()>;

    TurnCaptureController(Call& call,
                          Microphone& microphone,
                          FrameSender& sender,
                          EventLoop& loop,
                          ErrorSlot& errors);
    ~TurnCaptureController();

    TurnCaptureController(const TurnCaptureController&) = delete;
    TurnCaptureController& operator=(const TurnCaptureController&) = delete;

    // No-op unless the call is Connected with an open channel and a session
    // id, and no capture is active or being acquired. Returns true when a
    // microphone request was issued.
    bool beginTurn();

    // No-op unless capturing.
    bool endTurn();

    // Releases the microphone without telling the server. Used by hang-up
    // and channel loss. Returns true if a device was held.
    bool abort();

    bool capturing() const { return stream_ != nullptr; }
    bool acquiring() const { return acquiring_; }
    std::uint64_t framesSent() const { return framesSent_; }

    void setTurnOpeningCallback(TurnOpeningCallback callback) { turnOpening_ = std::move(callback); }

private:
    Call& call_;
    Microphone& microphone_;
    FrameSender& sender_;
    EventLoop& loop_;
    ErrorSlot& errors_;

    std::unique_ptr<CaptureStream> stream_;
    bool acquiring_{false};
    std::uint64_t generation_{0};
    std::uint64_t framesSent_{0};
    TurnOpeningCallback turnOpening_;
    std::shared_ptr<char> alive_{std::make_shared<char>(0)};

    void onAcquired(std::uint64_t generation, std::unique_ptr<CaptureStream> stream, const std::string& error);
    void onFrame(std::vector<std::uint8_t> frame);
    void sendControl(const char* type);
};

} // namespace voxcall
