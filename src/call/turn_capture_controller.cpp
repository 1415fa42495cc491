#include "call/turn_capture_controller.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace voxcall {

TurnCaptureController::TurnCaptureController(Call& call,
                                             Microphone& microphone,
                                             FrameSender& sender,
                                             EventLoop& loop,
                                             ErrorSlot& errors)
    : call_(call)
    , microphone_(microphone)
    , sender_(sender)
    , loop_(loop)
    , errors_(errors) {}

TurnCaptureController::~TurnCaptureController() {
    abort();
}

bool TurnCaptureController::beginTurn() {
    if (call_.state.phase() != CallPhase::Connected) return false;
    if (!sender_.isOpen() || !call_.sessionId) return false;
    if (acquiring_ || stream_) return false;

    acquiring_ = true;
    const std::uint64_t generation = generation_;
    std::weak_ptr<char> alive = alive_;
    microphone_.acquire([this, alive, generation](std::unique_ptr<CaptureStream> stream, std::string error) {
        // A stale grant is dropped here and its handle releases the device.
        if (alive.expired()) return;
        onAcquired(generation, std::move(stream), error);
    });
    return true;
}

void TurnCaptureController::onAcquired(std::uint64_t generation,
                                       std::unique_ptr<CaptureStream> stream,
                                       const std::string& error) {
    if (generation != generation_) return;
    acquiring_ = false;

    if (!stream) {
        std::cerr << "Error: microphone unavailable: " << error << std::endl;
        errors_.show(PERMISSION_DENIED_MESSAGE);
        return;
    }
    // The call moved on while we waited for the device.
    if (call_.state.phase() != CallPhase::Connected || !sender_.isOpen()) return;

    if (turnOpening_) turnOpening_();
    call_.openTurn(loop_.nowMs());
    sendControl("start");

    stream_ = std::move(stream);
    std::weak_ptr<char> alive = alive_;
    const std::uint64_t capture = ++generation_;
    const bool started = stream_->start([this, alive, capture](std::vector<std::uint8_t> frame) {
        if (alive.expired() || capture != generation_) return;
        onFrame(std::move(frame));
    });
    if (!started) {
        stream_.reset();
        sendControl("stop");
        errors_.show("Microphone could not be started.");
        return;
    }
    call_.state.beginCapture();
}

void TurnCaptureController::onFrame(std::vector<std::uint8_t> frame) {
    if (!stream_ || frame.empty() || !sender_.isOpen()) return;
    sender_.sendBinary(std::move(frame));
    ++framesSent_;
}

bool TurnCaptureController::endTurn() {
    if (!stream_) return false;
    ++generation_;
    {
        // Device released before anything below can fail.
        std::unique_ptr<CaptureStream> released = std::move(stream_);
    }
    if (sender_.isOpen()) {
        sendControl("stop");
    }
    call_.state.endCapture();
    return true;
}

bool TurnCaptureController::abort() {
    ++generation_;
    acquiring_ = false;
    if (!stream_) return false;
    stream_.reset();
    return true;
}

void TurnCaptureController::sendControl(const char* type) {
    sender_.sendText(nlohmann::json{{"type", type}}.dump());
}

} // namespace voxcall
