#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voxcall {

// An acquired input device. Destroying the handle stops capture and
// releases the device.
class CaptureStream {
public:
    // One encoded frame per capture tick; invoked on the event loop.
    using FrameCallback = std::function<void(std::vector<std::uint8_t> frame)>;

    virtual ~CaptureStream() = default;
    virtual bool start(FrameCallback onFrame) = 0;
};

class Microphone {
public:
    // Exactly one of stream / error is set.
    using AcquireCallback = std::function<void(std::unique_ptr<CaptureStream> stream, std::string error)>;

    virtual ~Microphone() = default;

    // Completes on the event loop, never inline.
    virtual void acquire(AcquireCallback done) = 0;
};

} // namespace voxcall
