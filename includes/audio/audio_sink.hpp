#pragma once

#include "call/call_types.hpp"
#include <functional>

namespace voxcall {

// Speaker output.
class AudioSink {
public:
    using DoneCallback = std::function<void()>;

    virtual ~AudioSink() = default;

    // Plays the buffer to completion, then calls done on the event loop.
    // done also fires when playback is cut short by stop().
    virtual void play(PcmBuffer pcm, DoneCallback done) = 0;

    // Cuts the current buffer short.
    virtual void stop() = 0;
};

} // namespace voxcall
