#pragma once

#include "call/call_types.hpp"
#include <functional>
#include <optional>

namespace voxcall {

class AudioDecoder {
public:
    // nullopt on decode failure. Completes on the event loop.
    using DecodeCallback = std::function<void(std::optional<PcmBuffer> pcm)>;

    virtual ~AudioDecoder() = default;
    virtual void decode(AudioChunk chunk, DecodeCallback done) = 0;
};

} // namespace voxcall
