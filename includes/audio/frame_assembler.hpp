#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxcall {

// Turns float capture buffers of any size into fixed-size mono s16le frames.
// Samples beyond the last whole frame are carried into the next push.
class FrameAssembler {
public:
    using Frame = std::vector<std::uint8_t>;

    explicit FrameAssembler(std::size_t bytesPerFrame);

    // Appends count samples and returns every frame completed by them.
    std::vector<Frame> push(const float* samples, std::size_t count);

    std::size_t bytesPerFrame() const { return bytesPerFrame_; }
    std::size_t buffered() const { return pending_.size(); }
    void reset() { pending_.clear(); }

    static std::size_t frameBytes(int sampleRate, int frameMs);

private:
    std::size_t bytesPerFrame_;
    Frame pending_;
};

} // namespace voxcall
