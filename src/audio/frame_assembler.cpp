#include "audio/frame_assembler.hpp"
#include <algorithm>

namespace voxcall {

FrameAssembler::FrameAssembler(std::size_t bytesPerFrame)
    : bytesPerFrame_(bytesPerFrame) {
    pending_.reserve(bytesPerFrame_);
}

std::vector<FrameAssembler::Frame> FrameAssembler::push(const float* samples, std::size_t count) {
    std::vector<Frame> frames;
    if (bytesPerFrame_ == 0) return frames;

    for (std::size_t i = 0; i < count; ++i) {
        float sample = std::max(-1.0f, std::min(1.0f, samples[i]));
        auto pcm = static_cast<std::int16_t>(sample * 32767.0f);
        pending_.push_back(static_cast<std::uint8_t>(pcm & 0xFF));
        pending_.push_back(static_cast<std::uint8_t>((pcm >> 8) & 0xFF));

        if (pending_.size() == bytesPerFrame_) {
            frames.push_back(std::move(pending_));
            pending_ = Frame{};
            pending_.reserve(bytesPerFrame_);
        }
    }
    return frames;
}

std::size_t FrameAssembler::frameBytes(int sampleRate, int frameMs) {
    if (sampleRate <= 0 || frameMs <= 0) return 0;
    const auto samples = static_cast<std::size_t>(sampleRate) * static_cast<std::size_t>(frameMs) / 1000;
    return samples * sizeof(std::int16_t);
}

} // namespace voxcall
