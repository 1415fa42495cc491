#pragma once
#include "audio/audio_sink.hpp"
#include "runtime/event_loop.hpp"
#include <portaudio.h>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstdint>
#include <optional>

namespace voxcall {

// Speaker output over a blocking PortAudio stream driven from a worker
// thread. The stream is kept open between buffers of the same format.
class PortAudioPlayer : public AudioSink {
public:
    static constexpr unsigned long WRITE_BLOCK = 1024;

    PortAudioPlayer(EventLoop& loop, std::optional<int> deviceIndex);
    ~PortAudioPlayer() override;

    PortAudioPlayer(const PortAudioPlayer&) = delete;
    PortAudioPlayer& operator=(const PortAudioPlayer&) = delete;

    void play(PcmBuffer pcm, DoneCallback done) override;
    void stop() override;

private:
    EventLoop& loop_;
    std::optional<int> deviceIndex_;
    boost::asio::thread_pool worker_{1};
    std::atomic<std::uint64_t> generation_{0};

    // Worker thread only.
    PaStream* stream_{nullptr};
    int streamRate_{0};
    int streamChannels_{0};

    void render(const PcmBuffer& pcm, std::uint64_t generation);
    bool ensureStream(int sampleRate, int channels);
    void closeStream();
};

} // namespace voxcall
