#pragma once
#include "audio/audio_decoder.hpp"
#include "runtime/event_loop.hpp"
#include <boost/asio/thread_pool.hpp>
#include <memory>

namespace voxcall {

// Decodes compressed speech chunks (MP3 by default) to mono float PCM.
// Each chunk is decoded independently on a worker thread; results are
// posted back to the event loop.
class FfmpegDecoder : public AudioDecoder {
public:
    explicit FfmpegDecoder(EventLoop& loop);
    ~FfmpegDecoder() override;

    FfmpegDecoder(const FfmpegDecoder&) = delete;
    FfmpegDecoder& operator=(const FfmpegDecoder&) = delete;

    void decode(AudioChunk chunk, DecodeCallback done) override;

    // Synchronous decode, used by the worker. nullopt when the chunk holds
    // no decodable audio.
    static std::optional<PcmBuffer> decodeChunk(const AudioChunk& chunk);

private:
    EventLoop& loop_;
    boost::asio::thread_pool worker_{1};
    // Decodes still in flight when the decoder goes away must not call back.
    std::shared_ptr<char> alive_;
};

} // namespace voxcall
