#pragma once

#include "audio/audio_decoder.hpp"
#include "audio/audio_sink.hpp"
#include "call/call_types.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

namespace voxcall {

// FIFO of synthesized audio chunks. At most one chunk is being decoded or
// played at a time; chunks play in enqueue order and a chunk that fails to
// decode is skipped without disturbing the rest.
class PlaybackQueue {
public:
    using SpeakingCallback = std::function<void(bool speaking)>;

    PlaybackQueue(AudioDecoder& decoder, AudioSink& sink);
    ~PlaybackQueue();

    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    void enqueue(AudioChunk chunk);

    // Drops pending chunks and cuts current output; completions still in
    // flight are ignored when they arrive.
    void clear();

    bool busy() const { return busy_; }
    bool speaking() const { return speaking_; }
    std::size_t pending() const { return queue_.size(); }
    std::uint64_t played() const { return played_; }
    std::uint64_t decodeFailures() const { return decodeFailures_; }

    void setSpeakingCallback(SpeakingCallback callback) { speakingCallback_ = std::move(callback); }

private:
    AudioDecoder& decoder_;
    AudioSink& sink_;
    std::deque<AudioChunk> queue_;
    bool busy_{false};
    bool speaking_{false};
    std::uint64_t generation_{0};
    std::uint64_t played_{0};
    std::uint64_t decodeFailures_{0};
    SpeakingCallback speakingCallback_;

    // Completions hold a weak reference; expired means the queue is gone.
    std::shared_ptr<char> alive_{std::make_shared<char>(0)};

    void playNext();
    void setSpeaking(bool speaking);
};

} // namespace voxcall
