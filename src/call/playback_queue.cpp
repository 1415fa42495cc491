#include "call/playback_queue.hpp"
#include <iostream>

namespace voxcall {

PlaybackQueue::PlaybackQueue(AudioDecoder& decoder, AudioSink& sink)
    : decoder_(decoder)
    , sink_(sink) {}

PlaybackQueue::~PlaybackQueue() {
    ++generation_;
    if (busy_) {
        sink_.stop();
    }
}

void PlaybackQueue::enqueue(AudioChunk chunk) {
    queue_.push_back(std::move(chunk));
    if (!busy_) {
        playNext();
    }
}

void PlaybackQueue::clear() {
    queue_.clear();
    ++generation_;
    if (busy_) {
        sink_.stop();
        busy_ = false;
    }
    setSpeaking(false);
}

void PlaybackQueue::playNext() {
    if (queue_.empty()) {
        busy_ = false;
        setSpeaking(false);
        return;
    }

    busy_ = true;
    AudioChunk chunk = std::move(queue_.front());
    queue_.pop_front();

    const std::uint64_t generation = generation_;
    std::weak_ptr<char> alive = alive_;
    decoder_.decode(std::move(chunk), [this, alive, generation](std::optional<PcmBuffer> pcm) {
        if (alive.expired() || generation != generation_) {
            return;
        }
        if (!pcm) {
            ++decodeFailures_;
            std::cerr << "Warning: audio chunk failed to decode, skipping" << std::endl;
            playNext();
            return;
        }
        setSpeaking(true);
        sink_.play(std::move(*pcm), [this, alive, generation]() {
            if (alive.expired() || generation != generation_) {
                return;
            }
            ++played_;
            playNext();
        });
    });
}

void PlaybackQueue::setSpeaking(bool speaking) {
    if (speaking_ == speaking) return;
    speaking_ = speaking;
    if (speakingCallback_) {
        speakingCallback_(speaking);
    }
}

} // namespace voxcall
