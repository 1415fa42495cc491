#include "audio/portaudio_player.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace voxcall {

PortAudioPlayer::PortAudioPlayer(EventLoop& loop, std::optional<int> deviceIndex)
    : loop_(loop)
    , deviceIndex_(deviceIndex) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw std::runtime_error("Failed to initialize PortAudio: " +
                               std::string(Pa_GetErrorText(err)));
    }
}

PortAudioPlayer::~PortAudioPlayer() {
    ++generation_;
    worker_.join();
    closeStream();
    Pa_Terminate();
}

void PortAudioPlayer::play(PcmBuffer pcm, DoneCallback done) {
    const std::uint64_t generation = generation_.load();
    EventLoop* loop = &loop_;
    boost::asio::post(worker_, [this, loop, generation, pcm = std::move(pcm), done = std::move(done)]() mutable {
        render(pcm, generation);
        loop->post(std::move(done));
    });
}

void PortAudioPlayer::stop() {
    ++generation_;
}

void PortAudioPlayer::render(const PcmBuffer& pcm, std::uint64_t generation) {
    if (generation != generation_.load() || pcm.samples.empty() || pcm.channels < 1) return;
    if (!ensureStream(pcm.sampleRate, pcm.channels)) return;

    const auto channels = static_cast<std::size_t>(pcm.channels);
    const std::size_t totalFrames = pcm.samples.size() / channels;
    std::size_t written = 0;
    while (written < totalFrames && generation == generation_.load()) {
        const std::size_t count = std::min<std::size_t>(WRITE_BLOCK, totalFrames - written);
        PaError err = Pa_WriteStream(stream_, pcm.samples.data() + written * channels,
                                     static_cast<unsigned long>(count));
        if (err != paNoError && err != paOutputUnderflowed) {
            std::cerr << "Warning: playback write failed: " << Pa_GetErrorText(err) << std::endl;
            closeStream();
            return;
        }
        written += count;
    }
}

bool PortAudioPlayer::ensureStream(int sampleRate, int channels) {
    if (stream_ && streamRate_ == sampleRate && streamChannels_ == channels) return true;
    closeStream();

    PaStreamParameters outputParams = {};
    outputParams.device = deviceIndex_.value_or(Pa_GetDefaultOutputDevice());
    if (outputParams.device == paNoDevice) {
        std::cerr << "Warning: no default output device available" << std::endl;
        return false;
    }
    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(outputParams.device);
    if (!deviceInfo || deviceInfo->maxOutputChannels < channels) {
        std::cerr << "Warning: output device " << outputParams.device
                  << " cannot play " << channels << " channel(s)" << std::endl;
        return false;
    }
    outputParams.channelCount = channels;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = deviceInfo->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(&stream_, nullptr, &outputParams, sampleRate,
                                paFramesPerBufferUnspecified, paClipOff, nullptr, nullptr);
    if (err != paNoError) {
        std::cerr << "Warning: could not open output stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Warning: could not start output stream: " << Pa_GetErrorText(err) << std::endl;
        closeStream();
        return false;
    }
    streamRate_ = sampleRate;
    streamChannels_ = channels;
    return true;
}

void PortAudioPlayer::closeStream() {
    if (!stream_) return;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    streamRate_ = 0;
    streamChannels_ = 0;
}

} // namespace voxcall
