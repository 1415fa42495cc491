#include "audio/portaudio_microphone.hpp"
#include "audio/frame_assembler.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <cstdint>
#include <stdexcept>

namespace voxcall {

namespace {

// Shared between the PortAudio callback thread and the event loop. The
// assembler is only touched by the callback; onFrame only by the loop.
struct CaptureState {
    explicit CaptureState(std::size_t bytesPerFrame) : assembler(bytesPerFrame) {}

    EventLoop* loop{nullptr};
    FrameAssembler assembler;
    CaptureStream::FrameCallback onFrame;
    std::atomic<bool> running{false};
    std::weak_ptr<CaptureState> self;
};

class PortAudioCaptureStream : public CaptureStream {
public:
    PortAudioCaptureStream(PaStream* stream, std::shared_ptr<CaptureState> state)
        : stream_(stream)
        , state_(std::move(state)) {}

    ~PortAudioCaptureStream() override {
        state_->running.store(false);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    bool start(FrameCallback onFrame) override {
        state_->onFrame = std::move(onFrame);
        state_->running.store(true);
        PaError err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::cerr << "Error starting stream: " << Pa_GetErrorText(err) << std::endl;
            state_->running.store(false);
            return false;
        }
        return true;
    }

    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          PaStreamCallbackFlags statusFlags,
                          void* userData) {
        (void)output;
        (void)timeInfo;
        (void)statusFlags;

        auto* state = static_cast<CaptureState*>(userData);
        const float* samples = static_cast<const float*>(input);
        if (!state->running.load() || !samples) {
            return paContinue;
        }

        for (auto& frame : state->assembler.push(samples, frameCount)) {
            // The loop side re-checks running before touching onFrame.
            state->loop->post([weak = state->self, frame = std::move(frame)]() mutable {
                auto locked = weak.lock();
                if (!locked || !locked->running.load() || !locked->onFrame) return;
                locked->onFrame(std::move(frame));
            });
        }
        return paContinue;
    }

private:
    PaStream* stream_{nullptr};
    std::shared_ptr<CaptureState> state_;
};

} // namespace

PortAudioMicrophone::PortAudioMicrophone(EventLoop& loop, Config config)
    : loop_(loop)
    , config_(config) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw std::runtime_error("Failed to initialize PortAudio: " +
                               std::string(Pa_GetErrorText(err)));
    }
}

PortAudioMicrophone::~PortAudioMicrophone() {
    Pa_Terminate();
}

std::vector<AudioDevice> PortAudioMicrophone::listDevices() {
    std::vector<AudioDevice> devices;
    PaError err = Pa_Initialize();
    if (err != paNoError) return devices;

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;
        AudioDevice device;
        device.index = i;
        device.name = deviceInfo->name;
        device.maxInputChannels = deviceInfo->maxInputChannels;
        device.maxOutputChannels = deviceInfo->maxOutputChannels;
        device.defaultSampleRate = deviceInfo->defaultSampleRate;
        devices.push_back(device);
    }

    Pa_Terminate();
    return devices;
}

void PortAudioMicrophone::acquire(AcquireCallback done) {
    loop_.post([this, done = std::move(done)]() {
        std::string error;
        auto stream = openStream(error);
        done(std::move(stream), error);
    });
}

std::unique_ptr<CaptureStream> PortAudioMicrophone::openStream(std::string& error) {
    PaStreamParameters inputParams = {};
    inputParams.device = config_.deviceIndex.value_or(Pa_GetDefaultInputDevice());
    if (inputParams.device == paNoDevice) {
        error = "No default input device available";
        return nullptr;
    }

    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(inputParams.device);
    if (!deviceInfo || deviceInfo->maxInputChannels < 1) {
        error = "Could not get input device info for device " + std::to_string(inputParams.device);
        return nullptr;
    }

    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = deviceInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    auto state = std::make_shared<CaptureState>(FrameAssembler::frameBytes(config_.sampleRate, config_.frameMs));
    state->loop = &loop_;
    state->self = state;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream,
                                &inputParams,
                                nullptr,
                                config_.sampleRate,
                                FRAMES_PER_BUFFER,
                                paClipOff,
                                &PortAudioCaptureStream::paCallback,
                                state.get());
    if (err != paNoError) {
        error = std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err);
        return nullptr;
    }
    return std::make_unique<PortAudioCaptureStream>(stream, std::move(state));
}

} // namespace voxcall
