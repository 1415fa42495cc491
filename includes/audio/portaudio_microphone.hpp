#pragma once
#include "audio/microphone.hpp"
#include "runtime/event_loop.hpp"
#include <portaudio.h>
#include <optional>
#include <string>
#include <vector>

namespace voxcall {

struct AudioDevice {
    int index;
    std::string name;
    int maxInputChannels;
    int maxOutputChannels;
    double defaultSampleRate;
};

// Microphone backed by a PortAudio input stream. Frames are mono 16-bit
// little-endian PCM, one per frameMs of captured audio.
class PortAudioMicrophone : public Microphone {
public:
    static constexpr int DEFAULT_SAMPLE_RATE = 16000;
    static constexpr int DEFAULT_FRAME_MS = 250;
    static constexpr unsigned long FRAMES_PER_BUFFER = 320; // 20ms @ 16k

    struct Config {
        std::optional<int> deviceIndex;   // default input if unset
        int sampleRate{DEFAULT_SAMPLE_RATE};
        int frameMs{DEFAULT_FRAME_MS};
    };

    PortAudioMicrophone(EventLoop& loop, Config config);
    ~PortAudioMicrophone() override;

    PortAudioMicrophone(const PortAudioMicrophone&) = delete;
    PortAudioMicrophone& operator=(const PortAudioMicrophone&) = delete;

    void acquire(AcquireCallback done) override;

    // Safe to call without an instance; initializes PortAudio for the query.
    static std::vector<AudioDevice> listDevices();

private:
    EventLoop& loop_;
    Config config_;

    std::unique_ptr<CaptureStream> openStream(std::string& error);
};

} // namespace voxcall
