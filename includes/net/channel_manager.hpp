#pragma once

#include "net/channel.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace voxcall {

// Owns the transport to the voice server for the current call. Components
// that only need to send get this object as a FrameSender.
class ChannelManager : public FrameSender {
public:
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void onChannelOpen() = 0;
        virtual void onChannelMessage(const std::string& text) = 0;
        virtual void onChannelFailure(const std::string& reason) = 0;
        virtual void onChannelClosed(const std::string& reason) = 0;
    };

    ChannelManager(ChannelFactory factory, std::string url);
    ~ChannelManager() override;

    ChannelManager(const ChannelManager&) = delete;
    ChannelManager& operator=(const ChannelManager&) = delete;

    // Opens a fresh channel, retiring any previous one.
    void connect(Listener& listener);

    // Sends {"type":"end_call"} when open, then closes.
    void endCall();

    // Closes without a goodbye, e.g. after the peer dropped.
    void shutdown();

    bool isOpen() const override;
    void sendText(const std::string& text) override;
    void sendBinary(std::vector<std::uint8_t> bytes) override;

    std::uint64_t framesSent() const { return framesSent_; }

private:
    ChannelFactory factory_;
    std::string url_;
    std::unique_ptr<Channel> channel_;
    std::uint64_t connection_{0};
    std::uint64_t framesSent_{0};
};

} // namespace voxcall
