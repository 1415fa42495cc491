#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voxcall {

// The send-only capability handed to components that produce frames.
class FrameSender {
public:
    virtual ~FrameSender() = default;
    virtual bool isOpen() const = 0;
    virtual void sendText(const std::string& text) = 0;
    virtual void sendBinary(std::vector<std::uint8_t> bytes) = 0;
};

// A message-framed bidirectional transport. Handlers run on the event loop.
// After close() no handler is invoked again.
class Channel : public FrameSender {
public:
    struct Handlers {
        std::function<void()> onOpen;
        std::function<void(const std::string& text)> onMessage;
        // Could not open.
        std::function<void(const std::string& reason)> onFailure;
        // Was open, then dropped by the peer or the network.
        std::function<void(const std::string& reason)> onClosed;
    };

    virtual void open(const std::string& url, Handlers handlers) = 0;
    virtual void close() = 0;
};

using ChannelFactory = std::function<std::unique_ptr<Channel>()>;

} // namespace voxcall
