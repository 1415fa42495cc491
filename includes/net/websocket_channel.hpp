#pragma once

#include "net/channel.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>

namespace voxcall {

// Channel over a plain (ws://) WebSocket, run on the io_context that also
// drives the event loop, so handlers already execute on the loop thread.
class WebSocketChannel : public Channel {
public:
    explicit WebSocketChannel(boost::asio::io_context& io);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    void open(const std::string& url, Handlers handlers) override;
    void close() override;

    bool isOpen() const override;
    void sendText(const std::string& text) override;
    void sendBinary(std::vector<std::uint8_t> bytes) override;

    static ChannelFactory factory(boost::asio::io_context& io);

private:
    class Session;

    boost::asio::io_context& io_;
    std::shared_ptr<Session> session_;
};

} // namespace voxcall
