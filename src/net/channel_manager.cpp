#include "net/channel_manager.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace voxcall {

ChannelManager::ChannelManager(ChannelFactory factory, std::string url)
    : factory_(std::move(factory))
    , url_(std::move(url)) {}

ChannelManager::~ChannelManager() {
    shutdown();
}

void ChannelManager::connect(Listener& listener) {
    shutdown();
    // The previous channel is destroyed here, outside of its own handlers.
    channel_ = factory_();
    const std::uint64_t connection = ++connection_;

    Channel::Handlers handlers;
    handlers.onOpen = [this, connection, &listener]() {
        if (connection == connection_) listener.onChannelOpen();
    };
    handlers.onMessage = [this, connection, &listener](const std::string& text) {
        if (connection == connection_) listener.onChannelMessage(text);
    };
    handlers.onFailure = [this, connection, &listener](const std::string& reason) {
        if (connection == connection_) listener.onChannelFailure(reason);
    };
    handlers.onClosed = [this, connection, &listener](const std::string& reason) {
        if (connection == connection_) listener.onChannelClosed(reason);
    };
    channel_->open(url_, std::move(handlers));
}

void ChannelManager::endCall() {
    if (!channel_) return;
    if (channel_->isOpen()) {
        channel_->sendText(nlohmann::json{{"type", "end_call"}}.dump());
    }
    shutdown();
}

void ChannelManager::shutdown() {
    if (!channel_) return;
    // Stale handlers from this connection are ignored from now on.
    ++connection_;
    channel_->close();
}

bool ChannelManager::isOpen() const {
    return channel_ && channel_->isOpen();
}

void ChannelManager::sendText(const std::string& text) {
    if (!isOpen()) {
        std::cerr << "Warning: dropping control frame, channel not open" << std::endl;
        return;
    }
    channel_->sendText(text);
    ++framesSent_;
}

void ChannelManager::sendBinary(std::vector<std::uint8_t> bytes) {
    if (!isOpen()) return;
    channel_->sendBinary(std::move(bytes));
    ++framesSent_;
}

} // namespace voxcall
