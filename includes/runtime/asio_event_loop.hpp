#pragma once

#include "runtime/event_loop.hpp"
#include <boost/asio/io_context.hpp>

namespace voxcall {

class AsioEventLoop : public EventLoop {
public:
    explicit AsioEventLoop(boost::asio::io_context& io) : io_(io) {}

    void post(Task task) override;
    std::unique_ptr<Timer> schedule(std::chrono::milliseconds delay, Task task) override;
    std::int64_t nowMs() const override;

    boost::asio::io_context& context() { return io_; }

private:
    boost::asio::io_context& io_;
};

} // namespace voxcall
