#include "runtime/asio_event_loop.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace voxcall {

namespace {

class AsioTimer : public EventLoop::Timer {
public:
    AsioTimer(std::shared_ptr<boost::asio::steady_timer> timer, std::shared_ptr<bool> cancelled)
        : timer_(std::move(timer))
        , cancelled_(std::move(cancelled)) {}

    // steady_timer::cancel() cannot recall a handler that expired and is
    // already queued; the flag covers that window.
    void cancel() override {
        *cancelled_ = true;
        timer_->cancel();
    }

private:
    std::shared_ptr<boost::asio::steady_timer> timer_;
    std::shared_ptr<bool> cancelled_;
};

} // namespace

void AsioEventLoop::post(Task task) {
    boost::asio::post(io_, std::move(task));
}

std::unique_ptr<EventLoop::Timer> AsioEventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    auto cancelled = std::make_shared<bool>(false);
    // The handler keeps the timer alive until it fires or is cancelled.
    timer->async_wait([timer, cancelled, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || *cancelled) return;
        task();
    });
    return std::make_unique<AsioTimer>(timer, cancelled);
}

std::int64_t AsioEventLoop::nowMs() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace voxcall
