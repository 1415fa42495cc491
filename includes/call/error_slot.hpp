#pragma once

#include "runtime/event_loop.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace voxcall {

// The one user-visible error message. Each show() replaces the text and
// restarts the clear timer; the timer is cancelled on destruction.
class ErrorSlot {
public:
    static constexpr std::chrono::milliseconds DISPLAY_TIME{5000};

    using ChangeCallback = std::function<void(const std::string&)>;

    explicit ErrorSlot(EventLoop& loop) : loop_(loop) {}
    ~ErrorSlot();

    ErrorSlot(const ErrorSlot&) = delete;
    ErrorSlot& operator=(const ErrorSlot&) = delete;

    void show(const std::string& message);
    void clear();

    const std::string& message() const { return message_; }
    bool active() const { return !message_.empty(); }

    void setChangeCallback(ChangeCallback callback) { changeCallback_ = std::move(callback); }

private:
    EventLoop& loop_;
    std::string message_;
    std::unique_ptr<EventLoop::Timer> timer_;
    ChangeCallback changeCallback_;

    void cancelTimer();
};

} // namespace voxcall
