#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace voxcall {

// The single thread all call logic runs on. Work arriving from audio or
// network threads is posted here; nothing in the call core runs elsewhere.
class EventLoop {
public:
    using Task = std::function<void()>;

    // Pending scheduled task. Destroying the handle does not cancel it.
    // After cancel() returns the task never runs, even if it was due.
    class Timer {
    public:
        virtual ~Timer() = default;
        virtual void cancel() = 0;
    };

    virtual ~EventLoop() = default;

    virtual void post(Task task) = 0;
    virtual std::unique_ptr<Timer> schedule(std::chrono::milliseconds delay, Task task) = 0;

    // Monotonic milliseconds, used for latency arithmetic.
    virtual std::int64_t nowMs() const = 0;
};

} // namespace voxcall
