#pragma once

#include "call/call_types.hpp"
#include "util/ring_buffer.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace voxcall {

// Recent pipeline trace events, newest first.
class TraceLog {
public:
    static constexpr std::size_t CAPACITY = 50;

    using WallClock = std::function<std::string()>;

    TraceLog();
    explicit TraceLog(WallClock clock);

    // Stamps wallTime and keeps the most recent CAPACITY events.
    void record(TraceEvent event);
    void clear() { events_.clear(); }

    std::size_t size() const { return events_.size(); }
    const TraceEvent& latest() const { return events_.newest(0); }
    std::vector<TraceEvent> events() const { return events_.newestFirst(); }

    // HH:MM:SS local time.
    static std::string localTimeString();

private:
    RingBuffer<TraceEvent> events_;
    WallClock clock_;
};

} // namespace voxcall
