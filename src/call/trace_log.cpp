#include "call/trace_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace voxcall {

TraceLog::TraceLog()
    : TraceLog(&TraceLog::localTimeString) {}

TraceLog::TraceLog(WallClock clock)
    : events_(CAPACITY)
    , clock_(std::move(clock)) {}

void TraceLog::record(TraceEvent event) {
    event.wallTime = clock_ ? clock_() : localTimeString();
    events_.push(std::move(event));
}

std::string TraceLog::localTimeString() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

} // namespace voxcall
