#pragma once

#include "call/call.hpp"
#include "call/error_slot.hpp"
#include "runtime/event_loop.hpp"
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace voxcall {

// Routes inbound server frames, one at a time and in arrival order, into
// the call. Frames that are not JSON objects with a string "type", or whose
// fields have the wrong types, are dropped without touching any state.
class ProtocolDispatcher {
public:
    using SessionCallback = std::function<void(const std::string& sessionId)>;

    ProtocolDispatcher(Call& call, EventLoop& loop, ErrorSlot& errors);

    // Returns true if the frame was recognized and applied.
    bool dispatch(const std::string& frame);

    std::uint64_t dropped() const { return dropped_; }
    std::uint64_t ignored() const { return ignored_; }

    void setSessionCallback(SessionCallback callback) { sessionCallback_ = std::move(callback); }

private:
    using Json = nlohmann::json;

    Call& call_;
    EventLoop& loop_;
    ErrorSlot& errors_;
    std::uint64_t dropped_{0};
    std::uint64_t ignored_{0};
    SessionCallback sessionCallback_;

    bool handleSessionId(const Json& msg);
    bool handleSttPartial(const Json& msg);
    bool handleSttFinal(const Json& msg);
    bool handleAssistantText(const Json& msg);
    bool handleAudioChunk(const Json& msg);
    bool handleTraceEvent(const Json& msg);
    bool handleError(const Json& msg);
};

} // namespace voxcall
