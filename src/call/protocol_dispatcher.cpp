#include "call/protocol_dispatcher.hpp"
#include "util/base64.hpp"
#include <cmath>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace voxcall {

namespace {

using Json = nlohmann::json;

// Beyond this a millisecond count is garbage, and llround would be unspecified.
constexpr double MAX_MS = 9.0e15;

// Absent or null yields nullopt; any other non-number throws type_error and
// a value outside +/-MAX_MS throws std::out_of_range.
std::optional<std::int64_t> optionalMs(const Json& msg, const char* key) {
    if (!msg.contains(key) || msg[key].is_null()) return std::nullopt;
    const double value = msg.at(key).get<double>();
    if (!std::isfinite(value) || std::fabs(value) > MAX_MS) {
        throw std::out_of_range(std::string(key) + " out of range");
    }
    return static_cast<std::int64_t>(std::llround(value));
}

std::optional<double> optionalNumber(const Json& msg, const char* key) {
    if (!msg.contains(key) || msg[key].is_null()) return std::nullopt;
    return msg.at(key).get<double>();
}

std::optional<std::string> optionalString(const Json& msg, const char* key) {
    if (!msg.contains(key) || msg[key].is_null()) return std::nullopt;
    return msg.at(key).get<std::string>();
}

} // namespace

ProtocolDispatcher::ProtocolDispatcher(Call& call, EventLoop& loop, ErrorSlot& errors)
    : call_(call)
    , loop_(loop)
    , errors_(errors) {}

bool ProtocolDispatcher::dispatch(const std::string& frame) {
    Json msg = Json::parse(frame, nullptr, false);
    if (msg.is_discarded() || !msg.is_object() || !msg.contains("type") || !msg["type"].is_string()) {
        ++dropped_;
        return false;
    }

    const std::string type = msg["type"].get<std::string>();
    try {
        if (type == "session_id")      return handleSessionId(msg);
        if (type == "stt_partial")     return handleSttPartial(msg);
        if (type == "stt_final")       return handleSttFinal(msg);
        if (type == "assistant_text")  return handleAssistantText(msg);
        if (type == "tts_audio_chunk") return handleAudioChunk(msg);
        if (type == "tts_done")        return true; // queue drains on its own
        if (type == "trace_event")     return handleTraceEvent(msg);
        if (type == "error")           return handleError(msg);
    } catch (const Json::exception&) {
        ++dropped_;
        return false;
    } catch (const std::out_of_range& e) {
        std::cerr << "Warning: dropping " << type << " frame: " << e.what() << std::endl;
        ++dropped_;
        return false;
    }

    ++ignored_;
    return false;
}

bool ProtocolDispatcher::handleSessionId(const Json& msg) {
    const std::string sessionId = msg.at("session_id").get<std::string>();
    if (sessionId.empty()) {
        ++dropped_;
        return false;
    }
    if (call_.sessionId) {
        std::cerr << "Warning: ignoring second session id " << sessionId
                  << " (call has " << *call_.sessionId << ")" << std::endl;
        ++ignored_;
        return false;
    }
    call_.sessionId = sessionId;
    call_.state.channelEstablished();
    if (sessionCallback_) sessionCallback_(sessionId);
    return true;
}

bool ProtocolDispatcher::handleSttPartial(const Json& msg) {
    std::string text = msg.at("text").get<std::string>();
    call_.turn.sttPartial = std::move(text);
    call_.latency.onPartialTranscript(loop_.nowMs());
    return true;
}

bool ProtocolDispatcher::handleSttFinal(const Json& msg) {
    std::string text = msg.at("text").get<std::string>();
    const auto latencyMs = optionalMs(msg, "latency_ms");

    call_.turn.sttPartial.clear();
    if (!call_.turn.finalReceived) {
        call_.turn.sttFinal = std::move(text);
        call_.turn.finalReceived = true;
    }
    call_.latency.onFinalTranscript(latencyMs);
    return true;
}

bool ProtocolDispatcher::handleAssistantText(const Json& msg) {
    const std::string text = optionalString(msg, "text").value_or("");
    const bool isFinal = msg.contains("is_final") && !msg["is_final"].is_null()
                       ? msg.at("is_final").get<bool>()
                       : false;
    const auto fullText = optionalString(msg, "full_text");

    Turn& turn = call_.turn;
    if (turn.assistantComplete) {
        ++ignored_;
        return false;
    }
    if (!isFinal) {
        turn.assistantText += text;
        return true;
    }
    turn.assistantComplete = true;
    if (turn.assistantText.empty() && fullText) {
        turn.assistantText = *fullText;
    }
    return true;
}

bool ProtocolDispatcher::handleAudioChunk(const Json& msg) {
    auto bytes = base64Decode(msg.at("audio").get<std::string>());
    if (!bytes) {
        ++dropped_;
        return false;
    }
    call_.latency.onAudioChunk(loop_.nowMs());
    call_.playback.enqueue(std::move(*bytes));
    return true;
}

bool ProtocolDispatcher::handleTraceEvent(const Json& msg) {
    TraceEvent event;
    event.event = msg.at("event").get<std::string>();
    event.ts = optionalNumber(msg, "ts");
    event.turnId = optionalString(msg, "turn_id");
    event.latencyMs = optionalMs(msg, "latency_ms");
    event.transcript = optionalString(msg, "transcript");
    if (msg.contains("latency") && !msg["latency"].is_null()) {
        const Json& latency = msg["latency"];
        if (!latency.is_object()) {
            ++dropped_;
            return false;
        }
        event.latency = LatencyBreakdown{optionalMs(latency, "stt_ms"), optionalMs(latency, "first_audio_ms")};
    }

    const bool turnComplete = event.event == "turn_complete" && event.latency.has_value();
    const LatencyBreakdown summary = event.latency.value_or(LatencyBreakdown{});
    call_.trace.record(std::move(event));
    if (turnComplete) {
        call_.latency.applySummary(summary);
    }
    return true;
}

bool ProtocolDispatcher::handleError(const Json& msg) {
    errors_.show(msg.at("message").get<std::string>());
    return true;
}

} // namespace voxcall
