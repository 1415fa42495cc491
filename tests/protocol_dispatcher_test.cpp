#include "call/protocol_dispatcher.hpp"
#include "fakes.hpp"
#include "util/base64.hpp"
#include <gtest/gtest.h>

using namespace voxcall;
using voxcall::fakes::FakeDecoder;
using voxcall::fakes::FakeSink;
using voxcall::fakes::ManualEventLoop;

namespace {

std::string audioFrame(std::uint8_t tag) {
    return nlohmann::json{{"type", "tts_audio_chunk"},
                          {"audio", base64Encode({tag, 0x10, 0x20})}}.dump();
}

class ProtocolDispatcherTest : public ::testing::Test {
protected:
    ManualEventLoop loop;
    ErrorSlot errors{loop};
    FakeDecoder decoder;
    FakeSink sink;
    Call call{decoder, sink};
    ProtocolDispatcher dispatcher{call, loop, errors};

    void SetUp() override {
        call.state.startCall();
    }

    void connectWithSession(const std::string& id = "sess-1") {
        ASSERT_TRUE(dispatcher.dispatch(R"({"type":"session_id","session_id":")" + id + R"("})"));
    }

    void openTurnAt(std::int64_t advanceMs = 0) {
        loop.advance(advanceMs);
        call.openTurn(loop.nowMs());
    }
};

} // namespace

TEST_F(ProtocolDispatcherTest, SessionIdEstablishesTheCall) {
    std::string seen;
    dispatcher.setSessionCallback([&seen](const std::string& id) { seen = id; });

    connectWithSession("abc-123");
    EXPECT_EQ(call.sessionId, "abc-123");
    EXPECT_EQ(call.state.phase(), CallPhase::Connected);
    EXPECT_EQ(seen, "abc-123");
}

TEST_F(ProtocolDispatcherTest, SecondSessionIdIsIgnored) {
    connectWithSession("first");
    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"session_id","session_id":"second"})"));
    EXPECT_EQ(call.sessionId, "first");
    EXPECT_EQ(dispatcher.ignored(), 1u);
}

TEST_F(ProtocolDispatcherTest, MalformedFramesAreDropped) {
    EXPECT_FALSE(dispatcher.dispatch("not json"));
    EXPECT_FALSE(dispatcher.dispatch("[1,2,3]"));
    EXPECT_FALSE(dispatcher.dispatch(R"({"text":"no type"})"));
    EXPECT_FALSE(dispatcher.dispatch(R"({"type":7})"));
    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"stt_partial","text":5})"));
    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"session_id"})"));
    EXPECT_EQ(dispatcher.dropped(), 6u);
    EXPECT_FALSE(call.sessionId.has_value());
    EXPECT_TRUE(call.turn.sttPartial.empty());
}

TEST_F(ProtocolDispatcherTest, UnknownTypesAreIgnored) {
    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"heartbeat"})"));
    EXPECT_EQ(dispatcher.ignored(), 1u);
    EXPECT_EQ(dispatcher.dropped(), 0u);
}

TEST_F(ProtocolDispatcherTest, PartialThenFinalTranscript) {
    connectWithSession();
    openTurnAt();
    const std::int64_t start = loop.nowMs();

    loop.advance(150);
    dispatcher.dispatch(R"({"type":"stt_partial","text":"hel"})");
    EXPECT_EQ(call.turn.sttPartial, "hel");
    EXPECT_EQ(call.latency.record().sttPartialMs, loop.nowMs() - start);

    dispatcher.dispatch(R"({"type":"stt_final","text":"hello","confidence":0.93,"latency_ms":400})");
    EXPECT_TRUE(call.turn.sttPartial.empty());
    EXPECT_EQ(call.turn.sttFinal, "hello");
    EXPECT_TRUE(call.turn.finalReceived);
    EXPECT_EQ(call.latency.record().sttFinalMs, 400);
}

TEST_F(ProtocolDispatcherTest, FinalTranscriptIsSetOnce) {
    connectWithSession();
    openTurnAt();
    dispatcher.dispatch(R"({"type":"stt_final","text":"hello","latency_ms":400})");
    dispatcher.dispatch(R"({"type":"stt_final","text":"again","latency_ms":900})");
    EXPECT_EQ(call.turn.sttFinal, "hello");
    EXPECT_EQ(call.latency.record().sttFinalMs, 400);
}

TEST_F(ProtocolDispatcherTest, AssistantTextAccumulatesUntilFinal) {
    connectWithSession();
    openTurnAt();

    dispatcher.dispatch(R"({"type":"assistant_text","text":"Hi","is_final":false})");
    dispatcher.dispatch(R"({"type":"assistant_text","text":" there","is_final":false})");
    EXPECT_EQ(call.turn.assistantText, "Hi there");
    EXPECT_FALSE(call.turn.assistantComplete);

    dispatcher.dispatch(R"({"type":"assistant_text","text":"","is_final":true})");
    EXPECT_EQ(call.turn.assistantText, "Hi there");
    EXPECT_TRUE(call.turn.assistantComplete);

    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"assistant_text","text":"late","is_final":false})"));
    EXPECT_EQ(call.turn.assistantText, "Hi there");
}

TEST_F(ProtocolDispatcherTest, FullTextFillsAnEmptyResponse) {
    connectWithSession();
    openTurnAt();
    dispatcher.dispatch(R"({"type":"assistant_text","text":"","is_final":true,"full_text":"Sure."})");
    EXPECT_EQ(call.turn.assistantText, "Sure.");

    openTurnAt();
    dispatcher.dispatch(R"({"type":"assistant_text","text":"Ok","is_final":false})");
    dispatcher.dispatch(R"({"type":"assistant_text","text":"","is_final":true,"full_text":"Different"})");
    EXPECT_EQ(call.turn.assistantText, "Ok");
}

TEST_F(ProtocolDispatcherTest, AudioChunksQueueInArrivalOrder) {
    connectWithSession();
    openTurnAt();

    loop.advance(800);
    EXPECT_TRUE(dispatcher.dispatch(audioFrame(1)));
    loop.advance(50);
    EXPECT_TRUE(dispatcher.dispatch(audioFrame(2)));
    EXPECT_EQ(call.latency.record().firstAudioMs, 800);

    // Second chunk arrived while the first was still decoding.
    ASSERT_EQ(decoder.pending.size(), 1u);
    decoder.completeNext();
    sink.finishCurrent();
    decoder.completeNext();
    sink.finishCurrent();
    EXPECT_EQ(sink.playedTags(), (std::vector<int>{1, 2}));
}

TEST_F(ProtocolDispatcherTest, UndecodableAudioPayloadIsDropped) {
    connectWithSession();
    openTurnAt();
    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"tts_audio_chunk","audio":"@@@"})"));
    EXPECT_TRUE(decoder.pending.empty());
    EXPECT_FALSE(call.latency.record().firstAudioMs.has_value());
    EXPECT_EQ(dispatcher.dropped(), 1u);
}

TEST_F(ProtocolDispatcherTest, TtsDoneIsANoOp) {
    connectWithSession();
    EXPECT_TRUE(dispatcher.dispatch(R"({"type":"tts_done"})"));
}

TEST_F(ProtocolDispatcherTest, TraceEventsAreRecordedNewestFirst) {
    connectWithSession();
    dispatcher.dispatch(R"({"type":"trace_event","event":"stt_start","ts":1.5,"turn_id":"t1"})");
    dispatcher.dispatch(R"({"type":"trace_event","event":"stt_final","ts":2.0,"latency_ms":410.6,"transcript":"hello"})");

    auto events = call.trace.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].event, "stt_final");
    EXPECT_EQ(events[0].latencyMs, 411);
    EXPECT_EQ(events[0].transcript, "hello");
    EXPECT_FALSE(events[0].wallTime.empty());
    EXPECT_EQ(events[1].turnId, "t1");
    EXPECT_DOUBLE_EQ(*events[1].ts, 1.5);
}

TEST_F(ProtocolDispatcherTest, TurnCompleteSummaryOverridesLatency) {
    connectWithSession();
    openTurnAt();
    dispatcher.dispatch(R"({"type":"stt_final","text":"hello","latency_ms":400})");
    loop.advance(900);
    dispatcher.dispatch(audioFrame(1));

    dispatcher.dispatch(R"({"type":"trace_event","event":"turn_complete","ts":3.0,"latency":{"stt_ms":380,"first_audio_ms":null}})");
    EXPECT_EQ(call.latency.record().sttFinalMs, 380);
    EXPECT_EQ(call.latency.record().firstAudioMs, 900);
    EXPECT_EQ(call.trace.latest().event, "turn_complete");
}

TEST_F(ProtocolDispatcherTest, OtherTraceEventsDoNotTouchLatency) {
    connectWithSession();
    openTurnAt();
    dispatcher.dispatch(R"({"type":"stt_final","text":"hello","latency_ms":400})");
    dispatcher.dispatch(R"({"type":"trace_event","event":"llm_done","latency":{"stt_ms":1}})");
    EXPECT_EQ(call.latency.record().sttFinalMs, 400);
}

TEST_F(ProtocolDispatcherTest, ServerErrorIsShown) {
    connectWithSession();
    EXPECT_TRUE(dispatcher.dispatch(R"({"type":"error","message":"LLM unavailable"})"));
    EXPECT_EQ(errors.message(), "LLM unavailable");
    loop.advance(5000);
    EXPECT_FALSE(errors.active());
}

TEST_F(ProtocolDispatcherTest, MalformedFrameDoesNotDisturbTheCall) {
    connectWithSession();
    openTurnAt();

    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"stt_partial","text":)"));
    EXPECT_FALSE(errors.active());
    EXPECT_EQ(call.state.phase(), CallPhase::Connected);

    EXPECT_TRUE(dispatcher.dispatch(R"({"type":"stt_partial","text":"next"})"));
    EXPECT_EQ(call.turn.sttPartial, "next");
}

TEST_F(ProtocolDispatcherTest, OutOfRangeLatencyDropsTheFrame) {
    connectWithSession();
    openTurnAt();

    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"stt_final","text":"hello","latency_ms":1e300})"));
    EXPECT_EQ(dispatcher.dropped(), 1u);
    EXPECT_FALSE(call.turn.finalReceived);
    EXPECT_FALSE(call.latency.record().sttFinalMs.has_value());

    EXPECT_FALSE(dispatcher.dispatch(R"({"type":"trace_event","event":"turn_complete","latency":{"stt_ms":-1e20}})"));
    EXPECT_TRUE(call.trace.events().empty());

    EXPECT_TRUE(dispatcher.dispatch(R"({"type":"stt_final","text":"hello","latency_ms":412.4})"));
    EXPECT_EQ(call.latency.record().sttFinalMs, 412);
}
