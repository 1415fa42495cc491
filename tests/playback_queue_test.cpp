#include "call/playback_queue.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace voxcall;
using voxcall::fakes::FakeDecoder;
using voxcall::fakes::FakeSink;

namespace {

AudioChunk chunk(std::uint8_t tag) {
    return AudioChunk{tag, 0x00, 0x01};
}

class PlaybackQueueTest : public ::testing::Test {
protected:
    FakeDecoder decoder;
    FakeSink sink;
    PlaybackQueue queue{decoder, sink};
    std::vector<bool> speakingChanges;

    void SetUp() override {
        queue.setSpeakingCallback([this](bool s) { speakingChanges.push_back(s); });
    }
};

} // namespace

TEST_F(PlaybackQueueTest, OnlyOneDecodeInFlight) {
    queue.enqueue(chunk(1));
    queue.enqueue(chunk(2));
    queue.enqueue(chunk(3));

    EXPECT_TRUE(queue.busy());
    EXPECT_EQ(decoder.pending.size(), 1u);
    EXPECT_EQ(queue.pending(), 2u);
}

TEST_F(PlaybackQueueTest, PlaysInEnqueueOrder) {
    queue.enqueue(chunk(1));
    queue.enqueue(chunk(2));

    decoder.completeNext();
    ASSERT_EQ(sink.played.size(), 1u);
    EXPECT_TRUE(queue.speaking());
    // Next chunk is not decoded until the current one finishes playing.
    EXPECT_TRUE(decoder.pending.empty());

    sink.finishCurrent();
    ASSERT_EQ(decoder.pending.size(), 1u);
    decoder.completeNext();
    sink.finishCurrent();

    EXPECT_EQ(sink.playedTags(), (std::vector<int>{1, 2}));
    EXPECT_EQ(queue.played(), 2u);
    EXPECT_FALSE(queue.busy());
    EXPECT_FALSE(queue.speaking());
    EXPECT_EQ(speakingChanges, (std::vector<bool>{true, false}));
}

TEST_F(PlaybackQueueTest, ChunkArrivingMidDecodeWaitsItsTurn) {
    queue.enqueue(chunk(1));
    queue.enqueue(chunk(2));
    decoder.completeNext();
    queue.enqueue(chunk(3));
    sink.finishCurrent();
    decoder.completeNext();
    sink.finishCurrent();
    decoder.completeNext();
    sink.finishCurrent();
    EXPECT_EQ(sink.playedTags(), (std::vector<int>{1, 2, 3}));
}

TEST_F(PlaybackQueueTest, DecodeFailureSkipsOnlyThatChunk) {
    queue.enqueue(chunk(1));
    queue.enqueue(chunk(2));
    queue.enqueue(chunk(3));

    decoder.completeNext();
    sink.finishCurrent();
    decoder.completeNext(false);
    ASSERT_EQ(decoder.pending.size(), 1u);
    decoder.completeNext();
    sink.finishCurrent();

    EXPECT_EQ(sink.playedTags(), (std::vector<int>{1, 3}));
    EXPECT_EQ(queue.decodeFailures(), 1u);
    EXPECT_FALSE(queue.busy());
}

TEST_F(PlaybackQueueTest, ClearDropsPendingAndIgnoresStaleCompletions) {
    queue.enqueue(chunk(1));
    queue.enqueue(chunk(2));
    decoder.completeNext();
    ASSERT_TRUE(queue.speaking());

    queue.clear();
    EXPECT_EQ(sink.stops, 1);
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_FALSE(queue.busy());
    EXPECT_FALSE(queue.speaking());

    // The cut-short buffer reports done; nothing else may start.
    sink.flushCutShort();
    EXPECT_TRUE(decoder.pending.empty());
    EXPECT_EQ(queue.played(), 0u);

    queue.enqueue(chunk(9));
    decoder.completeNext();
    sink.finishCurrent();
    EXPECT_EQ(sink.playedTags(), (std::vector<int>{1, 9}));
}

TEST_F(PlaybackQueueTest, ClearDuringDecodeDropsTheResult) {
    queue.enqueue(chunk(1));
    queue.clear();
    EXPECT_EQ(sink.stops, 1);
    decoder.completeNext();
    EXPECT_TRUE(sink.played.empty());
    EXPECT_FALSE(queue.busy());
}

TEST(PlaybackQueueLifetime, CompletionAfterDestructionIsHarmless) {
    FakeDecoder decoder;
    FakeSink sink;
    {
        PlaybackQueue queue(decoder, sink);
        queue.enqueue(chunk(1));
    }
    EXPECT_EQ(sink.stops, 1);
    decoder.completeNext();
    EXPECT_TRUE(sink.played.empty());
}
