#include "net/channel_manager.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace voxcall;
using voxcall::fakes::FakeChannelFactory;

namespace {

struct RecordingListener : ChannelManager::Listener {
    std::vector<std::string> events;

    void onChannelOpen() override { events.push_back("open"); }
    void onChannelMessage(const std::string& text) override { events.push_back("msg:" + text); }
    void onChannelFailure(const std::string& reason) override { events.push_back("fail:" + reason); }
    void onChannelClosed(const std::string& reason) override { events.push_back("closed:" + reason); }
};

} // namespace

TEST(ChannelManager, ConnectOpensTheConfiguredUrl) {
    FakeChannelFactory channels;
    ChannelManager manager(channels.factory(), "ws://localhost:8000/call");
    RecordingListener listener;

    EXPECT_FALSE(manager.isOpen());
    manager.connect(listener);
    ASSERT_EQ(channels.channels.size(), 1u);
    EXPECT_EQ(channels.last().url, "ws://localhost:8000/call");

    channels.last().acceptOpen();
    channels.last().deliver("hello");
    EXPECT_TRUE(manager.isOpen());
    EXPECT_EQ(listener.events, (std::vector<std::string>{"open", "msg:hello"}));
}

TEST(ChannelManager, SendsOnlyWhileOpen) {
    FakeChannelFactory channels;
    ChannelManager manager(channels.factory(), "ws://x/");
    RecordingListener listener;
    manager.connect(listener);

    manager.sendText("early");
    manager.sendBinary({1});
    EXPECT_TRUE(channels.last().texts.empty());
    EXPECT_TRUE(channels.last().binaries.empty());

    channels.last().acceptOpen();
    manager.sendText("{}");
    manager.sendBinary({1, 2});
    EXPECT_EQ(channels.last().texts.size(), 1u);
    EXPECT_EQ(channels.last().binaries.size(), 1u);
    EXPECT_EQ(manager.framesSent(), 2u);
}

TEST(ChannelManager, EndCallSendsEndCallThenCloses) {
    FakeChannelFactory channels;
    ChannelManager manager(channels.factory(), "ws://x/");
    RecordingListener listener;
    manager.connect(listener);
    channels.last().acceptOpen();

    manager.endCall();
    EXPECT_EQ(channels.last().textTypes(), (std::vector<std::string>{"end_call"}));
    EXPECT_TRUE(channels.last().closed);
    EXPECT_FALSE(manager.isOpen());

    // Idempotent.
    manager.endCall();
    EXPECT_EQ(channels.last().texts.size(), 1u);
}

TEST(ChannelManager, EndCallBeforeOpenOnlyCloses) {
    FakeChannelFactory channels;
    ChannelManager manager(channels.factory(), "ws://x/");
    RecordingListener listener;
    manager.connect(listener);

    manager.endCall();
    EXPECT_TRUE(channels.last().texts.empty());
    EXPECT_TRUE(channels.last().closed);
}

TEST(ChannelManager, HandlersFromAReplacedConnectionAreIgnored) {
    FakeChannelFactory channels;
    ChannelManager manager(channels.factory(), "ws://x/");
    RecordingListener listener;

    manager.connect(listener);
    auto first = channels.channels.front();
    manager.connect(listener);
    EXPECT_TRUE(first->closed);

    // Bypass the fake's own closed check to simulate a late callback.
    first->handlers.onMessage("stale");
    first->handlers.onClosed("late");
    channels.last().acceptOpen();
    EXPECT_EQ(listener.events, (std::vector<std::string>{"open"}));
}

TEST(ChannelManager, ShutdownSilencesTheListener) {
    FakeChannelFactory channels;
    ChannelManager manager(channels.factory(), "ws://x/");
    RecordingListener listener;
    manager.connect(listener);
    channels.last().acceptOpen();

    manager.shutdown();
    channels.last().handlers.onClosed("bye");
    EXPECT_EQ(listener.events, (std::vector<std::string>{"open"}));
}

TEST(ChannelManager, DestructionClosesTheChannel) {
    FakeChannelFactory channels;
    RecordingListener listener;
    {
        ChannelManager manager(channels.factory(), "ws://x/");
        manager.connect(listener);
    }
    EXPECT_TRUE(channels.last().closed);
}
