#include "net/session_directory.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace voxcall;
using voxcall::fakes::FakeHttpFetcher;

TEST(SessionDirectory, FetchesSessionsFromTheApi) {
    FakeHttpFetcher fetcher;
    SessionDirectory directory(fetcher, "http://localhost:8000/");
    int updates = 0;
    directory.setUpdateCallback([&updates](const std::vector<SessionRecord>&) { ++updates; });

    directory.listSessions();
    ASSERT_EQ(fetcher.urls.size(), 1u);
    EXPECT_EQ(fetcher.urls[0], "http://localhost:8000/sessions");
    EXPECT_TRUE(directory.loading());

    fetcher.respond(R"([
        {"id":"0f6c2a9e-1111-2222-3333-444455556666","status":"ended","created_at":"2024-05-01T10:00:00","ended_at":"2024-05-01T10:05:00"},
        {"id":"b2","status":"active","created_at":"2024-05-02T09:00:00","ended_at":null}
    ])");

    EXPECT_FALSE(directory.loading());
    EXPECT_EQ(updates, 1);
    ASSERT_EQ(directory.sessions().size(), 2u);
    EXPECT_EQ(directory.sessions()[0].status, "ended");
    EXPECT_EQ(directory.sessions()[0].endedAt, "2024-05-01T10:05:00");
    EXPECT_EQ(directory.sessions()[1].id, "b2");
    EXPECT_FALSE(directory.sessions()[1].endedAt.has_value());
}

TEST(SessionDirectory, FailureKeepsThePreviousListing) {
    FakeHttpFetcher fetcher;
    SessionDirectory directory(fetcher, "http://api");

    directory.listSessions();
    fetcher.respond(R"([{"id":"a","status":"ended"}])");
    ASSERT_EQ(directory.sessions().size(), 1u);

    directory.listSessions();
    fetcher.fail();
    EXPECT_EQ(directory.sessions().size(), 1u);
    EXPECT_FALSE(directory.loading());

    directory.listSessions();
    fetcher.respond("<html>502</html>");
    ASSERT_EQ(directory.sessions().size(), 1u);
    EXPECT_EQ(directory.sessions()[0].id, "a");
}

TEST(SessionDirectory, EmptyListingReplacesOldOne) {
    FakeHttpFetcher fetcher;
    SessionDirectory directory(fetcher, "http://api");
    directory.listSessions();
    fetcher.respond(R"([{"id":"a"}])");
    directory.listSessions();
    fetcher.respond("[]");
    EXPECT_TRUE(directory.sessions().empty());
}

TEST(SessionDirectory, ParseListingValidatesShape) {
    EXPECT_FALSE(SessionDirectory::parseListing("{}").has_value());
    EXPECT_FALSE(SessionDirectory::parseListing("not json").has_value());
    EXPECT_FALSE(SessionDirectory::parseListing(R"([{"status":"ended"}])").has_value());
    EXPECT_FALSE(SessionDirectory::parseListing(R"([{"id":42}])").has_value());
    EXPECT_FALSE(SessionDirectory::parseListing(R"(["a"])").has_value());

    auto listing = SessionDirectory::parseListing(R"([{"id":"x"}])");
    ASSERT_TRUE(listing.has_value());
    ASSERT_EQ(listing->size(), 1u);
    EXPECT_EQ((*listing)[0].status, "unknown");
    EXPECT_FALSE((*listing)[0].createdAt.has_value());
}

TEST(SessionDirectory, ResponseAfterDestructionIsIgnored) {
    FakeHttpFetcher fetcher;
    {
        SessionDirectory directory(fetcher, "http://api");
        directory.listSessions();
    }
    fetcher.respond(R"([{"id":"a"}])");
    SUCCEED();
}

TEST(SessionDirectoryOrdering, OlderResponseDoesNotReplaceNewerListing) {
    FakeHttpFetcher fetcher;
    SessionDirectory directory(fetcher, "http://api");
    int updates = 0;
    directory.setUpdateCallback([&updates](const std::vector<SessionRecord>&) { ++updates; });

    directory.listSessions();
    directory.listSessions();
    ASSERT_EQ(fetcher.pending.size(), 2u);

    fetcher.respondAt(1, R"([{"id":"newer"}])");
    fetcher.respondAt(0, R"([{"id":"older"}])");

    ASSERT_EQ(directory.sessions().size(), 1u);
    EXPECT_EQ(directory.sessions()[0].id, "newer");
    EXPECT_EQ(updates, 1);
    EXPECT_FALSE(directory.loading());
}

TEST(SessionDirectoryOrdering, InOrderResponsesBothApply) {
    FakeHttpFetcher fetcher;
    SessionDirectory directory(fetcher, "http://api");
    directory.listSessions();
    directory.listSessions();
    fetcher.respond(R"([{"id":"first"}])");
    fetcher.respond(R"([{"id":"second"}])");
    ASSERT_EQ(directory.sessions().size(), 1u);
    EXPECT_EQ(directory.sessions()[0].id, "second");
}
