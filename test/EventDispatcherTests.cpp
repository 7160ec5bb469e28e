// EventDispatcherTests.cpp
#include <gtest/gtest.h>

#include "EventDispatcher.hpp"
#include "TestSupport.hpp"

using json = nlohmann::json;

TEST(EventDispatcher, ResponsesAndEventsShareOneSequence) {
    RecordingWriter writer;
    EventDispatcher dispatcher(writer);

    json request = { { "seq", 7 }, { "type", "request" }, { "command", "initialize" } };
    EXPECT_EQ(dispatcher.post_response(request, true, { { "supportsLogPoints", true } }), 1);
    EXPECT_EQ(dispatcher.post_event("initialized"), 2);
    EXPECT_EQ(dispatcher.post_event("output", { { "output", "x" } }), 3);
    EXPECT_EQ(dispatcher.pending(), 3u);
    ASSERT_TRUE(dispatcher.flush());

    auto messages = writer.take();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0]["seq"], 1);
    EXPECT_EQ(messages[0]["type"], "response");
    EXPECT_EQ(messages[0]["request_seq"], 7);
    EXPECT_EQ(messages[0]["command"], "initialize");
    EXPECT_EQ(messages[0]["success"], true);
    EXPECT_TRUE(messages[0]["body"]["supportsLogPoints"]);
    EXPECT_EQ(messages[1]["event"], "initialized");
    EXPECT_FALSE(messages[1].contains("body"));
    EXPECT_EQ(messages[2]["seq"], 3);
    EXPECT_EQ(dispatcher.last_seq(), 3);
}

TEST(EventDispatcher, FailedResponseCarriesMessage) {
    RecordingWriter writer;
    EventDispatcher dispatcher(writer);
    dispatcher.post_response({ { "seq", 3 }, { "command", "stackTrace" } }, false, nullptr, "Request not valid in this state");
    dispatcher.flush();
    auto messages = writer.take();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["success"], false);
    EXPECT_EQ(messages[0]["message"], "Request not valid in this state");
    EXPECT_FALSE(messages[0].contains("body"));
}

TEST(EventDispatcher, MalformedRequestStillGetsAResponse) {
    RecordingWriter writer;
    EventDispatcher dispatcher(writer);
    dispatcher.post_response(json::array({ 1, 2 }), false, nullptr, "Malformed message");
    dispatcher.flush();
    auto messages = writer.take();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["request_seq"], 0);
    EXPECT_EQ(messages[0]["command"], "");
}

TEST(EventDispatcher, WriteFailureClosesTheQueue) {
    RecordingWriter writer;
    EventDispatcher dispatcher(writer);
    writer.broken = true;
    dispatcher.post_event("stopped");
    EXPECT_FALSE(dispatcher.flush());
    EXPECT_TRUE(dispatcher.closed());
    EXPECT_EQ(dispatcher.pending(), 0u);

    writer.broken = false;
    dispatcher.post_event("continued");
    EXPECT_FALSE(dispatcher.flush());
    EXPECT_TRUE(writer.take().empty());
}
