#pragma once

#include <harbor/stream/sse_parser.hpp>
#include <harbor/stream/stream_event.hpp>

#include <gtest/gtest.h>

namespace Harbor::Test
{
    class SseParserTests : public ::testing::Test
    {
      protected:
        SseParser parser_{};
    };

    TEST_F(SseParserTests, ParsesACompleteEvent)
    {
        const auto events = parser_.feed("id: 7\nevent: chat:status\ndata: {\"sessionState\":\"idle\"}\n\n");

        ASSERT_EQ(events.size(), 1);
        EXPECT_EQ(events[0].id, "7");
        EXPECT_EQ(events[0].event, "chat:status");
        EXPECT_EQ(events[0].data, R"({"sessionState":"idle"})");
    }

    TEST_F(SseParserTests, EventSplitAcrossChunksIsReassembled)
    {
        EXPECT_TRUE(parser_.feed("event: chat:mess").empty());
        EXPECT_TRUE(parser_.feed("age-chunk\ndata: hel").empty());
        const auto events = parser_.feed("lo\n\n");

        ASSERT_EQ(events.size(), 1);
        EXPECT_EQ(events[0].event, "chat:message-chunk");
        EXPECT_EQ(events[0].data, "hello");
    }

    TEST_F(SseParserTests, MultiLineDataIsJoinedWithNewlines)
    {
        const auto events = parser_.feed("data: first\ndata: second\n\n");

        ASSERT_EQ(events.size(), 1);
        EXPECT_EQ(events[0].event, "message");
        EXPECT_EQ(events[0].data, "first\nsecond");
    }

    TEST_F(SseParserTests, CommentsAndRetryAreIgnored)
    {
        const auto events = parser_.feed(": ping\n\nretry: 3000\ndata: x\n\n");

        ASSERT_EQ(events.size(), 1);
        EXPECT_EQ(events[0].data, "x");
    }

    TEST_F(SseParserTests, CarriageReturnLineEndingsAreAccepted)
    {
        const auto crlf = parser_.feed("data: a\r\n\r\n");
        const auto cr = parser_.feed("data: b\r\r");

        ASSERT_EQ(crlf.size(), 1);
        EXPECT_EQ(crlf[0].data, "a");
        ASSERT_EQ(cr.size(), 1);
        EXPECT_EQ(cr[0].data, "b");
    }

    TEST_F(SseParserTests, SeveralEventsInOneChunk)
    {
        const auto events = parser_.feed("id: 1\ndata: a\n\nid: 2\ndata: b\n\n");

        ASSERT_EQ(events.size(), 2);
        EXPECT_EQ(events[0].id, "1");
        EXPECT_EQ(events[1].id, "2");
    }

    TEST_F(SseParserTests, ResetDropsPartialEvent)
    {
        parser_.feed("data: stale\n");
        parser_.reset();
        const auto events = parser_.feed("data: fresh\n\n");

        ASSERT_EQ(events.size(), 1);
        EXPECT_EQ(events[0].data, "fresh");
    }

    class StreamEventTests : public ::testing::Test
    {};

    TEST_F(StreamEventTests, JsonDataIsDecoded)
    {
        const auto event = toStreamEvent(SseEvent{.id = "3", .event = "chat:status", .data = R"({"sessionState":"running"})"});

        EXPECT_EQ(event.name, "chat:status");
        EXPECT_EQ(event.payload["sessionState"], "running");
        EXPECT_EQ(event.id, "3");
    }

    TEST_F(StreamEventTests, NonJsonDataIsKeptAsString)
    {
        const auto event = toStreamEvent(SseEvent{.event = "chat:message-chunk", .data = "plain text"});

        ASSERT_TRUE(event.payload.is_string());
        EXPECT_EQ(event.payload.get<std::string>(), "plain text");
    }

    TEST_F(StreamEventTests, IdentityIsTheEventIdOrTheReplayedMessageId)
    {
        EXPECT_EQ(eventIdentity(toStreamEvent(SseEvent{.id = "42", .event = "chat:message-chunk", .data = "x"})), "42");
        EXPECT_EQ(
            eventIdentity(
                toStreamEvent(SseEvent{.event = "chat:message-replay", .data = R"({"message":{"id":"m1"}})"})),
            "replay:m1");
        EXPECT_FALSE(eventIdentity(toStreamEvent(SseEvent{.event = "chat:message-chunk", .data = "x"})));
    }

    TEST_F(StreamEventTests, GenerationStateFollowsStatusChunksAndTerminalEvents)
    {
        EXPECT_EQ(
            generationStateOf(toStreamEvent(SseEvent{.event = "chat:init", .data = R"({"sessionState":"running"})"})),
            true);
        EXPECT_EQ(
            generationStateOf(toStreamEvent(SseEvent{.event = "chat:status", .data = R"({"sessionState":"idle"})"})),
            false);
        EXPECT_EQ(generationStateOf(toStreamEvent(SseEvent{.event = "chat:message-chunk", .data = "x"})), true);
        EXPECT_EQ(generationStateOf(toStreamEvent(SseEvent{.event = "chat:message-complete", .data = "{}"})), false);
        EXPECT_EQ(generationStateOf(toStreamEvent(SseEvent{.event = "chat:message-stopped"})), false);
        EXPECT_EQ(generationStateOf(toStreamEvent(SseEvent{.event = "chat:message-error"})), false);
        EXPECT_EQ(generationStateOf(toStreamEvent(SseEvent{.event = "chat:other", .data = "{}"})), std::nullopt);
    }
}
