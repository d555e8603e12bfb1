//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_sse_parser.cpp
// Purpose: GoogleTests for incremental text/event-stream decoding
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/web/SseEventParser.h"

using namespace toolhost::web;

TEST(SseEventParser, SingleEventDefaultsToMessage) {
    SseEventParser p;
    auto events = p.Feed("data: {\"jsonrpc\":\"2.0\"}\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event, "message");
    EXPECT_EQ(events[0].data, "{\"jsonrpc\":\"2.0\"}");
}

TEST(SseEventParser, EndpointEventAndIds) {
    SseEventParser p;
    auto events = p.Feed("event: endpoint\nid: 7\ndata: /messages?sessionId=1\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event, "endpoint");
    EXPECT_EQ(events[0].id, "7");
    EXPECT_EQ(p.LastEventId(), "7");

    // Event type resets after dispatch, the id carries over.
    events = p.Feed("data: x\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event, "message");
    EXPECT_EQ(events[0].id, "7");
}

TEST(SseEventParser, ChunksSplitAnywhere) {
    const std::string stream = "event: message\r\ndata: line one\r\ndata:line two\r\n\r\n: comment\r\ndata: z\r\r";
    SseEventParser p;
    std::vector<SseEvent> all;
    for (char c : stream) {
        auto got = p.Feed(std::string(1, c));
        all.insert(all.end(), got.begin(), got.end());
    }
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].data, "line one\nline two");
    EXPECT_EQ(all[1].data, "z");
}

TEST(SseEventParser, CommentsRetryAndEmptyEvents) {
    SseEventParser p;
    auto events = p.Feed(": keepalive\n\nretry: 1000\nunknown: x\n\nevent: ping\n\n");
    EXPECT_TRUE(events.empty());
    events = p.Feed("data\n\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "");
}

TEST(SseEventParser, FinishFlushesPendingEvent) {
    SseEventParser p;
    EXPECT_TRUE(p.Feed("data: tail").empty());
    auto events = p.Finish();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "tail");
    EXPECT_TRUE(p.Finish().empty());
}
