/**
 * @file test_http_target.cpp
 * @brief Request-target parsing used by the HTTP front.
 */

#include <gtest/gtest.h>

#include <string>

#include <convo/delivery/http_session.hpp>

using namespace convo::delivery;

// =============================================================================
// url_decode
// =============================================================================

TEST(UrlDecodeTest, DecodesEscapesAndPlus)
{
    EXPECT_EQ(url_decode("a%20b+c"), "a b c");
    EXPECT_EQ(url_decode("%41%4a%4A"), "AJJ");
    EXPECT_EQ(url_decode("plain"), "plain");
    EXPECT_EQ(url_decode(""), "");
}

TEST(UrlDecodeTest, RejectsBrokenEscapes)
{
    EXPECT_FALSE(url_decode("%").has_value());
    EXPECT_FALSE(url_decode("%4").has_value());
    EXPECT_FALSE(url_decode("abc%zz").has_value());
    EXPECT_FALSE(url_decode("%g1").has_value());
}

// =============================================================================
// parse_target
// =============================================================================

TEST(ParseTargetTest, SplitsPathAndQuery)
{
    auto t = parse_target("/ws?conversation_id=conv-1&user_id=alice&client_id=my%20phone");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->path, "/ws");
    EXPECT_EQ(t->param("conversation_id"), "conv-1");
    EXPECT_EQ(t->param("user_id"), "alice");
    EXPECT_EQ(t->param("client_id"), "my phone");
    EXPECT_EQ(t->param("token"), "");
}

TEST(ParseTargetTest, PathWithoutQuery)
{
    auto t = parse_target("/healthz");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->path, "/healthz");
    EXPECT_TRUE(t->params.empty());
}

TEST(ParseTargetTest, FirstOccurrenceWinsAndEmptyPairsAreSkipped)
{
    auto t = parse_target("/ws?&user_id=a&&user_id=b&flag&=x");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->param("user_id"), "a");
    EXPECT_EQ(t->params.count("flag"), 1u);
    EXPECT_EQ(t->param("flag"), "");
}

TEST(ParseTargetTest, BadEscapeFailsTheWholeTarget)
{
    EXPECT_FALSE(parse_target("/ws?user_id=%zz").has_value());
    EXPECT_FALSE(parse_target("/w%s").has_value());
}

// =============================================================================
// match_events_path
// =============================================================================

TEST(EventsPathTest, ExtractsConversationId)
{
    EXPECT_EQ(match_events_path("/conversations/conv-1/events"), "conv-1");
}

TEST(EventsPathTest, RejectsOtherShapes)
{
    EXPECT_FALSE(match_events_path("/conversations//events").has_value());
    EXPECT_FALSE(match_events_path("/conversations/a/b/events").has_value());
    EXPECT_FALSE(match_events_path("/conversations/conv-1").has_value());
    EXPECT_FALSE(match_events_path("/conversation/conv-1/events").has_value());
    EXPECT_FALSE(match_events_path("/conversations/conv-1/events/").has_value());
    EXPECT_FALSE(match_events_path("/").has_value());
}

TEST(EventsPathTest, RejectsOverlongIds)
{
    const std::string id(kMaxIdLength + 1, 'x');
    EXPECT_FALSE(match_events_path("/conversations/" + id + "/events").has_value());

    const std::string ok(kMaxIdLength, 'x');
    EXPECT_EQ(match_events_path("/conversations/" + ok + "/events"), ok);
}

TEST(EventsPathTest, RejectsNonUtf8Ids)
{
    EXPECT_FALSE(match_events_path("/conversations/\xff/events").has_value());
    EXPECT_EQ(match_events_path("/conversations/caf\xC3\xA9/events"), "caf\xC3\xA9");
}
