/**
 * @file test_message_publisher.cpp
 * @brief Append-then-fan-out and ephemeral signals.
 */

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <convo/delivery/MemoryConversationLog.hpp>
#include <convo/delivery/MessagePublisher.hpp>

#include "failing_stores.hpp"

using namespace convo::delivery;
using convo::test::FlakyLog;

class MessagePublisherTest : public ::testing::Test
{
protected:
    std::shared_ptr<MemoryConversationLog> memory_ = std::make_shared<MemoryConversationLog>();
    std::shared_ptr<FlakyLog> log_ = std::make_shared<FlakyLog>(memory_);
    std::shared_ptr<BroadcastRegistry> registry_ = BroadcastRegistry::create();
    DeliveryMetrics metrics_;
    MessagePublisher publisher_{log_, registry_, &metrics_};
};

// =============================================================================
// publish
// =============================================================================

TEST_F(MessagePublisherTest, AppendsThenFansOut)
{
    auto sub = registry_->subscribe("c", 16);

    const auto id = publisher_.publish("c", R"({"text":"hi"})");

    auto stored = memory_->read_since("c", kBeginning);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].stream_entry_id, id);

    auto live = sub->poll();
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(live->kind, EventKind::Message);
    EXPECT_EQ(live->stream_entry_id, id);
    EXPECT_EQ(live->payload, R"({"text":"hi"})");
    EXPECT_EQ(metrics_.publishes_total.load(), 1u);
}

TEST_F(MessagePublisherTest, LiveEventCarriesTheStoredTimestamp)
{
    // A log clock far from wall time makes any re-stamping visible.
    auto fixedLog = std::make_shared<MemoryConversationLog>(
        []
        { return from_epoch_ms(1700000000000); });
    MessagePublisher publisher{fixedLog, registry_, &metrics_};
    auto sub = registry_->subscribe("c", 16);

    const auto id = publisher.publish("c", "x");

    auto live = sub->poll();
    ASSERT_TRUE(live.has_value());
    auto stored = fixedLog->read_since("c", kBeginning);
    ASSERT_EQ(stored.size(), 1u);

    EXPECT_EQ(live->stream_entry_id, id);
    EXPECT_EQ(to_epoch_ms(live->produced_at), 1700000000000);
    EXPECT_EQ(live->produced_at, stored[0].produced_at);
}

TEST_F(MessagePublisherTest, FailedAppendPublishesNothingAndRethrows)
{
    auto sub = registry_->subscribe("c", 16);
    log_->failAppend = true;

    EXPECT_THROW(publisher_.publish("c", "x"), StoreError);

    EXPECT_EQ(sub->pending(), 0u);
    EXPECT_EQ(memory_->size(), 0u);
    EXPECT_EQ(metrics_.publish_failures_total.load(), 1u);
    EXPECT_EQ(metrics_.publishes_total.load(), 0u);
}

TEST_F(MessagePublisherTest, LiveOrderMatchesLogOrderUnderContention)
{
    auto sub = registry_->subscribe("c", 10000);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([this]
                             {
                                 for (int i = 0; i < 200; ++i)
                                     publisher_.publish("c", "m"); });
    }
    for (auto &t : threads)
        t.join();

    auto stored = memory_->read_since("c", kBeginning);
    ASSERT_EQ(stored.size(), 800u);
    for (const auto &ev : stored)
    {
        auto live = sub->poll();
        ASSERT_TRUE(live.has_value());
        EXPECT_EQ(live->stream_entry_id, ev.stream_entry_id);
    }
}

// =============================================================================
// signal
// =============================================================================

TEST_F(MessagePublisherTest, SignalSkipsTheLog)
{
    auto sub = registry_->subscribe("c", 16);

    EXPECT_EQ(publisher_.signal("c", R"({"user_id":"u"})", "phone"), 1u);

    EXPECT_EQ(memory_->size(), 0u);
    auto ev = sub->poll();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Signal);
    EXPECT_EQ(ev->origin_client_id, "phone");
    EXPECT_TRUE(ev->stream_entry_id.is_beginning());
}
