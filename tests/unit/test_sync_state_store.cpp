/**
 * @file test_sync_state_store.cpp
 * @brief Per-device cursor persistence: lookups, non-regression and TTL.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include <convo/delivery/MemorySyncStateStore.hpp>
#include <convo/delivery/SqliteSyncStateStore.hpp>

#include "test_support.hpp"

using namespace convo::delivery;
using namespace std::chrono_literals;
using convo::test::ManualClock;
using convo::test::TempDbPath;

namespace
{
    enum class Backend
    {
        Memory,
        Sqlite
    };
} // namespace

class SyncStateStoreTest : public ::testing::TestWithParam<Backend>
{
protected:
    static constexpr std::chrono::seconds kTtl{3600};

    void SetUp() override
    {
        if (GetParam() == Backend::Memory)
        {
            store_ = std::make_shared<MemorySyncStateStore>(kTtl, clock_);
        }
        else
        {
            db_ = std::make_unique<TempDbPath>("cursors");
            store_ = std::make_shared<SqliteSyncStateStore>(db_->str(), kTtl, clock_);
        }
    }

    ClientSyncState state(const std::string &conv, StreamEntryId id)
    {
        ClientSyncState s;
        s.user_id = "alice";
        s.client_id = "phone";
        s.conversation_id = conv;
        s.last_message_id = id;
        s.last_sync_at = clock_();
        return s;
    }

    ManualClock clock_;
    std::unique_ptr<TempDbPath> db_;
    std::shared_ptr<ISyncStateStore> store_;
};

// =============================================================================
// put / get
// =============================================================================

TEST_P(SyncStateStoreTest, UnknownDeviceHasNoCursor)
{
    EXPECT_FALSE(store_->get("alice", "phone").has_value());
    EXPECT_FALSE(store_->get("alice", "phone", "c").has_value());
}

TEST_P(SyncStateStoreTest, PutThenGet)
{
    store_->put(state("c", StreamEntryId(100, 2)));

    auto got = store_->get("alice", "phone", "c");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->user_id, "alice");
    EXPECT_EQ(got->client_id, "phone");
    EXPECT_EQ(got->conversation_id, "c");
    EXPECT_EQ(got->last_message_id, StreamEntryId(100, 2));
    EXPECT_EQ(to_epoch_ms(got->last_sync_at), clock_.now_ms());
}

TEST_P(SyncStateStoreTest, CursorsAreScopedPerConversationAndDevice)
{
    store_->put(state("c1", StreamEntryId(10, 0)));
    store_->put(state("c2", StreamEntryId(20, 0)));

    auto other = state("c1", StreamEntryId(99, 0));
    other.client_id = "laptop";
    store_->put(other);

    EXPECT_EQ(store_->get("alice", "phone", "c1")->last_message_id, StreamEntryId(10, 0));
    EXPECT_EQ(store_->get("alice", "phone", "c2")->last_message_id, StreamEntryId(20, 0));
    EXPECT_EQ(store_->get("alice", "laptop", "c1")->last_message_id, StreamEntryId(99, 0));
    EXPECT_FALSE(store_->get("bob", "phone", "c1").has_value());
}

TEST_P(SyncStateStoreTest, DeviceLookupReturnsMostRecentlySynced)
{
    store_->put(state("c1", StreamEntryId(10, 0)));
    clock_.advance(1s);
    store_->put(state("c2", StreamEntryId(5, 0)));

    auto got = store_->get("alice", "phone");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->conversation_id, "c2");
}

// =============================================================================
// Non-regression
// =============================================================================

TEST_P(SyncStateStoreTest, CursorNeverMovesBackwards)
{
    store_->put(state("c", StreamEntryId(100, 5)));
    clock_.advance(1s);
    store_->put(state("c", StreamEntryId(100, 4)));
    store_->put(state("c", StreamEntryId(90, 9)));

    auto got = store_->get("alice", "phone", "c");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->last_message_id, StreamEntryId(100, 5));
    // The write still counts as a sync.
    EXPECT_EQ(to_epoch_ms(got->last_sync_at), clock_.now_ms());
}

TEST_P(SyncStateStoreTest, CursorAdvances)
{
    store_->put(state("c", StreamEntryId(100, 5)));
    store_->put(state("c", StreamEntryId(100, 6)));
    store_->put(state("c", StreamEntryId(200, 0)));

    EXPECT_EQ(store_->get("alice", "phone", "c")->last_message_id, StreamEntryId(200, 0));
}

// =============================================================================
// TTL
// =============================================================================

TEST_P(SyncStateStoreTest, CursorExpiresAfterTtl)
{
    store_->put(state("c", StreamEntryId(100, 0)));

    clock_.advance(kTtl - 1s);
    EXPECT_TRUE(store_->get("alice", "phone", "c").has_value());

    clock_.advance(2s);
    EXPECT_FALSE(store_->get("alice", "phone", "c").has_value());
    EXPECT_FALSE(store_->get("alice", "phone").has_value());
}

TEST_P(SyncStateStoreTest, WriteRefreshesTtl)
{
    store_->put(state("c", StreamEntryId(100, 0)));
    clock_.advance(kTtl - 10s);
    store_->put(state("c", StreamEntryId(100, 0)));
    clock_.advance(30s);

    EXPECT_TRUE(store_->get("alice", "phone", "c").has_value());
}

TEST_P(SyncStateStoreTest, ExpiredCursorMayBeReplacedByALowerOne)
{
    store_->put(state("c", StreamEntryId(500, 0)));
    clock_.advance(kTtl + 1s);
    store_->put(state("c", StreamEntryId(10, 0)));

    EXPECT_EQ(store_->get("alice", "phone", "c")->last_message_id, StreamEntryId(10, 0));
}

TEST_P(SyncStateStoreTest, PurgeRemovesOnlyExpired)
{
    store_->put(state("old", StreamEntryId(1, 0)));
    clock_.advance(kTtl / 2);
    store_->put(state("new", StreamEntryId(2, 0)));
    clock_.advance(kTtl / 2 + 1s);

    EXPECT_EQ(store_->purge_expired(), 1u);
    EXPECT_EQ(store_->purge_expired(), 0u);
    EXPECT_FALSE(store_->get("alice", "phone", "old").has_value());
    EXPECT_TRUE(store_->get("alice", "phone", "new").has_value());
}

INSTANTIATE_TEST_SUITE_P(Backends,
                         SyncStateStoreTest,
                         ::testing::Values(Backend::Memory, Backend::Sqlite),
                         [](const ::testing::TestParamInfo<Backend> &info)
                         {
                             return info.param == Backend::Memory ? std::string("Memory") : std::string("Sqlite");
                         });

// =============================================================================
// SQLite specifics
// =============================================================================

TEST(SqliteSyncStateStoreTest, SurvivesReopen)
{
    TempDbPath db("cursors_reopen");
    ManualClock clock;

    {
        SqliteSyncStateStore store(db.str(), std::chrono::hours(1), clock);
        ClientSyncState s{"phone", "alice", "c", StreamEntryId(42, 1), clock()};
        store.put(s);
    }

    SqliteSyncStateStore reopened(db.str(), std::chrono::hours(1), clock);
    auto got = reopened.get("alice", "phone", "c");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->last_message_id, StreamEntryId(42, 1));
}
