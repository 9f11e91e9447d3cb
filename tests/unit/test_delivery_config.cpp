/**
 * @file test_delivery_config.cpp
 * @brief Mapping of the JSON configuration onto delivery tunables.
 */

#include <gtest/gtest.h>

#include <chrono>

#include <convo/delivery/config.hpp>

using convo::delivery::Config;
using namespace std::chrono_literals;

namespace
{
    Config from(nlohmann::json j)
    {
        return Config::from_core(convo::config::Config{std::move(j)});
    }
} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(DeliveryConfigTest, EmptyConfigKeepsDefaults)
{
    const Config cfg = from(nlohmann::json::object());
    const Config defaults;

    EXPECT_EQ(cfg.address, defaults.address);
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.syncInterval, 5000ms);
    EXPECT_EQ(cfg.subscriberCapacity, 1024u);
    EXPECT_EQ(cfg.catchupBatchSize, 256u);
    EXPECT_EQ(cfg.cursorTtl, std::chrono::hours(24 * 30));
    EXPECT_EQ(cfg.logRetention, std::chrono::hours(24 * 30));
    EXPECT_GE(defaults.logRetention, defaults.cursorTtl);
    EXPECT_EQ(cfg.logPath, "convo_log.db");
    EXPECT_EQ(cfg.cursorPath, "convo_cursors.db");
}

// =============================================================================
// Mapping
// =============================================================================

TEST(DeliveryConfigTest, ReadsEveryKey)
{
    const Config cfg = from({
        {"server", {{"address", "127.0.0.1"}, {"port", 0}, {"io_threads", 3}, {"store_threads", 6}, {"shutdown_grace_ms", 500}}},
        {"delivery", {{"sync_interval_ms", 250}, {"subscriber_capacity", 64}, {"catchup_batch_size", 10}, {"max_message_size", 4096}, {"idle_timeout", 20}, {"ping_interval", 7}, {"enable_deflate", true}, {"cursor_ttl_hours", 48}, {"log_retention_hours", 0}, {"maintenance_interval", 60}}},
        {"storage", {{"log_path", ":memory:"}, {"cursor_path", "/tmp/c.db"}}},
    });

    EXPECT_EQ(cfg.address, "127.0.0.1");
    EXPECT_EQ(cfg.port, 0);
    EXPECT_EQ(cfg.ioThreads, 3u);
    EXPECT_EQ(cfg.storeThreads, 6u);
    EXPECT_EQ(cfg.shutdownGrace, 500ms);
    EXPECT_EQ(cfg.syncInterval, 250ms);
    EXPECT_EQ(cfg.subscriberCapacity, 64u);
    EXPECT_EQ(cfg.catchupBatchSize, 10u);
    EXPECT_EQ(cfg.maxMessageSize, 4096u);
    EXPECT_EQ(cfg.idleTimeout, 20s);
    EXPECT_EQ(cfg.pingInterval, 7s);
    EXPECT_TRUE(cfg.enablePerMessageDeflate);
    EXPECT_EQ(cfg.cursorTtl, 48h);
    EXPECT_EQ(cfg.logRetention, 0h);
    EXPECT_EQ(cfg.maintenanceInterval, 60s);
    EXPECT_EQ(cfg.logPath, ":memory:");
    EXPECT_EQ(cfg.cursorPath, "/tmp/c.db");
}

// =============================================================================
// Clamping
// =============================================================================

TEST(DeliveryConfigTest, ClampsOutOfRangeValues)
{
    const Config cfg = from({
        {"server", {{"port", 70000}, {"io_threads", 0}, {"store_threads", -2}}},
        {"delivery", {{"sync_interval_ms", 1}, {"subscriber_capacity", 2}, {"catchup_batch_size", 0}, {"max_message_size", 10}, {"idle_timeout", 2}, {"cursor_ttl_hours", 0}, {"log_retention_hours", -5}, {"maintenance_interval", 3}}},
    });

    EXPECT_EQ(cfg.port, 65535);
    EXPECT_EQ(cfg.ioThreads, 1u);
    EXPECT_EQ(cfg.storeThreads, 1u);
    EXPECT_EQ(cfg.syncInterval, 100ms);
    EXPECT_EQ(cfg.subscriberCapacity, 16u);
    EXPECT_EQ(cfg.catchupBatchSize, 1u);
    EXPECT_EQ(cfg.maxMessageSize, 1024u);
    EXPECT_EQ(cfg.idleTimeout, 5s);
    EXPECT_EQ(cfg.cursorTtl, 1h);
    EXPECT_EQ(cfg.logRetention, 0h);
    EXPECT_EQ(cfg.maintenanceInterval, 10s);
}

TEST(DeliveryConfigTest, RetentionNeverShorterThanCursorTtl)
{
    const Config shorter = from({
        {"delivery", {{"cursor_ttl_hours", 720}, {"log_retention_hours", 168}}},
    });
    EXPECT_EQ(shorter.logRetention, 720h);

    const Config longer = from({
        {"delivery", {{"cursor_ttl_hours", 24}, {"log_retention_hours", 168}}},
    });
    EXPECT_EQ(longer.logRetention, 168h);

    const Config forever = from({
        {"delivery", {{"cursor_ttl_hours", 720}, {"log_retention_hours", 0}}},
    });
    EXPECT_EQ(forever.logRetention, 0h);
}

TEST(DeliveryConfigTest, ZeroOrNegativeDisablesTimers)
{
    const Config cfg = from({
        {"delivery", {{"idle_timeout", 0}, {"ping_interval", -1}, {"maintenance_interval", 0}}},
    });

    EXPECT_EQ(cfg.idleTimeout, 0s);
    EXPECT_EQ(cfg.pingInterval, 0s);
    EXPECT_EQ(cfg.maintenanceInterval, 0s);
}

TEST(DeliveryConfigTest, WrongTypesAreIgnored)
{
    const Config cfg = from({
        {"server", {{"port", "9091"}}},
        {"delivery", {{"enable_deflate", "yes"}}},
    });

    EXPECT_EQ(cfg.port, 9090);
    EXPECT_FALSE(cfg.enablePerMessageDeflate);
}
