#include <convo/delivery/config.hpp>

#include <algorithm>

namespace convo::delivery
{
    Config Config::from_core(const convo::config::Config &core)
    {
        Config cfg;

        // ---- server ---------------------------------------------------------

        if (core.has("server.address"))
        {
            cfg.address = core.getString("server.address", cfg.address);
        }

        if (core.has("server.port"))
        {
            auto v = core.getInt("server.port", cfg.port);
            cfg.port = static_cast<std::uint16_t>(std::clamp(v, 0, 65535));
        }

        if (core.has("server.io_threads"))
        {
            auto v = core.getInt("server.io_threads", static_cast<int>(cfg.ioThreads));
            cfg.ioThreads = static_cast<std::size_t>(std::max(1, v));
        }

        if (core.has("server.store_threads"))
        {
            auto v = core.getInt("server.store_threads", static_cast<int>(cfg.storeThreads));
            cfg.storeThreads = static_cast<std::size_t>(std::max(1, v));
        }

        if (core.has("server.shutdown_grace_ms"))
        {
            auto v = core.getInt("server.shutdown_grace_ms", static_cast<int>(cfg.shutdownGrace.count()));
            cfg.shutdownGrace = std::chrono::milliseconds(std::max(0, v));
        }

        // ---- delivery -------------------------------------------------------

        if (core.has("delivery.sync_interval_ms"))
        {
            auto v = core.getInt("delivery.sync_interval_ms", static_cast<int>(cfg.syncInterval.count()));
            cfg.syncInterval = std::chrono::milliseconds(std::max(100, v)); // min 100ms
        }

        if (core.has("delivery.subscriber_capacity"))
        {
            auto v = core.getInt("delivery.subscriber_capacity", static_cast<int>(cfg.subscriberCapacity));
            cfg.subscriberCapacity = static_cast<std::size_t>(std::max(16, v));
        }

        if (core.has("delivery.catchup_batch_size"))
        {
            auto v = core.getInt("delivery.catchup_batch_size", static_cast<int>(cfg.catchupBatchSize));
            cfg.catchupBatchSize = static_cast<std::size_t>(std::max(1, v));
        }

        if (core.has("delivery.max_message_size"))
        {
            auto v = core.getInt("delivery.max_message_size", static_cast<int>(cfg.maxMessageSize));
            cfg.maxMessageSize = static_cast<std::size_t>(std::max(1024, v)); // min 1 KiB
        }

        if (core.has("delivery.idle_timeout"))
        {
            auto v = core.getInt("delivery.idle_timeout", static_cast<int>(cfg.idleTimeout.count()));
            if (v <= 0)
                cfg.idleTimeout = std::chrono::seconds{0};
            else
                cfg.idleTimeout = std::chrono::seconds(std::max(5, v)); // min 5s
        }

        if (core.has("delivery.ping_interval"))
        {
            auto v = core.getInt("delivery.ping_interval", static_cast<int>(cfg.pingInterval.count()));
            if (v <= 0)
                cfg.pingInterval = std::chrono::seconds{0};
            else
                cfg.pingInterval = std::chrono::seconds(v);
        }

        if (core.has("delivery.enable_deflate"))
        {
            cfg.enablePerMessageDeflate = core.getBool("delivery.enable_deflate", cfg.enablePerMessageDeflate);
        }

        if (core.has("delivery.cursor_ttl_hours"))
        {
            auto v = core.getInt("delivery.cursor_ttl_hours", static_cast<int>(cfg.cursorTtl.count()));
            cfg.cursorTtl = std::chrono::hours(std::max(1, v));
        }

        if (core.has("delivery.log_retention_hours"))
        {
            auto v = core.getInt("delivery.log_retention_hours", static_cast<int>(cfg.logRetention.count()));
            cfg.logRetention = std::chrono::hours(std::max(0, v));
        }

        if (core.has("delivery.maintenance_interval"))
        {
            auto v = core.getInt("delivery.maintenance_interval",
                                 static_cast<int>(cfg.maintenanceInterval.count()));
            if (v <= 0)
                cfg.maintenanceInterval = std::chrono::seconds{0};
            else
                cfg.maintenanceInterval = std::chrono::seconds(std::max(10, v));
        }

        // ---- storage --------------------------------------------------------

        if (core.has("storage.log_path"))
        {
            cfg.logPath = core.getString("storage.log_path", cfg.logPath);
        }

        if (core.has("storage.cursor_path"))
        {
            cfg.cursorPath = core.getString("storage.cursor_path", cfg.cursorPath);
        }

        // A cursor still within its TTL must never fall below the retention floor.
        if (cfg.logRetention.count() > 0 && cfg.logRetention < cfg.cursorTtl)
        {
            cfg.logRetention = cfg.cursorTtl;
        }

        return cfg;
    }

} // namespace convo::delivery
