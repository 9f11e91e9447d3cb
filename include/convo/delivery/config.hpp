#ifndef CONVO_DELIVERY_CONFIG_HPP
#define CONVO_DELIVERY_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Delivery-specific configuration.
 *
 * @details
 * Wraps the core `convo::config::Config` into a strongly-typed structure used
 * by the server, the sessions and the maintenance tasks. Keeps all delivery
 * knobs in one place instead of scattering literals across the codebase.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <convo/config/Config.hpp>

namespace convo::delivery
{
    /**
     * @struct Config
     * @brief Tunables controlling listener, delivery and storage behaviour.
     */
    struct Config
    {
        // ---- server ---------------------------------------------------------

        std::string address = "0.0.0.0";

        /// 0 asks the OS for an ephemeral port.
        std::uint16_t port = 9090;

        /// Threads running the io_context.
        std::size_t ioThreads = 2;

        /// Workers for blocking store calls.
        std::size_t storeThreads = 4;

        /// Time given to sessions to flush and close on shutdown.
        std::chrono::milliseconds shutdownGrace{2000};

        // ---- delivery -------------------------------------------------------

        /// Period of the per-connection cursor write.
        std::chrono::milliseconds syncInterval{5000};

        /// Live events a slow connection may buffer before it is disconnected.
        std::size_t subscriberCapacity = 1024;

        /// Entries fetched per catch-up read.
        std::size_t catchupBatchSize = 256;

        /// Maximum accepted inbound frame size in bytes.
        std::size_t maxMessageSize = 64 * 1024; // 64 KiB

        /// Idle timeout after which a silent connection is closed (0 = off).
        std::chrono::seconds idleTimeout{60};

        /// Interval between server-initiated pings (0 = disabled).
        std::chrono::seconds pingInterval{30};

        /// Enable permessage-deflate compression if client supports it.
        bool enablePerMessageDeflate = false;

        /// Lifetime of a stored client cursor since its last write.
        std::chrono::hours cursorTtl{24 * 30};

        /// Log entries older than this are trimmed (0 = keep forever).
        /// Never shorter than cursorTtl once loaded through from_core().
        std::chrono::hours logRetention{24 * 30};

        /// Period of the retention / TTL sweep (0 = disabled).
        std::chrono::seconds maintenanceInterval{3600};

        // ---- storage --------------------------------------------------------

        std::string logPath = "convo_log.db";
        std::string cursorPath = "convo_cursors.db";

        /**
         * @brief Build a Config from the core JSON configuration.
         *
         * Expected keys (all optional):
         *  - server.address, server.port, server.io_threads,
         *    server.store_threads, server.shutdown_grace_ms
         *  - delivery.sync_interval_ms, delivery.subscriber_capacity,
         *    delivery.catchup_batch_size, delivery.max_message_size,
         *    delivery.idle_timeout, delivery.ping_interval,
         *    delivery.enable_deflate, delivery.cursor_ttl_hours,
         *    delivery.log_retention_hours, delivery.maintenance_interval
         *  - storage.log_path, storage.cursor_path
         */
        static Config from_core(const convo::config::Config &core);
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_CONFIG_HPP
