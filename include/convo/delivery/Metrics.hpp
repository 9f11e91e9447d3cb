#ifndef CONVO_DELIVERY_METRICS_HPP
#define CONVO_DELIVERY_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Prometheus-style counters for the delivery service.
 *
 * All fields are 64-bit atomics and can be incremented from any thread
 * without external synchronization. The HTTP front door serves
 * `render_prometheus()` on `GET /metrics`.
 */

#include <atomic>
#include <cstdint>
#include <string>

namespace convo::delivery
{
    struct DeliveryMetrics
    {
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> connections_active{0};
        std::atomic<std::uint64_t> connections_rejected_total{0};

        std::atomic<std::uint64_t> catchup_events_total{0};
        std::atomic<std::uint64_t> live_events_total{0};
        std::atomic<std::uint64_t> duplicates_suppressed_total{0};
        std::atomic<std::uint64_t> signals_out_total{0};
        std::atomic<std::uint64_t> stale_cursor_resets_total{0};

        std::atomic<std::uint64_t> frames_in_total{0};
        std::atomic<std::uint64_t> frames_malformed_total{0};

        std::atomic<std::uint64_t> overflow_disconnects_total{0};
        std::atomic<std::uint64_t> catchup_failures_total{0};

        std::atomic<std::uint64_t> sync_writes_total{0};
        std::atomic<std::uint64_t> sync_write_failures_total{0};

        std::atomic<std::uint64_t> publishes_total{0};
        std::atomic<std::uint64_t> publish_failures_total{0};

        std::atomic<std::uint64_t> log_entries_trimmed_total{0};
        std::atomic<std::uint64_t> cursors_expired_total{0};

        /// Text exposition format v0.0.4, served as "text/plain; version=0.0.4".
        [[nodiscard]] std::string render_prometheus() const;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_METRICS_HPP
