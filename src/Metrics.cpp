#include <convo/delivery/Metrics.hpp>

#include <sstream>

namespace convo::delivery
{
    namespace
    {
        void emit(std::ostringstream &os,
                  const char *name,
                  const char *type,
                  const char *help,
                  const std::atomic<std::uint64_t> &value)
        {
            os << "# HELP convo_delivery_" << name << ' ' << help << "\n"
               << "# TYPE convo_delivery_" << name << ' ' << type << "\n"
               << "convo_delivery_" << name << ' ' << value.load() << "\n\n";
        }
    } // namespace

    std::string DeliveryMetrics::render_prometheus() const
    {
        std::ostringstream os;

        emit(os, "connections_total", "counter", "Total WebSocket connections upgraded", connections_total);
        emit(os, "connections_active", "gauge", "Current live WebSocket connections", connections_active);
        emit(os, "connections_rejected_total", "counter",
             "Upgrade requests refused by validation or access policy", connections_rejected_total);

        emit(os, "catchup_events_total", "counter", "Events replayed from the log", catchup_events_total);
        emit(os, "live_events_total", "counter", "Events forwarded from the live bus", live_events_total);
        emit(os, "duplicates_suppressed_total", "counter",
             "Live events dropped because catch-up already sent them", duplicates_suppressed_total);
        emit(os, "signals_out_total", "counter", "Ephemeral signals forwarded to clients", signals_out_total);
        emit(os, "stale_cursor_resets_total", "counter",
             "Sessions whose cursor fell below the retention floor", stale_cursor_resets_total);

        emit(os, "frames_in_total", "counter", "Inbound client frames", frames_in_total);
        emit(os, "frames_malformed_total", "counter", "Inbound frames ignored as malformed or unknown",
             frames_malformed_total);

        emit(os, "overflow_disconnects_total", "counter",
             "Sessions closed because their live queue overflowed", overflow_disconnects_total);
        emit(os, "catchup_failures_total", "counter",
             "Sessions closed because cursor load or catch-up failed", catchup_failures_total);

        emit(os, "sync_writes_total", "counter", "Cursor writes completed", sync_writes_total);
        emit(os, "sync_write_failures_total", "counter", "Cursor writes that failed", sync_write_failures_total);

        emit(os, "publishes_total", "counter", "Events appended and fanned out", publishes_total);
        emit(os, "publish_failures_total", "counter", "Publishes rejected by the log", publish_failures_total);

        emit(os, "log_entries_trimmed_total", "counter", "Log entries removed by retention",
             log_entries_trimmed_total);
        emit(os, "cursors_expired_total", "counter", "Client cursors purged after TTL", cursors_expired_total);

        return os.str();
    }

} // namespace convo::delivery
