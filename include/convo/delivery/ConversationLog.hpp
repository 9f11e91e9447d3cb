#ifndef CONVO_DELIVERY_CONVERSATION_LOG_HPP
#define CONVO_DELIVERY_CONVERSATION_LOG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    /**
     * @brief Durable, append-only, per-conversation ordered event log.
     *
     * Expected semantics:
     *  - append_entry(conv, payload): assigns an id strictly greater than
     *    every earlier id of `conv`, persists the entry and returns it exactly
     *    as read_since() will later report it. Throws StoreError on failure;
     *    a throwing append never leaves a visible entry behind.
     *  - read_since(conv, after, limit): entries with id STRICTLY > after,
     *    oldest-first, at most `limit` of them when a limit is given.
     *    An empty result is not an error.
     *  - retention_floor(conv): highest id ever trimmed, kBeginning if none.
     *    A cursor below the floor has lost entries for good.
     *  - trim_before(cutoff): removes entries whose id time is older than
     *    cutoff, raising retention floors accordingly.
     */
    class IConversationLog
    {
    public:
        virtual ~IConversationLog() = default;

        virtual BroadcastEvent append_entry(const std::string &conversation_id,
                                            const std::string &payload) = 0;

        StreamEntryId append(const std::string &conversation_id, const std::string &payload)
        {
            return append_entry(conversation_id, payload).stream_entry_id;
        }

        virtual std::vector<BroadcastEvent> read_since(
            const std::string &conversation_id,
            const StreamEntryId &after_id,
            const std::optional<std::size_t> &limit = std::nullopt) = 0;

        virtual std::optional<StreamEntryId> latest_id(const std::string &conversation_id) = 0;

        virtual StreamEntryId retention_floor(const std::string &conversation_id) = 0;

        virtual std::size_t trim_before(SystemClock::time_point cutoff) = 0;
    };

    /// Next id after `last` for an append happening at `now_ms`.
    [[nodiscard]] inline StreamEntryId next_entry_id(const StreamEntryId &last,
                                                     std::uint64_t now_ms) noexcept
    {
        if (now_ms > last.ms())
            return StreamEntryId{now_ms, 0};
        return StreamEntryId{last.ms(), last.seq() + 1};
    }

} // namespace convo::delivery

#endif // CONVO_DELIVERY_CONVERSATION_LOG_HPP
