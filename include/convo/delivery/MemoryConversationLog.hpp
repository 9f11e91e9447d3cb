#ifndef CONVO_DELIVERY_MEMORY_CONVERSATION_LOG_HPP
#define CONVO_DELIVERY_MEMORY_CONVERSATION_LOG_HPP

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <convo/delivery/ConversationLog.hpp>

namespace convo::delivery
{
    /**
     * @brief In-process conversation log.
     *
     * Same contract as the SQLite log minus durability. Used by tests and by
     * single-process development setups (`storage.log_path` = ":memory:").
     */
    class MemoryConversationLog : public IConversationLog
    {
    public:
        using Clock = std::function<SystemClock::time_point()>;

        explicit MemoryConversationLog(Clock clock = {});

        BroadcastEvent append_entry(const std::string &conversation_id,
                                    const std::string &payload) override;

        [[nodiscard]] std::vector<BroadcastEvent> read_since(
            const std::string &conversation_id,
            const StreamEntryId &after_id,
            const std::optional<std::size_t> &limit = std::nullopt) override;

        [[nodiscard]] std::optional<StreamEntryId> latest_id(const std::string &conversation_id) override;

        [[nodiscard]] StreamEntryId retention_floor(const std::string &conversation_id) override;

        std::size_t trim_before(SystemClock::time_point cutoff) override;

        /// Number of retained entries across all conversations.
        [[nodiscard]] std::size_t size() const;

    private:
        struct Stream
        {
            std::deque<BroadcastEvent> entries;
            StreamEntryId last;
            StreamEntryId floor;
        };

        Clock clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Stream> streams_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_MEMORY_CONVERSATION_LOG_HPP
