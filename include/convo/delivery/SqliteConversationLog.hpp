#ifndef CONVO_DELIVERY_SQLITE_CONVERSATION_LOG_HPP
#define CONVO_DELIVERY_SQLITE_CONVERSATION_LOG_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <convo/delivery/ConversationLog.hpp>

struct sqlite3;

namespace convo::delivery
{
    /**
     * @brief SQLite (WAL) implementation of the conversation log.
     *
     * Entries are keyed by (conversation_id, entry_ms, entry_seq); per
     * conversation retention floors live in a side table. All statements run
     * under one mutex, so a single instance is safe to share between threads.
     */
    class SqliteConversationLog : public IConversationLog
    {
    public:
        using Clock = std::function<SystemClock::time_point()>;

        explicit SqliteConversationLog(const std::string &db_path, Clock clock = {});
        ~SqliteConversationLog() override;

        SqliteConversationLog(const SqliteConversationLog &) = delete;
        SqliteConversationLog &operator=(const SqliteConversationLog &) = delete;
        SqliteConversationLog(SqliteConversationLog &&) = delete;
        SqliteConversationLog &operator=(SqliteConversationLog &&) = delete;

        BroadcastEvent append_entry(const std::string &conversation_id,
                                    const std::string &payload) override;

        [[nodiscard]] std::vector<BroadcastEvent> read_since(
            const std::string &conversation_id,
            const StreamEntryId &after_id,
            const std::optional<std::size_t> &limit = std::nullopt) override;

        [[nodiscard]] std::optional<StreamEntryId> latest_id(const std::string &conversation_id) override;

        [[nodiscard]] StreamEntryId retention_floor(const std::string &conversation_id) override;

        std::size_t trim_before(SystemClock::time_point cutoff) override;

    private:
        sqlite3 *db_{nullptr};
        Clock clock_;
        std::mutex mutex_;

        void init_schema();
        void exec(const char *sql, const char *stage);
        std::optional<StreamEntryId> latest_id_locked(const std::string &conversation_id);
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_SQLITE_CONVERSATION_LOG_HPP
