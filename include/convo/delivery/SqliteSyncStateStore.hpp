#ifndef CONVO_DELIVERY_SQLITE_SYNC_STATE_STORE_HPP
#define CONVO_DELIVERY_SQLITE_SYNC_STATE_STORE_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <convo/delivery/SyncStateStore.hpp>

struct sqlite3;

namespace convo::delivery
{
    class SqliteSyncStateStore : public ISyncStateStore
    {
    public:
        using Clock = std::function<SystemClock::time_point()>;

        SqliteSyncStateStore(const std::string &db_path,
                             std::chrono::seconds ttl,
                             Clock clock = {});
        ~SqliteSyncStateStore() override;

        SqliteSyncStateStore(const SqliteSyncStateStore &) = delete;
        SqliteSyncStateStore &operator=(const SqliteSyncStateStore &) = delete;
        SqliteSyncStateStore(SqliteSyncStateStore &&) = delete;
        SqliteSyncStateStore &operator=(SqliteSyncStateStore &&) = delete;

        [[nodiscard]] std::optional<ClientSyncState> get(const std::string &user_id,
                                                         const std::string &client_id) override;

        [[nodiscard]] std::optional<ClientSyncState> get(const std::string &user_id,
                                                         const std::string &client_id,
                                                         const std::string &conversation_id) override;

        void put(const ClientSyncState &state) override;

        std::size_t purge_expired() override;

    private:
        sqlite3 *db_{nullptr};
        std::chrono::seconds ttl_;
        Clock clock_;
        std::mutex mutex_;

        void init_schema();
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_SQLITE_SYNC_STATE_STORE_HPP
