#ifndef CONVO_DELIVERY_MEMORY_SYNC_STATE_STORE_HPP
#define CONVO_DELIVERY_MEMORY_SYNC_STATE_STORE_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include <convo/delivery/SyncStateStore.hpp>

namespace convo::delivery
{
    class MemorySyncStateStore : public ISyncStateStore
    {
    public:
        using Clock = std::function<SystemClock::time_point()>;

        explicit MemorySyncStateStore(std::chrono::seconds ttl = std::chrono::hours{24 * 30},
                                      Clock clock = {});

        [[nodiscard]] std::optional<ClientSyncState> get(const std::string &user_id,
                                                         const std::string &client_id) override;

        [[nodiscard]] std::optional<ClientSyncState> get(const std::string &user_id,
                                                         const std::string &client_id,
                                                         const std::string &conversation_id) override;

        void put(const ClientSyncState &state) override;

        std::size_t purge_expired() override;

        /// Records currently held, expired ones included.
        [[nodiscard]] std::size_t size() const;

    private:
        struct Record
        {
            ClientSyncState state;
            SystemClock::time_point expires_at;
        };

        using Key = std::tuple<std::string, std::string, std::string>;

        std::chrono::seconds ttl_;
        Clock clock_;
        mutable std::mutex mutex_;
        std::map<Key, Record> records_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_MEMORY_SYNC_STATE_STORE_HPP
