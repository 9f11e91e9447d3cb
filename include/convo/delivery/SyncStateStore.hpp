#ifndef CONVO_DELIVERY_SYNC_STATE_STORE_HPP
#define CONVO_DELIVERY_SYNC_STATE_STORE_HPP

#include <cstddef>
#include <optional>
#include <string>

#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    /**
     * @brief Persisted per-device read cursors with TTL.
     *
     *  - get(user, client): latest synced live record of that client
     *    identity, whatever the conversation; nullopt if never seen or expired.
     *  - get(user, client, conversation): the record sessions resume from.
     *  - put(state): upsert and refresh TTL. A live record's cursor never
     *    moves backwards; an expired record is replaced outright.
     *  - purge_expired(): drop records past their TTL.
     *
     * Implementations throw StoreError on backend failure.
     */
    class ISyncStateStore
    {
    public:
        virtual ~ISyncStateStore() = default;

        virtual std::optional<ClientSyncState> get(const std::string &user_id,
                                                   const std::string &client_id) = 0;

        virtual std::optional<ClientSyncState> get(const std::string &user_id,
                                                   const std::string &client_id,
                                                   const std::string &conversation_id) = 0;

        virtual void put(const ClientSyncState &state) = 0;

        virtual std::size_t purge_expired() = 0;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_SYNC_STATE_STORE_HPP
