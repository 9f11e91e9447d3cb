#include <convo/delivery/MemorySyncStateStore.hpp>

#include <utility>

namespace convo::delivery
{
    MemorySyncStateStore::MemorySyncStateStore(std::chrono::seconds ttl, Clock clock)
        : ttl_(ttl),
          clock_(clock ? std::move(clock) : Clock{[]
                                                  { return SystemClock::now(); }})
    {
    }

    std::optional<ClientSyncState> MemorySyncStateStore::get(const std::string &user_id,
                                                             const std::string &client_id)
    {
        const auto now = clock_();

        std::lock_guard<std::mutex> lock(mutex_);

        const Record *best = nullptr;
        for (auto it = records_.lower_bound(Key{user_id, client_id, std::string{}});
             it != records_.end() && std::get<0>(it->first) == user_id && std::get<1>(it->first) == client_id;
             ++it)
        {
            if (it->second.expires_at <= now)
                continue;
            if (!best || it->second.state.last_sync_at > best->state.last_sync_at)
                best = &it->second;
        }

        if (!best)
            return std::nullopt;
        return best->state;
    }

    std::optional<ClientSyncState> MemorySyncStateStore::get(const std::string &user_id,
                                                             const std::string &client_id,
                                                             const std::string &conversation_id)
    {
        const auto now = clock_();

        std::lock_guard<std::mutex> lock(mutex_);

        auto it = records_.find(Key{user_id, client_id, conversation_id});
        if (it == records_.end() || it->second.expires_at <= now)
            return std::nullopt;
        return it->second.state;
    }

    void MemorySyncStateStore::put(const ClientSyncState &state)
    {
        const auto now = clock_();

        std::lock_guard<std::mutex> lock(mutex_);

        Key key{state.user_id, state.client_id, state.conversation_id};
        auto it = records_.find(key);
        if (it == records_.end() || it->second.expires_at <= now)
        {
            records_[std::move(key)] = Record{state, now + ttl_};
            return;
        }

        Record &rec = it->second;
        if (state.last_message_id >= rec.state.last_message_id)
            rec.state.last_message_id = state.last_message_id;
        rec.state.last_sync_at = state.last_sync_at;
        rec.expires_at = now + ttl_;
    }

    std::size_t MemorySyncStateStore::purge_expired()
    {
        const auto now = clock_();
        std::size_t removed = 0;

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = records_.begin(); it != records_.end();)
        {
            if (it->second.expires_at <= now)
            {
                it = records_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t MemorySyncStateStore::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

} // namespace convo::delivery
