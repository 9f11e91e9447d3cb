#include <convo/delivery/MemoryConversationLog.hpp>

#include <algorithm>
#include <utility>

namespace convo::delivery
{
    MemoryConversationLog::MemoryConversationLog(Clock clock)
        : clock_(clock ? std::move(clock) : Clock{[]
                                                  { return SystemClock::now(); }})
    {
    }

    BroadcastEvent MemoryConversationLog::append_entry(const std::string &conversation_id,
                                                       const std::string &payload)
    {
        // Millisecond precision, as the durable store keeps it.
        const auto now = from_epoch_ms(to_epoch_ms(clock_()));

        std::lock_guard<std::mutex> lock(mutex_);
        auto &stream = streams_[conversation_id];

        const StreamEntryId id = next_entry_id(stream.last, static_cast<std::uint64_t>(to_epoch_ms(now)));

        BroadcastEvent ev;
        ev.conversation_id = conversation_id;
        ev.stream_entry_id = id;
        ev.payload = payload;
        ev.produced_at = now;

        stream.entries.push_back(ev);
        stream.last = id;
        return ev;
    }

    std::vector<BroadcastEvent> MemoryConversationLog::read_since(
        const std::string &conversation_id,
        const StreamEntryId &after_id,
        const std::optional<std::size_t> &limit)
    {
        std::vector<BroadcastEvent> out;
        if (limit.has_value() && *limit == 0)
            return out;

        std::lock_guard<std::mutex> lock(mutex_);

        auto it = streams_.find(conversation_id);
        if (it == streams_.end())
            return out;

        const auto &entries = it->second.entries;
        auto first = std::upper_bound(entries.begin(), entries.end(), after_id,
                                      [](const StreamEntryId &id, const BroadcastEvent &ev)
                                      { return id < ev.stream_entry_id; });

        for (; first != entries.end(); ++first)
        {
            if (limit.has_value() && out.size() >= *limit)
                break;
            out.push_back(*first);
        }
        return out;
    }

    std::optional<StreamEntryId> MemoryConversationLog::latest_id(const std::string &conversation_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = streams_.find(conversation_id);
        if (it == streams_.end() || it->second.entries.empty())
            return std::nullopt;
        return it->second.entries.back().stream_entry_id;
    }

    StreamEntryId MemoryConversationLog::retention_floor(const std::string &conversation_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = streams_.find(conversation_id);
        if (it == streams_.end())
            return kBeginning;
        return it->second.floor;
    }

    std::size_t MemoryConversationLog::trim_before(SystemClock::time_point cutoff)
    {
        const auto cutoff_ms = static_cast<std::uint64_t>(to_epoch_ms(cutoff));
        std::size_t removed = 0;

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[conversation, stream] : streams_)
        {
            while (!stream.entries.empty() && stream.entries.front().stream_entry_id.ms() < cutoff_ms)
            {
                stream.floor = std::max(stream.floor, stream.entries.front().stream_entry_id);
                stream.entries.pop_front();
                ++removed;
            }
        }
        return removed;
    }

    std::size_t MemoryConversationLog::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t total = 0;
        for (const auto &[conversation, stream] : streams_)
            total += stream.entries.size();
        return total;
    }

} // namespace convo::delivery
