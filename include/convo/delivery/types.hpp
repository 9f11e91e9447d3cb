#ifndef CONVO_DELIVERY_TYPES_HPP
#define CONVO_DELIVERY_TYPES_HPP

/**
 * @file types.hpp
 * @brief Value types shared by the log, the cursor store and the sessions.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace convo::delivery
{
    /**
     * @brief Identifier assigned by the conversation log at append time.
     *
     * Textual form is `<ms>-<seq>`; a bare `<ms>` parses with seq 0.
     * Ordering is numeric on (ms, seq). The default value `0-0` (text "0")
     * stands for the beginning of retained history.
     */
    class StreamEntryId
    {
    public:
        constexpr StreamEntryId() noexcept = default;
        constexpr StreamEntryId(std::uint64_t ms, std::uint64_t seq) noexcept
            : ms_(ms), seq_(seq)
        {
        }

        [[nodiscard]] static std::optional<StreamEntryId> parse(std::string_view text) noexcept;

        /// "0" for the beginning sentinel, "<ms>-<seq>" otherwise.
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] constexpr std::uint64_t ms() const noexcept { return ms_; }
        [[nodiscard]] constexpr std::uint64_t seq() const noexcept { return seq_; }
        [[nodiscard]] constexpr bool is_beginning() const noexcept { return ms_ == 0 && seq_ == 0; }

        friend constexpr bool operator==(const StreamEntryId &a, const StreamEntryId &b) noexcept
        {
            return a.ms_ == b.ms_ && a.seq_ == b.seq_;
        }
        friend constexpr bool operator!=(const StreamEntryId &a, const StreamEntryId &b) noexcept
        {
            return !(a == b);
        }
        friend constexpr bool operator<(const StreamEntryId &a, const StreamEntryId &b) noexcept
        {
            return a.ms_ < b.ms_ || (a.ms_ == b.ms_ && a.seq_ < b.seq_);
        }
        friend constexpr bool operator>(const StreamEntryId &a, const StreamEntryId &b) noexcept
        {
            return b < a;
        }
        friend constexpr bool operator<=(const StreamEntryId &a, const StreamEntryId &b) noexcept
        {
            return !(b < a);
        }
        friend constexpr bool operator>=(const StreamEntryId &a, const StreamEntryId &b) noexcept
        {
            return !(a < b);
        }

    private:
        std::uint64_t ms_ = 0;
        std::uint64_t seq_ = 0;
    };

    inline constexpr StreamEntryId kBeginning{};

    enum class EventKind
    {
        Message, ///< durable, carries a stream id
        Signal   ///< ephemeral (typing...), registry only
    };

    /// One appended log entry, or an ephemeral signal travelling the registry.
    struct BroadcastEvent
    {
        std::string conversation_id;
        StreamEntryId stream_entry_id;
        std::string payload;
        std::chrono::system_clock::time_point produced_at{};
        EventKind kind = EventKind::Message;
        std::string origin_client_id; ///< signals only: sender's client id
    };

    /// Persisted per-device read cursor.
    struct ClientSyncState
    {
        std::string client_id;
        std::string user_id;
        std::string conversation_id;
        StreamEntryId last_message_id;
        std::chrono::system_clock::time_point last_sync_at{};
    };

    /// Who is on the other end of a connection.
    struct SessionIdentity
    {
        std::string conversation_id;
        std::string user_id;
        std::string client_id;
        bool client_id_minted = false; ///< true when the server generated client_id
    };

    /// Raised by log and cursor store implementations on any backend failure.
    class StoreError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    using SystemClock = std::chrono::system_clock;

    [[nodiscard]] inline std::int64_t to_epoch_ms(SystemClock::time_point tp) noexcept
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    [[nodiscard]] inline SystemClock::time_point from_epoch_ms(std::int64_t ms) noexcept
    {
        return SystemClock::time_point{std::chrono::milliseconds{ms}};
    }

} // namespace convo::delivery

#endif // CONVO_DELIVERY_TYPES_HPP
