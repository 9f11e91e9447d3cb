#ifndef CONVO_DELIVERY_PROTOCOL_HPP
#define CONVO_DELIVERY_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief JSON frames exchanged with delivery clients.
 *
 * Server → client:
 *
 * {"type":"session.ready","conversation_id":..,"user_id":..,"client_id":..,
 *  "client_id_minted":bool,"cursor":"<id>"}
 * {"type":"message","conversation_id":..,"stream_id":"<id>","produced_at":<ms>,
 *  "payload":<json or string>}
 * {"type":"sync.reset","conversation_id":..,"latest_id":"<id>"}
 * {"type":"typing.started","conversation_id":..,"user_id":..}
 *
 * Client → server:
 *
 * {"type":"typing","conversation_id":..,"user_id":..}
 * {"type":"ack","msg_id":"<id>"}
 * {"type":"sync.request","after":"<id>"}   (after is optional)
 *
 * Anything else is ignored by the session.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <convo/delivery/types.hpp>

namespace convo::delivery::protocol
{
    inline constexpr std::string_view kSessionReady = "session.ready";
    inline constexpr std::string_view kMessage = "message";
    inline constexpr std::string_view kSyncReset = "sync.reset";
    inline constexpr std::string_view kTypingStarted = "typing.started";

    inline constexpr std::string_view kTyping = "typing";
    inline constexpr std::string_view kAck = "ack";
    inline constexpr std::string_view kSyncRequest = "sync.request";

    /// True when `text` is well-formed UTF-8 (no overlongs, no surrogates).
    [[nodiscard]] inline bool is_valid_utf8(std::string_view text) noexcept
    {
        std::size_t i = 0;
        const std::size_t n = text.size();
        while (i < n)
        {
            const auto c = static_cast<unsigned char>(text[i]);
            std::size_t len = 0;
            std::uint32_t cp = 0;
            if (c < 0x80)
            {
                ++i;
                continue;
            }
            else if ((c & 0xE0) == 0xC0)
            {
                len = 2;
                cp = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                len = 3;
                cp = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                len = 4;
                cp = c & 0x07;
            }
            else
            {
                return false;
            }

            if (i + len > n)
                return false;
            for (std::size_t k = 1; k < len; ++k)
            {
                const auto cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }

            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
                cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;

            i += len;
        }
        return true;
    }

    namespace detail
    {
        /// Serialize a frame. Invalid UTF-8 in stored bytes becomes U+FFFD
        /// instead of throwing.
        inline std::string to_text(const nlohmann::json &j)
        {
            return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        /// Embed `payload` as JSON when it parses, as a string otherwise.
        inline nlohmann::json payload_value(const std::string &payload)
        {
            auto j = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded())
                return payload;
            return j;
        }
    } // namespace detail

    [[nodiscard]] inline std::string session_ready(const SessionIdentity &identity, StreamEntryId cursor)
    {
        nlohmann::json j = nlohmann::json::object();
        j["type"] = std::string(kSessionReady);
        j["conversation_id"] = identity.conversation_id;
        j["user_id"] = identity.user_id;
        j["client_id"] = identity.client_id;
        j["client_id_minted"] = identity.client_id_minted;
        j["cursor"] = cursor.to_string();
        return detail::to_text(j);
    }

    [[nodiscard]] inline std::string message(const BroadcastEvent &event)
    {
        nlohmann::json j = nlohmann::json::object();
        j["type"] = std::string(kMessage);
        j["conversation_id"] = event.conversation_id;
        j["stream_id"] = event.stream_entry_id.to_string();
        j["produced_at"] = to_epoch_ms(event.produced_at);
        j["payload"] = detail::payload_value(event.payload);
        return detail::to_text(j);
    }

    [[nodiscard]] inline std::string sync_reset(const std::string &conversation_id, StreamEntryId latest)
    {
        nlohmann::json j = nlohmann::json::object();
        j["type"] = std::string(kSyncReset);
        j["conversation_id"] = conversation_id;
        j["latest_id"] = latest.to_string();
        return detail::to_text(j);
    }

    [[nodiscard]] inline std::string typing_started(const std::string &conversation_id,
                                                    const std::string &user_id)
    {
        nlohmann::json j = nlohmann::json::object();
        j["type"] = std::string(kTypingStarted);
        j["conversation_id"] = conversation_id;
        j["user_id"] = user_id;
        return detail::to_text(j);
    }

    /// A client frame the session understands.
    struct InboundFrame
    {
        enum class Kind
        {
            Typing,
            Ack,
            SyncRequest
        };

        Kind kind = Kind::Typing;
        std::string conversation_id;        ///< typing
        std::string user_id;                ///< typing
        std::string msg_id;                 ///< ack
        std::optional<StreamEntryId> after; ///< sync.request; unset means "my cursor"
    };

    /// nullopt for malformed JSON, missing fields or unknown types.
    [[nodiscard]] inline std::optional<InboundFrame> parse_inbound(std::string_view text)
    {
        auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        auto str = [&j](const char *key) -> std::optional<std::string>
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        };

        const auto type = str("type");
        if (!type)
            return std::nullopt;

        InboundFrame frame;
        if (*type == kTyping)
        {
            auto conv = str("conversation_id");
            auto user = str("user_id");
            if (!conv || !user)
                return std::nullopt;

            frame.kind = InboundFrame::Kind::Typing;
            frame.conversation_id = std::move(*conv);
            frame.user_id = std::move(*user);
            return frame;
        }

        if (*type == kAck)
        {
            frame.kind = InboundFrame::Kind::Ack;
            frame.msg_id = str("msg_id").value_or(std::string{});
            return frame;
        }

        if (*type == kSyncRequest)
        {
            frame.kind = InboundFrame::Kind::SyncRequest;
            if (j.contains("after"))
            {
                auto after = str("after");
                if (!after)
                    return std::nullopt;
                frame.after = StreamEntryId::parse(*after);
                if (!frame.after)
                    return std::nullopt;
            }
            return frame;
        }

        return std::nullopt;
    }

    /// Payload carried by a typing signal through the registry.
    [[nodiscard]] inline std::string typing_signal_payload(const std::string &user_id)
    {
        nlohmann::json j = nlohmann::json::object();
        j["user_id"] = user_id;
        return detail::to_text(j);
    }

    [[nodiscard]] inline std::string typing_signal_user(const std::string &payload)
    {
        auto j = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object())
            return {};
        auto it = j.find("user_id");
        if (it == j.end() || !it->is_string())
            return {};
        return it->get<std::string>();
    }

} // namespace convo::delivery::protocol

#endif // CONVO_DELIVERY_PROTOCOL_HPP
