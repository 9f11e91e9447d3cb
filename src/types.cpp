#include <convo/delivery/types.hpp>

#include <charconv>

namespace convo::delivery
{
    namespace
    {
        bool parse_u64(std::string_view text, std::uint64_t &out) noexcept
        {
            if (text.empty())
                return false;

            const char *first = text.data();
            const char *last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }
    } // namespace

    std::optional<StreamEntryId> StreamEntryId::parse(std::string_view text) noexcept
    {
        std::uint64_t ms = 0;
        std::uint64_t seq = 0;

        const auto dash = text.find('-');
        if (dash == std::string_view::npos)
        {
            if (!parse_u64(text, ms))
                return std::nullopt;
            return StreamEntryId{ms, 0};
        }

        if (!parse_u64(text.substr(0, dash), ms) || !parse_u64(text.substr(dash + 1), seq))
            return std::nullopt;

        return StreamEntryId{ms, seq};
    }

    std::string StreamEntryId::to_string() const
    {
        if (is_beginning())
            return "0";

        std::string out = std::to_string(ms_);
        out += '-';
        out += std::to_string(seq_);
        return out;
    }

} // namespace convo::delivery
