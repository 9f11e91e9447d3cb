#ifndef CONVO_DELIVERY_CURSOR_CELL_HPP
#define CONVO_DELIVERY_CURSOR_CELL_HPP

#include <mutex>

#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    /**
     * @brief Last StreamEntryId forwarded to a client.
     *
     * Shared between a connection's strand (writer) and its sync task
     * (reader, possibly from a store worker). The value only moves forward.
     */
    class CursorCell
    {
    public:
        CursorCell() = default;
        explicit CursorCell(StreamEntryId initial) : value_(initial) {}

        [[nodiscard]] StreamEntryId get() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return value_;
        }

        /// Returns true when the stored value moved.
        bool advance(StreamEntryId id)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (id <= value_)
                return false;
            value_ = id;
            return true;
        }

    private:
        mutable std::mutex mutex_;
        StreamEntryId value_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_CURSOR_CELL_HPP
