#ifndef CONVO_DELIVERY_PERIODIC_SYNC_HPP
#define CONVO_DELIVERY_PERIODIC_SYNC_HPP

/**
 * @file PeriodicSync.hpp
 * @brief Per-connection timer persisting the read cursor.
 *
 * Runs on the connection's strand; the store write itself runs on the
 * blocking executor so delivery never waits on it. At most one periodic
 * write is in flight, a tick that finds one is skipped. Failures are logged
 * and counted and the next tick simply tries again.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <convo/delivery/CursorCell.hpp>
#include <convo/delivery/Metrics.hpp>
#include <convo/delivery/SyncStateStore.hpp>
#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    class PeriodicSync : public std::enable_shared_from_this<PeriodicSync>
    {
    public:
        /// `strand` must be the owning connection's strand.
        PeriodicSync(boost::asio::any_io_executor strand,
                     boost::asio::any_io_executor blocking,
                     std::shared_ptr<ISyncStateStore> store,
                     std::shared_ptr<CursorCell> cell,
                     SessionIdentity identity,
                     std::chrono::milliseconds interval,
                     std::shared_ptr<DeliveryMetrics> metrics = nullptr);

        /// Arm the timer. Must be called on the strand.
        void start();

        /// Issue one last write with the current cell value, then stop.
        /// Does not wait for the write. Must be called on the strand.
        void flush_final();

        /// Cancel the timer. Idempotent. Must be called on the strand.
        void stop();

        [[nodiscard]] bool write_in_flight() const noexcept { return inFlight_.load(); }
        [[nodiscard]] std::uint64_t writes_completed() const noexcept { return writesCompleted_.load(); }
        [[nodiscard]] std::uint64_t ticks_skipped() const noexcept { return ticksSkipped_.load(); }

    private:
        void arm();
        void on_tick(const boost::system::error_code &ec);

        /// Snapshot the cell and persist it off-strand.
        void write(bool periodic);

        boost::asio::any_io_executor strand_;
        boost::asio::any_io_executor blocking_;
        std::shared_ptr<ISyncStateStore> store_;
        std::shared_ptr<CursorCell> cell_;
        SessionIdentity identity_;
        std::chrono::milliseconds interval_;
        std::shared_ptr<DeliveryMetrics> metrics_;

        boost::asio::steady_timer timer_;
        bool stopped_ = false;
        std::atomic<bool> inFlight_{false};
        std::atomic<std::uint64_t> writesCompleted_{0};
        std::atomic<std::uint64_t> ticksSkipped_{0};
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_PERIODIC_SYNC_HPP
