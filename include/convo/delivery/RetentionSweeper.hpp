#ifndef CONVO_DELIVERY_RETENTION_SWEEPER_HPP
#define CONVO_DELIVERY_RETENTION_SWEEPER_HPP

/**
 * @file RetentionSweeper.hpp
 * @brief Periodic log trimming and cursor TTL purge.
 *
 * Each run trims log entries older than the retention window (raising the
 * per-conversation retention floors) and drops expired client cursors.
 * Store work happens on the blocking executor; a failed run is logged and
 * the next one tries again.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <convo/delivery/ConversationLog.hpp>
#include <convo/delivery/Metrics.hpp>
#include <convo/delivery/SyncStateStore.hpp>

namespace convo::delivery
{
    class RetentionSweeper : public std::enable_shared_from_this<RetentionSweeper>
    {
    public:
        struct Result
        {
            std::size_t entriesTrimmed = 0;
            std::size_t cursorsPurged = 0;
            bool ok = true;
        };

        using Clock = std::function<SystemClock::time_point()>;

        /// `retention` of zero keeps the log forever (cursors are still purged).
        RetentionSweeper(boost::asio::any_io_executor executor,
                         boost::asio::any_io_executor blocking,
                         std::shared_ptr<IConversationLog> log,
                         std::shared_ptr<ISyncStateStore> syncStore,
                         std::chrono::hours retention,
                         std::chrono::seconds interval,
                         std::shared_ptr<DeliveryMetrics> metrics = nullptr,
                         Clock clock = {});

        void start();
        void stop();

        /// One synchronous pass on the calling thread.
        Result run_once();

        [[nodiscard]] std::uint64_t runs() const noexcept { return runs_.load(); }

    private:
        void arm();
        void on_timer(const boost::system::error_code &ec);

        boost::asio::steady_timer timer_;
        boost::asio::any_io_executor blocking_;
        std::shared_ptr<IConversationLog> log_;
        std::shared_ptr<ISyncStateStore> syncStore_;
        std::chrono::hours retention_;
        std::chrono::seconds interval_;
        std::shared_ptr<DeliveryMetrics> metrics_;
        Clock clock_;

        std::atomic<bool> stopped_{false};
        std::atomic<bool> running_{false};
        std::atomic<std::uint64_t> runs_{0};
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_RETENTION_SWEEPER_HPP
