#ifndef CONVO_DELIVERY_APP_HPP
#define CONVO_DELIVERY_APP_HPP

/**
 * @file App.hpp
 * @brief Process-level wiring of the delivery service.
 *
 * Wraps:
 *
 *   - convo::config::Config          (configuration loading)
 *   - boost::asio::thread_pool       (blocking store calls)
 *   - the conversation log and the cursor store (SQLite, or in-memory for ":memory:")
 *   - BroadcastRegistry + MessagePublisher
 *   - convo::delivery::Server        (listener, I/O threads)
 *   - RetentionSweeper
 *
 * Typical usage:
 * @code{.cpp}
 * convo::delivery::App app{"config/config.json"};
 * app.run_blocking(); // until stop() from a signal handler thread
 * @endcode
 */

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include <convo/config/Config.hpp>
#include <convo/delivery/AccessPolicy.hpp>
#include <convo/delivery/ConversationLog.hpp>
#include <convo/delivery/MessagePublisher.hpp>
#include <convo/delivery/Metrics.hpp>
#include <convo/delivery/RetentionSweeper.hpp>
#include <convo/delivery/SyncStateStore.hpp>
#include <convo/delivery/config.hpp>
#include <convo/delivery/context.hpp>
#include <convo/delivery/server.hpp>

namespace convo::delivery
{
    class App
    {
    public:
        /// Load `configPath`, apply `log.level` and open the stores it names.
        explicit App(const std::string &configPath);

        explicit App(const convo::config::Config &core);

        /// Explicit collaborators; `policy` defaults to AllowAllPolicy.
        App(Config cfg,
            std::shared_ptr<IConversationLog> log,
            std::shared_ptr<ISyncStateStore> syncStore,
            std::shared_ptr<IAccessPolicy> policy = nullptr);

        ~App();

        // Non-copyable / non-movable (owns pool + server + stores).
        App(const App &) = delete;
        App &operator=(const App &) = delete;
        App(App &&) = delete;
        App &operator=(App &&) = delete;

        /// Start the listener, I/O threads and the retention sweeper.
        void start();

        /// start(), then block until stop() is called.
        void run_blocking();

        /// Close sessions, stop the server and join every thread. Idempotent.
        void stop();

        [[nodiscard]] std::uint16_t port() const noexcept { return server_->port(); }

        [[nodiscard]] MessagePublisher &publisher() noexcept { return *ctx_->publisher; }
        [[nodiscard]] DeliveryMetrics &metrics() noexcept { return *ctx_->metrics; }
        [[nodiscard]] const DeliveryContext &context() const noexcept { return *ctx_; }
        [[nodiscard]] Server &server() noexcept { return *server_; }

    private:
        boost::asio::thread_pool pool_;
        std::shared_ptr<DeliveryContext> ctx_;
        std::unique_ptr<Server> server_;
        std::shared_ptr<RetentionSweeper> sweeper_;

        std::mutex stateMutex_;
        std::condition_variable stopped_;
        bool started_ = false;
        bool stopping_ = false;
        bool done_ = false;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_APP_HPP
