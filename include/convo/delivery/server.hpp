#ifndef CONVO_DELIVERY_SERVER_HPP
#define CONVO_DELIVERY_SERVER_HPP

/**
 * @file server.hpp
 * @brief Listener and I/O engine for the delivery service.
 *
 * This component:
 *  - owns the io_context and its I/O threads
 *  - accepts TCP connections, each on its own strand
 *  - hands them to an HttpSession, which upgrades WebSocket requests
 *  - tracks live WebSocket sessions so shutdown can close them
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <convo/delivery/context.hpp>
#include <convo/delivery/session.hpp>

namespace convo::delivery
{
    class Server
    {
    public:
        /// Binds immediately; throws std::system_error when the address is unusable.
        explicit Server(std::shared_ptr<const DeliveryContext> ctx);

        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        /// Start accepting connections and running the io_context in background threads.
        void run();

        /// Stop accepting, close every session with 1001, then stop the
        /// io_context once they are gone or the grace period has elapsed.
        void stop_async();

        /// Join all I/O threads.
        void join_threads();

        [[nodiscard]] bool is_stop_requested() const noexcept { return stopRequested_.load(); }

        /// Port actually bound (differs from the configured one when that was 0).
        [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }

        [[nodiscard]] net::io_context &io_context() noexcept { return *ioContext_; }

        /// WebSocket sessions not yet torn down.
        [[nodiscard]] std::size_t session_count();

    private:
        void init_acceptor();
        void start_accept();
        void start_io_threads();
        void handle_client(tcp::socket socket);

        void register_session(const std::shared_ptr<Session> &session);
        void cleanup_sessions_locked();

        void close_sessions();
        void wait_for_sessions(std::chrono::steady_clock::time_point deadline);

        std::shared_ptr<const DeliveryContext> ctx_;

        std::shared_ptr<net::io_context> ioContext_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::unique_ptr<net::steady_timer> graceTimer_;
        std::vector<std::thread> ioThreads_;
        std::uint16_t boundPort_ = 0;

        std::mutex sessionsMutex_;
        std::vector<std::weak_ptr<Session>> sessions_;

        std::atomic<bool> stopRequested_{false};
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_SERVER_HPP
