#ifndef CONVO_DELIVERY_SESSION_HPP
#define CONVO_DELIVERY_SESSION_HPP

/**
 * @file session.hpp
 * @brief Per-connection WebSocket transport.
 *
 * Responsibilities:
 *  - Complete the WebSocket handshake for an already-parsed upgrade request.
 *  - Configure WS options (max message size, deflate, handshake timeout).
 *  - Read frames and hand text frames to the ConnectionSession.
 *  - Write the frames the ConnectionSession emits, one at a time.
 *  - Send pings every ping interval and close idle connections.
 *
 * All handlers run on the stream's strand, which is also the strand of the
 * ConnectionSession driving this transport.
 */

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/error_code.hpp>

#include <convo/delivery/ClientChannel.hpp>
#include <convo/delivery/ConnectionSession.hpp>
#include <convo/delivery/context.hpp>
#include <convo/delivery/types.hpp>

namespace convo::delivery
{
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    namespace ws = boost::beast::websocket;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    class Session : public ClientChannel, public std::enable_shared_from_this<Session>
    {
    public:
        Session(beast::tcp_stream stream,
                std::shared_ptr<const DeliveryContext> ctx,
                SessionIdentity identity);

        ~Session() override;

        /// Accept the upgrade described by `req`, then start delivery.
        void run(http::request<http::string_body> req);

        /// Force-close from any thread (server shutdown).
        void shutdown();

        [[nodiscard]] std::shared_ptr<ConnectionSession> connection() const noexcept { return connection_; }

        // ClientChannel
        void async_send(std::string text, SendHandler handler) override;
        void close(ws::close_reason reason) override;

    private:
        void on_accept(const boost::system::error_code &ec);

        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void arm_idle_timer();
        void cancel_idle_timer();
        void on_idle_timeout(const boost::system::error_code &ec);

        void arm_ping_timer();
        void on_ping_timer(const boost::system::error_code &ec);

        void on_write_complete(const boost::system::error_code &ec, std::size_t bytes);

        void stop_timers();

        ws::stream<beast::tcp_stream> ws_;
        std::shared_ptr<const DeliveryContext> ctx_;
        SessionIdentity identity_;
        std::shared_ptr<ConnectionSession> connection_;
        std::string peer_;

        http::request<http::string_body> upgradeRequest_;
        beast::flat_buffer buffer_;
        net::steady_timer idleTimer_;
        net::steady_timer pingTimer_;
        bool accepted_ = false;
        bool closing_ = false;
        bool pingInFlight_ = false;

        std::string outgoing_;
        SendHandler pendingHandler_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_SESSION_HPP
