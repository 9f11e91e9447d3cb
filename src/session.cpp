#include <convo/delivery/session.hpp>

#include <utility>

#include <boost/asio/post.hpp>

#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    Session::Session(beast::tcp_stream stream,
                     std::shared_ptr<const DeliveryContext> ctx,
                     SessionIdentity identity)
        : ws_(std::move(stream)),
          ctx_(std::move(ctx)),
          identity_(std::move(identity)),
          idleTimer_(ws_.get_executor()),
          pingTimer_(ws_.get_executor())
    {
        {
            boost::system::error_code ec;
            auto &sock = beast::get_lowest_layer(ws_).socket();
            sock.set_option(tcp::no_delay(true), ec);

            auto ep = sock.remote_endpoint(ec);
            if (!ec)
                peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());
        }

        const auto &cfg = ctx_->config;

        ws_.read_message_max(cfg.maxMessageSize);

        // Idle detection and pings are ours, Beast only bounds the handshake.
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(ws::stream_base::timeout{
            std::chrono::seconds(30), ws::stream_base::none(), false});

        ws_.set_option(ws::stream_base::decorator(
            [](ws::response_type &res)
            {
                res.set(http::field::server, "convo-delivery");
            }));

        if (cfg.enablePerMessageDeflate)
        {
            ws::permessage_deflate pmd;
            pmd.server_enable = true;
            ws_.set_option(pmd);
        }

        ws_.control_callback(
            [this](ws::frame_type kind, beast::string_view)
            {
                // Any ping or pong from the peer counts as traffic.
                if (kind == ws::frame_type::pong)
                    pingInFlight_ = false;
                if (kind != ws::frame_type::close)
                    arm_idle_timer();
            });
    }

    Session::~Session()
    {
        logger.log(Logger::Level::DEBUG, "[Delivery][WebSocket] session {} destroyed", peer_);
    }

    void Session::run(http::request<http::string_body> req)
    {
        connection_ = std::make_shared<ConnectionSession>(ctx_, identity_, ws_.get_executor(), shared_from_this());

        logger.log(Logger::Level::DEBUG, "[Delivery][WebSocket] {} starting handshake", peer_);

        upgradeRequest_ = std::move(req);

        auto self = shared_from_this();
        ws_.async_accept(
            upgradeRequest_,
            [this, self](const boost::system::error_code &ec)
            {
                on_accept(ec);
            });
    }

    void Session::on_accept(const boost::system::error_code &ec)
    {
        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Delivery][WebSocket] {} accept failed: {}", peer_, ec.message());
            closing_ = true;
            connection_->on_transport_closed(ConnectionSession::CloseCause::TransportError);
            return;
        }

        accepted_ = true;
        logger.log(Logger::Level::DEBUG, "[Delivery][WebSocket] {} handshake OK", peer_);

        connection_->start();

        arm_idle_timer();
        arm_ping_timer();
        do_read();
    }

    void Session::do_read()
    {
        auto self = shared_from_this();

        ws_.async_read(
            buffer_,
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read(ec, bytes);
            });
    }

    void Session::on_read(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (ec)
        {
            stop_timers();

            auto cause = ConnectionSession::CloseCause::TransportError;
            if (ec == ws::error::closed)
            {
                cause = ConnectionSession::CloseCause::ClientClosed;
                logger.log(Logger::Level::DEBUG, "[Delivery][WebSocket] {} closed", peer_);
            }
            else if (ec != net::error::operation_aborted && !closing_)
            {
                logger.log(Logger::Level::WARN,
                           "[Delivery][WebSocket] {} read error: {}", peer_, ec.message());
            }

            closing_ = true;
            connection_->on_transport_closed(cause);
            return;
        }

        arm_idle_timer();

        if (ws_.got_text())
        {
            auto data = beast::buffers_to_string(buffer_.data());
            connection_->on_client_frame(std::move(data));
        }
        else
        {
            logger.log(Logger::Level::DEBUG,
                       "[Delivery][WebSocket] {} ignoring {} byte binary frame", peer_, bytes);
        }
        buffer_.consume(buffer_.size());

        if (!closing_)
            do_read();
    }

    void Session::arm_idle_timer()
    {
        if (closing_ || ctx_->config.idleTimeout.count() <= 0)
            return;

        idleTimer_.expires_after(ctx_->config.idleTimeout);

        auto self = shared_from_this();
        idleTimer_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_idle_timeout(ec);
            });
    }

    void Session::cancel_idle_timer()
    {
        boost::system::error_code ec;
        idleTimer_.cancel(ec);
    }

    void Session::on_idle_timeout(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || closing_)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Delivery][WebSocket] {} idle timer error: {}", peer_, ec.message());
            return;
        }

        logger.log(Logger::Level::INFO,
                   "[Delivery][WebSocket] {} idle for {}s, closing",
                   peer_, ctx_->config.idleTimeout.count());

        connection_->on_transport_closed(ConnectionSession::CloseCause::IdleTimeout);
        close(ws::close_reason(ws::close_code::normal, "idle timeout"));
    }

    void Session::arm_ping_timer()
    {
        if (closing_ || ctx_->config.pingInterval.count() <= 0)
            return;

        pingTimer_.expires_after(ctx_->config.pingInterval);

        auto self = shared_from_this();
        pingTimer_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_ping_timer(ec);
            });
    }

    void Session::on_ping_timer(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted || closing_)
            return;

        if (!pingInFlight_)
        {
            pingInFlight_ = true;

            auto self = shared_from_this();
            ws_.async_ping(
                {},
                [this, self](const boost::system::error_code &pec)
                {
                    if (pec && pec != net::error::operation_aborted && !closing_)
                    {
                        logger.log(Logger::Level::DEBUG,
                                   "[Delivery][WebSocket] {} ping failed: {}", peer_, pec.message());
                    }
                });
        }

        arm_ping_timer();
    }

    void Session::stop_timers()
    {
        cancel_idle_timer();

        boost::system::error_code ec;
        pingTimer_.cancel(ec);
    }

    void Session::async_send(std::string text, SendHandler handler)
    {
        if (closing_ || !accepted_)
        {
            net::post(ws_.get_executor(), [handler = std::move(handler)]()
                      { handler(net::error::operation_aborted); });
            return;
        }

        outgoing_ = std::move(text);
        pendingHandler_ = std::move(handler);

        auto self = shared_from_this();
        ws_.text(true);
        ws_.async_write(
            net::buffer(outgoing_),
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_write_complete(ec, bytes);
            });
    }

    void Session::on_write_complete(const boost::system::error_code &ec, std::size_t bytes)
    {
        if (ec && ec != net::error::operation_aborted)
        {
            logger.log(Logger::Level::WARN,
                       "[Delivery][WebSocket] {} write error: {}", peer_, ec.message());
        }
        else if (!ec)
        {
            logger.log(Logger::Level::TRACE, "[Delivery][WebSocket] {} sent {} bytes", peer_, bytes);
        }

        outgoing_.clear();
        auto handler = std::move(pendingHandler_);
        pendingHandler_ = nullptr;
        if (handler)
            handler(ec);
    }

    void Session::close(ws::close_reason reason)
    {
        if (closing_)
            return;

        closing_ = true;
        stop_timers();

        if (!accepted_)
        {
            boost::system::error_code ec;
            beast::get_lowest_layer(ws_).socket().close(ec);
            return;
        }

        auto self = shared_from_this();
        ws_.async_close(
            reason,
            [this, self](const boost::system::error_code &ec)
            {
                if (ec && ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::DEBUG,
                               "[Delivery][WebSocket] {} close error: {}", peer_, ec.message());
                }
            });
    }

    void Session::shutdown()
    {
        if (connection_)
            connection_->shutdown();
    }

} // namespace convo::delivery
