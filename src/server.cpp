#include <convo/delivery/server.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <convo/delivery/http_session.hpp>
#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr auto kShutdownPoll = std::chrono::milliseconds(50);
    }

    Server::Server(std::shared_ptr<const DeliveryContext> ctx)
        : ctx_(std::move(ctx)),
          ioContext_(std::make_shared<net::io_context>(static_cast<int>(ctx_->config.ioThreads)))
    {
        init_acceptor();

        const auto &cfg = ctx_->config;
        logger.log(Logger::Level::INFO,
                   "[Delivery][Server] Config -> maxMessageSize={} idleTimeout={}s pingInterval={}s "
                   "syncInterval={}ms subscriberCapacity={} catchupBatch={}",
                   cfg.maxMessageSize,
                   cfg.idleTimeout.count(),
                   cfg.pingInterval.count(),
                   cfg.syncInterval.count(),
                   cfg.subscriberCapacity,
                   cfg.catchupBatchSize);
    }

    Server::~Server()
    {
        if (!ioThreads_.empty())
        {
            stop_async();
            join_threads();
        }
    }

    void Server::init_acceptor()
    {
        boost::system::error_code ec;

        const auto address = net::ip::make_address(ctx_->config.address, ec);
        if (ec)
            throw std::system_error(ec, "invalid listen address '" + ctx_->config.address + "'");

        tcp::endpoint endpoint(address, ctx_->config.port);
        acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);

        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
        {
            if (ec == boost::system::errc::address_in_use)
            {
                throw std::system_error(
                    ec,
                    "bind: address already in use. Another process is listening on this port.");
            }
            throw std::system_error(ec, "bind acceptor");
        }

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        boundPort_ = acceptor_->local_endpoint(ec).port();

        logger.log(Logger::Level::INFO,
                   "[Delivery][Server] Listening on {}:{}", ctx_->config.address, boundPort_);
    }

    void Server::run()
    {
        start_accept();
        start_io_threads();
    }

    void Server::start_accept()
    {
        acceptor_->async_accept(
            net::make_strand(*ioContext_),
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (stopRequested_)
                    return;

                if (!ec)
                {
                    handle_client(std::move(socket));
                }
                else if (ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::WARN,
                               "[Delivery][Server] accept error: {}", ec.message());
                }

                start_accept();
            });
    }

    void Server::handle_client(tcp::socket socket)
    {
        auto session = std::make_shared<HttpSession>(
            std::move(socket),
            ctx_,
            [this](const std::shared_ptr<Session> &ws)
            {
                register_session(ws);
            });

        session->run();
    }

    void Server::start_io_threads()
    {
        const std::size_t n = std::max<std::size_t>(1, ctx_->config.ioThreads);
        ioThreads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            ioThreads_.emplace_back([this, i]()
                                    {
                try
                {
                    ioContext_->run();
                }
                catch (const std::exception &e)
                {
                    logger.log(Logger::Level::ERROR,
                               "[Delivery][Server] IO thread {} error: {}", i, e.what());
                }

                logger.log(Logger::Level::DEBUG,
                           "[Delivery][Server] IO thread {} finished", i); });
        }
    }

    void Server::stop_async()
    {
        if (stopRequested_.exchange(true))
            return;

        logger.log(Logger::Level::INFO, "[Delivery][Server] stopping");

        net::post(*ioContext_, [this]()
                  {
                      if (acceptor_ && acceptor_->is_open())
                      {
                          boost::system::error_code ec;
                          acceptor_->close(ec);
                      }

                      close_sessions();
                      wait_for_sessions(std::chrono::steady_clock::now() + ctx_->config.shutdownGrace); });
    }

    void Server::close_sessions()
    {
        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex_);
            cleanup_sessions_locked();
            for (auto &weak : sessions_)
            {
                if (auto s = weak.lock())
                    live.push_back(std::move(s));
            }
        }

        logger.log(Logger::Level::INFO, "[Delivery][Server] closing {} session(s)", live.size());

        for (auto &s : live)
            s->shutdown();
    }

    void Server::wait_for_sessions(std::chrono::steady_clock::time_point deadline)
    {
        const std::size_t remaining = session_count();
        if (remaining == 0 || std::chrono::steady_clock::now() >= deadline)
        {
            if (remaining > 0)
            {
                logger.log(Logger::Level::WARN,
                           "[Delivery][Server] grace period over, {} session(s) still open", remaining);
            }
            ioContext_->stop();
            return;
        }

        if (!graceTimer_)
            graceTimer_ = std::make_unique<net::steady_timer>(*ioContext_);

        graceTimer_->expires_after(kShutdownPoll);
        graceTimer_->async_wait(
            [this, deadline](const boost::system::error_code &ec)
            {
                if (ec == net::error::operation_aborted)
                    return;
                wait_for_sessions(deadline);
            });
    }

    void Server::join_threads()
    {
        for (auto &t : ioThreads_)
        {
            if (t.joinable())
                t.join();
        }
        ioThreads_.clear();
    }

    void Server::register_session(const std::shared_ptr<Session> &session)
    {
        {
            std::lock_guard<std::mutex> lock(sessionsMutex_);
            cleanup_sessions_locked();
            sessions_.emplace_back(session);
        }

        // Raced with stop_async(): close it right away.
        if (stopRequested_)
            session->shutdown();
    }

    void Server::cleanup_sessions_locked()
    {
        sessions_.erase(
            std::remove_if(
                sessions_.begin(),
                sessions_.end(),
                [](const std::weak_ptr<Session> &w)
                {
                    return w.expired();
                }),
            sessions_.end());
    }

    std::size_t Server::session_count()
    {
        // A session expires once its close handshake and every pending
        // handler have finished.
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        cleanup_sessions_locked();
        return sessions_.size();
    }

} // namespace convo::delivery
