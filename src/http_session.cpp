#include <convo/delivery/http_session.hpp>

#include <chrono>
#include <exception>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include <convo/delivery/protocol.hpp>
#include <convo/utils/Logger.hpp>

namespace convo::delivery
{
    using Logger = convo::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        constexpr std::string_view kEventsPrefix = "/conversations/";
        constexpr std::string_view kEventsSuffix = "/events";
        constexpr auto kHttpTimeout = std::chrono::seconds(30);

        int hex_value(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] bool valid_id(const std::string &id) noexcept
        {
            return !id.empty() && id.size() <= kMaxIdLength && protocol::is_valid_utf8(id);
        }

        std::string mint_client_id()
        {
            thread_local boost::uuids::random_generator gen;
            return boost::uuids::to_string(gen());
        }
    } // namespace

    std::optional<std::string> url_decode(std::string_view in)
    {
        std::string out;
        out.reserve(in.size());

        for (std::size_t i = 0; i < in.size(); ++i)
        {
            const char c = in[i];
            if (c == '+')
            {
                out.push_back(' ');
            }
            else if (c == '%')
            {
                if (i + 2 >= in.size())
                    return std::nullopt;

                const int hi = hex_value(in[i + 1]);
                const int lo = hex_value(in[i + 2]);
                if (hi < 0 || lo < 0)
                    return std::nullopt;

                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<RequestTarget> parse_target(std::string_view target)
    {
        RequestTarget result;

        const auto qpos = target.find('?');
        auto path = url_decode(target.substr(0, qpos));
        if (!path)
            return std::nullopt;
        result.path = std::move(*path);

        if (qpos == std::string_view::npos)
            return result;

        std::string_view query = target.substr(qpos + 1);
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const std::string_view pair = query.substr(0, amp);
            query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

            if (pair.empty())
                continue;

            const auto eq = pair.find('=');
            auto key = url_decode(pair.substr(0, eq));
            auto value = url_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
            if (!key || !value)
                return std::nullopt;

            // First occurrence wins.
            result.params.emplace(std::move(*key), std::move(*value));
        }

        return result;
    }

    std::optional<std::string> match_events_path(std::string_view path)
    {
        if (path.size() <= kEventsPrefix.size() + kEventsSuffix.size())
            return std::nullopt;
        if (path.substr(0, kEventsPrefix.size()) != kEventsPrefix)
            return std::nullopt;
        if (path.substr(path.size() - kEventsSuffix.size()) != kEventsSuffix)
            return std::nullopt;

        std::string_view id = path.substr(kEventsPrefix.size(),
                                          path.size() - kEventsPrefix.size() - kEventsSuffix.size());
        if (id.empty() || id.find('/') != std::string_view::npos || id.size() > kMaxIdLength ||
            !protocol::is_valid_utf8(id))
            return std::nullopt;

        return std::string{id};
    }

    // ───────────────────────── HttpSession ─────────────────────────

    HttpSession::HttpSession(tcp::socket socket,
                             std::shared_ptr<const DeliveryContext> ctx,
                             UpgradeHandler onUpgrade)
        : stream_(std::move(socket)),
          ctx_(std::move(ctx)),
          onUpgrade_(std::move(onUpgrade))
    {
        boost::system::error_code ec;
        auto ep = stream_.socket().remote_endpoint(ec);
        if (!ec)
            peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    void HttpSession::run()
    {
        auto self = shared_from_this();
        net::dispatch(stream_.get_executor(), [self]()
                      { self->do_read(); });
    }

    void HttpSession::do_read()
    {
        parser_.emplace();
        parser_->body_limit(ctx_->config.maxMessageSize);

        stream_.expires_after(kHttpTimeout);

        auto self = shared_from_this();
        http::async_read(
            stream_,
            buffer_,
            *parser_,
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read(ec, bytes);
            });
    }

    void HttpSession::on_read(const boost::system::error_code &ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
        {
            do_close();
            return;
        }

        if (ec == http::error::body_limit)
        {
            send_response(make_response(http::status::payload_too_large, 11, false, "payload too large\n"));
            return;
        }

        if (ec)
        {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout)
            {
                logger.log(Logger::Level::DEBUG,
                           "[Delivery][Http] {} read error: {}", peer_, ec.message());
            }
            do_close();
            return;
        }

        auto req = parser_->release();

        if (ws::is_upgrade(req))
        {
            handle_upgrade(std::move(req));
            return;
        }

        handle_request(std::move(req));
    }

    // ───────────────────────── Upgrade ─────────────────────────

    void HttpSession::handle_upgrade(http::request<http::string_body> req)
    {
        const unsigned version = req.version();
        const auto target = parse_target(std::string_view{req.target().data(), req.target().size()});

        auto reject = [this, version](http::status status, std::string body)
        {
            if (ctx_->metrics)
                ctx_->metrics->connections_rejected_total++;
            send_response(make_response(status, version, false, std::move(body)));
        };

        if (!target)
        {
            reject(http::status::bad_request, "malformed request target\n");
            return;
        }

        if (target->path != "/ws")
        {
            reject(http::status::not_found, "not found\n");
            return;
        }

        SessionIdentity identity;
        identity.conversation_id = target->param("conversation_id");
        identity.user_id = target->param("user_id");
        identity.client_id = target->param("client_id");

        if (!valid_id(identity.conversation_id) || !valid_id(identity.user_id))
        {
            reject(http::status::bad_request, "conversation_id and user_id must be non-empty UTF-8\n");
            return;
        }

        if (identity.client_id.size() > kMaxIdLength || !protocol::is_valid_utf8(identity.client_id))
        {
            reject(http::status::bad_request, "client_id too long or not UTF-8\n");
            return;
        }

        ConnectRequest request;
        request.conversation_id = identity.conversation_id;
        request.user_id = identity.user_id;
        request.client_id = identity.client_id;
        request.token = target->param("token");
        request.remote_address = peer_;

        upgradeRequest_ = std::move(req);

        auto self = shared_from_this();
        net::post(
            ctx_->blockingExecutor,
            [self, request = std::move(request), identity = std::move(identity)]() mutable
            {
                std::optional<AccessDecision> decision;
                try
                {
                    decision = self->ctx_->accessPolicy
                                   ? self->ctx_->accessPolicy->check(request)
                                   : AccessDecision::Allow;
                }
                catch (const std::exception &e)
                {
                    logger.log(Logger::Level::ERROR,
                               "[Delivery][Http] access policy failed for {}/{}: {}",
                               request.conversation_id, request.user_id, e.what());
                }

                net::post(self->stream_.get_executor(),
                          [self, decision, identity = std::move(identity)]() mutable
                          { self->on_access_decided(decision, std::move(identity)); });
            });
    }

    void HttpSession::on_access_decided(std::optional<AccessDecision> decision, SessionIdentity identity)
    {
        const unsigned version = upgradeRequest_.version();

        if (!decision || *decision != AccessDecision::Allow)
        {
            if (ctx_->metrics)
                ctx_->metrics->connections_rejected_total++;

            http::status status = http::status::service_unavailable;
            std::string body = "access check unavailable\n";
            if (decision == AccessDecision::Unauthenticated)
            {
                status = http::status::unauthorized;
                body = "unauthenticated\n";
            }
            else if (decision == AccessDecision::Forbidden)
            {
                status = http::status::forbidden;
                body = "forbidden\n";
            }

            logger.log(Logger::Level::INFO,
                       "[Delivery][Http] {} upgrade for {}/{} refused ({})",
                       peer_, identity.conversation_id, identity.user_id, static_cast<unsigned>(status));

            send_response(make_response(status, version, false, std::move(body)));
            return;
        }

        if (identity.client_id.empty())
        {
            identity.client_id = mint_client_id();
            identity.client_id_minted = true;
        }

        logger.log(Logger::Level::DEBUG,
                   "[Delivery][Http] {} upgrading {} user={} client={}{}",
                   peer_, identity.conversation_id, identity.user_id, identity.client_id,
                   identity.client_id_minted ? " (minted)" : "");

        stream_.expires_never();

        auto session = std::make_shared<Session>(std::move(stream_), ctx_, std::move(identity));
        session->run(std::move(upgradeRequest_));
        if (onUpgrade_)
            onUpgrade_(session);
    }

    // ───────────────────────── Plain requests ─────────────────────────

    void HttpSession::handle_request(http::request<http::string_body> req)
    {
        const unsigned version = req.version();
        const bool keepAlive = req.keep_alive();
        const auto target = parse_target(std::string_view{req.target().data(), req.target().size()});

        if (!target)
        {
            send_response(make_response(http::status::bad_request, version, keepAlive, "malformed request target\n"));
            return;
        }

        if (target->path == "/healthz")
        {
            if (req.method() != http::verb::get && req.method() != http::verb::head)
            {
                send_response(make_response(http::status::method_not_allowed, version, keepAlive, "method not allowed\n"));
                return;
            }
            send_response(make_response(http::status::ok, version, keepAlive, "ok\n"));
            return;
        }

        if (target->path == "/metrics")
        {
            if (req.method() != http::verb::get)
            {
                send_response(make_response(http::status::method_not_allowed, version, keepAlive, "method not allowed\n"));
                return;
            }

            std::string body = ctx_->metrics ? ctx_->metrics->render_prometheus() : std::string{};
            send_response(make_response(http::status::ok, version, keepAlive, std::move(body),
                                        "text/plain; version=0.0.4; charset=utf-8"));
            return;
        }

        if (auto conv = match_events_path(target->path))
        {
            if (req.method() != http::verb::post)
            {
                send_response(make_response(http::status::method_not_allowed, version, keepAlive, "method not allowed\n"));
                return;
            }
            handle_publish(std::move(req), std::move(*conv));
            return;
        }

        send_response(make_response(http::status::not_found, version, keepAlive, "not found\n"));
    }

    void HttpSession::handle_publish(http::request<http::string_body> req, std::string conversationId)
    {
        const unsigned version = req.version();
        const bool keepAlive = req.keep_alive();

        if (req.body().empty())
        {
            send_response(make_response(http::status::bad_request, version, keepAlive, "empty payload\n"));
            return;
        }

        auto self = shared_from_this();
        net::post(
            ctx_->blockingExecutor,
            [self, version, keepAlive, conversationId = std::move(conversationId),
             payload = std::move(req.body())]() mutable
            {
                http::response<http::string_body> res;
                try
                {
                    const StreamEntryId id = self->ctx_->publisher->publish(conversationId, payload);

                    nlohmann::json body = nlohmann::json::object();
                    body["conversation_id"] = conversationId;
                    body["stream_entry_id"] = id.to_string();

                    res = self->make_response(http::status::created, version, keepAlive,
                                              body.dump() + "\n", "application/json");
                }
                catch (const StoreError &e)
                {
                    res = self->make_response(http::status::service_unavailable, version, keepAlive,
                                              std::string("not delivered: ") + e.what() + "\n");
                }
                catch (const std::exception &e)
                {
                    logger.log(Logger::Level::ERROR,
                               "[Delivery][Http] publish to {} failed: {}", conversationId, e.what());
                    res = self->make_response(http::status::internal_server_error, version, keepAlive,
                                              "not delivered\n");
                }

                net::post(self->stream_.get_executor(),
                          [self, res = std::move(res)]() mutable
                          { self->send_response(std::move(res)); });
            });
    }

    // ───────────────────────── Output ─────────────────────────

    http::response<http::string_body> HttpSession::make_response(http::status status,
                                                                 unsigned version,
                                                                 bool keepAlive,
                                                                 std::string body,
                                                                 std::string_view contentType) const
    {
        http::response<http::string_body> res{status, version};
        res.set(http::field::server, "convo-delivery");
        res.set(http::field::cache_control, "no-store");
        res.set(http::field::content_type, beast::string_view{contentType.data(), contentType.size()});
        res.keep_alive(keepAlive);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    void HttpSession::send_response(http::response<http::string_body> res)
    {
        auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
        const bool close = sp->need_eof();

        stream_.expires_after(kHttpTimeout);

        auto self = shared_from_this();
        http::async_write(
            stream_,
            *sp,
            [this, self, sp, close](const boost::system::error_code &ec, std::size_t)
            {
                if (ec)
                {
                    logger.log(Logger::Level::DEBUG,
                               "[Delivery][Http] {} write error: {}", peer_, ec.message());
                    do_close();
                    return;
                }

                if (close)
                {
                    do_close();
                    return;
                }

                do_read();
            });
    }

    void HttpSession::do_close()
    {
        boost::system::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

} // namespace convo::delivery
