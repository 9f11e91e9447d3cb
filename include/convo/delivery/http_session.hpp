#ifndef CONVO_DELIVERY_HTTP_SESSION_HPP
#define CONVO_DELIVERY_HTTP_SESSION_HPP

/**
 * @file http_session.hpp
 * @brief Plain HTTP handling in front of the WebSocket endpoint.
 *
 * Routes:
 *  - GET  /ws?conversation_id=..&user_id=..[&client_id=..][&token=..]  (Upgrade)
 *  - POST /conversations/{id}/events   body = opaque payload → 201
 *  - GET  /healthz
 *  - GET  /metrics                     Prometheus text
 *
 * Anything else is answered with 404.
 */

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <convo/delivery/AccessPolicy.hpp>
#include <convo/delivery/context.hpp>
#include <convo/delivery/session.hpp>

namespace convo::delivery
{
    /// Path and decoded query parameters of a request target.
    struct RequestTarget
    {
        std::string path;
        std::map<std::string, std::string> params;

        [[nodiscard]] std::string param(const std::string &key) const
        {
            auto it = params.find(key);
            return it == params.end() ? std::string{} : it->second;
        }
    };

    /// Percent-decode (and '+' → space). nullopt on a malformed escape.
    [[nodiscard]] std::optional<std::string> url_decode(std::string_view in);

    /// Split "/path?a=1&b=2". nullopt when any component fails to decode.
    [[nodiscard]] std::optional<RequestTarget> parse_target(std::string_view target);

    /// "/conversations/{id}/events" → id, nullopt for any other path.
    [[nodiscard]] std::optional<std::string> match_events_path(std::string_view path);

    /// Longest accepted conversation, user or client id.
    inline constexpr std::size_t kMaxIdLength = 256;

    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        using UpgradeHandler = std::function<void(const std::shared_ptr<Session> &)>;

        HttpSession(tcp::socket socket,
                    std::shared_ptr<const DeliveryContext> ctx,
                    UpgradeHandler onUpgrade);

        void run();

    private:
        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void handle_upgrade(http::request<http::string_body> req);
        /// `decision` is empty when the policy itself failed.
        void on_access_decided(std::optional<AccessDecision> decision, SessionIdentity identity);

        void handle_request(http::request<http::string_body> req);
        void handle_publish(http::request<http::string_body> req, std::string conversationId);

        void send_response(http::response<http::string_body> res);
        void do_close();

        http::response<http::string_body> make_response(http::status status,
                                                         unsigned version,
                                                         bool keepAlive,
                                                         std::string body,
                                                         std::string_view contentType = "text/plain; charset=utf-8") const;

        beast::tcp_stream stream_;
        std::shared_ptr<const DeliveryContext> ctx_;
        UpgradeHandler onUpgrade_;
        std::string peer_;

        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        http::request<http::string_body> upgradeRequest_;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_HTTP_SESSION_HPP
