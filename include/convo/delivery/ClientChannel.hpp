#ifndef CONVO_DELIVERY_CLIENT_CHANNEL_HPP
#define CONVO_DELIVERY_CLIENT_CHANNEL_HPP

#include <functional>
#include <string>

#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/system/error_code.hpp>

namespace convo::delivery
{
    /**
     * @brief Outbound half of a client connection, as seen by a ConnectionSession.
     *
     * The WebSocket Session implements it; tests substitute an in-memory fake.
     * The session issues at most one async_send at a time and the handler runs
     * on the session's strand.
     */
    class ClientChannel
    {
    public:
        using SendHandler = std::function<void(const boost::system::error_code &)>;

        virtual ~ClientChannel() = default;

        virtual void async_send(std::string text, SendHandler handler) = 0;

        /// Send a close frame and shut the transport. Idempotent.
        virtual void close(boost::beast::websocket::close_reason reason) = 0;
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_CLIENT_CHANNEL_HPP
