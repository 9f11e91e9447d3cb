/**
 * @file test_server.cpp
 * @brief End-to-end tests: a real App on an ephemeral port, driven by
 *        synchronous Beast HTTP and WebSocket clients.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <convo/delivery/App.hpp>
#include <convo/delivery/MemoryConversationLog.hpp>
#include <convo/delivery/MemorySyncStateStore.hpp>

using namespace convo::delivery;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

namespace
{
    struct HttpResult
    {
        http::status status;
        std::string body;
    };

    HttpResult http_request(std::uint16_t port, http::verb verb, const std::string &target,
                            const std::string &body = {})
    {
        net::io_context ioc;
        tcp::socket socket{ioc};
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(false);
        if (!body.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return {res.result(), res.body()};
    }

    class WsClient
    {
    public:
        WsClient(std::uint16_t port, const std::string &target)
            : ws_{ioc_}
        {
            beast::get_lowest_layer(ws_).connect(
                tcp::endpoint{net::ip::make_address("127.0.0.1"), port});
            ws_.handshake("127.0.0.1", target);
        }

        nlohmann::json read()
        {
            beast::flat_buffer buffer;
            ws_.read(buffer);
            return nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
        }

        void write(const std::string &text)
        {
            ws_.text(true);
            ws_.write(net::buffer(text));
        }

        void close()
        {
            ws_.close(ws::close_code::normal);
        }

        ws::stream<tcp::socket> &stream() { return ws_; }

    private:
        net::io_context ioc_;
        ws::stream<tcp::socket> ws_;
    };

    /// Status of a refused upgrade.
    http::status rejected_upgrade(std::uint16_t port, const std::string &target)
    {
        net::io_context ioc;
        ws::stream<tcp::socket> stream{ioc};
        beast::get_lowest_layer(stream).connect(
            tcp::endpoint{net::ip::make_address("127.0.0.1"), port});

        ws::response_type res;
        beast::error_code ec;
        stream.handshake(res, "127.0.0.1", target, ec);
        EXPECT_TRUE(ec);
        return res.result();
    }

    class DenyUserPolicy : public IAccessPolicy
    {
    public:
        AccessDecision check(const ConnectRequest &request) override
        {
            if (request.user_id == "mallory")
                return AccessDecision::Forbidden;
            if (request.token == "expired")
                return AccessDecision::Unauthenticated;
            return AccessDecision::Allow;
        }
    };

    std::string post_event(std::uint16_t port, const std::string &conv, const std::string &text)
    {
        nlohmann::json body = {{"text", text}};
        auto res = http_request(port, http::verb::post, "/conversations/" + conv + "/events", body.dump());
        EXPECT_EQ(res.status, http::status::created) << res.body;
        auto j = nlohmann::json::parse(res.body, nullptr, false);
        if (j.is_discarded() || !j.contains("stream_entry_id"))
            return {};
        return j["stream_entry_id"].get<std::string>();
    }
} // namespace

// =============================================================================
// Fixture
// =============================================================================

class ServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        log_ = std::make_shared<MemoryConversationLog>();
        cursors_ = std::make_shared<MemorySyncStateStore>();

        Config cfg;
        cfg.address = "127.0.0.1";
        cfg.port = 0;
        cfg.ioThreads = 2;
        cfg.storeThreads = 2;
        cfg.syncInterval = std::chrono::milliseconds{100};
        cfg.shutdownGrace = std::chrono::milliseconds{1000};
        cfg.maintenanceInterval = std::chrono::seconds{0};

        app_ = std::make_unique<App>(cfg, log_, cursors_, std::make_shared<DenyUserPolicy>());
        app_->start();
        port_ = app_->port();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override
    {
        if (app_)
            app_->stop();
    }

    std::string ws_target(const std::string &conv, const std::string &user, const std::string &client) const
    {
        std::string t = "/ws?conversation_id=" + conv + "&user_id=" + user;
        if (!client.empty())
            t += "&client_id=" + client;
        return t;
    }

    /// Poll until the stored cursor reaches `id`.
    bool wait_for_cursor(const std::string &user, const std::string &client,
                         const std::string &conv, const std::string &id)
    {
        const auto want = StreamEntryId::parse(id);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (std::chrono::steady_clock::now() < deadline)
        {
            auto state = cursors_->get(user, client, conv);
            if (state && want && state->last_message_id >= *want)
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
        }
        return false;
    }

    std::shared_ptr<MemoryConversationLog> log_;
    std::shared_ptr<MemorySyncStateStore> cursors_;
    std::unique_ptr<App> app_;
    std::uint16_t port_ = 0;
};

// =============================================================================
// Plain HTTP
// =============================================================================

TEST_F(ServerTest, HealthzAnswersOk)
{
    auto res = http_request(port_, http::verb::get, "/healthz");
    EXPECT_EQ(res.status, http::status::ok);
    EXPECT_EQ(res.body, "ok\n");
}

TEST_F(ServerTest, PublishAppendsToTheLog)
{
    const std::string id = post_event(port_, "c1", "hello");
    ASSERT_FALSE(id.empty());

    auto latest = log_->latest_id("c1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->to_string(), id);
}

TEST_F(ServerTest, PublishWithEmptyBodyIsRejected)
{
    auto res = http_request(port_, http::verb::post, "/conversations/c1/events");
    EXPECT_EQ(res.status, http::status::bad_request);
    EXPECT_FALSE(log_->latest_id("c1").has_value());
}

TEST_F(ServerTest, UnknownRoutesAndMethods)
{
    EXPECT_EQ(http_request(port_, http::verb::get, "/nope").status, http::status::not_found);
    EXPECT_EQ(http_request(port_, http::verb::get, "/conversations/c1/events").status,
              http::status::method_not_allowed);
}

TEST_F(ServerTest, MetricsExposesCounters)
{
    { WsClient client(port_, ws_target("c1", "alice", "phone")); client.read(); client.close(); }

    auto res = http_request(port_, http::verb::get, "/metrics");
    EXPECT_EQ(res.status, http::status::ok);
    EXPECT_NE(res.body.find("convo_delivery_connections_total"), std::string::npos);
    EXPECT_NE(res.body.find("# TYPE convo_delivery_live_events_total counter"), std::string::npos);
}

// =============================================================================
// Upgrade admission
// =============================================================================

TEST_F(ServerTest, UpgradeWithoutUserIsBadRequest)
{
    EXPECT_EQ(rejected_upgrade(port_, "/ws?conversation_id=c1"), http::status::bad_request);
}

TEST_F(ServerTest, UpgradeWithNonUtf8IdIsBadRequest)
{
    EXPECT_EQ(rejected_upgrade(port_, "/ws?conversation_id=c1&user_id=%FF"), http::status::bad_request);
    EXPECT_EQ(rejected_upgrade(port_, "/ws?conversation_id=c1&user_id=alice&client_id=%C3"),
              http::status::bad_request);
}

TEST_F(ServerTest, BinaryPayloadReachesTheClient)
{
    auto res = http_request(port_, http::verb::post, "/conversations/c1/events", "\xff\xfe raw");
    ASSERT_EQ(res.status, http::status::created);

    WsClient client(port_, ws_target("c1", "alice", "phone"));
    EXPECT_EQ(client.read()["type"], "session.ready");
    auto frame = client.read();
    EXPECT_EQ(frame["type"], "message");
    EXPECT_TRUE(frame["payload"].is_string());
    client.close();

    // The server still answers afterwards.
    EXPECT_EQ(http_request(port_, http::verb::get, "/healthz").status, http::status::ok);
}

TEST_F(ServerTest, UpgradeOnWrongPathIsNotFound)
{
    EXPECT_EQ(rejected_upgrade(port_, "/socket?conversation_id=c1&user_id=alice"), http::status::not_found);
}

TEST_F(ServerTest, PolicyDecisionsMapToStatusCodes)
{
    EXPECT_EQ(rejected_upgrade(port_, ws_target("c1", "mallory", "x")), http::status::forbidden);
    EXPECT_EQ(rejected_upgrade(port_, ws_target("c1", "alice", "x") + "&token=expired"),
              http::status::unauthorized);
    EXPECT_GE(app_->metrics().connections_rejected_total.load(), 2u);
}

// =============================================================================
// Delivery
// =============================================================================

TEST_F(ServerTest, NewClientReplaysHistoryThenReceivesLiveEvents)
{
    const std::string first = post_event(port_, "c1", "one");
    const std::string second = post_event(port_, "c1", "two");

    WsClient client(port_, ws_target("c1", "alice", "phone"));

    auto ready = client.read();
    EXPECT_EQ(ready["type"], "session.ready");
    EXPECT_EQ(ready["client_id"], "phone");
    EXPECT_EQ(ready["client_id_minted"], false);
    EXPECT_EQ(ready["cursor"], "0");

    auto m1 = client.read();
    EXPECT_EQ(m1["type"], "message");
    EXPECT_EQ(m1["stream_id"], first);
    EXPECT_EQ(m1["payload"]["text"], "one");

    auto m2 = client.read();
    EXPECT_EQ(m2["stream_id"], second);

    const std::string third = post_event(port_, "c1", "three");
    auto m3 = client.read();
    EXPECT_EQ(m3["type"], "message");
    EXPECT_EQ(m3["stream_id"], third);
    EXPECT_EQ(m3["payload"]["text"], "three");

    client.close();
}

TEST_F(ServerTest, MissingClientIdIsMinted)
{
    WsClient client(port_, ws_target("c1", "alice", ""));
    auto ready = client.read();
    EXPECT_EQ(ready["type"], "session.ready");
    EXPECT_EQ(ready["client_id_minted"], true);
    EXPECT_EQ(ready["client_id"].get<std::string>().size(), 36u);
    client.close();
}

TEST_F(ServerTest, ReconnectResumesFromStoredCursor)
{
    const std::string first = post_event(port_, "c1", "one");

    {
        WsClient client(port_, ws_target("c1", "alice", "phone"));
        client.read();                      // session.ready
        EXPECT_EQ(client.read()["stream_id"], first);
        client.close();
    }
    ASSERT_TRUE(wait_for_cursor("alice", "phone", "c1", first));

    const std::string second = post_event(port_, "c1", "two");

    WsClient again(port_, ws_target("c1", "alice", "phone"));
    auto ready = again.read();
    EXPECT_EQ(ready["cursor"], first);

    auto next = again.read();
    EXPECT_EQ(next["stream_id"], second);
    again.close();
}

TEST_F(ServerTest, CursorsAreIndependentPerDevice)
{
    const std::string first = post_event(port_, "c1", "one");
    {
        WsClient phone(port_, ws_target("c1", "alice", "phone"));
        phone.read();
        phone.read();
        phone.close();
    }
    ASSERT_TRUE(wait_for_cursor("alice", "phone", "c1", first));

    // The laptop has never synced, so it starts from the beginning.
    WsClient laptop(port_, ws_target("c1", "alice", "laptop"));
    auto ready = laptop.read();
    EXPECT_EQ(ready["cursor"], "0");
    EXPECT_EQ(laptop.read()["stream_id"], first);
    laptop.close();
}

TEST_F(ServerTest, TypingIsRelayedToOtherConnections)
{
    WsClient alice(port_, ws_target("c1", "alice", "phone"));
    WsClient bob(port_, ws_target("c1", "bob", "tablet"));
    alice.read();
    bob.read();

    alice.write(R"({"type":"typing","conversation_id":"c1","user_id":"alice"})");

    auto frame = bob.read();
    EXPECT_EQ(frame["type"], "typing.started");
    EXPECT_EQ(frame["user_id"], "alice");

    alice.close();
    bob.close();
}

// =============================================================================
// Shutdown
// =============================================================================

TEST_F(ServerTest, StopClosesSessionsWithGoingAway)
{
    WsClient client(port_, ws_target("c1", "alice", "phone"));
    client.read();

    // Destroying the App also releases the sockets, so the client's
    // closing handshake can finish even if the server stopped first.
    std::thread stopper([this]
                        { app_.reset(); });

    beast::flat_buffer buffer;
    beast::error_code ec;
    client.stream().read(buffer, ec);
    stopper.join();

    EXPECT_TRUE(ec);
    if (ec == ws::error::closed)
        EXPECT_EQ(client.stream().reason().code, ws::close_code::going_away);
}
