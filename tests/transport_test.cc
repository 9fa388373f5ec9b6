#include "test_support.h"
#include "transport/polling_transport.h"
#include "transport/websocket_transport.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace eio::transport;
using eio::protocol::Packet;
using eio::protocol::PacketType;
using eio::testing::FakeWebSocketConnection;
using eio::testing::make_request;

TEST(TransportNameTest, NamesRoundTrip) {
    EXPECT_EQ(transport_name(TransportKind::POLLING), "polling");
    EXPECT_EQ(transport_name(TransportKind::WEBSOCKET), "websocket");
    EXPECT_EQ(parse_transport("polling"), TransportKind::POLLING);
    EXPECT_EQ(parse_transport("websocket"), TransportKind::WEBSOCKET);
    EXPECT_FALSE(parse_transport("flashsocket").has_value());
    EXPECT_FALSE(parse_transport("").has_value());
}

class PollingTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<PollingTransport>();
        transport->set_packet_handler([this](const Packet &packet) { received.push_back(packet); });
        transport->set_close_handler([this]() { ++close_events; });
    }

    HttpResponse serve(const HttpRequest &request) {
        HttpResponse response;
        HttpExchange exchange{request, response};
        transport->on_request(exchange);
        return response;
    }

    std::shared_ptr<PollingTransport> transport;
    std::vector<Packet> received;
    int close_events = 0;
};

TEST_F(PollingTransportTest, GetFlushesQueuedPacketsInOrder) {
    transport->send({{PacketType::MESSAGE, "one"}});
    transport->send({{PacketType::MESSAGE, "two"}, {PacketType::PING, ""}});

    auto response = serve(make_request("GET", "/engine.io/?transport=polling&sid=x"));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Type"), "text/plain; charset=UTF-8");
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(response.body, "4:4one4:4two1:2");
    EXPECT_EQ(transport->pending_count(), 0u);
}

TEST_F(PollingTransportTest, EmptyGetAnswersNoop) {
    auto request = make_request("GET", "/engine.io/?transport=polling&sid=x");
    request.headers["Origin"] = "http://client.example";

    auto response = serve(request);

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "1:6");
    EXPECT_EQ(response.header("Access-Control-Allow-Origin"), "http://client.example");
    EXPECT_EQ(response.header("Access-Control-Allow-Credentials"), "true");
}

TEST_F(PollingTransportTest, PostDeliversEachPacket) {
    auto response = serve(make_request("POST", "/engine.io/?transport=polling&sid=x", "6:4hello1:2"));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "ok");
    EXPECT_EQ(response.header("Content-Type"), "text/html");
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], (Packet{PacketType::MESSAGE, "hello"}));
    EXPECT_EQ(received[1], (Packet{PacketType::PING, ""}));
}

TEST_F(PollingTransportTest, MalformedPostIsBadRequest) {
    auto response = serve(make_request("POST", "/engine.io/?transport=polling&sid=x", "garbage"));

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(nlohmann::json::parse(response.body)["code"], 3);
    EXPECT_TRUE(received.empty());
}

TEST_F(PollingTransportTest, OtherMethodsAreBadRequest) {
    auto response = serve(make_request("PUT", "/engine.io/?transport=polling&sid=x"));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(nlohmann::json::parse(response.body)["code"], 3);
}

TEST_F(PollingTransportTest, CloseQueuesCloseOnceAndNotifiesOnce) {
    transport->send({{PacketType::MESSAGE, "last"}});
    transport->close();
    transport->close();

    EXPECT_TRUE(transport->is_closed());
    EXPECT_EQ(close_events, 1);

    // sends after close are dropped
    transport->send({{PacketType::MESSAGE, "late"}});
    auto drained = transport->drain();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].data, "last");
    EXPECT_EQ(drained[1].type, PacketType::CLOSE);
}

TEST_F(PollingTransportTest, ClearedHandlersAreNotCalled) {
    transport->clear_handlers();
    serve(make_request("POST", "/engine.io/?transport=polling&sid=x", "2:4a"));
    transport->close();

    EXPECT_TRUE(received.empty());
    EXPECT_EQ(close_events, 0);
}

TEST(WebSocketTransportTest, FramesMapToPackets) {
    auto connection = std::make_shared<FakeWebSocketConnection>();
    auto transport = WebSocketTransport::create(connection);
    std::vector<Packet> received;
    transport->set_packet_handler([&received](const Packet &packet) { received.push_back(packet); });

    connection->receive("4hello");
    connection->receive("");// undecodable, dropped
    connection->receive("2probe");
    transport->send({{PacketType::PONG, "probe"}, {PacketType::MESSAGE, "hi"}});

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], (Packet{PacketType::MESSAGE, "hello"}));
    EXPECT_EQ(received[1], (Packet{PacketType::PING, "probe"}));
    EXPECT_EQ(connection->written, (std::vector<std::string>{"3probe", "4hi"}));
    EXPECT_EQ(transport->kind(), TransportKind::WEBSOCKET);
}

TEST(WebSocketTransportTest, PeerCloseNotifiesOnce) {
    auto connection = std::make_shared<FakeWebSocketConnection>();
    auto transport = WebSocketTransport::create(connection);
    int close_events = 0;
    transport->set_close_handler([&close_events]() { ++close_events; });

    connection->peer_close();
    connection->fail("reset by peer");
    transport->close();

    EXPECT_TRUE(transport->is_closed());
    EXPECT_EQ(close_events, 1);
    EXPECT_EQ(connection->close_calls, 0);

    transport->send({{PacketType::MESSAGE, "late"}});
    EXPECT_TRUE(connection->written.empty());
}

TEST(WebSocketTransportTest, LocalCloseClosesConnectionOnce) {
    auto connection = std::make_shared<FakeWebSocketConnection>();
    auto transport = WebSocketTransport::create(connection);
    int close_events = 0;
    transport->set_close_handler([&close_events]() { ++close_events; });

    transport->close();
    transport->close();

    EXPECT_EQ(connection->close_calls, 1);
    EXPECT_EQ(close_events, 1);
}

TEST(WebSocketTransportTest, ConnectionDoesNotOwnTransport) {
    auto connection = std::make_shared<FakeWebSocketConnection>();
    std::weak_ptr<WebSocketTransport> weak;
    {
        auto transport = WebSocketTransport::create(connection);
        weak = transport;
    }
    EXPECT_TRUE(weak.expired());
    connection->receive("4ignored");
    connection->peer_close();
}
