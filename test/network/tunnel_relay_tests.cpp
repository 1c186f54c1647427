#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/real_transport.hpp"
#include "network/tunnel_provisioner.hpp"
#include "network/tunnel_relay.hpp"
#include "network/websocket_transport.hpp"
#include "network/test_helpers.hpp"
#include <atomic>
#include <mutex>
#include <string>

using namespace whisperlink;
using namespace whisperlink::network;
using namespace whisperlink::test;

TEST_CASE("TunnelRelay answers plain HTTP with the liveness body", "[network][tunnel][relay]") {
    TunnelRelay relay;
    REQUIRE(relay.start(0, 9));
    REQUIRE(relay.is_running());
    REQUIRE(relay.port() != 0);
    CHECK(relay.target_port() == 9);

    BeastHttpFetcher fetcher;
    auto response = fetcher.get("http://127.0.0.1:" + std::to_string(relay.port()) + "/anything",
                                std::chrono::seconds(3));
    REQUIRE(response.ok);
    CHECK(response.status == 200);
    CHECK(response.body == protocol::RELAY_LIVENESS_BODY);

    relay.stop();
    CHECK_FALSE(relay.is_running());
    CHECK(relay.port() == 0);
}

TEST_CASE("TunnelRelay start/stop lifecycle", "[network][tunnel][relay]") {
    TunnelRelay relay;

    // stop() before start() is harmless
    relay.stop();

    REQUIRE(relay.start(0, 9));
    CHECK_FALSE(relay.start(0, 9)); // already running
    relay.stop();
    relay.stop();

    // Restart after stop
    REQUIRE(relay.start(0, 10));
    CHECK(relay.target_port() == 10);
    relay.stop();

    // Invalid bind address
    CHECK_FALSE(relay.start(0, 9, "not-an-address"));
    CHECK_FALSE(relay.is_running());
}

TEST_CASE("TunnelRelay refuses a port that is already bound", "[network][tunnel][relay]") {
    TunnelRelay first;
    REQUIRE(first.start(0, 9));

    TunnelRelay second;
    CHECK_FALSE(second.start(first.port(), 9));
    CHECK_FALSE(second.is_running());

    first.stop();
}

TEST_CASE("TunnelRelay bridges WebSocket messages to the direct listener", "[network][tunnel][relay]") {
    // Direct listener echoing whatever it receives
    RealTransport server(1);
    std::mutex m;
    std::vector<TransportConnectionPtr> accepted;
    REQUIRE(server.listen(0, [&](TransportConnectionPtr c) {
        {
            std::lock_guard<std::mutex> lock(m);
            accepted.push_back(c);
        }
        std::weak_ptr<TransportConnection> weak = c;
        c->set_receive_callback([weak](const std::vector<uint8_t> &data) {
            if (auto conn = weak.lock())
                conn->send(data);
        });
        c->start();
    }));
    server.run();

    TunnelRelay relay;
    REQUIRE(relay.start(0, server.listening_port()));

    ReactorThread reactor;
    auto url = util::ParseUrl("ws://127.0.0.1:" + std::to_string(relay.port()) + "/");
    REQUIRE(url.has_value());

    std::atomic<bool> opened{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> disconnected{false};
    std::vector<uint8_t> received;

    auto ws = CreateWebSocketConnection(reactor.io(), *url, std::chrono::seconds(5),
                                        [&](TransportError err) {
                                            if (err == TransportError::NONE)
                                                opened = true;
                                            else
                                                failed = true;
                                        });
    REQUIRE(ws);
    REQUIRE(WaitUntil([&] { return opened.load() || failed.load(); }));
    REQUIRE(opened);
    CHECK(ws->kind() == TransportKind::TUNNEL_WEBSOCKET);

    ws->set_receive_callback([&](const std::vector<uint8_t> &data) {
        std::lock_guard<std::mutex> lock(m);
        received.insert(received.end(), data.begin(), data.end());
    });
    ws->set_disconnect_callback([&] { disconnected = true; });
    ws->start();

    auto frame = message::EncodeFrame(R"({"type":"chat","message":"aGk="})");
    REQUIRE(ws->send(frame));

    REQUIRE(WaitUntil([&] {
        std::lock_guard<std::mutex> lock(m);
        return received.size() == frame.size();
    }));
    {
        std::lock_guard<std::mutex> lock(m);
        CHECK(received == frame);
        CHECK(accepted.size() == 1);
    }

    // Closing the listener side tears down the WebSocket too
    {
        std::lock_guard<std::mutex> lock(m);
        accepted.front()->close();
    }
    CHECK(WaitUntil([&] { return disconnected.load(); }));

    ws->close();
    relay.stop();
    server.stop();
}
