// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/connection_manager.hpp"
#include "network/tunnel_relay.hpp"
#include "network/test_helpers.hpp"
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <array>
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace whisperlink;
using namespace whisperlink::network;
using namespace whisperlink::test;

namespace {

// One messenger instance: identity, contacts, manager and recorded events
struct Node {
    LocalIdentity identity;
    StaticIdentityProvider identity_provider;
    MemoryContactDirectory contacts;
    std::unique_ptr<ConnectionManager> manager;

    std::mutex mutex;
    std::vector<IncomingMessage> messages;
    std::vector<std::pair<std::string, bool>> connected;   // peer_id, inbound
    std::vector<std::pair<std::string, std::string>> disconnected; // peer_id, reason
    std::vector<MessageEvents::Subscription> subs;

    explicit Node(const std::string &username,
                  ConnectionManager::Config config = ConnectionManager::Config{},
                  std::unique_ptr<TunnelBridge> tunnel = nullptr)
        : identity(MakeIdentity(username)), identity_provider(identity) {
        manager = std::make_unique<ConnectionManager>(contacts, identity_provider, config,
                                                      std::move(tunnel));
        auto record = [this](const IncomingMessage &msg) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(msg);
        };
        subs.push_back(manager->add_message_handler(message::MessageKind::CHAT, record));
        subs.push_back(manager->add_message_handler(message::MessageKind::SIGNAL, record));
        subs.push_back(manager->events().SubscribePeerConnected(
            [this](const std::string &peer_id, const std::string &, TransportKind, bool inbound) {
                std::lock_guard<std::mutex> lock(mutex);
                connected.emplace_back(peer_id, inbound);
            }));
        subs.push_back(manager->events().SubscribePeerDisconnected(
            [this](const std::string &peer_id, const std::string &reason) {
                std::lock_guard<std::mutex> lock(mutex);
                disconnected.emplace_back(peer_id, reason);
            }));
    }

    ~Node() {
        subs.clear();
        manager->shutdown();
    }

    uint16_t listen() {
        auto [ok, info] = manager->start_listening(0);
        if (!ok)
            throw std::runtime_error("listen failed: " + info);
        return manager->listen_info().port;
    }

    void know(const Node &other, uint16_t port) {
        contacts.AddContact(ContactFor(other.identity, "127.0.0.1:" + std::to_string(port)));
    }

    bool connected_to(const std::string &peer_id) {
        auto info = manager->get_connection(peer_id);
        return info && info->status == ConnectionStatus::CONNECTED;
    }

    size_t message_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

    size_t disconnect_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return disconnected.size();
    }
};

// Stand-in for a peer behind a tunnel whose public URL only upgrades on the
// fallback path: "/" gets a 404, "/ws" upgrades and answers the handshake as
// `identity`, then holds the WebSocket until the dialer leaves.
class WsPathOnlyPeer {
public:
    explicit WsPathOnlyPeer(LocalIdentity identity)
        : identity_(std::move(identity)),
          acceptor_(io_, {boost::asio::ip::make_address("127.0.0.1"), 0}),
          thread_([this] { serve(); }) {}

    ~WsPathOnlyPeer() {
        stop_ = true;
        // Unblock a pending accept
        boost::asio::io_context poke_io;
        boost::asio::ip::tcp::socket poke(poke_io);
        boost::system::error_code ec;
        poke.connect(acceptor_.local_endpoint(), ec);
        thread_.join();
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
    }

    std::vector<std::string> targets() {
        std::lock_guard<std::mutex> lock(mutex_);
        return targets_;
    }

private:
    void serve() {
        namespace beast = boost::beast;
        namespace http = beast::http;
        namespace websocket = beast::websocket;
        using boost::asio::ip::tcp;

        for (int served = 0; served < 2 && !stop_; ++served) {
            tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stop_)
                return;

            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec)
                continue;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                targets_.emplace_back(req.target().data(), req.target().size());
            }

            if (!websocket::is_upgrade(req) || req.target() != protocol::TUNNEL_FALLBACK_PATH) {
                http::response<http::string_body> res{http::status::not_found, req.version()};
                res.set(http::field::content_type, "text/plain");
                res.body() = "no tunnel here";
                res.keep_alive(false);
                res.prepare_payload();
                http::write(socket, res, ec);
                socket.shutdown(tcp::socket::shutdown_both, ec);
                continue;
            }

            websocket::stream<tcp::socket> ws(std::move(socket));
            ws.accept(req, ec);
            if (ec)
                return;

            message::FrameDecoder decoder;
            std::vector<std::string> frames;
            while (frames.empty()) {
                beast::flat_buffer incoming;
                ws.read(incoming, ec);
                if (ec)
                    return;
                decoder.feed(static_cast<const uint8_t *>(incoming.data().data()),
                             incoming.size(), frames);
            }
            HandshakeError err = HandshakeError::NONE;
            if (!message::DecodeHandshake(frames[0], err))
                return;

            message::HandshakeResponse response{identity_.user_id, identity_.username,
                                                identity_.public_key, protocol::status::ACCEPTED};
            auto frame = message::EncodeFrame(message::EncodeHandshakeResponse(response));
            ws.binary(true);
            ws.write(boost::asio::buffer(frame), ec);
            while (!ec) {
                beast::flat_buffer incoming;
                ws.read(incoming, ec);
            }
            return;
        }
    }

    LocalIdentity identity_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::vector<std::string> targets_;
    std::thread thread_;
};

Contact TunnelContact(const LocalIdentity &id, const std::string &url) {
    Contact c = ContactFor(id, "");
    c.connection_type = ContactConnectionType::TUNNEL;
    c.tunnel_url = url;
    return c;
}

// A listening, B dialing A directly; both sides CONNECTED on return
void ConnectDirect(Node &a, Node &b) {
    uint16_t port = a.listen();
    b.know(a, port);
    REQUIRE(b.manager->connect_to_peer(a.identity.user_id));
    REQUIRE(WaitUntil([&] { return a.connected_to(b.identity.user_id); }));
}

} // namespace

TEST_CASE("ConnectionManager direct connect and encrypted chat", "[network][manager]") {
    Node a("alice");
    Node b("bob");

    uint16_t port = a.listen();
    REQUIRE(port != 0);
    CHECK(a.manager->listen_info().listening);

    b.know(a, port);
    REQUIRE(b.manager->connect_to_peer(a.identity.user_id));
    REQUIRE(WaitUntil([&] { return a.connected_to(b.identity.user_id); }));

    // Both sides report the connection
    auto b_view = b.manager->get_connection(a.identity.user_id);
    REQUIRE(b_view.has_value());
    CHECK(b_view->status == ConnectionStatus::CONNECTED);
    CHECK(b_view->transport_kind == TransportKind::DIRECT_SOCKET);
    CHECK_FALSE(b_view->inbound);
    CHECK(b_view->peer_username == "alice");
    CHECK_FALSE(b_view->established_at.empty());

    auto a_view = a.manager->get_connection(b.identity.user_id);
    REQUIRE(a_view.has_value());
    CHECK(a_view->inbound);

    // Each side names the transport its session runs on
    CHECK(b_view->transport_id != 0);
    CHECK(a_view->transport_id != 0);
    CHECK(a.manager->get_active_connections().size() == 1);

    // Trust on first use stored bob on alice's side
    auto added = a.contacts.GetContact(b.identity.user_id);
    REQUIRE(added.has_value());
    CHECK(added->public_key == b.identity.public_key);

    // A connected event on each side
    REQUIRE(WaitUntil([&] {
        std::lock_guard<std::mutex> lock(a.mutex);
        return a.connected.size() == 1;
    }));
    {
        std::lock_guard<std::mutex> lock(b.mutex);
        REQUIRE(b.connected.size() == 1);
        CHECK(b.connected[0].first == a.identity.user_id);
        CHECK_FALSE(b.connected[0].second);
    }

    REQUIRE(a.manager->send_message(b.identity.user_id, "hello"));
    REQUIRE(WaitUntil([&] { return b.message_count() == 1; }));
    {
        std::lock_guard<std::mutex> lock(b.mutex);
        CHECK(b.messages[0].kind == message::MessageKind::CHAT);
        CHECK(b.messages[0].text == "hello");
        CHECK(b.messages[0].peer_id == a.identity.user_id);
        CHECK(b.messages[0].peer_username == "alice");
        CHECK_FALSE(b.messages[0].group_id.has_value());
        CHECK_FALSE(b.messages[0].timestamp.empty());
    }

    // And back
    REQUIRE(b.manager->send_message(a.identity.user_id, "hi alice"));
    REQUIRE(WaitUntil([&] { return a.message_count() == 1; }));

    // Reconnecting an established peer is a no-op success
    CHECK(b.manager->connect_to_peer(a.identity.user_id));
    CHECK(b.manager->get_active_connections().size() == 1);
}

TEST_CASE("ConnectionManager tunnel listen fails cleanly without the binary", "[network][manager][tunnel]") {
    ConnectionManager::Config config;
    config.tunnel.relay_port = PickFreePort();
    config.tunnel.provisioner.binary = "whisperlink-no-such-tunnel-binary";
    Node a("alice", config);

    auto [ok, reason] = a.manager->start_listening(0, true);
    CHECK_FALSE(ok);
    CHECK(reason.find("not found") != std::string::npos);
    CHECK(a.manager->last_error() == reason);

    // Neither the listener nor the relay survives
    auto info = a.manager->listen_info();
    CHECK_FALSE(info.listening);
    CHECK(info.tunnel_url.empty());

    TunnelRelay probe;
    CHECK(probe.start(config.tunnel.relay_port, 9));
    probe.stop();

    // A plain listen still works afterwards
    auto [ok2, info2] = a.manager->start_listening(0);
    CHECK(ok2);
    CHECK(info2.rfind("localhost:", 0) == 0);
}

TEST_CASE("ConnectionManager send to an unknown peer fails", "[network][manager]") {
    Node b("bob");
    CHECK_FALSE(b.manager->send_message("0123456789abcdef0123456789abcdef", "hi"));
    CHECK_FALSE(b.manager->last_error().empty());
    CHECK_FALSE(b.manager->connect_to_peer("0123456789abcdef0123456789abcdef"));
    CHECK(b.manager->last_error().find("unknown contact") != std::string::npos);
}

TEST_CASE("ConnectionManager disconnect of a never-connected peer is a no-op", "[network][manager]") {
    Node a("alice");
    Node b("bob");
    ConnectDirect(a, b);

    auto before = a.manager->get_active_connections();
    a.manager->disconnect_from_peer("ffffffffffffffffffffffffffffffff");
    a.manager->disconnect_from_peer("ffffffffffffffffffffffffffffffff");
    auto after = a.manager->get_active_connections();

    REQUIRE(after.size() == before.size());
    CHECK(after[0].peer_id == before[0].peer_id);
    CHECK(a.disconnect_count() == 0);
}

TEST_CASE("ConnectionManager closes an inbound handshake missing public_key", "[network][manager]") {
    Node a("alice");
    uint16_t port = a.listen();

    boost::asio::io_context io;
    boost::asio::ip::tcp::socket socket(io);
    socket.connect({boost::asio::ip::make_address("127.0.0.1"), port});

    auto frame = message::EncodeFrame(R"({"user_id":"0123456789abcdef0123456789abcdef","username":"mallory"})");
    boost::asio::write(socket, boost::asio::buffer(frame));

    // No answer, just EOF
    std::array<uint8_t, 64> buf{};
    boost::system::error_code read_ec;
    size_t read_bytes = 0;
    bool done = false;
    socket.async_read_some(boost::asio::buffer(buf),
                           [&](const boost::system::error_code &ec, size_t n) {
                               read_ec = ec;
                               read_bytes = n;
                               done = true;
                           });
    io.run_for(std::chrono::seconds(5));

    REQUIRE(done);
    CHECK(read_ec == boost::asio::error::eof);
    CHECK(read_bytes == 0);
    CHECK(a.manager->get_active_connections().empty());
    CHECK(a.contacts.ListContacts().empty());
}

TEST_CASE("ConnectionManager connects through a tunnel URL", "[network][manager][tunnel]") {
    auto world = std::make_shared<FakeTunnelWorld>();
    TunnelBridge::Config bridge_config;
    bridge_config.relay_port = PickFreePort();
    bridge_config.provisioner.poll_interval = std::chrono::milliseconds(10);
    const std::string public_url = "http://127.0.0.1:" + std::to_string(bridge_config.relay_port);
    world->control_responses.push_back(TunnelsBody(public_url));

    auto bridge = std::make_unique<TunnelBridge>(bridge_config, std::make_unique<FakeLauncher>(world),
                                                 std::make_unique<FakeFetcher>(world),
                                                 RecordingSleep(world));
    Node a("alice", ConnectionManager::Config{}, std::move(bridge));
    Node b("bob");

    auto [ok, info] = a.manager->start_listening(0, true);
    REQUIRE(ok);
    CHECK(info == public_url);
    CHECK(a.manager->listen_info().tunnel_url == public_url);

    Contact alice = ContactFor(a.identity, "");
    alice.connection_type = ContactConnectionType::TUNNEL;
    alice.tunnel_url = public_url;
    b.contacts.AddContact(alice);

    REQUIRE(b.manager->connect_to_peer(a.identity.user_id));
    auto view = b.manager->get_connection(a.identity.user_id);
    REQUIRE(view.has_value());
    CHECK(view->transport_kind == TransportKind::TUNNEL_WEBSOCKET);
    CHECK(view->address == public_url);
    CHECK(view->transport_id != 0);

    REQUIRE(WaitUntil([&] { return a.connected_to(b.identity.user_id); }));

    REQUIRE(b.manager->send_message(a.identity.user_id, "through the tunnel"));
    REQUIRE(WaitUntil([&] { return a.message_count() == 1; }));
    {
        std::lock_guard<std::mutex> lock(a.mutex);
        CHECK(a.messages[0].text == "through the tunnel");
    }
    REQUIRE(a.manager->send_message(b.identity.user_id, "and back"));
    REQUIRE(WaitUntil([&] { return b.message_count() == 1; }));

    a.manager->stop_listening();
    CHECK(a.manager->listen_info().tunnel_url.empty());
    std::lock_guard<std::mutex> lock(world->mutex);
    CHECK(world->terminations == 1);
}

TEST_CASE("ConnectionManager tunnel dial to a closed port fails cleanly", "[network][manager][tunnel]") {
    Node a("alice");
    Node b("bob");
    const uint16_t closed = PickFreePort();
    b.contacts.AddContact(TunnelContact(a.identity, "ws://127.0.0.1:" + std::to_string(closed)));

    CHECK_FALSE(b.manager->connect_to_peer(a.identity.user_id));
    CHECK_FALSE(b.manager->get_connection(a.identity.user_id).has_value());
    CHECK(b.manager->get_active_connections().empty());

    // Both candidate paths were tried; the reported failure is the last one
    auto error = b.manager->last_error();
    CHECK_FALSE(error.empty());
    CHECK(error.find(protocol::TUNNEL_FALLBACK_PATH) != std::string::npos);

    // The placeholder is gone, so a second attempt gets as far as dialing again
    CHECK_FALSE(b.manager->connect_to_peer(a.identity.user_id));
    CHECK(b.manager->last_error().find("in progress") == std::string::npos);
}

TEST_CASE("ConnectionManager tunnel dial gives up at the overall deadline", "[network][manager][tunnel]") {
    // Accepts TCP (kernel backlog) but never answers the upgrade
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor silent(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
    const std::string url = "http://127.0.0.1:" + std::to_string(silent.local_endpoint().port());

    ConnectionManager::Config config;
    config.tunnel_overall_timeout = std::chrono::milliseconds(400);
    Node a("alice");
    Node b("bob", config);
    b.contacts.AddContact(TunnelContact(a.identity, url));

    auto started = std::chrono::steady_clock::now();
    CHECK_FALSE(b.manager->connect_to_peer(a.identity.user_id));
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed >= std::chrono::milliseconds(350));
    CHECK(elapsed < std::chrono::seconds(3));
    CHECK_FALSE(b.manager->get_connection(a.identity.user_id).has_value());
    CHECK(b.manager->last_error().find("timed out") != std::string::npos);
}

TEST_CASE("ConnectionManager tunnel dial falls back to the /ws path", "[network][manager][tunnel]") {
    auto alice = MakeIdentity("alice");
    WsPathOnlyPeer peer(alice);
    Node b("bob");
    b.contacts.AddContact(TunnelContact(alice, peer.url()));

    REQUIRE(b.manager->connect_to_peer(alice.user_id));
    auto view = b.manager->get_connection(alice.user_id);
    REQUIRE(view.has_value());
    CHECK(view->status == ConnectionStatus::CONNECTED);
    CHECK(view->transport_kind == TransportKind::TUNNEL_WEBSOCKET);
    CHECK(view->peer_username == "alice");
    CHECK(view->transport_id != 0);

    auto targets = peer.targets();
    REQUIRE(targets.size() == 2);
    CHECK(targets[0] == "/");
    CHECK(targets[1] == protocol::TUNNEL_FALLBACK_PATH);

    b.manager->disconnect_from_peer(alice.user_id);
}

TEST_CASE("ConnectionManager peers dialing each other at once both connect", "[network][manager]") {
    for (int trial = 0; trial < 5; ++trial) {
        INFO("trial " << trial);
        Node a("alice");
        Node b("bob");
        const uint16_t a_port = a.listen();
        const uint16_t b_port = b.listen();
        a.know(b, b_port);
        b.know(a, a_port);

        auto a_dial = std::async(std::launch::async,
                                 [&] { return a.manager->connect_to_peer(b.identity.user_id); });
        auto b_dial = std::async(std::launch::async,
                                 [&] { return b.manager->connect_to_peer(a.identity.user_id); });
        const bool a_ok = a_dial.get();
        const bool b_ok = b_dial.get();
        INFO("alice: " << a.manager->last_error() << " | bob: " << b.manager->last_error());
        CHECK(a_ok);
        CHECK(b_ok);

        REQUIRE(WaitUntil([&] {
            return a.connected_to(b.identity.user_id) && b.connected_to(a.identity.user_id);
        }));
        CHECK(a.manager->get_active_connections().size() == 1);
        CHECK(b.manager->get_active_connections().size() == 1);

        // One surviving connection: outbound on one side, inbound on the other
        auto a_view = a.manager->get_connection(b.identity.user_id);
        auto b_view = b.manager->get_connection(a.identity.user_id);
        REQUIRE(a_view.has_value());
        REQUIRE(b_view.has_value());
        CHECK(a_view->inbound != b_view->inbound);

        REQUIRE(a.manager->send_message(b.identity.user_id, "ping"));
        REQUIRE(b.manager->send_message(a.identity.user_id, "pong"));
        REQUIRE(WaitUntil([&] { return a.message_count() == 1 && b.message_count() == 1; }));
    }
}

TEST_CASE("ConnectionManager without trust on first use rejects strangers", "[network][manager]") {
    ConnectionManager::Config strict;
    strict.trust_on_first_use = false;
    Node a("alice", strict);
    Node b("bob");

    uint16_t port = a.listen();
    b.know(a, port);
    CHECK_FALSE(b.manager->connect_to_peer(a.identity.user_id));
    CHECK_FALSE(b.manager->get_connection(a.identity.user_id).has_value());
    CHECK(a.contacts.ListContacts().empty());

    // Once bob is a contact the same dial succeeds
    a.know(b, 0);
    REQUIRE(b.manager->connect_to_peer(a.identity.user_id));
    CHECK(WaitUntil([&] { return a.connected_to(b.identity.user_id); }));
}

TEST_CASE("ConnectionManager rejects a public key that contradicts the contact", "[network][manager]") {
    Node a("alice");
    Node b("bob");
    auto impostor = MakeIdentity("bob");

    SECTION("inbound side holds a different key") {
        Contact stale = ContactFor(b.identity, "");
        stale.public_key = impostor.public_key;
        a.contacts.AddContact(stale);

        uint16_t port = a.listen();
        b.know(a, port);
        CHECK_FALSE(b.manager->connect_to_peer(a.identity.user_id));
        CHECK(a.manager->get_active_connections().empty());
    }

    SECTION("outbound side holds a different key") {
        uint16_t port = a.listen();
        Contact stale = ContactFor(a.identity, "127.0.0.1:" + std::to_string(port));
        stale.public_key = impostor.public_key;
        b.contacts.AddContact(stale);

        CHECK_FALSE(b.manager->connect_to_peer(a.identity.user_id));
        CHECK(b.manager->last_error().find("does not match") != std::string::npos);
        CHECK(b.manager->get_active_connections().empty());
    }
}

TEST_CASE("ConnectionManager refuses dials that cannot work", "[network][manager]") {
    Node b("bob");

    SECTION("closed port") {
        auto nobody = MakeIdentity("nobody");
        b.contacts.AddContact(ContactFor(nobody, "127.0.0.1:" + std::to_string(PickFreePort())));
        CHECK_FALSE(b.manager->connect_to_peer(nobody.user_id));
        CHECK(b.manager->last_error().find("refused") != std::string::npos);
        CHECK_FALSE(b.manager->get_connection(nobody.user_id).has_value());
    }

    SECTION("ourselves") {
        b.contacts.AddContact(ContactFor(b.identity, "127.0.0.1:1"));
        CHECK_FALSE(b.manager->connect_to_peer(b.identity.user_id));
    }

    SECTION("no address recorded") {
        auto nobody = MakeIdentity("nobody");
        b.contacts.AddContact(ContactFor(nobody, ""));
        CHECK_FALSE(b.manager->connect_to_peer(nobody.user_id));
        CHECK(b.manager->last_error().find("no address") != std::string::npos);
    }

    SECTION("no identity logged in") {
        auto nobody = MakeIdentity("nobody");
        b.contacts.AddContact(ContactFor(nobody, "127.0.0.1:1"));
        b.identity_provider.Logout();
        CHECK_FALSE(b.manager->connect_to_peer(nobody.user_id));
    }
}

TEST_CASE("ConnectionManager signals and group messages", "[network][manager]") {
    Node a("alice");
    Node b("bob");
    ConnectDirect(a, b);

    SECTION("signal payload must be a JSON object") {
        CHECK_FALSE(a.manager->send_signal(b.identity.user_id, "[1,2,3]"));
        CHECK_FALSE(a.manager->send_signal(b.identity.user_id, "not json"));
        REQUIRE(a.manager->send_signal(b.identity.user_id, R"({"type":"typing","active":true})"));

        REQUIRE(WaitUntil([&] { return b.message_count() == 1; }));
        std::lock_guard<std::mutex> lock(b.mutex);
        CHECK(b.messages[0].kind == message::MessageKind::SIGNAL);
        CHECK(b.messages[0].text == R"({"type":"typing","active":true})");
    }

    SECTION("group message skips ourselves") {
        std::vector<std::string> members{a.identity.user_id, b.identity.user_id,
                                         "ffffffffffffffffffffffffffffffff"};
        auto results = a.manager->send_group_message(members, "team update", "g-1", "Team");

        CHECK(results.count(a.identity.user_id) == 0);
        CHECK(results.at(b.identity.user_id));
        CHECK_FALSE(results.at("ffffffffffffffffffffffffffffffff"));

        REQUIRE(WaitUntil([&] { return b.message_count() == 1; }));
        std::lock_guard<std::mutex> lock(b.mutex);
        CHECK(b.messages[0].text == "team update");
        REQUIRE(b.messages[0].group_id.has_value());
        CHECK(*b.messages[0].group_id == "g-1");
        CHECK(b.messages[0].group_name == std::optional<std::string>("Team"));
    }
}

TEST_CASE("ConnectionManager drops undecryptable envelopes without closing", "[network][manager]") {
    Node a("alice");
    Node b("bob");
    ConnectDirect(a, b);

    // Bob seals with a key alice does not associate with him
    auto rotated = MakeIdentity("bob");
    rotated.user_id = b.identity.user_id;
    b.identity_provider.SetIdentity(rotated);
    REQUIRE(b.manager->send_message(a.identity.user_id, "garbled"));

    b.identity_provider.SetIdentity(b.identity);
    REQUIRE(b.manager->send_message(a.identity.user_id, "clear"));

    REQUIRE(WaitUntil([&] { return a.message_count() == 1; }));
    std::lock_guard<std::mutex> lock(a.mutex);
    CHECK(a.messages[0].text == "clear");
    CHECK(a.connected_to(b.identity.user_id));
}

TEST_CASE("ConnectionManager disconnect notifies both sides", "[network][manager]") {
    Node a("alice");
    Node b("bob");
    ConnectDirect(a, b);

    a.manager->disconnect_from_peer(b.identity.user_id);
    CHECK_FALSE(a.manager->get_connection(b.identity.user_id).has_value());
    CHECK_FALSE(a.manager->send_message(b.identity.user_id, "gone"));
    {
        std::lock_guard<std::mutex> lock(a.mutex);
        REQUIRE(a.disconnected.size() == 1);
        CHECK(a.disconnected[0].first == b.identity.user_id);
    }

    // Remote side sees the socket close
    REQUIRE(WaitUntil([&] { return b.disconnect_count() == 1; }));
    CHECK(b.manager->get_active_connections().empty());

    // And may dial again
    REQUIRE(b.manager->connect_to_peer(a.identity.user_id));
    CHECK(WaitUntil([&] { return a.connected_to(b.identity.user_id); }));
}

TEST_CASE("ConnectionManager shutdown is idempotent and final", "[network][manager]") {
    Node a("alice");
    Node b("bob");
    ConnectDirect(a, b);

    a.manager->shutdown();
    a.manager->shutdown();
    CHECK(a.manager->get_active_connections().empty());
    CHECK_FALSE(a.manager->start_listening(0).first);

    REQUIRE(WaitUntil([&] { return b.manager->get_active_connections().empty(); }));
}
