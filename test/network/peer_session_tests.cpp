// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/peer_session.hpp"
#include "network/test_helpers.hpp"
#include <atomic>
#include <mutex>
#include <string>

using namespace whisperlink;
using namespace whisperlink::network;
using namespace whisperlink::test;

namespace {

message::HandshakeFrame FrameOf(const LocalIdentity& id) {
    return {id.user_id, id.username, id.public_key};
}

std::string AcceptedBy(const LocalIdentity& id) {
    return message::EncodeHandshakeResponse(
        {id.user_id, id.username, id.public_key, protocol::status::ACCEPTED});
}

// Captures the callbacks a session fires
struct SessionProbe {
    std::mutex mutex;
    std::atomic<int> handshake_calls{0};
    std::atomic<bool> accepted{false};
    HandshakeError error{HandshakeError::NONE};
    std::vector<std::string> frames;
    std::atomic<int> closed_calls{0};
    std::string closed_reason;

    void attach(const PeerSessionPtr& session) {
        session->set_handshake_callback([this](const PeerSessionPtr&, const HandshakeProtocol& hs) {
            std::lock_guard<std::mutex> lock(mutex);
            error = hs.error();
            accepted = hs.accepted();
            ++handshake_calls;
        });
        session->set_frame_callback([this](const PeerSessionPtr&, const std::string& body) {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(body);
        });
        session->set_closed_callback([this](const PeerSessionPtr&, const std::string& reason) {
            std::lock_guard<std::mutex> lock(mutex);
            closed_reason = reason;
            ++closed_calls;
        });
    }

    size_t frame_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
};

} // namespace

TEST_CASE("PeerSession outbound: handshake then frames", "[network][session]") {
    ReactorThread reactor;
    auto alice = MakeIdentity("alice");
    auto bob = MakeIdentity("bob");
    auto conn = std::make_shared<MockTransportConnection>(false);

    auto session = PeerSession::create_outbound(reactor.io(), conn, 1, FrameOf(alice), bob.user_id,
                                                std::chrono::seconds(5));
    SessionProbe probe;
    probe.attach(session);
    session->start();

    // Handshake goes out first
    REQUIRE(WaitUntil([&] { return conn->sent_frames().size() == 1; }));
    CHECK(conn->started());
    HandshakeError err = HandshakeError::NONE;
    auto hs = message::DecodeHandshake(conn->sent_frames()[0], err);
    REQUIRE(hs.has_value());
    CHECK(hs->user_id == alice.user_id);

    CHECK_FALSE(session->send_frame("too early"));

    // Response and the first envelope arrive in one read
    auto bytes = message::EncodeFrame(AcceptedBy(bob));
    auto env = message::EncodeFrame(R"({"type":"chat","message":"eA=="})");
    bytes.insert(bytes.end(), env.begin(), env.end());
    conn->inject_bytes(bytes);

    REQUIRE(WaitUntil([&] { return probe.frame_count() == 1; }));
    CHECK(probe.handshake_calls == 1);
    CHECK(probe.accepted);
    CHECK(session->is_established());
    CHECK(session->remote().user_id == bob.user_id);
    CHECK_FALSE(session->is_inbound());

    CHECK(session->send_frame(R"({"type":"chat","message":"eQ=="})"));
    CHECK(conn->sent_frames().size() == 2);

    // Remote close reports once, with the session ESTABLISHED before
    conn->close();
    REQUIRE(WaitUntil([&] { return probe.closed_calls == 1; }));
    CHECK(session->state() == PeerSessionState::CLOSED);
    CHECK_FALSE(session->send_frame("after close"));
    CHECK(probe.handshake_calls == 1);
}

TEST_CASE("PeerSession outbound: rejected handshake closes the transport", "[network][session]") {
    ReactorThread reactor;
    auto alice = MakeIdentity("alice");
    auto bob = MakeIdentity("bob");
    auto conn = std::make_shared<MockTransportConnection>(false);

    auto session = PeerSession::create_outbound(reactor.io(), conn, 2, FrameOf(alice), bob.user_id,
                                                std::chrono::seconds(5));
    SessionProbe probe;
    probe.attach(session);
    session->start();
    REQUIRE(WaitUntil([&] { return conn->sent_frames().size() == 1; }));

    conn->inject_frame(R"({"status":"rejected"})");

    REQUIRE(WaitUntil([&] { return session->state() == PeerSessionState::CLOSED; }));
    CHECK(probe.handshake_calls == 1);
    CHECK_FALSE(probe.accepted);
    CHECK(probe.error == HandshakeError::REJECTED);
    CHECK_FALSE(conn->is_open());
    // Never established, so no closed callback
    CHECK(probe.closed_calls == 0);
}

TEST_CASE("PeerSession handshake timeout (test override)", "[network][session][timeout]") {
    ReactorThread reactor;
    auto alice = MakeIdentity("alice");
    auto conn = std::make_shared<MockTransportConnection>(true);

    PeerSession::SetHandshakeTimeoutForTest(std::chrono::milliseconds(100));
    auto session = PeerSession::create_inbound(
        reactor.io(), conn, 3, FrameOf(alice),
        [](const message::HandshakeFrame&) { return HandshakeDecision::Accept(); },
        std::chrono::seconds(30));
    SessionProbe probe;
    probe.attach(session);
    session->start();

    REQUIRE(WaitUntil([&] { return probe.handshake_calls == 1; }, std::chrono::seconds(2)));
    CHECK(probe.error == HandshakeError::TIMED_OUT);
    CHECK(WaitUntil([&] { return !conn->is_open(); }));
    CHECK(conn->sent_frames().empty());
    PeerSession::ResetHandshakeTimeoutForTest();
}

TEST_CASE("PeerSession inbound: accept answers with the local identity", "[network][session]") {
    ReactorThread reactor;
    auto alice = MakeIdentity("alice");
    auto bob = MakeIdentity("bob");
    auto conn = std::make_shared<MockTransportConnection>(true);

    std::string seen_peer;
    auto session = PeerSession::create_inbound(
        reactor.io(), conn, 4, FrameOf(bob),
        [&](const message::HandshakeFrame& remote) {
            seen_peer = remote.user_id;
            return HandshakeDecision::Accept();
        },
        std::chrono::seconds(5));
    SessionProbe probe;
    probe.attach(session);
    session->start();

    conn->inject_frame(message::EncodeHandshake(FrameOf(alice)));

    REQUIRE(WaitUntil([&] { return probe.handshake_calls == 1; }));
    CHECK(probe.accepted);
    CHECK(seen_peer == alice.user_id);
    CHECK(session->is_inbound());
    REQUIRE(conn->sent_frames().size() == 1);

    HandshakeError err = HandshakeError::NONE;
    auto response = message::DecodeHandshakeResponse(conn->sent_frames()[0], err);
    REQUIRE(response.has_value());
    CHECK(response->accepted());
    CHECK(response->user_id == bob.user_id);

    session->disconnect("test done");
    session->disconnect("again");
    REQUIRE(WaitUntil([&] { return probe.closed_calls == 1; }));
    CHECK(probe.closed_reason == "test done");
    CHECK(conn->close_count() == 1);
}

TEST_CASE("PeerSession inbound: incomplete handshake closes without an answer", "[network][session]") {
    ReactorThread reactor;
    auto bob = MakeIdentity("bob");
    auto conn = std::make_shared<MockTransportConnection>(true);
    bool decider_called = false;

    auto session = PeerSession::create_inbound(
        reactor.io(), conn, 5, FrameOf(bob),
        [&](const message::HandshakeFrame&) {
            decider_called = true;
            return HandshakeDecision::Accept();
        },
        std::chrono::seconds(5));
    SessionProbe probe;
    probe.attach(session);
    session->start();

    conn->inject_frame(R"({"user_id":"x","username":"y"})");

    REQUIRE(WaitUntil([&] { return !conn->is_open(); }));
    CHECK(probe.handshake_calls == 1);
    CHECK(probe.error == HandshakeError::INCOMPLETE_FIELDS);
    CHECK_FALSE(decider_called);
    CHECK(conn->sent_frames().empty());
}

TEST_CASE("PeerSession inbound: rejection is delivered before the close", "[network][session]") {
    ReactorThread reactor;
    auto alice = MakeIdentity("alice");
    auto bob = MakeIdentity("bob");
    auto conn = std::make_shared<MockTransportConnection>(true);

    auto session = PeerSession::create_inbound(
        reactor.io(), conn, 6, FrameOf(bob),
        [](const message::HandshakeFrame&) { return HandshakeDecision::Reject("not a contact"); },
        std::chrono::seconds(5));
    SessionProbe probe;
    probe.attach(session);
    session->start();

    conn->inject_frame(message::EncodeHandshake(FrameOf(alice)));

    REQUIRE(WaitUntil([&] { return conn->sent_frames().size() == 1; }));
    HandshakeError err = HandshakeError::NONE;
    auto response = message::DecodeHandshakeResponse(conn->sent_frames()[0], err);
    REQUIRE(response.has_value());
    CHECK_FALSE(response->accepted());

    // The transport lingers briefly, then goes away
    REQUIRE(WaitUntil([&] { return !conn->is_open(); }, std::chrono::seconds(3)));
    CHECK(probe.closed_calls == 0);
}

TEST_CASE("PeerSession oversized frame closes the session", "[network][session]") {
    ReactorThread reactor;
    auto bob = MakeIdentity("bob");
    auto conn = std::make_shared<MockTransportConnection>(true);

    auto session = PeerSession::create_inbound(
        reactor.io(), conn, 7, FrameOf(bob),
        [](const message::HandshakeFrame&) { return HandshakeDecision::Accept(); },
        std::chrono::seconds(5));
    session->start();

    // Length prefix announces 16 MiB
    conn->inject_bytes({0x01, 0x00, 0x00, 0x00});
    REQUIRE(WaitUntil([&] { return session->state() == PeerSessionState::CLOSED; }));
    CHECK_FALSE(conn->is_open());
}

TEST_CASE("PeerSession start on a closed transport", "[network][session]") {
    ReactorThread reactor;
    auto alice = MakeIdentity("alice");
    auto conn = std::make_shared<MockTransportConnection>(false);
    conn->close();

    auto session = PeerSession::create_outbound(reactor.io(), conn, 8, FrameOf(alice), "bob",
                                                std::chrono::seconds(5));
    SessionProbe probe;
    probe.attach(session);
    session->start();
    session->start(); // single use: ignored

    REQUIRE(WaitUntil([&] { return probe.handshake_calls == 1; }));
    CHECK(probe.error == HandshakeError::CLOSED);
    CHECK(session->state() == PeerSessionState::CLOSED);
}
