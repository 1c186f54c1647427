// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "crypto/crypto_box.hpp"
#include "network/handshake.hpp"
#include "network/message.hpp"
#include <string>

using namespace whisperlink;
using namespace whisperlink::network;

namespace {

message::HandshakeFrame MakeIdentity(const std::string& id, const std::string& name) {
    auto kp = crypto::CryptoBox::GenerateKeyPair();
    REQUIRE(kp.has_value());
    return {id, name, kp->public_key};
}

std::string AcceptedResponse(const message::HandshakeFrame& who) {
    message::HandshakeResponse r{who.user_id, who.username, who.public_key,
                                 protocol::status::ACCEPTED};
    return message::EncodeHandshakeResponse(r);
}

} // namespace

TEST_CASE("Initiator happy path", "[handshake][initiator]") {
    auto alice = MakeIdentity("alice-id", "alice");
    auto bob = MakeIdentity("bob-id", "bob");

    HandshakeProtocol hs(HandshakeRole::INITIATOR, alice);
    hs.set_expected_peer_id("bob-id");
    CHECK(hs.state() == HandshakeState::INIT);

    auto body = hs.begin();
    REQUIRE(body.has_value());
    CHECK(hs.state() == HandshakeState::SENT);
    CHECK_FALSE(hs.begin().has_value()); // single use

    hs.mark_sent();
    CHECK(hs.state() == HandshakeState::AWAITING_RESPONSE);

    CHECK(hs.on_response(AcceptedResponse(bob)) == HandshakeState::ACCEPTED);
    CHECK(hs.accepted());
    CHECK(hs.finished());
    CHECK(hs.remote().user_id == "bob-id");
    CHECK(hs.remote().public_key == bob.public_key);
    CHECK(hs.error() == HandshakeError::NONE);
}

TEST_CASE("Initiator failure modes", "[handshake][initiator]") {
    auto alice = MakeIdentity("alice-id", "alice");
    auto bob = MakeIdentity("bob-id", "bob");

    HandshakeProtocol hs(HandshakeRole::INITIATOR, alice);
    hs.set_expected_peer_id("bob-id");
    REQUIRE(hs.begin().has_value());
    hs.mark_sent();

    SECTION("Rejected status") {
        CHECK(hs.on_response(R"({"status":"rejected"})") == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::REJECTED);
    }

    SECTION("Peer keeps its own simultaneous dial") {
        CHECK(hs.on_response(R"({"status":"simultaneous"})") == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::SIMULTANEOUS_DIAL);
        CHECK_FALSE(hs.accepted());
    }

    SECTION("Unexpected responder identity") {
        auto mallory = MakeIdentity("mallory-id", "mallory");
        CHECK(hs.on_response(AcceptedResponse(mallory)) == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::REJECTED);
    }

    SECTION("Malformed response") {
        CHECK(hs.on_response("nope") == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::MALFORMED);
    }

    SECTION("Invalid public key in an accepted response") {
        message::HandshakeFrame bad{"bob-id", "bob", "xyz"};
        CHECK(hs.on_response(AcceptedResponse(bad)) == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::MALFORMED);
    }

    SECTION("Timeout") {
        hs.on_timeout();
        CHECK(hs.state() == HandshakeState::TIMED_OUT);
        CHECK(hs.error() == HandshakeError::TIMED_OUT);
    }

    SECTION("Transport closed") {
        hs.on_closed();
        CHECK(hs.state() == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::CLOSED);
    }

    SECTION("Terminal state is sticky") {
        hs.on_timeout();
        CHECK(hs.on_response(AcceptedResponse(bob)) == HandshakeState::TIMED_OUT);
        hs.on_closed();
        CHECK(hs.error() == HandshakeError::TIMED_OUT);
    }
}

TEST_CASE("Responder accepts and answers with its identity", "[handshake][responder]") {
    auto alice = MakeIdentity("alice-id", "alice");
    auto bob = MakeIdentity("bob-id", "bob");

    HandshakeProtocol hs(HandshakeRole::RESPONDER, bob);
    bool asked = false;
    auto reply = hs.on_request(message::EncodeHandshake(alice),
                               [&](const message::HandshakeFrame& remote) {
                                   asked = true;
                                   CHECK(remote.user_id == "alice-id");
                                   return HandshakeDecision::Accept();
                               });
    REQUIRE(reply.has_value());
    CHECK(asked);
    CHECK(hs.accepted());
    CHECK(hs.remote().username == "alice");

    HandshakeError err = HandshakeError::NONE;
    auto response = message::DecodeHandshakeResponse(*reply, err);
    REQUIRE(response.has_value());
    CHECK(response->accepted());
    CHECK(response->user_id == "bob-id");
    CHECK(response->public_key == bob.public_key);
}

TEST_CASE("Responder rejection and malformed input", "[handshake][responder]") {
    auto alice = MakeIdentity("alice-id", "alice");
    auto bob = MakeIdentity("bob-id", "bob");
    HandshakeProtocol hs(HandshakeRole::RESPONDER, bob);

    SECTION("Decider rejects: a rejected response is still produced") {
        auto reply = hs.on_request(message::EncodeHandshake(alice),
                                   [](const message::HandshakeFrame&) {
                                       return HandshakeDecision::Reject("unknown peer");
                                   });
        REQUIRE(reply.has_value());
        CHECK(hs.state() == HandshakeState::REJECTED);
        CHECK(hs.reason() == "unknown peer");

        HandshakeError err = HandshakeError::NONE;
        auto response = message::DecodeHandshakeResponse(*reply, err);
        REQUIRE(response.has_value());
        CHECK_FALSE(response->accepted());
    }

    SECTION("Yielding to our own dial answers simultaneous") {
        auto reply = hs.on_request(message::EncodeHandshake(alice),
                                   [](const message::HandshakeFrame&) {
                                       return HandshakeDecision::YieldToOwnDial("dialing alice");
                                   });
        REQUIRE(reply.has_value());
        CHECK(hs.state() == HandshakeState::REJECTED);
        CHECK(hs.error() == HandshakeError::SIMULTANEOUS_DIAL);

        HandshakeError err = HandshakeError::NONE;
        auto response = message::DecodeHandshakeResponse(*reply, err);
        REQUIRE(response.has_value());
        CHECK(response->status == "simultaneous");
        CHECK_FALSE(response->accepted());

        // The initiator that receives it learns why
        HandshakeProtocol initiator(HandshakeRole::INITIATOR, alice);
        REQUIRE(initiator.begin().has_value());
        initiator.mark_sent();
        CHECK(initiator.on_response(*reply) == HandshakeState::REJECTED);
        CHECK(initiator.error() == HandshakeError::SIMULTANEOUS_DIAL);
    }

    SECTION("Incomplete handshake: no answer, decider never consulted") {
        bool asked = false;
        auto reply = hs.on_request(R"({"user_id":"alice-id","username":"alice"})",
                                   [&](const message::HandshakeFrame&) {
                                       asked = true;
                                       return HandshakeDecision::Accept();
                                   });
        CHECK_FALSE(reply.has_value());
        CHECK_FALSE(asked);
        CHECK(hs.error() == HandshakeError::INCOMPLETE_FIELDS);
    }

    SECTION("No decider rejects") {
        auto reply = hs.on_request(message::EncodeHandshake(alice), HandshakeDecider{});
        REQUIRE(reply.has_value());
        CHECK(hs.state() == HandshakeState::REJECTED);
    }

    SECTION("Second request is ignored") {
        auto accept = [](const message::HandshakeFrame&) { return HandshakeDecision::Accept(); };
        REQUIRE(hs.on_request(message::EncodeHandshake(alice), accept).has_value());
        CHECK_FALSE(hs.on_request(message::EncodeHandshake(alice), accept).has_value());
    }
}
