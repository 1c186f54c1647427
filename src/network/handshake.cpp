#include "network/handshake.hpp"
#include "crypto/crypto_box.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace whisperlink {
namespace network {

std::string HandshakeStateAsString(HandshakeState state) {
  switch (state) {
  case HandshakeState::INIT:
    return "INIT";
  case HandshakeState::SENT:
    return "SENT";
  case HandshakeState::AWAITING_RESPONSE:
    return "AWAITING_RESPONSE";
  case HandshakeState::ACCEPTED:
    return "ACCEPTED";
  case HandshakeState::REJECTED:
    return "REJECTED";
  case HandshakeState::TIMED_OUT:
    return "TIMED_OUT";
  }
  return "UNKNOWN";
}

HandshakeProtocol::HandshakeProtocol(HandshakeRole role, message::HandshakeFrame local)
    : role_(role), local_(std::move(local)) {}

bool HandshakeProtocol::finished() const {
  return state_ == HandshakeState::ACCEPTED || state_ == HandshakeState::REJECTED ||
         state_ == HandshakeState::TIMED_OUT;
}

void HandshakeProtocol::fail(HandshakeState state, HandshakeError error, std::string reason) {
  state_ = state;
  error_ = error;
  reason_ = std::move(reason);
  LOG_NET_DEBUG("handshake {} ({}): {}", HandshakeStateAsString(state_), to_string(error_), reason_);
}

bool HandshakeProtocol::validate_identity(const message::HandshakeFrame &identity) {
  if (!crypto::CryptoBox::IsValidKey(identity.public_key)) {
    fail(HandshakeState::REJECTED, HandshakeError::MALFORMED, "invalid public key");
    return false;
  }
  return true;
}

std::optional<std::string> HandshakeProtocol::begin() {
  if (role_ != HandshakeRole::INITIATOR || state_ != HandshakeState::INIT) {
    return std::nullopt;
  }
  state_ = HandshakeState::SENT;
  return message::EncodeHandshake(local_);
}

void HandshakeProtocol::mark_sent() {
  if (state_ == HandshakeState::SENT) {
    state_ = HandshakeState::AWAITING_RESPONSE;
  }
}

HandshakeState HandshakeProtocol::on_response(const std::string &body) {
  if (role_ != HandshakeRole::INITIATOR || finished()) {
    return state_;
  }
  if (state_ == HandshakeState::INIT) {
    fail(HandshakeState::REJECTED, HandshakeError::MALFORMED, "response before handshake sent");
    return state_;
  }

  HandshakeError err = HandshakeError::NONE;
  auto response = message::DecodeHandshakeResponse(body, err);
  if (!response) {
    fail(HandshakeState::REJECTED, err, to_string(err));
    return state_;
  }

  if (response->status == protocol::status::SIMULTANEOUS) {
    fail(HandshakeState::REJECTED, HandshakeError::SIMULTANEOUS_DIAL,
         "peer keeps its own dial to us");
    return state_;
  }
  if (!response->accepted()) {
    fail(HandshakeState::REJECTED, HandshakeError::REJECTED,
         "peer answered status \"" + response->status + "\"");
    return state_;
  }

  message::HandshakeFrame identity{response->user_id, response->username, response->public_key};
  if (!validate_identity(identity)) {
    return state_;
  }
  if (!expected_peer_id_.empty() && identity.user_id != expected_peer_id_) {
    fail(HandshakeState::REJECTED, HandshakeError::REJECTED,
         "peer identified as " + identity.user_id + ", expected " + expected_peer_id_);
    return state_;
  }

  remote_ = std::move(identity);
  state_ = HandshakeState::ACCEPTED;
  return state_;
}

std::optional<std::string> HandshakeProtocol::on_request(const std::string &body,
                                                         const HandshakeDecider &decide) {
  if (role_ != HandshakeRole::RESPONDER || finished()) {
    return std::nullopt;
  }

  HandshakeError err = HandshakeError::NONE;
  auto frame = message::DecodeHandshake(body, err);
  if (!frame) {
    fail(HandshakeState::REJECTED, err, to_string(err));
    return std::nullopt;
  }
  if (!validate_identity(*frame)) {
    return std::nullopt;
  }
  remote_ = *frame;

  HandshakeDecision decision = decide ? decide(remote_) : HandshakeDecision::Reject("no decider");

  message::HandshakeResponse response;
  response.user_id = local_.user_id;
  response.username = local_.username;
  response.public_key = local_.public_key;
  if (decision.accept) {
    response.status = protocol::status::ACCEPTED;
    state_ = HandshakeState::ACCEPTED;
  } else if (decision.simultaneous) {
    response.status = protocol::status::SIMULTANEOUS;
    fail(HandshakeState::REJECTED, HandshakeError::SIMULTANEOUS_DIAL, decision.reason);
  } else {
    response.status = protocol::status::REJECTED;
    fail(HandshakeState::REJECTED, HandshakeError::REJECTED, decision.reason);
  }
  return message::EncodeHandshakeResponse(response);
}

void HandshakeProtocol::on_timeout() {
  if (!finished()) {
    fail(HandshakeState::TIMED_OUT, HandshakeError::TIMED_OUT, "no handshake within timeout");
  }
}

void HandshakeProtocol::on_closed() {
  if (!finished()) {
    fail(HandshakeState::REJECTED, HandshakeError::CLOSED, "transport closed");
  }
}

} // namespace network
} // namespace whisperlink
