#pragma once

#include "network/errors.hpp"
#include "network/message.hpp"
#include <functional>
#include <optional>
#include <string>

namespace whisperlink {
namespace network {

// Identity exchange states
//   initiator: INIT -> SENT -> AWAITING_RESPONSE -> ACCEPTED | REJECTED | TIMED_OUT
//   responder: INIT -> ACCEPTED | REJECTED | TIMED_OUT
enum class HandshakeState {
  INIT,
  SENT,
  AWAITING_RESPONSE,
  ACCEPTED,
  REJECTED,
  TIMED_OUT,
};

enum class HandshakeRole { INITIATOR, RESPONDER };

std::string HandshakeStateAsString(HandshakeState state);

// Responder's verdict on a well-formed inbound handshake
struct HandshakeDecision {
  bool accept{false};
  std::string reason;
  // Rejection answered with status "simultaneous" instead of "rejected"
  bool simultaneous{false};

  static HandshakeDecision Accept() { return {true, {}, false}; }
  static HandshakeDecision Reject(std::string why) { return {false, std::move(why), false}; }
  static HandshakeDecision YieldToOwnDial(std::string why) {
    return {false, std::move(why), true};
  }
};

using HandshakeDecider =
    std::function<HandshakeDecision(const message::HandshakeFrame &remote)>;

/**
 * HandshakeProtocol - transport-agnostic identity exchange
 *
 * Pure state machine: it consumes and produces JSON bodies and never touches
 * a socket, timer or the registry. PeerSession owns one instance per
 * connection and feeds it frames, timeouts and closes.
 *
 * Validation applied to every remote identity:
 * - user_id, username and public_key present and non-empty
 * - public_key is a 32-byte hex key
 * - (initiator) response user_id matches the contact we dialed, if set
 *
 * Terminal states are sticky: once ACCEPTED/REJECTED/TIMED_OUT, further
 * input is ignored.
 */
class HandshakeProtocol {
public:
  HandshakeProtocol(HandshakeRole role, message::HandshakeFrame local);

  // Initiator only: peer id the response must carry (empty = no check)
  void set_expected_peer_id(std::string peer_id) { expected_peer_id_ = std::move(peer_id); }

  // Initiator: INIT -> SENT, returns the handshake body to frame and send
  std::optional<std::string> begin();

  // Initiator: SENT -> AWAITING_RESPONSE once the bytes were handed to the transport
  void mark_sent();

  // Initiator: consume the responder's body
  HandshakeState on_response(const std::string &body);

  /**
   * Responder: consume the initiator's body and decide.
   * Returns the response body to send back. A malformed or incomplete
   * frame returns std::nullopt: the caller closes without answering.
   * A rejection returns a "rejected" response; the caller sends it, then
   * closes.
   */
  std::optional<std::string> on_request(const std::string &body, const HandshakeDecider &decide);

  void on_timeout();

  // Transport went away before a terminal state
  void on_closed();

  HandshakeRole role() const { return role_; }
  HandshakeState state() const { return state_; }
  bool finished() const;
  bool accepted() const { return state_ == HandshakeState::ACCEPTED; }

  HandshakeError error() const { return error_; }
  // Human-readable failure description (empty while not failed)
  const std::string &reason() const { return reason_; }

  // Remote identity, valid once ACCEPTED (and for responder rejections)
  const message::HandshakeFrame &remote() const { return remote_; }

private:
  void fail(HandshakeState state, HandshakeError error, std::string reason);
  bool validate_identity(const message::HandshakeFrame &identity);

  HandshakeRole role_;
  message::HandshakeFrame local_;
  message::HandshakeFrame remote_;
  std::string expected_peer_id_;
  HandshakeState state_{HandshakeState::INIT};
  HandshakeError error_{HandshakeError::NONE};
  std::string reason_;
};

} // namespace network
} // namespace whisperlink
