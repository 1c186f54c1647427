#pragma once

#include "network/handshake.hpp"
#include "network/message.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace whisperlink {
namespace network {

class PeerSession;
using PeerSessionPtr = std::shared_ptr<PeerSession>;

enum class PeerSessionState {
  HANDSHAKING, // transport open, identity exchange in progress
  ESTABLISHED, // handshake ACCEPTED, envelopes flow
  CLOSED       // terminal
};

// Fired exactly once when the handshake reaches a terminal state (or the
// session dies before it does). Inspect hs.accepted()/error()/reason().
using HandshakeCompleteCallback =
    std::function<void(const PeerSessionPtr &session, const HandshakeProtocol &hs)>;
// One complete frame body received after the handshake
using FrameCallback =
    std::function<void(const PeerSessionPtr &session, const std::string &body)>;
// Fired once when an ESTABLISHED session closes for any reason
using SessionClosedCallback =
    std::function<void(const PeerSessionPtr &session, const std::string &reason)>;

// PeerSession - one logical session over exactly one TransportConnection
// Handles frame reassembly, the handshake (with timeout), post-handshake
// frame delivery and the close path.
//
// IMPORTANT: PeerSession is single-use. start() runs once; after close the
// caller creates a new session for any reconnection.
//
// All internal work runs on the session's strand; disconnect() and
// send_frame() are safe from any thread.
class PeerSession : public std::enable_shared_from_this<PeerSession> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  // We dialed: send handshake, expect a response from expected_peer_id
  static PeerSessionPtr create_outbound(boost::asio::io_context &io_context,
                                        TransportConnectionPtr connection,
                                        uint64_t session_id,
                                        message::HandshakeFrame local,
                                        std::string expected_peer_id,
                                        std::chrono::milliseconds handshake_timeout);

  // They connected: wait for handshake, answer with decider's verdict
  static PeerSessionPtr create_inbound(boost::asio::io_context &io_context,
                                       TransportConnectionPtr connection,
                                       uint64_t session_id,
                                       message::HandshakeFrame local,
                                       HandshakeDecider decider,
                                       std::chrono::milliseconds handshake_timeout);

  ~PeerSession();

  PeerSession(const PeerSession &) = delete;
  PeerSession &operator=(const PeerSession &) = delete;

  // Set before start()
  void set_handshake_callback(HandshakeCompleteCallback cb) { handshake_cb_ = std::move(cb); }
  void set_frame_callback(FrameCallback cb) { frame_cb_ = std::move(cb); }
  void set_closed_callback(SessionClosedCallback cb) { closed_cb_ = std::move(cb); }

  void start();

  // Frame and hand to the transport. false if not ESTABLISHED, oversized, or
  // the transport is closed. true = scheduled on the transport's strand.
  bool send_frame(const std::string &body);

  // Idempotent, any thread
  void disconnect(const std::string &reason);

#ifdef WHISPERLINK_TESTS
  // Test-only: force every handshake timeout (0ms clears the override)
  static void SetHandshakeTimeoutForTest(std::chrono::milliseconds timeout);
  static void ResetHandshakeTimeoutForTest();
#endif

  uint64_t id() const { return session_id_; }
  PeerSessionState state() const { return state_; }
  bool is_established() const { return state_ == PeerSessionState::ESTABLISHED; }
  bool is_inbound() const { return handshake_.role() == HandshakeRole::RESPONDER; }
  TransportKind kind() const { return kind_; }
  uint64_t transport_id() const { return transport_id_; }
  std::string address() const;

  // Remote identity; valid once the handshake callback reported success
  const message::HandshakeFrame &remote() const { return handshake_.remote(); }

  // Public for make_shared; use the create_* factories
  PeerSession(PrivateTag, boost::asio::io_context &io_context,
              TransportConnectionPtr connection, uint64_t session_id,
              HandshakeProtocol handshake, HandshakeDecider decider,
              std::chrono::milliseconds handshake_timeout);

private:
  void on_transport_receive(const std::vector<uint8_t> &data);
  void on_transport_disconnect();
  void process_frame(const std::string &body);
  void handle_handshake_frame(const std::string &body);

  void start_handshake_timeout();
  void complete_handshake();
  void linger_then_close(const std::string &reason);

  void do_disconnect(const std::string &reason);

  boost::asio::io_context &io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  TransportConnectionPtr connection_;
  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer linger_timer_;

  uint64_t session_id_;
  uint64_t transport_id_;
  TransportKind kind_;
  std::string remote_addr_;
  uint16_t remote_port_;

  HandshakeProtocol handshake_;
  HandshakeDecider decider_;
  std::chrono::milliseconds handshake_timeout_;
  bool handshake_reported_{false};

  message::FrameDecoder decoder_;
  std::atomic<PeerSessionState> state_{PeerSessionState::HANDSHAKING};
  std::atomic<bool> started_{false};

  HandshakeCompleteCallback handshake_cb_;
  FrameCallback frame_cb_;
  SessionClosedCallback closed_cb_;

#ifdef WHISPERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> handshake_timeout_override_ms_;
#endif
};

} // namespace network
} // namespace whisperlink
