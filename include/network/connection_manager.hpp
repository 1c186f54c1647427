#pragma once

/*
 ConnectionManager - the public surface of the connection layer

 Owns the reactor (RealTransport), the registry, the tunnel bridge and the
 event channel. Callers use it to listen (directly or through a tunnel),
 dial contacts, send encrypted chat/signal envelopes and observe incoming
 messages and connection events.

 Threading
 - One reactor (Config::io_threads, default 1) drives every direct socket and
   outbound WebSocket; each connection is serialized by its own strand
 - The tunnel relay runs on its own reactor thread inside TunnelBridge
 - start_listening() and connect_to_peer() block until the reactor reports
   the outcome; they fail fast if invoked from a reactor thread
 - ContactDirectory and IdentityProvider are called from reactor threads and
   must be thread-safe
 - Event callbacks run on reactor threads; they must not call the blocking
   facade methods

 Simultaneous dials
 - When two peers dial each other at once, the dial started by the peer with
   the lexicographically smaller user_id survives. The other side accepts it
   in place of its own attempt, and its connect_to_peer() returns true once
   that inbound session is connected.

 Failures never escape as exceptions: every establishment failure is a false
 return, with the reason available from last_error().
*/

#include "network/connection.hpp"
#include "network/connection_registry.hpp"
#include "network/message_events.hpp"
#include "network/peer_directory.hpp"
#include "network/protocol.hpp"
#include "network/real_transport.hpp"
#include "network/tunnel_bridge.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace whisperlink {
namespace network {

class ConnectionManager {
public:
  struct Config {
    // Auto-add unknown inbound peers as contacts on first handshake. When
    // false, handshakes from peers not in the directory are rejected.
    bool trust_on_first_use;
    size_t io_threads;
    std::chrono::milliseconds handshake_timeout;        // direct, both roles
    std::chrono::milliseconds tunnel_open_timeout;      // per candidate path
    std::chrono::milliseconds tunnel_handshake_timeout; // after the upgrade
    std::chrono::milliseconds tunnel_overall_timeout;   // all candidates
    TunnelBridge::Config tunnel;

    Config()
        : trust_on_first_use(true), io_threads(1),
          handshake_timeout(protocol::DIRECT_HANDSHAKE_TIMEOUT),
          tunnel_open_timeout(protocol::TUNNEL_OPEN_TIMEOUT),
          tunnel_handshake_timeout(protocol::TUNNEL_HANDSHAKE_TIMEOUT),
          tunnel_overall_timeout(protocol::TUNNEL_OVERALL_TIMEOUT) {}
  };

  struct ListenInfo {
    uint16_t port{0};
    bool listening{false};
    std::string tunnel_url; // empty unless a tunnel is up
  };

  // tunnel = nullptr builds a TunnelBridge from config.tunnel
  ConnectionManager(ContactDirectory &contacts, IdentityProvider &identity,
                    const Config &config = Config{},
                    std::unique_ptr<TunnelBridge> tunnel = nullptr);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager &) = delete;
  ConnectionManager &operator=(const ConnectionManager &) = delete;

  // Stop listening, close every session, stop the reactor. Idempotent.
  void shutdown();

  // Listen on 0.0.0.0:port (0 = OS-assigned). On success info is
  // "localhost:<port>" or, with use_tunnel, the verified public tunnel URL.
  // A tunnel failure also closes the direct listener.
  std::pair<bool, std::string> start_listening(uint16_t port, bool use_tunnel = false);

  // Close the listener and tear down the tunnel; live connections stay up
  void stop_listening();

  // Dial a known contact (direct TCP or tunnel WebSocket per its record) and
  // run the handshake. true once the peer is CONNECTED (or already was).
  bool connect_to_peer(const std::string &peer_id);

  // true = encrypted envelope scheduled on the peer's transport
  bool send_message(const std::string &peer_id, const std::string &text);

  // payload_json must be a JSON object
  bool send_signal(const std::string &peer_id, const std::string &payload_json);

  // Chat envelope with group_id/group_name to every member except ourselves
  std::map<std::string, bool> send_group_message(const std::vector<std::string> &member_ids,
                                                 const std::string &text,
                                                 const std::string &group_id,
                                                 const std::string &group_name);

  // Idempotent; unknown peer_id is a no-op
  void disconnect_from_peer(const std::string &peer_id);

  std::vector<ConnectionInfo> get_active_connections() const;
  std::optional<ConnectionInfo> get_connection(const std::string &peer_id) const;

  ListenInfo listen_info() const;
  std::string last_error() const;

  [[nodiscard]] MessageEvents::Subscription
  add_message_handler(message::MessageKind kind, MessageEvents::MessageCallback handler);

  MessageEvents &events() { return events_; }
  const Config &config() const { return config_; }

private:
  struct DialOutcome {
    bool ok{false};
    bool retryable{false}; // transport-level failure, another path may work
    std::string reason;
    bool peer_dialing{false}; // peer answered "simultaneous"
  };

  // Inbound
  void handle_inbound(TransportConnectionPtr connection);
  HandshakeDecision decide_inbound(const message::HandshakeFrame &remote,
                                   const std::optional<LocalIdentity> &self,
                                   uint64_t session_id, const std::string &address);
  void on_inbound_handshake(const PeerSessionPtr &session, const HandshakeProtocol &hs);

  // Outbound
  DialOutcome dial_direct(const Contact &contact, const LocalIdentity &self,
                          uint64_t session_id);
  DialOutcome dial_tunnel(const Contact &contact, const LocalIdentity &self,
                          uint64_t session_id);
  DialOutcome run_outbound_session(TransportConnectionPtr connection, const Contact &contact,
                                   const LocalIdentity &self, uint64_t session_id,
                                   std::chrono::milliseconds handshake_timeout);

  // Waits for an inbound session from peer_id to finish its handshake.
  // true once the registry holds it as CONNECTED.
  bool await_inbound(const std::string &peer_id, uint64_t own_session_id, bool peer_dialing);
  void resolve_inbound_waiter(const std::string &peer_id, bool connected);

  // Shared session wiring
  void attach_established_callbacks(const PeerSessionPtr &session);
  void handle_envelope(const PeerSessionPtr &session, const std::string &body);
  void on_session_closed(const PeerSessionPtr &session, const std::string &reason);

  bool send_envelope(const std::string &peer_id, message::MessageKind kind,
                     const std::string &plaintext, const std::optional<std::string> &group_id,
                     const std::optional<std::string> &group_name);

  bool on_reactor_thread() const;
  void set_error(const std::string &error) const;
  uint64_t next_session_id() { return next_session_id_.fetch_add(1); }

  ContactDirectory &contacts_;
  IdentityProvider &identity_;
  Config config_;

  // Outlives the registry and pending sessions bound to its io_context
  std::unique_ptr<RealTransport> transport_;
  std::unique_ptr<TunnelBridge> tunnel_;

  ConnectionRegistry registry_;
  MessageEvents events_;

  // Sessions still handshaking (inbound) keyed by session id
  util::ThreadSafeMap<uint64_t, PeerSessionPtr> pending_;

  // connect_to_peer() callers waiting on an inbound session, keyed by peer id
  util::ThreadSafeMap<std::string, std::shared_ptr<std::promise<bool>>> inbound_waiters_;

  std::atomic<uint64_t> next_session_id_{1};
  std::atomic<bool> running_{true};

  std::mutex listen_mutex_; // serializes start/stop_listening
  mutable std::mutex error_mutex_;
  mutable std::string last_error_;
};

} // namespace network
} // namespace whisperlink
