#pragma once

#include "network/connection_types.hpp"
#include "network/peer_session.hpp"
#include <cstdint>
#include <string>

namespace whisperlink {
namespace network {

// One registry entry. session owns the single live transport; it is null only
// for an outbound CONNECTING placeholder that has not finished dialing.
struct Connection {
  std::string peer_id;
  std::string peer_username;
  std::string peer_public_key;
  TransportKind transport_kind{TransportKind::DIRECT_SOCKET};
  std::string address; // host:port or tunnel URL
  ConnectionStatus status{ConnectionStatus::CONNECTING};
  std::string established_at; // ISO-8601, set on CONNECTED
  bool inbound{false};
  uint64_t session_id{0};
  // Id of the transport (and of the strand serializing it) this entry talks
  // through; 0 until the handshake completes
  uint64_t transport_id{0};
  PeerSessionPtr session;
};

// Copyable snapshot handed out by the facade (no transport handle)
struct ConnectionInfo {
  std::string peer_id;
  std::string peer_username;
  TransportKind transport_kind{TransportKind::DIRECT_SOCKET};
  std::string address;
  ConnectionStatus status{ConnectionStatus::CONNECTING};
  std::string established_at;
  bool inbound{false};
  uint64_t transport_id{0};
};

inline ConnectionInfo ToConnectionInfo(const Connection &conn) {
  return ConnectionInfo{conn.peer_id,     conn.peer_username, conn.transport_kind,
                        conn.address,     conn.status,        conn.established_at,
                        conn.inbound,     conn.transport_id};
}

} // namespace network
} // namespace whisperlink
