// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "network/errors.hpp"

namespace whisperlink {
namespace network {

std::string to_string(HandshakeError err) {
  switch (err) {
  case HandshakeError::NONE:
    return "none";
  case HandshakeError::INCOMPLETE_FIELDS:
    return "handshake missing required fields";
  case HandshakeError::MALFORMED:
    return "malformed handshake frame";
  case HandshakeError::REJECTED:
    return "handshake rejected by peer";
  case HandshakeError::SIMULTANEOUS_DIAL:
    return "peer is dialing us and keeps its own connection";
  case HandshakeError::TIMED_OUT:
    return "handshake timed out";
  case HandshakeError::CLOSED:
    return "connection closed during handshake";
  case HandshakeError::SEND_FAILED:
    return "failed to send handshake";
  }
  return "unknown handshake error";
}

std::string to_string(TransportError err) {
  switch (err) {
  case TransportError::NONE:
    return "none";
  case TransportError::REFUSED:
    return "connection refused or unreachable";
  case TransportError::RESOLVE_FAILED:
    return "failed to resolve host";
  case TransportError::TIMED_OUT:
    return "connection timed out";
  case TransportError::CLOSED:
    return "connection closed unexpectedly";
  case TransportError::TLS_FAILED:
    return "TLS handshake failed";
  case TransportError::UPGRADE_FAILED:
    return "WebSocket upgrade failed";
  }
  return "unknown transport error";
}

std::string to_string(TunnelProvisionError err) {
  switch (err) {
  case TunnelProvisionError::NONE:
    return "none";
  case TunnelProvisionError::RELAY_FAILED:
    return "relay server failed to start";
  case TunnelProvisionError::BINARY_MISSING:
    return "tunnel binary not found";
  case TunnelProvisionError::PROCESS_EXITED_EARLY:
    return "tunnel process exited early";
  case TunnelProvisionError::CONTROL_API_NEVER_READY:
    return "tunnel control API never reported a public URL";
  case TunnelProvisionError::LIVENESS_PROBE_FAILED:
    return "public URL failed liveness probe";
  }
  return "unknown tunnel error";
}

} // namespace network
} // namespace whisperlink
