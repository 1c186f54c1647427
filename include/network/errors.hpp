// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace whisperlink {
namespace network {

// Why a handshake did not reach ACCEPTED
enum class HandshakeError {
  NONE,
  INCOMPLETE_FIELDS, // required field missing or empty
  MALFORMED,         // not JSON / not an object / oversized frame
  REJECTED,          // responder answered "rejected" (or any non-"accepted")
  SIMULTANEOUS_DIAL, // responder is dialing us too and keeps its own dial
  TIMED_OUT,
  CLOSED,            // transport closed before completion
  SEND_FAILED,
};

// Why a transport could not be opened or was lost
enum class TransportError {
  NONE,
  REFUSED,        // connection refused / unreachable
  RESOLVE_FAILED, // DNS failure
  TIMED_OUT,
  CLOSED,
  TLS_FAILED,
  UPGRADE_FAILED, // WebSocket upgrade rejected
};

// Which step of tunnel provisioning failed
enum class TunnelProvisionError {
  NONE,
  RELAY_FAILED,
  BINARY_MISSING,
  PROCESS_EXITED_EARLY,
  CONTROL_API_NEVER_READY,
  LIVENESS_PROBE_FAILED,
};

std::string to_string(HandshakeError err);
std::string to_string(TransportError err);
std::string to_string(TunnelProvisionError err);

} // namespace network
} // namespace whisperlink
