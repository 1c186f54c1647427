#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace whisperlink {
namespace protocol {

// Default direct listen port (0 on the command line = OS-assigned)
constexpr uint16_t DEFAULT_PORT = 9001;

// Handshake response status values
namespace status {
constexpr const char *ACCEPTED = "accepted";
constexpr const char *REJECTED = "rejected";
// Rejected because the responder is dialing the initiator and its own dial
// wins the user_id tie-break; the initiator should wait for that dial
constexpr const char *SIMULTANEOUS = "simultaneous";
} // namespace status

// Envelope "type" values
namespace envelope_type {
constexpr const char *CHAT = "chat";
constexpr const char *SIGNAL = "signal";
} // namespace envelope_type

// ============================================================================
// FRAMING
// ============================================================================

// Every handshake frame and envelope: 4-byte big-endian length + JSON body
constexpr size_t FRAME_HEADER_SIZE = 4;

// Frames above this are a protocol violation and close the transport
constexpr uint32_t MAX_FRAME_SIZE = 1024 * 1024; // 1 MiB

// Pending-accept backlog for the peer listener and the relay
constexpr int LISTEN_BACKLOG = 16;

// Outgoing bytes queued per connection before a slow reader is dropped
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 8 * 1024 * 1024; // 8 MiB

// ============================================================================
// TIMEOUTS
// ============================================================================

// TCP connect for direct outbound
constexpr std::chrono::seconds DIRECT_CONNECT_TIMEOUT{10};

// Direct handshake, from transport open to response (both roles)
constexpr std::chrono::seconds DIRECT_HANDSHAKE_TIMEOUT{10};

// Opening the WebSocket to a tunnel URL (TCP + TLS + upgrade)
constexpr std::chrono::seconds TUNNEL_OPEN_TIMEOUT{25};

// Handshake response over an open tunnel WebSocket
constexpr std::chrono::seconds TUNNEL_HANDSHAKE_TIMEOUT{15};

// Upper bound for an outbound tunnel connect across all candidate paths
constexpr std::chrono::seconds TUNNEL_OVERALL_TIMEOUT{30};

// Alternate path tried after the URL's own path
constexpr const char *TUNNEL_FALLBACK_PATH = "/ws";

// ============================================================================
// TUNNEL PROVISIONING
// ============================================================================

// Local WebSocket relay port fronting the direct listener
constexpr uint16_t DEFAULT_RELAY_PORT = 8765;

// Control API of the external tunnel process
constexpr const char *DEFAULT_CONTROL_HOST = "127.0.0.1";
constexpr uint16_t DEFAULT_CONTROL_PORT = 4040;
constexpr const char *CONTROL_TUNNELS_PATH = "/api/tunnels";

constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{1000};
constexpr int DEFAULT_POLL_ATTEMPTS = 15;

// Liveness probe against the public URL
constexpr std::chrono::seconds LIVENESS_PROBE_TIMEOUT{10};

// Body returned by the relay for plain HTTP requests
constexpr const char *RELAY_LIVENESS_BODY = "WhisperLink relay OK";

// Cap on captured tunnel process output surfaced in errors
constexpr size_t MAX_CAPTURED_OUTPUT = 4096;

} // namespace protocol
} // namespace whisperlink
