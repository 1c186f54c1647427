// Copyright (c) 2025 The WhisperLink developers
// Connection kinds and lifecycle states for peer sessions

#pragma once

#include <string>

namespace whisperlink {
namespace network {

/**
 * How the bytes of a session travel.
 */
enum class TransportKind {
  /**
   * Plain TCP socket, inbound on our listener or dialed to a contact's
   * recorded host:port.
   */
  DIRECT_SOCKET,

  /**
   * Outbound WebSocket (ws/wss) to a contact's published tunnel URL. Inbound
   * tunnel traffic reaches us through the relay and looks like DIRECT_SOCKET
   * from the loopback side.
   */
  TUNNEL_WEBSOCKET,
};

/**
 * Lifecycle of a registry entry. CONNECTING is only used by outbound
 * placeholders; DISCONNECTED is terminal and never stored.
 */
enum class ConnectionStatus {
  CONNECTING,
  CONNECTED,
  DISCONNECTED,
};

/**
 * How a contact is dialed (mirrors the contact record's connection_type)
 */
enum class ContactConnectionType {
  DIRECT,
  TUNNEL,
};

std::string TransportKindAsString(TransportKind kind);
std::string ConnectionStatusAsString(ConnectionStatus status);
std::string ContactConnectionTypeAsString(ContactConnectionType type);

// Parses "direct" / "tunnel"; anything else defaults to DIRECT
ContactConnectionType ParseContactConnectionType(const std::string &value);

} // namespace network
} // namespace whisperlink
