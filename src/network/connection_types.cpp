// Copyright (c) 2025 The WhisperLink developers
// Connection kinds and lifecycle states for peer sessions

#include "network/connection_types.hpp"

namespace whisperlink {
namespace network {

std::string TransportKindAsString(TransportKind kind) {
  switch (kind) {
  case TransportKind::DIRECT_SOCKET:
    return "direct-socket";
  case TransportKind::TUNNEL_WEBSOCKET:
    return "tunnel-websocket";
  default:
    return "unknown";
  }
}

std::string ConnectionStatusAsString(ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::CONNECTING:
    return "connecting";
  case ConnectionStatus::CONNECTED:
    return "connected";
  case ConnectionStatus::DISCONNECTED:
    return "disconnected";
  default:
    return "unknown";
  }
}

std::string ContactConnectionTypeAsString(ContactConnectionType type) {
  switch (type) {
  case ContactConnectionType::DIRECT:
    return "direct";
  case ContactConnectionType::TUNNEL:
    return "tunnel";
  default:
    return "unknown";
  }
}

ContactConnectionType ParseContactConnectionType(const std::string &value) {
  if (value == "tunnel") {
    return ContactConnectionType::TUNNEL;
  }
  return ContactConnectionType::DIRECT;
}

} // namespace network
} // namespace whisperlink
