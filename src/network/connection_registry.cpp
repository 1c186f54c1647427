#include "network/connection_registry.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace whisperlink {
namespace network {

bool ConnectionRegistry::register_connection(const Connection &conn) {
  if (conn.peer_id.empty()) {
    return false;
  }
  if (!connections_.TryInsert(conn.peer_id, conn)) {
    LOG_NET_DEBUG("Registry already holds a connection for {}", conn.peer_id);
    return false;
  }
  LOG_NET_TRACE("Registered {} session={} status={}", conn.peer_id, conn.session_id,
                ConnectionStatusAsString(conn.status));
  return true;
}

bool ConnectionRegistry::take_over_dial(const Connection &conn) {
  bool replaced = false;
  uint64_t dial_session = 0;
  connections_.Modify(conn.peer_id, [&](Connection &existing) {
    if (existing.inbound || existing.status != ConnectionStatus::CONNECTING)
      return;
    dial_session = existing.session_id;
    existing = conn;
    replaced = true;
  });
  if (replaced) {
    LOG_NET_DEBUG("Inbound session {} took over dial session {} for {}", conn.session_id,
                  dial_session, conn.peer_id);
  }
  return replaced;
}

std::optional<Connection> ConnectionRegistry::get(const std::string &peer_id) const {
  std::optional<Connection> result;
  connections_.Read(peer_id, [&](const Connection &conn) { result = conn; });
  return result;
}

bool ConnectionRegistry::contains(const std::string &peer_id) const {
  return connections_.Contains(peer_id);
}

std::optional<Connection> ConnectionRegistry::remove(const std::string &peer_id) {
  return connections_.Take(peer_id);
}

std::optional<Connection> ConnectionRegistry::remove_session(const std::string &peer_id,
                                                             uint64_t session_id) {
  auto removed = connections_.TakeIf(
      peer_id, [session_id](const Connection &conn) { return conn.session_id == session_id; });
  if (!removed) {
    LOG_NET_TRACE("remove_session ignored for {} (session {} is not current)", peer_id,
                  session_id);
  }
  return removed;
}

bool ConnectionRegistry::mark_connected(const std::string &peer_id, uint64_t session_id,
                                        const PeerSessionPtr &session,
                                        const std::string &username,
                                        const std::string &public_key) {
  bool updated = false;
  connections_.Modify(peer_id, [&](Connection &conn) {
    if (conn.session_id != session_id || conn.status != ConnectionStatus::CONNECTING)
      return;
    conn.status = ConnectionStatus::CONNECTED;
    conn.established_at = util::GetTimeISO8601();
    conn.session = session;
    if (session)
      conn.transport_id = session->transport_id();
    if (!username.empty())
      conn.peer_username = username;
    if (!public_key.empty())
      conn.peer_public_key = public_key;
    updated = true;
  });
  return updated;
}

std::vector<Connection> ConnectionRegistry::list_active() const {
  std::vector<Connection> result;
  connections_.ForEach([&](const std::string &, const Connection &conn) {
    if (conn.status == ConnectionStatus::CONNECTED)
      result.push_back(conn);
  });
  return result;
}

std::vector<Connection> ConnectionRegistry::take_all() {
  std::vector<Connection> result;
  for (auto &entry : connections_.TakeAll())
    result.push_back(std::move(entry.second));
  return result;
}

} // namespace network
} // namespace whisperlink
