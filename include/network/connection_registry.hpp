#pragma once

/*
 ConnectionRegistry - the single authoritative peer_id -> Connection map

 Invariants
 - At most one Connection per peer_id (register_connection fails on duplicates;
   the only replacement is take_over_dial, used when two peers dial each
   other at once and the inbound side wins the tie-break)
 - Status only moves CONNECTING -> CONNECTED; disconnecting removes the entry
 - Session-scoped calls (mark_connected, remove_session) only act when the
   stored session_id matches, so a stale session's close never touches a
   newer connection for the same peer

 Threading
 - Every method takes the map's lock once and never performs I/O under it
 - Removed entries are returned to the caller, who closes the session after
   the lock is released
*/

#include "network/connection.hpp"
#include "util/threadsafe_containers.hpp"
#include <optional>
#include <string>
#include <vector>

namespace whisperlink {
namespace network {

class ConnectionRegistry {
public:
  ConnectionRegistry() = default;

  ConnectionRegistry(const ConnectionRegistry &) = delete;
  ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

  // false if peer_id is already present (any status)
  bool register_connection(const Connection &conn);

  std::optional<Connection> get(const std::string &peer_id) const;
  bool contains(const std::string &peer_id) const;

  // Replaces our own outbound CONNECTING placeholder for conn.peer_id with
  // conn (an inbound entry). false if there is no such placeholder.
  bool take_over_dial(const Connection &conn);

  // Unconditional removal; returns the removed entry
  std::optional<Connection> remove(const std::string &peer_id);

  // Removes only if the entry still belongs to session_id
  std::optional<Connection> remove_session(const std::string &peer_id, uint64_t session_id);

  // CONNECTING -> CONNECTED for the matching session. Fills in the identity
  // learned from the handshake and attaches the live session.
  bool mark_connected(const std::string &peer_id, uint64_t session_id,
                      const PeerSessionPtr &session, const std::string &username,
                      const std::string &public_key);

  // Snapshot of CONNECTED entries only
  std::vector<Connection> list_active() const;

  // Remove everything (shutdown); returns what was removed
  std::vector<Connection> take_all();

  size_t size() const { return connections_.Size(); }

private:
  util::ThreadSafeMap<std::string, Connection> connections_;
};

} // namespace network
} // namespace whisperlink
