#include "network/connection_manager.hpp"
#include "crypto/crypto_box.hpp"
#include "network/websocket_transport.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <future>
#include <nlohmann/json.hpp>

namespace whisperlink {
namespace network {

namespace {

// Slack on top of the component timeouts before a blocked caller gives up
constexpr std::chrono::milliseconds WAIT_MARGIN{5000};

message::HandshakeFrame LocalFrame(const std::optional<LocalIdentity> &self) {
  message::HandshakeFrame frame;
  if (self) {
    frame.user_id = self->user_id;
    frame.username = self->username;
    frame.public_key = self->public_key;
  }
  return frame;
}

} // namespace

ConnectionManager::ConnectionManager(ContactDirectory &contacts, IdentityProvider &identity,
                                     const Config &config, std::unique_ptr<TunnelBridge> tunnel)
    : contacts_(contacts), identity_(identity), config_(config),
      transport_(std::make_unique<RealTransport>(config.io_threads > 0 ? config.io_threads : 1)),
      tunnel_(tunnel ? std::move(tunnel) : std::make_unique<TunnelBridge>(config.tunnel)) {
  transport_->run();
}

ConnectionManager::~ConnectionManager() { shutdown(); }

void ConnectionManager::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    transport_->stop_listening();
    tunnel_->close_tunnel();
  }

  for (auto &conn : registry_.take_all()) {
    if (conn.session) {
      conn.session->disconnect("shutting down");
    }
  }
  for (auto &[id, session] : pending_.TakeAll()) {
    session->disconnect("shutting down");
  }
  for (auto &[peer_id, waiter] : inbound_waiters_.TakeAll()) {
    waiter->set_value(false);
  }

  transport_->stop();
}

bool ConnectionManager::on_reactor_thread() const {
  return transport_->io_context().get_executor().running_in_this_thread();
}

void ConnectionManager::set_error(const std::string &error) const {
  LOG_NET_DEBUG("{}", error);
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_ = error;
}

std::string ConnectionManager::last_error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

// ============================================================================
// Listening
// ============================================================================

std::pair<bool, std::string> ConnectionManager::start_listening(uint16_t port, bool use_tunnel) {
  if (!running_) {
    set_error("connection manager is shut down");
    return {false, last_error()};
  }
  if (on_reactor_thread()) {
    set_error("start_listening must not be called from a reactor thread");
    return {false, last_error()};
  }

  std::lock_guard<std::mutex> lock(listen_mutex_);
  if (transport_->is_listening()) {
    set_error("already listening on port " + std::to_string(transport_->listening_port()));
    return {false, last_error()};
  }

  bool ok = transport_->listen(port, [this](TransportConnectionPtr connection) {
    handle_inbound(std::move(connection));
  });
  if (!ok) {
    set_error("cannot listen on port " + std::to_string(port));
    return {false, last_error()};
  }

  uint16_t bound = transport_->listening_port();
  std::string info = "localhost:" + std::to_string(bound);
  LOG_NET_INFO("Listening for peers on port {}", bound);

  if (use_tunnel) {
    ProvisionResult result = tunnel_->create_tunnel(bound);
    if (!result.ok()) {
      transport_->stop_listening();
      set_error(result.message);
      return {false, result.message};
    }
    info = result.public_url;
    LOG_NET_INFO("Reachable through tunnel {}", info);
  }

  return {true, info};
}

void ConnectionManager::stop_listening() {
  std::lock_guard<std::mutex> lock(listen_mutex_);
  transport_->stop_listening();
  tunnel_->close_tunnel();
}

ConnectionManager::ListenInfo ConnectionManager::listen_info() const {
  ListenInfo info;
  info.port = transport_->listening_port();
  info.listening = transport_->is_listening();
  info.tunnel_url = tunnel_->state().public_url;
  return info;
}

// ============================================================================
// Inbound
// ============================================================================

void ConnectionManager::handle_inbound(TransportConnectionPtr connection) {
  if (!running_ || !connection) {
    if (connection)
      connection->close();
    return;
  }

  const uint64_t session_id = next_session_id();
  const auto self = identity_.GetCurrentUser();
  const std::string address =
      connection->remote_address() + ":" + std::to_string(connection->remote_port());

  auto session = PeerSession::create_inbound(
      transport_->io_context(), connection, session_id, LocalFrame(self),
      [this, self, session_id, address](const message::HandshakeFrame &remote) {
        return decide_inbound(remote, self, session_id, address);
      },
      config_.handshake_timeout);

  session->set_handshake_callback(
      [this](const PeerSessionPtr &s, const HandshakeProtocol &hs) { on_inbound_handshake(s, hs); });
  attach_established_callbacks(session);

  pending_.Insert(session_id, session);
  LOG_NET_DEBUG("Inbound connection from {} (session {})", address, session_id);
  session->start();
}

HandshakeDecision ConnectionManager::decide_inbound(const message::HandshakeFrame &remote,
                                                    const std::optional<LocalIdentity> &self,
                                                    uint64_t session_id,
                                                    const std::string &address) {
  if (!self) {
    return HandshakeDecision::Reject("no local identity logged in");
  }
  if (remote.user_id == self->user_id) {
    return HandshakeDecision::Reject("peer claims our own user id");
  }

  auto contact = contacts_.GetContact(remote.user_id);
  if (!contact && !config_.trust_on_first_use) {
    return HandshakeDecision::Reject("unknown peer " + remote.user_id);
  }
  if (contact && !contact->public_key.empty() && contact->public_key != remote.public_key) {
    return HandshakeDecision::Reject("public key does not match contact " + remote.user_id);
  }

  Connection conn;
  conn.peer_id = remote.user_id;
  conn.peer_username = remote.username;
  conn.peer_public_key = remote.public_key;
  conn.transport_kind = TransportKind::DIRECT_SOCKET;
  conn.address = address;
  conn.status = ConnectionStatus::CONNECTING;
  conn.inbound = true;
  conn.session_id = session_id;
  if (!registry_.register_connection(conn)) {
    auto existing = registry_.get(remote.user_id);
    const bool our_dial =
        existing && !existing->inbound && existing->status == ConnectionStatus::CONNECTING;
    if (!our_dial) {
      return HandshakeDecision::Reject("already connected to " + remote.user_id);
    }
    if (self->user_id < remote.user_id) {
      return HandshakeDecision::YieldToOwnDial("our dial to " + remote.user_id +
                                               " takes precedence");
    }
    if (!registry_.take_over_dial(conn)) {
      return HandshakeDecision::Reject("already connected to " + remote.user_id);
    }
    LOG_NET_INFO("Simultaneous dial with {}: accepting their connection", remote.user_id);
  }

  if (!contact) {
    LOG_NET_WARN("Trust on first use: adding unknown peer {} ({}) as a contact", remote.username,
                 remote.user_id);
    Contact added;
    added.user_id = remote.user_id;
    added.username = remote.username;
    added.public_key = remote.public_key;
    added.connection_type = ContactConnectionType::DIRECT;
    contacts_.AddContact(added);
  }
  return HandshakeDecision::Accept();
}

void ConnectionManager::on_inbound_handshake(const PeerSessionPtr &session,
                                             const HandshakeProtocol &hs) {
  pending_.Erase(session->id());
  const auto &remote = hs.remote();

  if (hs.accepted() && session->is_established()) {
    if (!registry_.mark_connected(remote.user_id, session->id(), session, remote.username,
                                  remote.public_key)) {
      session->disconnect("connection no longer registered");
      return;
    }
    contacts_.UpdateLastSeen(remote.user_id);
    LOG_NET_INFO("Incoming connection established with {} ({})", remote.username, remote.user_id);
    events_.NotifyPeerConnected(remote.user_id, remote.username, session->kind(), true);
    resolve_inbound_waiter(remote.user_id, true);
    return;
  }

  // Only removes an entry this session registered itself
  if (!remote.user_id.empty() && registry_.remove_session(remote.user_id, session->id())) {
    resolve_inbound_waiter(remote.user_id, false);
  }
  LOG_NET_DEBUG("Inbound session {} ended during handshake: {}", session->id(),
                hs.reason().empty() ? to_string(hs.error()) : hs.reason());
}

// ============================================================================
// Outbound
// ============================================================================

bool ConnectionManager::connect_to_peer(const std::string &peer_id) {
  if (!running_) {
    set_error("connection manager is shut down");
    return false;
  }
  if (on_reactor_thread()) {
    set_error("connect_to_peer must not be called from a reactor thread");
    return false;
  }

  const auto self = identity_.GetCurrentUser();
  if (!self) {
    set_error("no local identity logged in");
    return false;
  }
  const auto contact = contacts_.GetContact(peer_id);
  if (!contact) {
    set_error("unknown contact " + peer_id);
    return false;
  }
  if (peer_id == self->user_id) {
    set_error("cannot connect to ourselves");
    return false;
  }

  if (auto existing = registry_.get(peer_id)) {
    if (existing->status == ConnectionStatus::CONNECTED) {
      return true;
    }
    if (existing->inbound) {
      // The peer is dialing us; its handshake decides
      if (await_inbound(peer_id, 0, false)) {
        return true;
      }
      set_error("incoming connection from " + peer_id + " did not complete");
      return false;
    }
    set_error("connection attempt to " + peer_id + " already in progress");
    return false;
  }

  const bool via_tunnel = contact->connection_type == ContactConnectionType::TUNNEL;
  if (via_tunnel ? contact->tunnel_url.empty() : contact->address.empty()) {
    set_error("contact " + contact->username + " has no " +
              (via_tunnel ? "tunnel URL" : "address"));
    return false;
  }

  const uint64_t session_id = next_session_id();
  Connection placeholder;
  placeholder.peer_id = peer_id;
  placeholder.peer_username = contact->username;
  placeholder.peer_public_key = contact->public_key;
  placeholder.transport_kind = via_tunnel ? TransportKind::TUNNEL_WEBSOCKET : TransportKind::DIRECT_SOCKET;
  placeholder.address = via_tunnel ? contact->tunnel_url : contact->address;
  placeholder.status = ConnectionStatus::CONNECTING;
  placeholder.session_id = session_id;
  if (!registry_.register_connection(placeholder)) {
    set_error("connection attempt to " + peer_id + " already in progress");
    return false;
  }

  LOG_NET_INFO("Connecting to {} ({}) via {}", contact->username, peer_id,
               TransportKindAsString(placeholder.transport_kind));

  DialOutcome outcome = via_tunnel ? dial_tunnel(*contact, *self, session_id)
                                   : dial_direct(*contact, *self, session_id);
  if (!outcome.ok) {
    // Our dial may have lost a simultaneous-dial tie-break to the peer's own
    if (await_inbound(peer_id, session_id, outcome.peer_dialing)) {
      LOG_NET_INFO("Connected to {} ({}) through its own dial", contact->username, peer_id);
      return true;
    }
    registry_.remove_session(peer_id, session_id);
    set_error("failed to connect to " + contact->username + ": " + outcome.reason);
    return false;
  }

  contacts_.UpdateLastSeen(peer_id);
  LOG_NET_INFO("Successfully connected to {} ({})", contact->username, peer_id);
  events_.NotifyPeerConnected(peer_id, contact->username, placeholder.transport_kind, false);
  return true;
}

ConnectionManager::DialOutcome ConnectionManager::dial_direct(const Contact &contact,
                                                              const LocalIdentity &self,
                                                              uint64_t session_id) {
  auto host_port = util::SplitHostPort(contact.address);
  if (!host_port) {
    return {false, false, "invalid address '" + contact.address + "'"};
  }

  auto connected = std::make_shared<std::promise<TransportError>>();
  auto connected_future = connected->get_future();
  auto connection = transport_->connect(host_port->first, host_port->second,
                                        [connected](TransportError error) { connected->set_value(error); });
  if (!connection) {
    return {false, true, "could not create connection"};
  }

  if (connected_future.wait_for(protocol::DIRECT_CONNECT_TIMEOUT + WAIT_MARGIN) !=
      std::future_status::ready) {
    connection->close();
    return {false, true, to_string(TransportError::TIMED_OUT)};
  }
  TransportError error = connected_future.get();
  if (error != TransportError::NONE) {
    return {false, true, to_string(error) + " (" + contact.address + ")"};
  }

  return run_outbound_session(connection, contact, self, session_id, config_.handshake_timeout);
}

ConnectionManager::DialOutcome ConnectionManager::dial_tunnel(const Contact &contact,
                                                              const LocalIdentity &self,
                                                              uint64_t session_id) {
  auto ws_url = util::ToWebSocketUrl(contact.tunnel_url);
  auto parsed = ws_url ? util::ParseUrl(*ws_url) : std::nullopt;
  if (!parsed) {
    return {false, false, "invalid tunnel URL '" + contact.tunnel_url + "'"};
  }

  std::vector<std::string> targets{parsed->target};
  if (parsed->target != protocol::TUNNEL_FALLBACK_PATH) {
    targets.push_back(protocol::TUNNEL_FALLBACK_PATH);
  }

  const auto deadline = std::chrono::steady_clock::now() + config_.tunnel_overall_timeout;
  auto remaining = [&deadline]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                 std::chrono::steady_clock::now());
  };

  DialOutcome last{false, true, "tunnel connect timed out"};
  for (const auto &target : targets) {
    if (remaining().count() <= 0) {
      break;
    }
    util::ParsedUrl url = *parsed;
    url.target = target;
    auto open_timeout = std::min(config_.tunnel_open_timeout, remaining());

    auto opened = std::make_shared<std::promise<TransportError>>();
    auto opened_future = opened->get_future();
    auto connection = CreateWebSocketConnection(transport_->io_context(), url, open_timeout,
                                                [opened](TransportError error) { opened->set_value(error); });
    if (!connection) {
      return {false, false, "unsupported tunnel URL scheme '" + url.scheme + "'"};
    }

    if (opened_future.wait_for(open_timeout + WAIT_MARGIN) != std::future_status::ready) {
      connection->close();
      last = {false, true, "websocket open timed out on " + target};
      continue;
    }
    TransportError error = opened_future.get();
    if (error != TransportError::NONE) {
      LOG_NET_DEBUG("Tunnel path {} failed: {}", target, to_string(error));
      last = {false, true, to_string(error) + " on " + url.host + target};
      continue;
    }

    auto handshake_timeout = std::min(config_.tunnel_handshake_timeout, remaining());
    if (handshake_timeout.count() <= 0) {
      connection->close();
      break;
    }
    // Once the upgrade succeeded the handshake outcome is final
    return run_outbound_session(connection, contact, self, session_id, handshake_timeout);
  }
  return last;
}

ConnectionManager::DialOutcome
ConnectionManager::run_outbound_session(TransportConnectionPtr connection, const Contact &contact,
                                        const LocalIdentity &self, uint64_t session_id,
                                        std::chrono::milliseconds handshake_timeout) {
  auto session = PeerSession::create_outbound(transport_->io_context(), std::move(connection),
                                              session_id, LocalFrame(self), contact.user_id,
                                              handshake_timeout);

  auto done = std::make_shared<std::promise<DialOutcome>>();
  auto done_future = done->get_future();
  const std::string expected_key = contact.public_key;

  session->set_handshake_callback([this, done, expected_key](const PeerSessionPtr &s,
                                                             const HandshakeProtocol &hs) {
    DialOutcome outcome;
    const auto &remote = hs.remote();
    if (!hs.accepted() || !s->is_established()) {
      outcome.reason = hs.reason().empty() ? to_string(hs.error()) : hs.reason();
      outcome.peer_dialing = hs.error() == HandshakeError::SIMULTANEOUS_DIAL;
    } else if (!expected_key.empty() && remote.public_key != expected_key) {
      outcome.reason = "peer public key does not match contact";
      s->disconnect(outcome.reason);
    } else if (!registry_.mark_connected(remote.user_id, s->id(), s, remote.username,
                                         remote.public_key)) {
      outcome.reason = "connection was cancelled";
      s->disconnect(outcome.reason);
    } else {
      outcome.ok = true;
    }
    done->set_value(outcome);
  });
  attach_established_callbacks(session);
  session->start();

  if (done_future.wait_for(handshake_timeout + WAIT_MARGIN) != std::future_status::ready) {
    session->disconnect("handshake timeout");
    return {false, false, to_string(HandshakeError::TIMED_OUT)};
  }
  return done_future.get();
}

bool ConnectionManager::await_inbound(const std::string &peer_id, uint64_t own_session_id,
                                      bool peer_dialing) {
  auto waiter = std::make_shared<std::promise<bool>>();
  auto result = waiter->get_future();
  inbound_waiters_.Insert(peer_id, waiter);

  auto current = registry_.get(peer_id);
  const bool inbound_registered = current && current->inbound &&
                                  current->session_id != own_session_id;
  bool connected = false;
  if (inbound_registered && current->status == ConnectionStatus::CONNECTED) {
    connected = true;
  } else if (inbound_registered || (peer_dialing && current &&
                                    current->session_id == own_session_id)) {
    // peer_dialing with our placeholder still in place: their handshake has
    // not reached us yet and will take the placeholder over
    if (result.wait_for(config_.handshake_timeout + WAIT_MARGIN) == std::future_status::ready) {
      connected = result.get();
    }
  }

  inbound_waiters_.TakeIf(peer_id, [&waiter](const std::shared_ptr<std::promise<bool>> &w) {
    return w == waiter;
  });
  if (connected) {
    auto conn = registry_.get(peer_id);
    connected = conn && conn->status == ConnectionStatus::CONNECTED;
  }
  return connected;
}

void ConnectionManager::resolve_inbound_waiter(const std::string &peer_id, bool connected) {
  if (auto waiter = inbound_waiters_.Take(peer_id)) {
    (*waiter)->set_value(connected);
  }
}

// ============================================================================
// Established sessions
// ============================================================================

void ConnectionManager::attach_established_callbacks(const PeerSessionPtr &session) {
  session->set_frame_callback(
      [this](const PeerSessionPtr &s, const std::string &body) { handle_envelope(s, body); });
  session->set_closed_callback(
      [this](const PeerSessionPtr &s, const std::string &reason) { on_session_closed(s, reason); });
}

void ConnectionManager::handle_envelope(const PeerSessionPtr &session, const std::string &body) {
  const auto &remote = session->remote();

  auto envelope = message::DecodeEnvelope(body);
  if (!envelope) {
    LOG_NET_WARN("Dropping malformed envelope from {}", remote.user_id);
    return;
  }

  const auto self = identity_.GetCurrentUser();
  if (!self) {
    LOG_NET_DEBUG("Dropping envelope from {}: no local identity", remote.user_id);
    return;
  }

  std::string peer_key = remote.public_key;
  if (auto contact = contacts_.GetContact(remote.user_id); contact && !contact->public_key.empty()) {
    peer_key = contact->public_key;
  }

  auto plaintext = crypto::CryptoBox::Decrypt(self->private_key, peer_key, envelope->ciphertext);
  if (!plaintext) {
    LOG_CRYPTO_WARN("Dropping {} from {}: decryption failed",
                    message::MessageKindAsString(envelope->kind), remote.user_id);
    return;
  }

  IncomingMessage msg;
  msg.kind = envelope->kind;
  msg.peer_id = remote.user_id;
  msg.peer_username = remote.username;
  msg.text = std::move(*plaintext);
  msg.timestamp = envelope->timestamp;
  msg.group_id = envelope->group_id;
  msg.group_name = envelope->group_name;
  events_.NotifyMessage(msg);
}

void ConnectionManager::on_session_closed(const PeerSessionPtr &session, const std::string &reason) {
  const std::string &peer_id = session->remote().user_id;
  auto removed = registry_.remove_session(peer_id, session->id());
  if (!removed) {
    // Already removed by disconnect_from_peer or superseded
    return;
  }
  LOG_NET_INFO("Connection with {} ({}) closed: {}", removed->peer_username, peer_id, reason);
  if (removed->status == ConnectionStatus::CONNECTED) {
    events_.NotifyPeerDisconnected(peer_id, reason);
  }
}

// ============================================================================
// Sending
// ============================================================================

bool ConnectionManager::send_envelope(const std::string &peer_id, message::MessageKind kind,
                                      const std::string &plaintext,
                                      const std::optional<std::string> &group_id,
                                      const std::optional<std::string> &group_name) {
  auto conn = registry_.get(peer_id);
  if (!conn || conn->status != ConnectionStatus::CONNECTED || !conn->session) {
    set_error("not connected to " + peer_id);
    return false;
  }

  const auto self = identity_.GetCurrentUser();
  if (!self) {
    set_error("no local identity logged in");
    return false;
  }

  std::string peer_key = conn->peer_public_key;
  if (auto contact = contacts_.GetContact(peer_id); contact && !contact->public_key.empty()) {
    peer_key = contact->public_key;
  }
  if (peer_key.empty()) {
    set_error("public key of " + peer_id + " is unknown");
    return false;
  }

  auto sealed = crypto::CryptoBox::Encrypt(self->private_key, peer_key, plaintext);
  if (!sealed) {
    set_error("encryption failed for " + peer_id);
    return false;
  }

  message::Envelope envelope;
  envelope.kind = kind;
  envelope.ciphertext = std::move(*sealed);
  envelope.timestamp = util::GetTimeISO8601();
  envelope.group_id = group_id;
  envelope.group_name = group_name;

  if (!conn->session->send_frame(message::EncodeEnvelope(envelope))) {
    set_error("send to " + peer_id + " failed");
    return false;
  }
  return true;
}

bool ConnectionManager::send_message(const std::string &peer_id, const std::string &text) {
  return send_envelope(peer_id, message::MessageKind::CHAT, text, std::nullopt, std::nullopt);
}

bool ConnectionManager::send_signal(const std::string &peer_id, const std::string &payload_json) {
  try {
    auto payload = nlohmann::json::parse(payload_json);
    if (!payload.is_object()) {
      set_error("signal payload must be a JSON object");
      return false;
    }
  } catch (const nlohmann::json::exception &e) {
    set_error(std::string("invalid signal payload: ") + e.what());
    return false;
  }
  return send_envelope(peer_id, message::MessageKind::SIGNAL, payload_json, std::nullopt,
                       std::nullopt);
}

std::map<std::string, bool>
ConnectionManager::send_group_message(const std::vector<std::string> &member_ids,
                                      const std::string &text, const std::string &group_id,
                                      const std::string &group_name) {
  std::map<std::string, bool> results;
  const auto self = identity_.GetCurrentUser();
  for (const auto &member : member_ids) {
    if (self && member == self->user_id) {
      continue;
    }
    results[member] = send_envelope(member, message::MessageKind::CHAT, text, group_id, group_name);
  }
  return results;
}

// ============================================================================
// Teardown and queries
// ============================================================================

void ConnectionManager::disconnect_from_peer(const std::string &peer_id) {
  auto removed = registry_.remove(peer_id);
  if (!removed) {
    return;
  }
  if (removed->session) {
    removed->session->disconnect("disconnected locally");
  }
  LOG_NET_INFO("Disconnected from {} ({})", removed->peer_username, peer_id);
  if (removed->status == ConnectionStatus::CONNECTED) {
    events_.NotifyPeerDisconnected(peer_id, "disconnected locally");
  }
}

std::vector<ConnectionInfo> ConnectionManager::get_active_connections() const {
  std::vector<ConnectionInfo> result;
  for (const auto &conn : registry_.list_active()) {
    result.push_back(ToConnectionInfo(conn));
  }
  return result;
}

std::optional<ConnectionInfo> ConnectionManager::get_connection(const std::string &peer_id) const {
  auto conn = registry_.get(peer_id);
  if (!conn) {
    return std::nullopt;
  }
  return ToConnectionInfo(*conn);
}

MessageEvents::Subscription
ConnectionManager::add_message_handler(message::MessageKind kind,
                                       MessageEvents::MessageCallback handler) {
  return events_.SubscribeMessage(kind, std::move(handler));
}

} // namespace network
} // namespace whisperlink
