#include "network/peer_session.hpp"
#include "util/logging.hpp"

namespace whisperlink {
namespace network {

namespace {
// A rejected initiator normally closes first; this bounds how long we wait
constexpr std::chrono::milliseconds REJECT_LINGER{1000};
} // namespace

#ifdef WHISPERLINK_TESTS
// Test-only timeout override (0ms = disabled)
std::atomic<std::chrono::milliseconds> PeerSession::handshake_timeout_override_ms_{std::chrono::milliseconds{0}};
#endif

PeerSession::PeerSession(PrivateTag, boost::asio::io_context &io_context,
                         TransportConnectionPtr connection, uint64_t session_id,
                         HandshakeProtocol handshake, HandshakeDecider decider,
                         std::chrono::milliseconds handshake_timeout)
    : io_context_(io_context), strand_(boost::asio::make_strand(io_context)),
      connection_(std::move(connection)), handshake_timer_(io_context),
      linger_timer_(io_context), session_id_(session_id),
      transport_id_(connection_ ? connection_->connection_id() : 0),
      kind_(connection_ ? connection_->kind() : TransportKind::DIRECT_SOCKET),
      remote_addr_(connection_ ? connection_->remote_address() : ""),
      remote_port_(connection_ ? connection_->remote_port() : 0),
      handshake_(std::move(handshake)), decider_(std::move(decider)),
      handshake_timeout_(handshake_timeout) {}

PeerSession::~PeerSession() {
  // Cleanup belongs to do_disconnect() while the shared_ptr is alive
  if (state_ != PeerSessionState::CLOSED && started_) {
    LOG_NET_ERROR("PeerSession {} destroyed without prior disconnect (address={})",
                  session_id_, address());
  }
  handshake_timer_.cancel();
  linger_timer_.cancel();
}

PeerSessionPtr PeerSession::create_outbound(boost::asio::io_context &io_context,
                                            TransportConnectionPtr connection,
                                            uint64_t session_id,
                                            message::HandshakeFrame local,
                                            std::string expected_peer_id,
                                            std::chrono::milliseconds handshake_timeout) {
  HandshakeProtocol hs(HandshakeRole::INITIATOR, std::move(local));
  hs.set_expected_peer_id(std::move(expected_peer_id));
  return std::make_shared<PeerSession>(PrivateTag{}, io_context, std::move(connection),
                                       session_id, std::move(hs), HandshakeDecider{},
                                       handshake_timeout);
}

PeerSessionPtr PeerSession::create_inbound(boost::asio::io_context &io_context,
                                           TransportConnectionPtr connection,
                                           uint64_t session_id,
                                           message::HandshakeFrame local,
                                           HandshakeDecider decider,
                                           std::chrono::milliseconds handshake_timeout) {
  HandshakeProtocol hs(HandshakeRole::RESPONDER, std::move(local));
  return std::make_shared<PeerSession>(PrivateTag{}, io_context, std::move(connection),
                                       session_id, std::move(hs), std::move(decider),
                                       handshake_timeout);
}

std::string PeerSession::address() const {
  if (remote_addr_.empty())
    return "unknown";
  return remote_addr_ + ":" + std::to_string(remote_port_);
}

void PeerSession::start() {
  // Atomic CAS: exactly one caller wires callbacks and starts the transport
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    LOG_NET_ERROR("PeerSession {} start() called twice; sessions are single-use", session_id_);
    return;
  }

  if (!connection_ || !connection_->is_open()) {
    LOG_NET_DEBUG("PeerSession {} cannot start: transport not open", session_id_);
    auto self = shared_from_this();
    boost::asio::post(strand_, [self]() { self->do_disconnect("transport not open"); });
    return;
  }

  std::weak_ptr<PeerSession> weak_self = weak_from_this();
  connection_->set_receive_callback([weak_self](const std::vector<uint8_t> &data) {
    if (auto self = weak_self.lock()) {
      boost::asio::post(self->strand_, [self, data]() { self->on_transport_receive(data); });
    }
  });
  connection_->set_disconnect_callback([weak_self]() {
    if (auto self = weak_self.lock()) {
      boost::asio::post(self->strand_, [self]() { self->on_transport_disconnect(); });
    }
  });

  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    if (self->state_ == PeerSessionState::CLOSED)
      return;

    self->connection_->start();

    if (self->handshake_.role() == HandshakeRole::INITIATOR) {
      auto body = self->handshake_.begin();
      if (!body) {
        self->do_disconnect("handshake could not be encoded");
        return;
      }
      auto frame = message::EncodeFrame(*body);
      if (frame.empty() || !self->connection_->send(frame)) {
        self->do_disconnect("handshake send failed");
        return;
      }
      self->handshake_.mark_sent();
      LOG_NET_DEBUG("PeerSession {} sent handshake to {}", self->session_id_, self->address());
    }
    self->start_handshake_timeout();
  });
}

bool PeerSession::send_frame(const std::string &body) {
  if (state_ != PeerSessionState::ESTABLISHED || !connection_)
    return false;
  auto frame = message::EncodeFrame(body);
  if (frame.empty()) {
    LOG_NET_WARN("PeerSession {} refusing oversized frame ({} bytes)", session_id_, body.size());
    return false;
  }
  return connection_->send(frame);
}

void PeerSession::disconnect(const std::string &reason) {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self, reason]() { self->do_disconnect(reason); });
}

void PeerSession::on_transport_receive(const std::vector<uint8_t> &data) {
  if (state_ == PeerSessionState::CLOSED)
    return;

  std::vector<std::string> frames;
  bool ok = decoder_.feed(data, frames);

  // Frames completed before a violation are still processed in order
  for (const auto &body : frames) {
    if (state_ == PeerSessionState::CLOSED)
      return;
    process_frame(body);
  }

  if (!ok && state_ != PeerSessionState::CLOSED) {
    LOG_NET_WARN("PeerSession {} from {} sent an oversized frame, closing",
                 session_id_, address());
    do_disconnect("frame size limit exceeded");
  }
}

void PeerSession::on_transport_disconnect() {
  if (state_ == PeerSessionState::CLOSED)
    return;
  LOG_NET_DEBUG("PeerSession {} transport closed by {}", session_id_, address());
  do_disconnect("connection closed by remote");
}

void PeerSession::process_frame(const std::string &body) {
  if (state_ == PeerSessionState::HANDSHAKING) {
    handle_handshake_frame(body);
    return;
  }
  if (state_ == PeerSessionState::ESTABLISHED && frame_cb_) {
    try {
      frame_cb_(shared_from_this(), body);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("PeerSession {} frame handler threw: {}", session_id_, e.what());
    }
  }
}

void PeerSession::handle_handshake_frame(const std::string &body) {
  // A lingering rejected responder ignores whatever else arrives
  if (handshake_.finished())
    return;

  if (handshake_.role() == HandshakeRole::INITIATOR) {
    handshake_.on_response(body);
    if (handshake_.accepted()) {
      handshake_timer_.cancel();
      state_ = PeerSessionState::ESTABLISHED;
      LOG_NET_INFO("Handshake accepted by {} ({}) at {}", handshake_.remote().username,
                   handshake_.remote().user_id, address());
      complete_handshake();
      return;
    }
    LOG_NET_INFO("Handshake with {} failed: {}", address(), handshake_.reason());
    complete_handshake();
    do_disconnect(handshake_.reason());
    return;
  }

  auto response = handshake_.on_request(body, decider_);
  if (!response) {
    // Malformed or incomplete: close without answering
    LOG_NET_WARN("Invalid handshake from {}: {}", address(), handshake_.reason());
    complete_handshake();
    do_disconnect(handshake_.reason());
    return;
  }

  auto frame = message::EncodeFrame(*response);
  bool sent = !frame.empty() && connection_->send(frame);

  if (handshake_.accepted()) {
    if (!sent) {
      // Reported as accepted but the session is already CLOSED
      do_disconnect("handshake response send failed");
      return;
    }
    handshake_timer_.cancel();
    state_ = PeerSessionState::ESTABLISHED;
    LOG_NET_INFO("Accepted handshake from {} ({}) at {}", handshake_.remote().username,
                 handshake_.remote().user_id, address());
    complete_handshake();
    return;
  }

  LOG_NET_INFO("Rejected handshake from {}: {}", address(), handshake_.reason());
  complete_handshake();
  if (sent) {
    linger_then_close(handshake_.reason());
  } else {
    do_disconnect(handshake_.reason());
  }
}

void PeerSession::start_handshake_timeout() {
  auto timeout = handshake_timeout_;
#ifdef WHISPERLINK_TESTS
  auto ov = handshake_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0)
    timeout = ov;
#endif
  handshake_timer_.expires_after(timeout);

  std::weak_ptr<PeerSession> weak_self = weak_from_this();
  handshake_timer_.async_wait(boost::asio::bind_executor(
      strand_, [weak_self](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        auto self = weak_self.lock();
        if (!self || self->state_ != PeerSessionState::HANDSHAKING ||
            self->handshake_.finished())
          return;
        LOG_NET_INFO("Handshake with {} timed out", self->address());
        self->handshake_.on_timeout();
        self->complete_handshake();
        self->do_disconnect("handshake timeout");
      }));
}

void PeerSession::complete_handshake() {
  if (handshake_reported_)
    return;
  handshake_reported_ = true;
  if (!handshake_cb_)
    return;
  try {
    handshake_cb_(shared_from_this(), handshake_);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("PeerSession {} handshake handler threw: {}", session_id_, e.what());
  }
}

void PeerSession::linger_then_close(const std::string &reason) {
  handshake_timer_.cancel();
  linger_timer_.expires_after(REJECT_LINGER);
  auto self = shared_from_this();
  linger_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self, reason](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted)
          return;
        self->do_disconnect(reason);
      }));
}

void PeerSession::do_disconnect(const std::string &reason) {
  PeerSessionState prev = state_.exchange(PeerSessionState::CLOSED);
  if (prev == PeerSessionState::CLOSED)
    return;

  handshake_timer_.cancel();
  linger_timer_.cancel();

  if (!handshake_.finished()) {
    handshake_.on_closed();
  }
  complete_handshake();

  if (connection_) {
    connection_->set_receive_callback({});
    connection_->set_disconnect_callback({});
    connection_->close();
  }

  LOG_NET_DEBUG("PeerSession {} closed ({})", session_id_, reason);

  if (prev == PeerSessionState::ESTABLISHED && closed_cb_) {
    try {
      closed_cb_(shared_from_this(), reason);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("PeerSession {} close handler threw: {}", session_id_, e.what());
    }
  }

  handshake_cb_ = nullptr;
  frame_cb_ = nullptr;
  closed_cb_ = nullptr;
}

#ifdef WHISPERLINK_TESTS
void PeerSession::SetHandshakeTimeoutForTest(std::chrono::milliseconds timeout) {
  handshake_timeout_override_ms_.store(timeout, std::memory_order_relaxed);
}

void PeerSession::ResetHandshakeTimeoutForTest() {
  handshake_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}
#endif

} // namespace network
} // namespace whisperlink
