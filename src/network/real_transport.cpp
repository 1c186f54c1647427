// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

// Direct TCP transport: dialed and accepted peer sockets plus the listener

#include "network/real_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace whisperlink {
namespace network {

namespace {

std::atomic<uint64_t> g_next_connection_id{1};

void ConfigureSocket(boost::asio::ip::tcp::socket &socket) {
  boost::system::error_code ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), ec);
}

// Reason reported to the dialer for a failed async_connect
TransportError ClassifyConnectError(const boost::system::error_code &ec) {
  if (ec == boost::asio::error::timed_out)
    return TransportError::TIMED_OUT;
  if (ec == boost::asio::error::host_not_found || ec == boost::asio::error::host_not_found_try_again)
    return TransportError::RESOLVE_FAILED;
  return TransportError::REFUSED;
}

} // namespace

uint64_t NextConnectionId() { return g_next_connection_id++; }

// ============================================================================
// RealTransportConnection
// ============================================================================

#ifdef WHISPERLINK_TESTS
std::atomic<std::chrono::milliseconds> RealTransportConnection::connect_timeout_override_ms_{std::chrono::milliseconds{0}};
std::atomic<size_t> RealTransportConnection::send_queue_limit_override_bytes_{0};
#endif

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &address,
    uint16_t port, ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, false));
  // Defer do_connect onto the strand so shared_from_this() is safe
  boost::asio::post(conn->strand_, [conn, address, port, callback]() mutable {
    conn->do_connect(address, port, std::move(callback));
  });
  return conn;
}

TransportConnectionPtr
RealTransportConnection::create_inbound(boost::asio::io_context &io_context,
                                        boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }

  return conn;
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, bool is_inbound)
    : io_context_(io_context), socket_(io_context),
      strand_(io_context.get_executor()),
      is_inbound_(is_inbound),
      id_(NextConnectionId()),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {}

// Cleanup happens in close_impl() while the shared_ptr is alive; no logging
// here because the logger may already be gone at process exit.
RealTransportConnection::~RealTransportConnection() = default;

void RealTransportConnection::finish_connect(const ConnectCallback &callback,
                                             TransportError error) {
  connect_done_ = true;
  if (connect_timer_) {
    connect_timer_->cancel();
  }
  if (!callback) {
    return;
  }
  try {
    callback(error);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("exception in connect callback for {}:{}: {}", remote_addr_, remote_port_, e.what());
  }
}

void RealTransportConnection::do_connect(const std::string &address,
                                         uint16_t port,
                                         ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;
  connect_done_ = false;

  auto timeout = connect_timeout_ms();
  if (timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(timeout);
    connect_timer_->async_wait(boost::asio::bind_executor(
        strand_, [this, self = shared_from_this(), callback](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted || connect_done_) {
            return;
          }
          LOG_NET_WARN("connect timeout to {}:{} after {} ms", remote_addr_, remote_port_,
                       connect_timeout_ms().count());
          boost::system::error_code ignored;
          if (resolver_) resolver_->cancel();
          socket_.cancel(ignored);
          socket_.close(ignored);
          finish_connect(callback, TransportError::TIMED_OUT);
        }));
  }

  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      address, std::to_string(port),
      boost::asio::bind_executor(strand_,
      [this, self = shared_from_this(), callback](const boost::system::error_code &ec,
                 boost::asio::ip::tcp::resolver::results_type results) {
        if (connect_done_) return;
        if (ec) {
          LOG_NET_DEBUG("cannot resolve peer host {}: {}", remote_addr_, ec.message());
          finish_connect(callback, TransportError::RESOLVE_FAILED);
          return;
        }

        boost::asio::async_connect(
            socket_, results,
            boost::asio::bind_executor(strand_,
            [this, self, callback](const boost::system::error_code &ec,
                                   const boost::asio::ip::tcp::endpoint &) {
              if (connect_done_) return; // timed out already
              if (ec) {
                LOG_NET_DEBUG("dial {}:{} failed: {}", remote_addr_, remote_port_, ec.message());
                finish_connect(callback, ClassifyConnectError(ec));
                return;
              }

              open_ = true;
              ConfigureSocket(socket_);
              LOG_NET_TRACE("dialed peer at {}:{}", remote_addr_, remote_port_);
              finish_connect(callback, TransportError::NONE);
            }));
      }));
}

void RealTransportConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void RealTransportConnection::start_read_impl() {
  if (!open_)
    return;

  // One read outstanding at a time, so the member buffer is never shared
  socket_.async_read_some(
      boost::asio::buffer(read_buffer_),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this()](const boost::system::error_code &ec,
                                            size_t bytes_transferred) {
        if (!open_) {
          deliver_disconnect_once();
          close_impl();
          return;
        }

        if (ec) {
          if (ec != boost::asio::error::eof &&
              ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_,
                          ec.message());
          }
          deliver_disconnect_once();
          close_impl();
          return;
        }

        if (bytes_transferred > 0 && receive_callback_) {
          ReceiveCallback saved_receive_cb = receive_callback_;
          std::vector<uint8_t> data(read_buffer_.begin(), read_buffer_.begin() + bytes_transferred);
          try {
            saved_receive_cb(data);
          } catch (const std::exception &e) {
            LOG_NET_ERROR("exception in receive callback from {}:{}: {}",
                          remote_addr_, remote_port_, e.what());
          }
          // Receive callback may have closed us
          if (!open_) {
            return;
          }
        }

        start_read_impl();
      }));
}

bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_) return false;
  // Copy before posting: caller may free data as soon as we return
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_) return;

    size_t limit = send_queue_limit();
    if (send_queue_bytes_ + payload->size() > limit) {
      LOG_NET_WARN("peer {}:{} is not reading ({} bytes queued, limit {}), closing",
                   remote_addr_, remote_port_, send_queue_bytes_ + payload->size(), limit);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_)
    return;

  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data_ptr = send_queue_.front();

  boost::asio::async_write(
      socket_, boost::asio::buffer(*data_ptr),
      boost::asio::bind_executor(
          strand_,
          [this, self = shared_from_this(), data_ptr](const boost::system::error_code &ec,
                                                      size_t /*bytes_transferred*/) {
        if (!open_) {
          return; // queue already cleared by close_impl()
        }

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                        ec.message());
          deliver_disconnect_once();
          close_impl();
          return;
        }

        send_queue_bytes_ -= data_ptr->size();
        send_queue_.pop();

        if (!send_queue_.empty()) {
          do_write_impl();
        } else {
          writing_ = false;
        }
      }));
}

void RealTransportConnection::deliver_disconnect_once() {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering strand
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb), id = id_]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in disconnect callback (connection {}): {}", id, e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    close_impl();
  });
}

void RealTransportConnection::close_impl() {
  if (!open_.exchange(false)) {
    // Never opened (connect still pending) still needs its timer/resolver torn down
    if (connect_timer_) {
      connect_timer_->cancel();
    }
    if (resolver_) {
      resolver_->cancel();
    }
    boost::system::error_code ignored;
    socket_.close(ignored);
    return;
  }

  // Move socket out and cancel: pending handlers complete with
  // operation_aborted and release their shared_ptr
  {
    boost::asio::ip::tcp::socket socket_to_cancel(std::move(socket_));
    boost::system::error_code ec;
    socket_to_cancel.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_to_cancel.cancel(ec);
    socket_to_cancel.close(ec);
  }

  receive_callback_ = {};
  disconnect_callback_ = {};

  // Destroy the timer here while the io_context is still running
  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      timer_to_destroy->cancel();
    }
  }

  resolver_.reset();

  std::queue<std::shared_ptr<std::vector<uint8_t>>> empty;
  std::swap(send_queue_, empty);
  send_queue_bytes_ = 0;
  writing_ = false;
}

bool RealTransportConnection::is_open() const { return open_; }

#ifdef WHISPERLINK_TESTS
void RealTransportConnection::SetConnectTimeoutForTest(std::chrono::milliseconds timeout_ms) {
  connect_timeout_override_ms_.store(timeout_ms, std::memory_order_relaxed);
}

void RealTransportConnection::ResetConnectTimeoutForTest() {
  connect_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}

void RealTransportConnection::SetSendQueueLimitForTest(size_t bytes) {
  send_queue_limit_override_bytes_.store(bytes, std::memory_order_relaxed);
}

void RealTransportConnection::ResetSendQueueLimitForTest() {
  send_queue_limit_override_bytes_.store(0, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds RealTransportConnection::connect_timeout_ms() const {
#ifdef WHISPERLINK_TESTS
  auto ms = connect_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
#endif
  return std::chrono::duration_cast<std::chrono::milliseconds>(protocol::DIRECT_CONNECT_TIMEOUT);
}

size_t RealTransportConnection::send_queue_limit() const {
#ifdef WHISPERLINK_TESTS
  size_t limit = send_queue_limit_override_bytes_.load(std::memory_order_relaxed);
  if (limit != 0) return limit;
#endif
  return protocol::DEFAULT_SEND_QUEUE_SIZE;
}

std::string RealTransportConnection::remote_address() const {
  return remote_addr_;
}

uint16_t RealTransportConnection::remote_port() const { return remote_port_; }

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(
    DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(size_t io_threads)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads) {
}

RealTransport::~RealTransport() { stop(); }

TransportConnectionPtr RealTransport::connect(const std::string &address,
                                              uint16_t port,
                                              ConnectCallback callback) {
  return RealTransportConnection::create_outbound(*io_context_, address, port,
                                                  std::move(callback));
}

bool RealTransport::listen(
    uint16_t port,
    std::function<void(TransportConnectionPtr)> accept_callback) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    LOG_NET_DEBUG("already listening on port {}", last_listen_port_.load());
    return false;
  }

  using tcp = boost::asio::ip::tcp;
  boost::system::error_code ec;
  auto acceptor = std::make_unique<tcp::acceptor>(*io_context_);

  // Dual-stack first (IPv6 with v6_only=false), IPv4-only fallback
  auto open_and_bind = [&](const tcp &proto) {
    ec.clear();
    acceptor->open(proto, ec);
    if (!ec && proto == tcp::v6()) acceptor->set_option(boost::asio::ip::v6_only(false), ec);
    if (!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor->bind(tcp::endpoint(proto, port), ec);
    if (!ec) acceptor->listen(protocol::LISTEN_BACKLOG, ec);
    return !ec;
  };

  if (!open_and_bind(tcp::v6())) {
    boost::system::error_code ignored;
    acceptor->close(ignored);
    if (!open_and_bind(tcp::v4())) {
      LOG_NET_ERROR("failed to listen on port {}: {}", port, ec.message());
      acceptor->close(ignored);
      return false;
    }
  }

  auto ep = acceptor->local_endpoint(ec);
  last_listen_port_ = ec ? 0 : ep.port();

  acceptor_ = std::move(acceptor);
  accept_callback_ = std::move(accept_callback);

  LOG_NET_INFO("listening on port {}", last_listen_port_.load());
  start_accept();
  return true;
}

void RealTransport::start_accept() {
  // acceptor_mutex_ held by caller
  if (!acceptor_)
    return;

  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      std::lock_guard<std::mutex> lock(acceptor_mutex_);
      start_accept();
    }
    return;
  }

  ConfigureSocket(socket);
  auto conn = RealTransportConnection::create_inbound(*io_context_, std::move(socket));
  LOG_NET_DEBUG("peer socket from {}:{} accepted", conn->remote_address(), conn->remote_port());

  std::function<void(TransportConnectionPtr)> callback;
  {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    callback = accept_callback_;
  }

  if (callback) {
    try {
      callback(conn);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in accept callback: {}", e.what());
      conn->close();
    }
  } else {
    conn->close();
  }

  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  start_accept();
}

void RealTransport::stop_listening() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->cancel(ec);
    acceptor_->close(ec);
    acceptor_.reset();
    LOG_NET_INFO("stopped listening on port {}", last_listen_port_.load());
  }
  last_listen_port_ = 0;
  // Release anything the callback captured
  accept_callback_ = {};
}

void RealTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void RealTransport::stop() {
  running_.store(false);

  // No logging: called from destructor, logger may be shut down
  {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    last_listen_port_ = 0;
    accept_callback_ = {};
  }

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

} // namespace network
} // namespace whisperlink
