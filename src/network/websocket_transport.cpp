// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "network/websocket_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <atomic>
#include <queue>
#include <type_traits>

namespace whisperlink {
namespace network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

template <class T> struct is_ssl_layer : std::false_type {};
template <class T> struct is_ssl_layer<beast::ssl_stream<T>> : std::true_type {};

/**
 * WebSocketConnection - ws/wss client stream behind TransportConnection
 *
 * The websocket stream, resolver and open timer all use one strand
 * executor, so their completion handlers are serialized without explicit
 * bind_executor. Public methods dispatch onto that strand.
 */
template <class NextLayer>
class WebSocketConnection
    : public TransportConnection,
      public std::enable_shared_from_this<WebSocketConnection<NextLayer>> {
public:
  using Strand = net::strand<net::io_context::executor_type>;

  template <class... LayerArgs>
  WebSocketConnection(Strand strand, util::ParsedUrl url, std::shared_ptr<ssl::context> tls,
                      LayerArgs &&...layer_args)
      : strand_(strand), tls_(std::move(tls)),
        ws_(strand, std::forward<LayerArgs>(layer_args)...), resolver_(strand),
        open_timer_(strand), url_(std::move(url)), id_(NextConnectionId()) {}

  void open(std::chrono::milliseconds timeout, ConnectCallback callback) {
    net::dispatch(strand_, [self = this->shared_from_this(), timeout, cb = std::move(callback)]() mutable {
      self->connect_callback_ = std::move(cb);
      self->open_timer_.expires_after(timeout);
      self->open_timer_.async_wait([self](const beast::error_code &ec) {
        if (ec == net::error::operation_aborted || self->connect_done_) {
          return;
        }
        LOG_NET_WARN("websocket open to {} timed out", self->describe());
        self->abort_open(TransportError::TIMED_OUT);
      });
      self->resolver_.async_resolve(
          self->url_.host, std::to_string(self->url_.port),
          [self](const beast::error_code &ec, tcp::resolver::results_type results) {
            self->on_resolve(ec, std::move(results));
          });
    });
  }

  // TransportConnection interface
  void start() override {
    net::dispatch(strand_, [self = this->shared_from_this()]() {
      if (self->open_) {
        self->start_read_impl();
      }
    });
  }

  bool send(const std::vector<uint8_t> &data) override {
    if (!open_) return false;
    auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
    net::dispatch(strand_, [self = this->shared_from_this(), payload]() {
      if (!self->open_) return;
      if (self->send_queue_bytes_ + payload->size() > protocol::DEFAULT_SEND_QUEUE_SIZE) {
        LOG_NET_WARN("websocket send queue overflow to {}, closing", self->describe());
        self->deliver_disconnect_once();
        self->close_impl();
        return;
      }
      self->send_queue_.push(payload);
      self->send_queue_bytes_ += payload->size();
      if (!self->writing_) {
        self->writing_ = true;
        self->do_write_impl();
      }
    });
    return true;
  }

  void close() override {
    net::dispatch(strand_, [self = this->shared_from_this()]() { self->close_impl(); });
  }

  bool is_open() const override { return open_; }
  std::string remote_address() const override { return url_.host; }
  uint16_t remote_port() const override { return url_.port; }
  bool is_inbound() const override { return false; }
  TransportKind kind() const override { return TransportKind::TUNNEL_WEBSOCKET; }
  uint64_t connection_id() const override { return id_; }

  void set_receive_callback(ReceiveCallback callback) override {
    net::dispatch(strand_, [self = this->shared_from_this(), cb = std::move(callback)]() mutable {
      self->receive_callback_ = std::move(cb);
    });
  }

  void set_disconnect_callback(DisconnectCallback callback) override {
    net::dispatch(strand_, [self = this->shared_from_this(), cb = std::move(callback)]() mutable {
      self->disconnect_callback_ = std::move(cb);
    });
  }

private:
  std::string describe() const { return url_.scheme + "://" + url_.host + ":" + std::to_string(url_.port) + url_.target; }

  std::string host_header() const {
    const bool default_port = (url_.secure() && url_.port == 443) || (!url_.secure() && url_.port == 80);
    return default_port ? url_.host : url_.host + ":" + std::to_string(url_.port);
  }

  void on_resolve(const beast::error_code &ec, tcp::resolver::results_type results) {
    if (connect_done_) return;
    if (ec) {
      LOG_NET_DEBUG("websocket resolve {} failed: {}", url_.host, ec.message());
      finish_open(TransportError::RESOLVE_FAILED);
      return;
    }
    beast::get_lowest_layer(ws_).async_connect(
        results, [self = this->shared_from_this()](const beast::error_code &ec,
                                                  const tcp::resolver::results_type::endpoint_type &) {
          self->on_connect(ec);
        });
  }

  void on_connect(const beast::error_code &ec) {
    if (connect_done_) return;
    if (ec) {
      LOG_NET_DEBUG("websocket connect {} failed: {}", describe(), ec.message());
      finish_open(TransportError::REFUSED);
      return;
    }

    if constexpr (is_ssl_layer<NextLayer>::value) {
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
        LOG_NET_DEBUG("websocket SNI setup for {} failed", url_.host);
        finish_open(TransportError::TLS_FAILED);
        return;
      }
      ws_.next_layer().async_handshake(
          ssl::stream_base::client, [self = this->shared_from_this()](const beast::error_code &ec) {
            if (self->connect_done_) return;
            if (ec) {
              LOG_NET_DEBUG("TLS handshake with {} failed: {}", self->url_.host, ec.message());
              self->finish_open(TransportError::TLS_FAILED);
              return;
            }
            self->do_upgrade();
          });
    } else {
      do_upgrade();
    }
  }

  void do_upgrade() {
    // Open timer bounds the upgrade; the stream's own expiry is not used
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
      req.set(beast::http::field::user_agent, "whisperlink/" + GetVersionString());
    }));
    ws_.async_handshake(host_header(), url_.target, [self = this->shared_from_this()](const beast::error_code &ec) {
      if (self->connect_done_) return;
      if (ec) {
        LOG_NET_DEBUG("websocket upgrade {} failed: {}", self->describe(), ec.message());
        self->finish_open(TransportError::UPGRADE_FAILED);
        return;
      }
      self->ws_.binary(true);
      self->ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
      self->open_ = true;
      LOG_NET_DEBUG("websocket open to {}", self->describe());
      self->finish_open(TransportError::NONE);
    });
  }

  void abort_open(TransportError error) {
    beast::error_code ignored;
    resolver_.cancel();
    beast::get_lowest_layer(ws_).socket().close(ignored);
    finish_open(error);
  }

  void finish_open(TransportError error) {
    if (connect_done_) return;
    connect_done_ = true;
    open_timer_.cancel();
    if (error != TransportError::NONE) {
      beast::error_code ignored;
      beast::get_lowest_layer(ws_).socket().close(ignored);
    }
    ConnectCallback cb = std::move(connect_callback_);
    if (!cb) return;
    try {
      cb(error);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in websocket connect callback for {}: {}", describe(), e.what());
    }
  }

  void start_read_impl() {
    ws_.async_read(read_buffer_, [self = this->shared_from_this()](const beast::error_code &ec,
                                                                   size_t bytes_transferred) {
      if (!self->open_) {
        return;
      }
      if (ec) {
        if (ec != net::error::operation_aborted && ec != websocket::error::closed) {
          LOG_NET_TRACE("websocket read error from {}: {}", self->describe(), ec.message());
        }
        self->deliver_disconnect_once();
        self->close_impl();
        return;
      }

      auto data_view = self->read_buffer_.data();
      const auto *begin = static_cast<const uint8_t *>(data_view.data());
      std::vector<uint8_t> data(begin, begin + data_view.size());
      self->read_buffer_.consume(bytes_transferred);

      if (!data.empty() && self->receive_callback_) {
        ReceiveCallback cb = self->receive_callback_;
        try {
          cb(data);
        } catch (const std::exception &e) {
          LOG_NET_ERROR("exception in websocket receive callback from {}: {}", self->describe(), e.what());
        }
        if (!self->open_) {
          return;
        }
      }
      self->start_read_impl();
    });
  }

  void do_write_impl() {
    if (!open_) return;
    if (send_queue_.empty()) {
      writing_ = false;
      return;
    }
    auto front = send_queue_.front();
    ws_.async_write(net::buffer(*front), [self = this->shared_from_this(), front](const beast::error_code &ec,
                                                                                 size_t /*bytes*/) {
      if (!self->open_) return;
      if (ec) {
        LOG_NET_TRACE("websocket write error to {}: {}", self->describe(), ec.message());
        self->deliver_disconnect_once();
        self->close_impl();
        return;
      }
      self->send_queue_bytes_ -= front->size();
      self->send_queue_.pop();
      self->do_write_impl();
    });
  }

  void deliver_disconnect_once() {
    if (disconnect_delivered_) return;
    disconnect_delivered_ = true;
    DisconnectCallback cb = std::move(disconnect_callback_);
    if (cb) {
      net::post(strand_.get_inner_executor(), [cb = std::move(cb), id = id_]() {
        try {
          cb();
        } catch (const std::exception &e) {
          LOG_NET_ERROR("exception in disconnect callback (connection {}): {}", id, e.what());
        }
      });
    }
  }

  void close_impl() {
    if (!connect_done_) {
      abort_open(TransportError::CLOSED);
    }
    if (!open_.exchange(false)) {
      return;
    }
    // Closing the socket aborts pending websocket ops; handlers see !open_
    beast::error_code ec;
    auto &sock = beast::get_lowest_layer(ws_).socket();
    sock.shutdown(tcp::socket::shutdown_both, ec);
    sock.close(ec);

    receive_callback_ = {};
    disconnect_callback_ = {};
    std::queue<std::shared_ptr<std::vector<uint8_t>>> empty;
    std::swap(send_queue_, empty);
    send_queue_bytes_ = 0;
    writing_ = false;
  }

  Strand strand_;
  std::shared_ptr<ssl::context> tls_; // outlives ws_ (declared first)
  websocket::stream<NextLayer> ws_;
  tcp::resolver resolver_;
  net::steady_timer open_timer_;
  util::ParsedUrl url_;
  uint64_t id_;

  beast::flat_buffer read_buffer_;

  // strand-only state
  ConnectCallback connect_callback_;
  bool connect_done_{false};
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_{0};
  bool writing_{false};

  std::atomic<bool> open_{false};
};

using PlainWebSocketConnection = WebSocketConnection<beast::tcp_stream>;
using TlsWebSocketConnection = WebSocketConnection<beast::ssl_stream<beast::tcp_stream>>;

std::shared_ptr<ssl::context> MakeTunnelTlsContext() {
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
  // Tunnel provider chains are not verified
  ctx->set_verify_mode(ssl::verify_none);
  return ctx;
}

} // namespace

TransportConnectionPtr CreateWebSocketConnection(net::io_context &io_context,
                                                 const util::ParsedUrl &url,
                                                 std::chrono::milliseconds open_timeout,
                                                 ConnectCallback callback) {
  auto strand = net::make_strand(io_context);
  if (url.scheme == "wss") {
    auto tls = MakeTunnelTlsContext();
    auto conn = std::make_shared<TlsWebSocketConnection>(strand, url, tls, *tls);
    conn->open(open_timeout, std::move(callback));
    return conn;
  }
  if (url.scheme == "ws") {
    auto conn = std::make_shared<PlainWebSocketConnection>(strand, url, nullptr);
    conn->open(open_timeout, std::move(callback));
    return conn;
  }
  LOG_NET_WARN("unsupported websocket scheme '{}'", url.scheme);
  return nullptr;
}

} // namespace network
} // namespace whisperlink
