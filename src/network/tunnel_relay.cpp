#include "network/tunnel_relay.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <array>

namespace whisperlink {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr size_t RELAY_CHUNK_SIZE = 16 * 1024;
constexpr std::chrono::seconds REQUEST_READ_TIMEOUT{30};

// One upgraded WebSocket paired with one loopback TCP connection. Both live
// on the accepted socket's strand, so the two pumps never race.
class RelayPipe : public std::enable_shared_from_this<RelayPipe> {
public:
  RelayPipe(tcp::socket &&socket, uint16_t target_port)
      : ws_(std::move(socket)), target_(ws_.get_executor()), target_port_(target_port) {}

  void run(http::request<http::string_body> req) {
    req_ = std::move(req);
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res) {
      res.set(http::field::server, "whisperlink-relay");
    }));
    ws_.binary(true);
    ws_.async_accept(req_, beast::bind_front_handler(&RelayPipe::on_accept, shared_from_this()));
  }

private:
  void on_accept(beast::error_code ec) {
    if (ec) {
      LOG_TUNNEL_DEBUG("relay: websocket accept failed: {}", ec.message());
      return;
    }
    tcp::endpoint endpoint(net::ip::make_address_v4("127.0.0.1"), target_port_);
    target_.async_connect(endpoint,
                          beast::bind_front_handler(&RelayPipe::on_target_connect, shared_from_this()));
  }

  void on_target_connect(beast::error_code ec) {
    if (ec) {
      LOG_TUNNEL_WARN("relay: loopback connect to port {} failed: {}", target_port_, ec.message());
      close_both();
      return;
    }
    LOG_TUNNEL_DEBUG("relay: session bridged to 127.0.0.1:{}", target_port_);
    read_ws();
    read_target();
  }

  // WebSocket -> TCP
  void read_ws() {
    ws_.async_read(ws_buffer_, beast::bind_front_handler(&RelayPipe::on_ws_read, shared_from_this()));
  }

  void on_ws_read(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
        LOG_TUNNEL_DEBUG("relay: websocket read ended: {}", ec.message());
      }
      close_both();
      return;
    }
    net::async_write(target_, ws_buffer_.data(),
                     beast::bind_front_handler(&RelayPipe::on_target_write, shared_from_this()));
  }

  void on_target_write(beast::error_code ec, std::size_t) {
    if (ec) {
      close_both();
      return;
    }
    ws_buffer_.consume(ws_buffer_.size());
    read_ws();
  }

  // TCP -> WebSocket
  void read_target() {
    target_.async_read_some(net::buffer(target_buffer_),
                            beast::bind_front_handler(&RelayPipe::on_target_read, shared_from_this()));
  }

  void on_target_read(beast::error_code ec, std::size_t n) {
    if (ec) {
      close_both();
      return;
    }
    ws_.async_write(net::buffer(target_buffer_.data(), n),
                    beast::bind_front_handler(&RelayPipe::on_ws_write, shared_from_this()));
  }

  void on_ws_write(beast::error_code ec, std::size_t) {
    if (ec) {
      close_both();
      return;
    }
    read_target();
  }

  void close_both() {
    if (closed_)
      return;
    closed_ = true;

    beast::error_code ignored;
    target_.shutdown(tcp::socket::shutdown_both, ignored);
    target_.close(ignored);

    if (ws_.is_open()) {
      ws_.async_close(websocket::close_code::normal,
                      [self = shared_from_this()](beast::error_code) {
                        beast::error_code ec;
                        beast::get_lowest_layer(self->ws_).socket().close(ec);
                      });
    } else {
      beast::get_lowest_layer(ws_).socket().close(ignored);
    }
  }

  websocket::stream<beast::tcp_stream> ws_;
  tcp::socket target_;
  uint16_t target_port_;
  http::request<http::string_body> req_;
  beast::flat_buffer ws_buffer_;
  std::array<uint8_t, RELAY_CHUNK_SIZE> target_buffer_{};
  bool closed_{false};
};

// Reads the first request on an accepted socket and routes it: WebSocket
// upgrades become RelayPipes, everything else gets the liveness answer.
class RelayHttpSession : public std::enable_shared_from_this<RelayHttpSession> {
public:
  RelayHttpSession(tcp::socket &&socket, uint16_t target_port)
      : stream_(std::move(socket)), target_port_(target_port) {}

  void run() {
    stream_.expires_after(REQUEST_READ_TIMEOUT);
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&RelayHttpSession::on_read, shared_from_this()));
  }

private:
  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec != http::error::end_of_stream) {
        LOG_TUNNEL_DEBUG("relay: request read failed: {}", ec.message());
      }
      beast::error_code ignored;
      stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
      return;
    }

    if (websocket::is_upgrade(req_)) {
      LOG_TUNNEL_DEBUG("relay: websocket upgrade for {}", std::string(req_.target()));
      stream_.expires_never();
      std::make_shared<RelayPipe>(stream_.release_socket(), target_port_)->run(std::move(req_));
      return;
    }

    LOG_TUNNEL_TRACE("relay: liveness {} {}", std::string(req_.method_string()),
                     std::string(req_.target()));
    res_.version(req_.version());
    res_.result(http::status::ok);
    res_.set(http::field::server, "whisperlink-relay");
    res_.set(http::field::content_type, "text/plain");
    res_.keep_alive(false);
    if (req_.method() != http::verb::head) {
      res_.body() = protocol::RELAY_LIVENESS_BODY;
    }
    res_.prepare_payload();
    http::async_write(stream_, res_,
                      beast::bind_front_handler(&RelayHttpSession::on_write, shared_from_this()));
  }

  void on_write(beast::error_code, std::size_t) {
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
  }

  beast::tcp_stream stream_;
  uint16_t target_port_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};

} // namespace

TunnelRelay::~TunnelRelay() { stop(); }

bool TunnelRelay::start(uint16_t port, uint16_t target_port, const std::string &bind_address) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    LOG_TUNNEL_WARN("relay already running on port {}", port_.load());
    return false;
  }

  io_context_ = std::make_unique<net::io_context>();
  acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

  boost::system::error_code ec;
  auto address = net::ip::make_address(bind_address, ec);
  if (ec) {
    LOG_TUNNEL_ERROR("relay: invalid bind address '{}': {}", bind_address, ec.message());
    acceptor_.reset();
    io_context_.reset();
    return false;
  }
  tcp::endpoint endpoint(address, port);

  acceptor_->open(endpoint.protocol(), ec);
  if (!ec)
    acceptor_->set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_->bind(endpoint, ec);
  if (!ec)
    acceptor_->listen(protocol::LISTEN_BACKLOG, ec);
  if (ec) {
    LOG_TUNNEL_ERROR("relay: failed to bind {}:{}: {}", bind_address, port, ec.message());
    acceptor_.reset();
    io_context_.reset();
    return false;
  }

  port_ = acceptor_->local_endpoint().port();
  target_port_ = target_port;
  running_ = true;

  start_accept();
  thread_ = std::thread([this]() { io_context_->run(); });

  LOG_TUNNEL_INFO("relay listening on {}:{} -> 127.0.0.1:{}", bind_address, port_.load(), target_port);
  return true;
}

void TunnelRelay::start_accept() {
  acceptor_->async_accept(net::make_strand(*io_context_),
                          [this](boost::system::error_code ec, tcp::socket socket) {
                            if (ec) {
                              if (ec != net::error::operation_aborted) {
                                LOG_TUNNEL_DEBUG("relay: accept failed: {}", ec.message());
                              }
                              if (!running_ || !acceptor_->is_open())
                                return;
                            } else {
                              std::make_shared<RelayHttpSession>(std::move(socket), target_port_)->run();
                            }
                            start_accept();
                          });
}

void TunnelRelay::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!io_context_) {
    return;
  }
  running_ = false;

  io_context_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }

  // Acceptor first; destroying the io_context then shuts down every socket
  // and releases the sessions held by pending handlers
  acceptor_.reset();
  io_context_.reset();
  port_ = 0;
  target_port_ = 0;
}

} // namespace network
} // namespace whisperlink
