#pragma once

#include "network/transport.hpp"
#include <array>
#include <atomic>
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace whisperlink {
namespace network {

/**
 * RealTransportConnection - TCP socket implementation of TransportConnection
 *
 * Wraps boost::asio::ip::tcp::socket; all socket work runs on strand_.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  /**
   * Create outbound connection (resolves and dials with connect timeout)
   */
  static TransportConnectionPtr
  create_outbound(boost::asio::io_context &io_context,
                  const std::string &address, uint16_t port,
                  ConnectCallback callback);

  /**
   * Create inbound connection (already connected socket)
   */
  static TransportConnectionPtr
  create_inbound(boost::asio::io_context &io_context,
                 boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override;

  RealTransportConnection(const RealTransportConnection&) = delete;
  RealTransportConnection& operator=(const RealTransportConnection&) = delete;
  RealTransportConnection(RealTransportConnection&&) = delete;
  RealTransportConnection& operator=(RealTransportConnection&&) = delete;

  // TransportConnection interface
  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  bool is_inbound() const override { return is_inbound_; }
  TransportKind kind() const override { return TransportKind::DIRECT_SOCKET; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

#ifdef WHISPERLINK_TESTS
  // Test-only: override connect timeout (0ms disables override)
  static void SetConnectTimeoutForTest(std::chrono::milliseconds timeout_ms);
  static void ResetConnectTimeoutForTest();

  // Test-only: override send queue byte limit (0 disables override)
  static void SetSendQueueLimitForTest(size_t bytes);
  static void ResetSendQueueLimitForTest();
#endif

private:
  RealTransportConnection(boost::asio::io_context &io_context, bool is_inbound);

  void do_connect(const std::string &address, uint16_t port,
                  ConnectCallback callback);
  void finish_connect(const ConnectCallback &callback, TransportError error);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();

  // Deliver disconnect callback exactly once (must be called on strand)
  void deliver_disconnect_once();

  std::chrono::milliseconds connect_timeout_ms() const;
  size_t send_queue_limit() const;

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  bool is_inbound_;
  uint64_t id_;

  // Callbacks (accessed only on strand_)
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on strand_)
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  bool writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;
  std::array<uint8_t, RECV_BUFFER_SIZE> read_buffer_{}; // strand only

  // Connect timeout. The timer is a unique_ptr so close_impl() can destroy it
  // while the io_context is still alive.
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  bool connect_done_{false}; // strand only
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;

#ifdef WHISPERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> connect_timeout_override_ms_;
  static std::atomic<size_t> send_queue_limit_override_bytes_;
#endif

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * RealTransport - owns the connection layer's reactor
 *
 * One io_context, driven by io_threads worker threads, hosts every
 * transport of a ConnectionManager: the direct TCP listener, accepted and
 * dialed TCP connections, outbound tunnel WebSockets, and handshake timers.
 * Per-connection strands keep one slow peer from blocking another.
 */
class RealTransport {
public:
  explicit RealTransport(size_t io_threads = 1);
  ~RealTransport();

  RealTransport(const RealTransport &) = delete;
  RealTransport &operator=(const RealTransport &) = delete;

  // Outbound TCP (callback reports TransportError::NONE on success)
  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback);

  // Bind 0.0.0.0:port (dual-stack when available); port 0 = OS-assigned,
  // read back with listening_port()
  bool listen(uint16_t port,
              std::function<void(TransportConnectionPtr)> accept_callback);

  void stop_listening();

  // Start worker threads (idempotent)
  void run();

  // Stop listener, stop the reactor, join threads
  void stop();

  bool is_running() const { return running_; }

  boost::asio::io_context &io_context() { return *io_context_; }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const { return last_listen_port_; }

  bool is_listening() const { return last_listen_port_ != 0; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  // io_context_ is destroyed only in the destructor, after threads are
  // joined, so it outlives every socket, strand and timer bound to it.
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  size_t desired_io_threads_{1};

  // Guards acceptor_ and accept_callback_: listen/stop_listening run on the
  // caller's thread while accepts complete on the reactor
  mutable std::mutex acceptor_mutex_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::function<void(TransportConnectionPtr)> accept_callback_;
  std::atomic<uint16_t> last_listen_port_{0};
};

} // namespace network
} // namespace whisperlink
