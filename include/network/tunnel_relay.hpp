#pragma once

/*
 TunnelRelay - local WebSocket relay in front of the direct listener

 The external tunnel process forwards public HTTPS traffic to this port. Each
 WebSocket upgrade (any path) gets its own loopback TCP connection to the
 direct listener, and bytes are copied 1:1 in both directions until either
 side closes, at which point the other is closed too. Any plain HTTP request
 is answered 200 with protocol::RELAY_LIVENESS_BODY so the public URL can be
 probed.

 The relay owns its own io_context and thread so it can be torn down
 independently of the main reactor. start() after stop() is allowed.
*/

#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace whisperlink {
namespace network {

class TunnelRelay {
public:
  TunnelRelay() = default;
  ~TunnelRelay();

  TunnelRelay(const TunnelRelay &) = delete;
  TunnelRelay &operator=(const TunnelRelay &) = delete;

  // Bind bind_address:port (0 = OS-assigned) and relay upgrades to
  // 127.0.0.1:target_port. false if already running or bind failed.
  bool start(uint16_t port, uint16_t target_port,
             const std::string &bind_address = "127.0.0.1");

  // Close the acceptor, drop every relayed session, join the thread
  void stop();

  bool is_running() const { return running_; }

  // Bound port (0 when stopped)
  uint16_t port() const { return port_; }
  uint16_t target_port() const { return target_port_; }

private:
  void start_accept();

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
  std::atomic<uint16_t> target_port_{0};
  // Serializes start/stop from different callers
  std::mutex lifecycle_mutex_;
};

} // namespace network
} // namespace whisperlink
