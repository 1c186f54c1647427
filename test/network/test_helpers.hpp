#pragma once

// Shared fixtures for connection-layer tests: a scriptable transport, fake
// tunnel collaborators, a background reactor and polling helpers.

#include "network/message.hpp"
#include "network/peer_directory.hpp"
#include "network/transport.hpp"
#include "network/tunnel_provisioner.hpp"
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace whisperlink {
namespace test {

// Poll pred every 10ms until true or timeout
inline bool WaitUntil(const std::function<bool()> &pred,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

// Bind an ephemeral port, release it, and hand the number out
inline uint16_t PickFreePort() {
  boost::asio::io_context io;
  boost::asio::ip::tcp::acceptor acceptor(
      io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

inline network::LocalIdentity MakeIdentity(const std::string &username) {
  auto id = network::GenerateIdentity(username);
  if (!id)
    throw std::runtime_error("identity generation failed");
  return *id;
}

inline network::Contact ContactFor(const network::LocalIdentity &id, const std::string &address) {
  network::Contact c;
  c.user_id = id.user_id;
  c.username = id.username;
  c.public_key = id.public_key;
  c.connection_type = network::ContactConnectionType::DIRECT;
  c.address = address;
  return c;
}

// io_context driven by one background thread for the lifetime of the object
class ReactorThread {
public:
  ReactorThread() : guard_(boost::asio::make_work_guard(io_)), thread_([this] { io_.run(); }) {}
  ~ReactorThread() {
    guard_.reset();
    io_.stop();
    if (thread_.joinable())
      thread_.join();
  }
  boost::asio::io_context &io() { return io_; }

private:
  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
  std::thread thread_;
};

// ============================================================================
// Scriptable transport
// ============================================================================

// In-memory TransportConnection: records sends, lets the test inject bytes
// and a remote close.
class MockTransportConnection : public network::TransportConnection {
public:
  explicit MockTransportConnection(bool inbound = false)
      : inbound_(inbound), id_(network::NextConnectionId()) {}

  void start() override { started_ = true; }

  bool send(const std::vector<uint8_t> &data) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_)
      return false;
    sent_.push_back(data);
    return true;
  }

  void close() override {
    network::DisconnectCallback cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!open_)
        return;
      open_ = false;
      cb = disconnect_cb_;
    }
    ++close_count_;
    if (cb)
      cb();
  }

  bool is_open() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }
  std::string remote_address() const override { return "127.0.0.1"; }
  uint16_t remote_port() const override { return 40000; }
  bool is_inbound() const override { return inbound_; }
  network::TransportKind kind() const override { return network::TransportKind::DIRECT_SOCKET; }
  uint64_t connection_id() const override { return id_; }

  void set_receive_callback(network::ReceiveCallback cb) override {
    std::lock_guard<std::mutex> lock(mutex_);
    receive_cb_ = std::move(cb);
  }
  void set_disconnect_callback(network::DisconnectCallback cb) override {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_cb_ = std::move(cb);
  }

  // Deliver one framed body as if it arrived from the peer
  void inject_frame(const std::string &body) { inject_bytes(message::EncodeFrame(body)); }

  void inject_bytes(const std::vector<uint8_t> &bytes) {
    network::ReceiveCallback cb;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cb = receive_cb_;
    }
    if (cb)
      cb(bytes);
  }

  // Frame bodies sent so far (decoded from the recorded byte chunks)
  std::vector<std::string> sent_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    message::FrameDecoder decoder;
    std::vector<std::string> frames;
    for (const auto &chunk : sent_)
      decoder.feed(chunk, frames);
    return frames;
  }

  bool started() const { return started_; }
  int close_count() const { return close_count_; }

private:
  mutable std::mutex mutex_;
  bool open_{true};
  bool inbound_;
  uint64_t id_;
  std::atomic<bool> started_{false};
  std::atomic<int> close_count_{0};
  std::vector<std::vector<uint8_t>> sent_;
  network::ReceiveCallback receive_cb_;
  network::DisconnectCallback disconnect_cb_;
};

// ============================================================================
// Tunnel provisioning fakes
// ============================================================================

// Observable state shared between a test and the fakes it hands away
struct FakeTunnelWorld {
  std::mutex mutex;

  // Launcher
  bool binary_present{true};
  bool launch_fails{false};
  std::vector<std::string> last_argv;
  int launches{0};

  // Process (exits_immediately: dies right after launch)
  bool exits_immediately{false};
  bool process_alive{false};
  int terminations{0};
  std::string process_output{"t=ngrok msg=\"starting\"\n"};

  // Fetcher: control API responses consumed in order; the last one repeats
  std::deque<network::HttpResponse> control_responses;
  // Probe answer; nullopt = forward to a real BeastHttpFetcher
  std::optional<network::HttpResponse> probe_response;
  std::vector<std::string> fetched_urls;
  int control_polls{0};

  // Sleeps requested by the provisioner
  std::vector<std::chrono::milliseconds> sleeps;
};

inline network::HttpResponse TunnelsBody(const std::string &https_url) {
  network::HttpResponse r;
  r.ok = true;
  r.status = 200;
  r.body = R"({"tunnels":[{"proto":"http","public_url":"http://ignored.example"},)"
           R"({"proto":"https","public_url":")" +
           https_url + R"("}]})";
  return r;
}

inline network::HttpResponse NotReady() {
  network::HttpResponse r;
  r.ok = false;
  r.error = "Connection refused";
  return r;
}

class FakeProcess : public network::ManagedProcess {
public:
  explicit FakeProcess(std::shared_ptr<FakeTunnelWorld> world) : world_(std::move(world)) {}
  bool running() override {
    std::lock_guard<std::mutex> lock(world_->mutex);
    return world_->process_alive;
  }
  void terminate() override {
    std::lock_guard<std::mutex> lock(world_->mutex);
    if (!terminated_) {
      ++world_->terminations;
      terminated_ = true;
    }
    world_->process_alive = false;
  }
  std::string output() override {
    std::lock_guard<std::mutex> lock(world_->mutex);
    return world_->process_output;
  }
  std::optional<int> exit_code() override {
    std::lock_guard<std::mutex> lock(world_->mutex);
    if (world_->process_alive)
      return std::nullopt;
    return 1;
  }

private:
  std::shared_ptr<FakeTunnelWorld> world_;
  bool terminated_{false};
};

class FakeLauncher : public network::ProcessLauncher {
public:
  explicit FakeLauncher(std::shared_ptr<FakeTunnelWorld> world) : world_(std::move(world)) {}
  std::optional<std::string> find_executable(const std::string &name) override {
    std::lock_guard<std::mutex> lock(world_->mutex);
    if (!world_->binary_present)
      return std::nullopt;
    return "/usr/local/bin/" + name;
  }
  std::unique_ptr<network::ManagedProcess> launch(const std::vector<std::string> &argv,
                                                  std::string &error) override {
    std::lock_guard<std::mutex> lock(world_->mutex);
    world_->last_argv = argv;
    ++world_->launches;
    if (world_->launch_fails) {
      error = "exec failed";
      return nullptr;
    }
    world_->process_alive = !world_->exits_immediately;
    return std::make_unique<FakeProcess>(world_);
  }

private:
  std::shared_ptr<FakeTunnelWorld> world_;
};

class FakeFetcher : public network::HttpFetcher {
public:
  explicit FakeFetcher(std::shared_ptr<FakeTunnelWorld> world) : world_(std::move(world)) {}
  network::HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) override {
    std::optional<network::HttpResponse> probe;
    {
      std::lock_guard<std::mutex> lock(world_->mutex);
      world_->fetched_urls.push_back(url);
      if (url.find("/api/tunnels") != std::string::npos) {
        ++world_->control_polls;
        if (world_->control_responses.empty())
          return NotReady();
        auto r = world_->control_responses.front();
        if (world_->control_responses.size() > 1)
          world_->control_responses.pop_front();
        return r;
      }
      probe = world_->probe_response;
    }
    if (probe)
      return *probe;
    return real_.get(url, timeout);
  }

private:
  std::shared_ptr<FakeTunnelWorld> world_;
  network::BeastHttpFetcher real_;
};

inline network::SleepFn RecordingSleep(std::shared_ptr<FakeTunnelWorld> world) {
  return [world](std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lock(world->mutex);
    world->sleeps.push_back(d);
  };
}

} // namespace test
} // namespace whisperlink
