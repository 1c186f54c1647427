#include "network/tunnel_bridge.hpp"
#include "util/logging.hpp"

namespace whisperlink {
namespace network {

TunnelBridge::TunnelBridge(Config config, std::unique_ptr<ProcessLauncher> launcher,
                           std::unique_ptr<HttpFetcher> fetcher, SleepFn sleep)
    : config_(std::move(config)),
      provisioner_(config_.provisioner,
                   launcher ? std::move(launcher) : std::make_unique<PosixProcessLauncher>(),
                   fetcher ? std::move(fetcher) : std::make_unique<BeastHttpFetcher>(),
                   std::move(sleep)) {}

TunnelBridge::~TunnelBridge() { close_tunnel(); }

ProvisionResult TunnelBridge::create_tunnel(uint16_t listener_port) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Forcibly replace any previous tunnel
  close_tunnel_locked();

  if (!relay_.start(config_.relay_port, listener_port, config_.relay_bind_address)) {
    ProvisionResult result;
    result.error = TunnelProvisionError::RELAY_FAILED;
    result.message = to_string(result.error) + ": cannot bind relay on " +
                     config_.relay_bind_address + ":" + std::to_string(config_.relay_port);
    LOG_TUNNEL_ERROR("{}", result.message);
    return result;
  }

  ProvisionResult result = provisioner_.provision(relay_.port());
  if (!result.ok()) {
    relay_.stop();
    return result;
  }

  listener_port_ = listener_port;
  public_url_ = result.public_url;
  LOG_TUNNEL_INFO("tunnel {} -> relay :{} -> listener :{}", public_url_, relay_.port(),
                  listener_port_);
  return result;
}

void TunnelBridge::close_tunnel() {
  std::lock_guard<std::mutex> lock(mutex_);
  close_tunnel_locked();
}

void TunnelBridge::close_tunnel_locked() {
  bool was_running = !public_url_.empty() || relay_.is_running();
  provisioner_.terminate();
  relay_.stop();
  if (was_running) {
    LOG_TUNNEL_INFO("tunnel closed");
  }
  listener_port_ = 0;
  public_url_.clear();
}

TunnelState TunnelBridge::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  TunnelState s;
  s.relay_port = relay_.port();
  s.listener_port = listener_port_;
  s.public_url = public_url_;
  s.running = !public_url_.empty() && relay_.is_running();
  s.provision_state = provisioner_.state();
  return s;
}

bool TunnelBridge::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !public_url_.empty() && relay_.is_running();
}

} // namespace network
} // namespace whisperlink
