#pragma once

#include "network/protocol.hpp"
#include "network/tunnel_provisioner.hpp"
#include "network/tunnel_relay.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace whisperlink {
namespace network {

struct TunnelState {
  uint16_t relay_port{0};
  uint16_t listener_port{0};
  std::string public_url;
  bool running{false};
  ProvisionState provision_state{ProvisionState::IDLE};
};

/**
 * TunnelBridge - relay server plus the external tunnel that exposes it
 *
 * create_tunnel() is all-or-nothing: it returns a URL only when the relay is
 * up, the tunnel process is running, the control API reported an https URL
 * and that URL answered the liveness probe. Any failure leaves neither a
 * relay thread nor a process behind. Calling create_tunnel() again replaces
 * whatever was running.
 */
class TunnelBridge {
public:
  struct Config {
    uint16_t relay_port;            // 0 = OS-assigned
    std::string relay_bind_address; // where the tunnel process connects
    TunnelProvisioner::Config provisioner;

    Config()
        : relay_port(protocol::DEFAULT_RELAY_PORT),
          relay_bind_address("127.0.0.1") {}
  };

  // Null collaborators select PosixProcessLauncher / BeastHttpFetcher / real sleep
  explicit TunnelBridge(Config config = Config{},
                        std::unique_ptr<ProcessLauncher> launcher = nullptr,
                        std::unique_ptr<HttpFetcher> fetcher = nullptr, SleepFn sleep = {});
  ~TunnelBridge();

  TunnelBridge(const TunnelBridge &) = delete;
  TunnelBridge &operator=(const TunnelBridge &) = delete;

  // Relay upgrades to 127.0.0.1:listener_port and publish the relay
  ProvisionResult create_tunnel(uint16_t listener_port);

  // Terminates the process and stops the relay; safe when nothing runs
  void close_tunnel();

  TunnelState state() const;
  bool is_running() const;
  bool relay_running() const { return relay_.is_running(); }

private:
  void close_tunnel_locked();

  Config config_;
  TunnelRelay relay_;
  TunnelProvisioner provisioner_;
  mutable std::mutex mutex_;
  uint16_t listener_port_{0};
  std::string public_url_;
};

} // namespace network
} // namespace whisperlink
