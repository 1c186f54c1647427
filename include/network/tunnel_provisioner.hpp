#pragma once

/*
 TunnelProvisioner - brings up an external tunnel process and verifies it

 State machine:

   IDLE --provision()--> STARTING --url found--> PROBING --200--> READY
                            |                       |
                            +-------> FAILED <------+

 STARTING: locate the binary, launch it pointed at the relay port, then poll
 the process's local control API (http://<control_host>:<control_port>/api/tunnels)
 up to poll_attempts times, poll_interval apart, for the "https" tunnel's
 public_url. Exactly poll_attempts polls and poll_attempts - 1 sleeps happen
 before giving up.

 PROBING: one GET against the public URL. Only a 2xx answer marks READY; a
 failing probe never yields a URL.

 Any failure terminates the process (kill-and-wait) before provision()
 returns, and the result carries the captured process output.

 Process launching, HTTP fetching and sleeping are injected so the retry
 logic can be tested without real processes or network.
*/

#include "network/errors.hpp"
#include "network/protocol.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace whisperlink {
namespace network {

// ============================================================================
// Injectable collaborators
// ============================================================================

struct HttpResponse {
  bool ok{false}; // transport-level success (a response was read)
  unsigned status{0};
  std::string body;
  std::string error;
};

class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;
  virtual HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) = 0;
};

class ManagedProcess {
public:
  virtual ~ManagedProcess() = default;

  virtual bool running() = 0;
  // Kill-and-wait; safe to call repeatedly
  virtual void terminate() = 0;
  // Captured stdout/stderr so far (bounded)
  virtual std::string output() = 0;
  virtual std::optional<int> exit_code() = 0;
};

class ProcessLauncher {
public:
  virtual ~ProcessLauncher() = default;

  // Resolve a bare name via PATH (or check an explicit path)
  virtual std::optional<std::string> find_executable(const std::string &name) = 0;
  // argv[0] is the resolved executable. nullptr + error on failure.
  virtual std::unique_ptr<ManagedProcess> launch(const std::vector<std::string> &argv,
                                                 std::string &error) = 0;
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// fork/exec with stdout+stderr captured through a pipe
class PosixProcessLauncher : public ProcessLauncher {
public:
  std::optional<std::string> find_executable(const std::string &name) override;
  std::unique_ptr<ManagedProcess> launch(const std::vector<std::string> &argv,
                                         std::string &error) override;
};

// Blocking GET over Boost.Beast, http:// and https:// (SNI, no chain check)
class BeastHttpFetcher : public HttpFetcher {
public:
  HttpResponse get(const std::string &url, std::chrono::milliseconds timeout) override;
};

// ============================================================================
// TunnelProvisioner
// ============================================================================

enum class ProvisionState { IDLE, STARTING, PROBING, READY, FAILED };

std::string ProvisionStateAsString(ProvisionState state);

struct ProvisionResult {
  TunnelProvisionError error{TunnelProvisionError::NONE};
  std::string public_url;
  std::string message; // includes captured process output on failure

  bool ok() const { return error == TunnelProvisionError::NONE; }
};

// Select the "https" tunnel's public_url from a control API /api/tunnels body
std::optional<std::string> ParseTunnelsResponse(const std::string &body);

class TunnelProvisioner {
public:
  struct Config {
    std::string binary;
    // "{port}" is replaced by the relay port
    std::vector<std::string> args;
    std::string control_host;
    uint16_t control_port;
    std::chrono::milliseconds poll_interval;
    int poll_attempts;
    std::chrono::milliseconds control_request_timeout;
    std::chrono::milliseconds probe_timeout;

    Config()
        : binary("ngrok"), args({"http", "{port}", "--log", "stdout"}),
          control_host(protocol::DEFAULT_CONTROL_HOST),
          control_port(protocol::DEFAULT_CONTROL_PORT),
          poll_interval(protocol::DEFAULT_POLL_INTERVAL),
          poll_attempts(protocol::DEFAULT_POLL_ATTEMPTS),
          control_request_timeout(std::chrono::seconds(2)),
          probe_timeout(protocol::LIVENESS_PROBE_TIMEOUT) {}
  };

  TunnelProvisioner(Config config, std::unique_ptr<ProcessLauncher> launcher,
                    std::unique_ptr<HttpFetcher> fetcher, SleepFn sleep = {});
  ~TunnelProvisioner();

  TunnelProvisioner(const TunnelProvisioner &) = delete;
  TunnelProvisioner &operator=(const TunnelProvisioner &) = delete;

  // Synchronous; terminates any process this provisioner still owns first
  ProvisionResult provision(uint16_t relay_port);

  // Kill-and-wait the owned process (if any) and return to IDLE
  void terminate();

  ProvisionState state() const { return state_; }
  const std::string &public_url() const { return public_url_; }
  bool process_running();

  const Config &config() const { return config_; }

private:
  ProvisionResult fail(TunnelProvisionError error, std::string message);
  std::vector<std::string> build_argv(const std::string &executable, uint16_t relay_port) const;
  std::string control_url() const;

  Config config_;
  std::unique_ptr<ProcessLauncher> launcher_;
  std::unique_ptr<HttpFetcher> fetcher_;
  SleepFn sleep_;

  std::unique_ptr<ManagedProcess> process_;
  ProvisionState state_{ProvisionState::IDLE};
  std::string public_url_;
};

} // namespace network
} // namespace whisperlink
