#include "network/tunnel_provisioner.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <type_traits>
#include <unistd.h>

namespace whisperlink {
namespace network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

std::string ProvisionStateAsString(ProvisionState state) {
  switch (state) {
  case ProvisionState::IDLE:
    return "idle";
  case ProvisionState::STARTING:
    return "starting";
  case ProvisionState::PROBING:
    return "probing";
  case ProvisionState::READY:
    return "ready";
  case ProvisionState::FAILED:
    return "failed";
  }
  return "unknown";
}

// ============================================================================
// PosixProcessLauncher
// ============================================================================

namespace {

constexpr std::chrono::milliseconds TERMINATE_GRACE{2000};
constexpr std::chrono::milliseconds TERMINATE_POLL{50};

class PosixProcess : public ManagedProcess {
public:
  PosixProcess(pid_t pid, int output_fd) : pid_(pid), output_fd_(output_fd) {}

  ~PosixProcess() override { terminate(); }

  bool running() override {
    drain();
    reap(false);
    return !exited_;
  }

  void terminate() override {
    if (!exited_ && pid_ > 0) {
      ::kill(pid_, SIGTERM);
      auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
      while (!reap(false) && std::chrono::steady_clock::now() < deadline) {
        drain();
        std::this_thread::sleep_for(TERMINATE_POLL);
      }
      if (!exited_) {
        LOG_TUNNEL_WARN("tunnel process {} ignored SIGTERM, killing", pid_);
        ::kill(pid_, SIGKILL);
        reap(true);
      }
    }
    drain();
    if (output_fd_ >= 0) {
      ::close(output_fd_);
      output_fd_ = -1;
    }
  }

  std::string output() override {
    drain();
    return output_;
  }

  std::optional<int> exit_code() override {
    reap(false);
    return exit_code_;
  }

private:
  // true once the child has been reaped
  bool reap(bool block) {
    if (exited_)
      return true;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
      exited_ = true;
      if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
      } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
      }
    } else if (r < 0 && errno == ECHILD) {
      exited_ = true;
    }
    return exited_;
  }

  void drain() {
    if (output_fd_ < 0)
      return;
    char buf[1024];
    while (true) {
      ssize_t n = ::read(output_fd_, buf, sizeof(buf));
      if (n > 0) {
        size_t room = protocol::MAX_CAPTURED_OUTPUT > output_.size()
                          ? protocol::MAX_CAPTURED_OUTPUT - output_.size()
                          : 0;
        output_.append(buf, std::min(room, static_cast<size_t>(n)));
        continue;
      }
      if (n < 0 && errno == EINTR)
        continue;
      // EOF or EAGAIN
      return;
    }
  }

  pid_t pid_;
  int output_fd_;
  bool exited_{false};
  std::optional<int> exit_code_;
  std::string output_;
};

bool IsExecutableFile(const std::string &path) {
  struct stat st {};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> PosixProcessLauncher::find_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (IsExecutableFile(name))
      return name;
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  if (!path_env)
    return std::nullopt;

  std::string path_list(path_env);
  size_t start = 0;
  while (start <= path_list.size()) {
    size_t end = path_list.find(':', start);
    if (end == std::string::npos)
      end = path_list.size();
    std::string dir = path_list.substr(start, end - start);
    if (dir.empty())
      dir = ".";
    std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate))
      return candidate;
    start = end + 1;
  }
  return std::nullopt;
}

std::unique_ptr<ManagedProcess> PosixProcessLauncher::launch(const std::vector<std::string> &argv,
                                                            std::string &error) {
  if (argv.empty()) {
    error = "empty command line";
    return nullptr;
  }

  int fds[2];
  if (::pipe(fds) != 0) {
    error = std::string("pipe failed: ") + std::strerror(errno);
    return nullptr;
  }

  // Build argv before fork: no allocation in the child
  std::vector<std::string> argv_storage = argv;
  std::vector<char *> argv_ptrs;
  argv_ptrs.reserve(argv_storage.size() + 1);
  for (auto &value : argv_storage) {
    argv_ptrs.push_back(value.data());
  }
  argv_ptrs.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return nullptr;
  }

  if (pid == 0) {
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
      ::dup2(dev_null, STDIN_FILENO);
      if (dev_null > STDERR_FILENO)
        ::close(dev_null);
    }
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::close(fds[0]);
    if (fds[1] > STDERR_FILENO)
      ::close(fds[1]);

    ::execv(argv_storage.front().c_str(), argv_ptrs.data());
    _exit(127);
  }

  ::close(fds[1]);
  int flags = ::fcntl(fds[0], F_GETFL, 0);
  ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);

  LOG_TUNNEL_DEBUG("launched {} (pid {})", argv.front(), pid);
  return std::make_unique<PosixProcess>(pid, fds[0]);
}

// ============================================================================
// BeastHttpFetcher
// ============================================================================

namespace {

// One GET driven on a private io_context so every step honors the deadline
template <class Stream> class FetchOp {
public:
  FetchOp(Stream &stream, tcp::resolver &resolver, const util::ParsedUrl &url,
          std::chrono::milliseconds timeout, HttpResponse &out)
      : stream_(stream), resolver_(resolver), url_(url), timeout_(timeout), out_(out) {}

  void start() {
    req_.version(11);
    req_.method(http::verb::get);
    req_.target(url_.target);
    bool default_port = (url_.secure() && url_.port == 443) || (!url_.secure() && url_.port == 80);
    req_.set(http::field::host, default_port ? url_.host : url_.host + ":" + std::to_string(url_.port));
    req_.set(http::field::user_agent, "whisperlink/" + GetVersionString());
    req_.set(http::field::accept, "*/*");

    resolver_.async_resolve(url_.host, std::to_string(url_.port),
                            [this](beast::error_code ec, tcp::resolver::results_type results) {
                              if (ec)
                                return fail("resolve", ec);
                              lowest().expires_after(timeout_);
                              lowest().async_connect(results, [this](beast::error_code ec2,
                                                                     const tcp::endpoint &) {
                                if (ec2)
                                  return fail("connect", ec2);
                                on_connect();
                              });
                            });
  }

private:
  beast::tcp_stream &lowest() { return beast::get_lowest_layer(stream_); }

  void on_connect() {
    if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
        out_.error = "failed to set SNI host name";
        return;
      }
      stream_.async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
        if (ec)
          return fail("tls handshake", ec);
        write_request();
      });
    } else {
      write_request();
    }
  }

  void write_request() {
    http::async_write(stream_, req_, [this](beast::error_code ec, std::size_t) {
      if (ec)
        return fail("write", ec);
      http::async_read(stream_, buffer_, res_, [this](beast::error_code ec2, std::size_t) {
        if (ec2)
          return fail("read", ec2);
        out_.ok = true;
        out_.status = res_.result_int();
        out_.body = std::move(res_.body());
        // Best effort: peers that drop the connection right away are fine
        beast::error_code ignored;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
      });
    });
  }

  void fail(const char *what, beast::error_code ec) {
    out_.ok = false;
    out_.error = std::string(what) + ": " + ec.message();
  }

  Stream &stream_;
  tcp::resolver &resolver_;
  const util::ParsedUrl &url_;
  std::chrono::milliseconds timeout_;
  HttpResponse &out_;
  http::request<http::empty_body> req_;
  beast::flat_buffer buffer_;
  http::response<http::string_body> res_;
};

} // namespace

HttpResponse BeastHttpFetcher::get(const std::string &url, std::chrono::milliseconds timeout) {
  HttpResponse out;
  auto parsed = util::ParseUrl(url);
  if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
    out.error = "unsupported url: " + url;
    return out;
  }

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);

    if (parsed->secure()) {
      ssl::context ctx(ssl::context::tls_client);
      // Tunnel provider chains are not verified
      ctx.set_verify_mode(ssl::verify_none);
      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
      FetchOp<beast::ssl_stream<beast::tcp_stream>> op(stream, resolver, *parsed, timeout, out);
      op.start();
      ioc.run_for(timeout);
    } else {
      beast::tcp_stream stream(ioc);
      FetchOp<beast::tcp_stream> op(stream, resolver, *parsed, timeout, out);
      op.start();
      ioc.run_for(timeout);
    }
    if (!out.ok && out.error.empty()) {
      out.error = "timed out";
    }
  } catch (const boost::system::system_error &e) {
    out.ok = false;
    out.error = e.what();
  }
  return out;
}

// ============================================================================
// TunnelProvisioner
// ============================================================================

std::optional<std::string> ParseTunnelsResponse(const std::string &body) {
  try {
    auto root = nlohmann::json::parse(body);
    if (!root.is_object() || !root.contains("tunnels") || !root["tunnels"].is_array())
      return std::nullopt;
    for (const auto &tunnel : root["tunnels"]) {
      if (!tunnel.is_object())
        continue;
      if (tunnel.value("proto", std::string{}) != "https")
        continue;
      std::string url = tunnel.value("public_url", std::string{});
      if (!url.empty())
        return url;
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_TUNNEL_TRACE("control API body not parseable yet: {}", e.what());
  }
  return std::nullopt;
}

TunnelProvisioner::TunnelProvisioner(Config config, std::unique_ptr<ProcessLauncher> launcher,
                                     std::unique_ptr<HttpFetcher> fetcher, SleepFn sleep)
    : config_(std::move(config)), launcher_(std::move(launcher)), fetcher_(std::move(fetcher)),
      sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

TunnelProvisioner::~TunnelProvisioner() { terminate(); }

std::vector<std::string> TunnelProvisioner::build_argv(const std::string &executable,
                                                       uint16_t relay_port) const {
  std::vector<std::string> argv{executable};
  for (const auto &arg : config_.args) {
    std::string value = arg;
    auto pos = value.find("{port}");
    if (pos != std::string::npos) {
      value.replace(pos, 6, std::to_string(relay_port));
    }
    argv.push_back(std::move(value));
  }
  return argv;
}

std::string TunnelProvisioner::control_url() const {
  return "http://" + config_.control_host + ":" + std::to_string(config_.control_port) +
         protocol::CONTROL_TUNNELS_PATH;
}

ProvisionResult TunnelProvisioner::fail(TunnelProvisionError error, std::string message) {
  std::string output;
  if (process_) {
    output = process_->output();
    process_->terminate();
    process_.reset();
  }
  state_ = ProvisionState::FAILED;
  public_url_.clear();

  ProvisionResult result;
  result.error = error;
  result.message = to_string(error) + ": " + message;
  if (!output.empty()) {
    result.message += "\nprocess output:\n" + output;
  }
  LOG_TUNNEL_ERROR("tunnel provisioning failed: {}", result.message);
  return result;
}

ProvisionResult TunnelProvisioner::provision(uint16_t relay_port) {
  // Any stale process from an earlier attempt goes first
  terminate();
  state_ = ProvisionState::STARTING;

  auto executable = launcher_->find_executable(config_.binary);
  if (!executable) {
    return fail(TunnelProvisionError::BINARY_MISSING,
                "'" + config_.binary + "' not found on PATH");
  }

  std::string launch_error;
  process_ = launcher_->launch(build_argv(*executable, relay_port), launch_error);
  if (!process_) {
    return fail(TunnelProvisionError::PROCESS_EXITED_EARLY, "launch failed: " + launch_error);
  }
  LOG_TUNNEL_INFO("started {} for relay port {}", config_.binary, relay_port);

  const std::string url = control_url();
  const int attempts = std::max(1, config_.poll_attempts);
  std::optional<std::string> public_url;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (!process_->running()) {
      auto code = process_->exit_code();
      return fail(TunnelProvisionError::PROCESS_EXITED_EARLY,
                  config_.binary + " exited" + (code ? " with code " + std::to_string(*code) : ""));
    }

    HttpResponse res = fetcher_->get(url, config_.control_request_timeout);
    if (res.ok && res.status == 200) {
      public_url = ParseTunnelsResponse(res.body);
      if (public_url)
        break;
      LOG_TUNNEL_DEBUG("control API poll {}/{}: no https tunnel yet", attempt, attempts);
    } else {
      LOG_TUNNEL_DEBUG("control API poll {}/{}: {}", attempt, attempts,
                       res.ok ? "HTTP " + std::to_string(res.status) : res.error);
    }

    if (attempt < attempts) {
      sleep_(config_.poll_interval);
    }
  }

  if (!public_url) {
    return fail(TunnelProvisionError::CONTROL_API_NEVER_READY,
                "no https tunnel reported by " + url + " after " + std::to_string(attempts) +
                    " attempts");
  }

  state_ = ProvisionState::PROBING;
  LOG_TUNNEL_INFO("tunnel reported {}, probing", *public_url);

  HttpResponse probe = fetcher_->get(*public_url, config_.probe_timeout);
  if (!probe.ok || probe.status < 200 || probe.status >= 300) {
    return fail(TunnelProvisionError::LIVENESS_PROBE_FAILED,
                *public_url + " answered " +
                    (probe.ok ? "HTTP " + std::to_string(probe.status) : probe.error));
  }

  state_ = ProvisionState::READY;
  public_url_ = *public_url;
  LOG_TUNNEL_INFO("tunnel ready at {}", public_url_);

  ProvisionResult result;
  result.public_url = public_url_;
  return result;
}

void TunnelProvisioner::terminate() {
  if (process_) {
    LOG_TUNNEL_DEBUG("terminating {}", config_.binary);
    process_->terminate();
    process_.reset();
  }
  public_url_.clear();
  state_ = ProvisionState::IDLE;
}

bool TunnelProvisioner::process_running() { return process_ && process_->running(); }

} // namespace network
} // namespace whisperlink
