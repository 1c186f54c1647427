#include "application.hpp"
#include "network/connection_types.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace whisperlink {
namespace app {

namespace {
constexpr const char *IDENTITY_FILE = "identity.json";
constexpr const char *CONTACTS_FILE = "contacts.json";
} // namespace

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) { instance_ = this; }

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.listen_port, config_.use_tunnel) << std::endl;

  LOG_INFO("Initializing WhisperLink...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }
  if (!init_identity()) {
    LOG_ERROR("Failed to load identity");
    return false;
  }
  if (!init_contacts()) {
    LOG_ERROR("Failed to load contacts");
    return false;
  }
  if (!init_network()) {
    LOG_ERROR("Failed to initialize connection manager");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  setup_signal_handlers();

  if (config_.listen_enabled) {
    auto [ok, info] = connection_manager_->start_listening(config_.listen_port, config_.use_tunnel);
    if (!ok) {
      LOG_ERROR("Failed to start listening: {}", info);
      return false;
    }
    std::cout << "Reachable at " << info << std::endl;
  }

  running_ = true;

  for (const auto &peer_id : config_.connect_peers) {
    if (!connection_manager_->connect_to_peer(peer_id)) {
      LOG_WARN("Could not connect to {}: {}", peer_id, connection_manager_->last_error());
    }
  }

  LOG_INFO("WhisperLink node started");
  return true;
}

void Application::stop() {
  if (!running_ && !connection_manager_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  LOG_INFO("Shutting down WhisperLink...");

  chat_sub_.Unsubscribe();
  signal_sub_.Unsubscribe();
  connected_sub_.Unsubscribe();
  disconnected_sub_.Unsubscribe();

  if (connection_manager_) {
    connection_manager_->shutdown();
    connection_manager_.reset();
  }
  if (contacts_ && !contacts_->Save()) {
    LOG_WARN("Failed to save contacts on shutdown");
  }

  datadir_lock_.Release();
  running_ = false;
  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  auto result = datadir_lock_.Acquire(config_.datadir);
  if (result == util::LockResult::ERROR_LOCK) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. WhisperLink is probably already "
              "running.",
              config_.datadir.string());
    return false;
  }
  if (result != util::LockResult::SUCCESS) {
    LOG_ERROR("Cannot create lock file in {}: {}", config_.datadir.string(), datadir_lock_.reason());
    return false;
  }
  return true;
}

bool Application::init_identity() {
  auto path = config_.datadir / IDENTITY_FILE;
  auto identity = network::LoadIdentity(path.string());
  if (!identity) {
    LOG_ERROR("No usable identity at {}. Create one with --genkey=<username>", path.string());
    return false;
  }
  LOG_INFO("Identity: {} ({})", identity->username, identity->user_id);
  identity_ = std::make_unique<network::StaticIdentityProvider>(std::move(*identity));
  return true;
}

bool Application::init_contacts() {
  auto path = config_.datadir / CONTACTS_FILE;
  contacts_ = std::make_unique<network::MemoryContactDirectory>(path.string());
  return contacts_->Load();
}

bool Application::init_network() {
  connection_manager_ = std::make_unique<network::ConnectionManager>(*contacts_, *identity_,
                                                                     config_.network_config);
  auto &events = connection_manager_->events();

  chat_sub_ = events.SubscribeMessage(message::MessageKind::CHAT, [](const IncomingMessage &msg) {
    if (msg.group_name) {
      std::cout << "[" << msg.timestamp << "] #" << *msg.group_name << " <" << msg.peer_username
                << "> " << msg.text << std::endl;
    } else {
      std::cout << "[" << msg.timestamp << "] <" << msg.peer_username << "> " << msg.text
                << std::endl;
    }
  });

  signal_sub_ = events.SubscribeMessage(message::MessageKind::SIGNAL, [](const IncomingMessage &msg) {
    LOG_DEBUG("Signal from {}: {}", msg.peer_id, msg.text);
  });

  connected_sub_ = events.SubscribePeerConnected([](const std::string &peer_id,
                                                    const std::string &username,
                                                    network::TransportKind kind, bool inbound) {
    LOG_INFO("{} connection with {} ({}) over {}", inbound ? "Inbound" : "Outbound", username,
             peer_id, network::TransportKindAsString(kind));
  });

  disconnected_sub_ = events.SubscribePeerDisconnected(
      [](const std::string &peer_id, const std::string &reason) {
        LOG_INFO("Peer {} disconnected: {}", peer_id, reason);
      });

  return true;
}

bool Application::GenerateIdentityFile(const std::filesystem::path &datadir,
                                       const std::string &username) {
  if (!util::ensure_directory(datadir)) {
    LOG_ERROR("Failed to create data directory: {}", datadir.string());
    return false;
  }
  auto path = datadir / IDENTITY_FILE;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    LOG_ERROR("Refusing to overwrite existing identity {}", path.string());
    return false;
  }

  auto identity = network::GenerateIdentity(username);
  if (!identity) {
    LOG_ERROR("Key generation failed");
    return false;
  }
  if (!network::SaveIdentity(path.string(), *identity)) {
    return false;
  }
  std::cout << "user_id:    " << identity->user_id << "\n"
            << "public_key: " << identity->public_key << "\n"
            << "written to  " << path.string() << std::endl;
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // A peer closing mid-write must not kill the node
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace whisperlink
