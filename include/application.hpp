#pragma once

#include "network/connection_manager.hpp"
#include "network/message_events.hpp"
#include "network/peer_directory.hpp"
#include "network/protocol.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace whisperlink {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (identity.json, contacts.json, debug.log)
  std::filesystem::path datadir;

  uint16_t listen_port = protocol::DEFAULT_PORT;
  bool listen_enabled = true;
  bool use_tunnel = false;

  // Contacts (by user_id) to dial once listening
  std::vector<std::string> connect_peers;

  network::ConnectionManager::Config network_config;

  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - node coordinator
// Loads identity and contacts, owns the ConnectionManager, handles signals,
// coordinates shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  network::ConnectionManager &connection_manager() { return *connection_manager_; }

  bool is_running() const { return running_; }
  void request_shutdown() { shutdown_requested_ = true; }

  // Write a fresh identity.json into datadir (refuses to overwrite)
  static bool GenerateIdentityFile(const std::filesystem::path &datadir,
                                   const std::string &username);

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  util::DirectoryLock datadir_lock_;

  // Components (initialized in order)
  std::unique_ptr<network::StaticIdentityProvider> identity_;
  std::unique_ptr<network::MemoryContactDirectory> contacts_;
  std::unique_ptr<network::ConnectionManager> connection_manager_;

  // IMPORTANT: declared AFTER components so they are destroyed BEFORE
  MessageEvents::Subscription chat_sub_;
  MessageEvents::Subscription signal_sub_;
  MessageEvents::Subscription connected_sub_;
  MessageEvents::Subscription disconnected_sub_;

  // Initialization steps
  bool init_datadir();
  bool init_identity();
  bool init_contacts();
  bool init_network();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace whisperlink
