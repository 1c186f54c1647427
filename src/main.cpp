#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.whisperlink)\n"
      << "  --port=<port>        Listen port (default: 9001, 0 = OS-assigned)\n"
      << "  --nolisten           Disable inbound connections\n"
      << "  --tunnel             Expose the listener through a public tunnel\n"
      << "  --connect=<user_id>  Connect to a known contact after startup (repeatable)\n"
      << "  --notofu             Reject inbound peers that are not already contacts\n"
      << "  --genkey=<username>  Create identity.json in the data directory and exit\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, tunnel, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=network,tunnel\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    whisperlink::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    std::string genkey_username;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << whisperlink::GetFullVersionString() << std::endl;
        std::cout << whisperlink::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = whisperlink::util::SafeParseInt(arg.substr(7), 0, 65535);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 0 and 65535" << std::endl;
          return 1;
        }
        config.listen_port = static_cast<uint16_t>(*port_opt);
      } else if (arg == "--nolisten") {
        config.listen_enabled = false;
      } else if (arg == "--tunnel") {
        config.use_tunnel = true;
      } else if (arg.find("--connect=") == 0) {
        std::string peer = arg.substr(10);
        if (peer.empty()) {
          std::cerr << "Error: --connect requires a user_id" << std::endl;
          return 1;
        }
        config.connect_peers.push_back(peer);
      } else if (arg == "--notofu") {
        config.network_config.trust_on_first_use = false;
      } else if (arg.find("--genkey=") == 0) {
        genkey_username = arg.substr(9);
        if (genkey_username.empty()) {
          std::cerr << "Error: --genkey requires a username" << std::endl;
          return 1;
        }
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=net,tunnel
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.use_tunnel && !config.listen_enabled) {
      std::cerr << "Error: --tunnel requires inbound listening (drop --nolisten)" << std::endl;
      return 1;
    }

    // Ensure datadir exists before initializing file logger
    if (!whisperlink::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir.string() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    whisperlink::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        whisperlink::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        whisperlink::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        whisperlink::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    if (!genkey_username.empty()) {
      bool ok = whisperlink::app::Application::GenerateIdentityFile(config.datadir, genkey_username);
      whisperlink::util::LogManager::Shutdown();
      return ok ? 0 : 1;
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // so no reactor callback logs into a destroyed logger
    {
      whisperlink::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    // Shutdown logging AFTER app is fully destroyed
    whisperlink::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    whisperlink::util::LogManager::Shutdown();
    return 1;
  }
}
