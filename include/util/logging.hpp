// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace whisperlink {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "network", "tunnel", "crypto", "app").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * Auto-initializes if not initialized. Unknown names return "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace whisperlink

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  whisperlink::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  whisperlink::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  whisperlink::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  whisperlink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  whisperlink::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  whisperlink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  whisperlink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  whisperlink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  whisperlink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  whisperlink::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_TUNNEL_TRACE(...)                                                  \
  whisperlink::util::LogManager::GetLogger("tunnel")->trace(__VA_ARGS__)
#define LOG_TUNNEL_DEBUG(...)                                                  \
  whisperlink::util::LogManager::GetLogger("tunnel")->debug(__VA_ARGS__)
#define LOG_TUNNEL_INFO(...)                                                   \
  whisperlink::util::LogManager::GetLogger("tunnel")->info(__VA_ARGS__)
#define LOG_TUNNEL_WARN(...)                                                   \
  whisperlink::util::LogManager::GetLogger("tunnel")->warn(__VA_ARGS__)
#define LOG_TUNNEL_ERROR(...)                                                  \
  whisperlink::util::LogManager::GetLogger("tunnel")->error(__VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...)                                                  \
  whisperlink::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_WARN(...)                                                   \
  whisperlink::util::LogManager::GetLogger("crypto")->warn(__VA_ARGS__)
