#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace whisperlink {
namespace util {

/**
 * Atomic file operations for crash-safe persistence of identity and
 * contact files
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix) with the requested mode
 * 2. fsync() the file, then the directory
 * 3. Atomic rename over original file
 *
 * Either the old file or the new file is always valid on disk.
 */

/**
 * Write string to file atomically
 * @param mode File permissions (0600 for private key material)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if missing, unreadable or larger than 16 MiB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * $WHISPERLINK_DATADIR when set, else $HOME/.whisperlink, else
 * ./.whisperlink
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace whisperlink
