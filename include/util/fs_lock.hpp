// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace whisperlink {
namespace util {

namespace fs = std::filesystem;

enum class LockResult {
  SUCCESS,     // Lock acquired
  ERROR_WRITE, // Could not create/open the lock file
  ERROR_LOCK,  // Lock already held (another node on this datadir)
};

/**
 * Exclusive lock on a data directory
 *
 * Creates <directory>/<lockfile_name> and holds an flock() on it for the
 * lifetime of the object, so two nodes never share identity.json and
 * contacts.json. flock() locks belong to the open file description, so a
 * second DirectoryLock in the same process is refused as well.
 */
class DirectoryLock {
public:
  DirectoryLock() = default;
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  LockResult Acquire(const fs::path &directory, const std::string &lockfile_name = ".lock");
  void Release();

  bool held() const { return fd_ != -1; }
  const std::string &reason() const { return reason_; }

private:
  int fd_{-1};
  std::string reason_;
};

} // namespace util
} // namespace whisperlink
