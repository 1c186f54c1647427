// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace whisperlink {
namespace util {

DirectoryLock::~DirectoryLock() { Release(); }

LockResult DirectoryLock::Acquire(const fs::path &directory, const std::string &lockfile_name) {
  if (fd_ != -1) {
    return LockResult::SUCCESS;
  }

  fs::path lockfile_path = directory / lockfile_name;

  // O_CREAT avoids a separate create step; O_CLOEXEC keeps the lock out of
  // spawned tunnel processes
  int fd = ::open(lockfile_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", lockfile_path.string(), reason_);
    return LockResult::ERROR_WRITE;
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    reason_ = std::strerror(errno);
    ::close(fd);
    LOG_ERROR("Failed to lock directory {}: {}", directory.string(), reason_);
    return LockResult::ERROR_LOCK;
  }

  fd_ = fd;
  reason_.clear();
  return LockResult::SUCCESS;
}

void DirectoryLock::Release() {
  if (fd_ != -1) {
    // Closing the descriptor releases the flock
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace util
} // namespace whisperlink
