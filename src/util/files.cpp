#include "util/files.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace whisperlink {
namespace util {

namespace {

constexpr std::streamsize MAX_FILE_SIZE = 16 * 1024 * 1024;

// Closes the descriptor on every exit path
class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  bool close() {
    int fd = fd_;
    fd_ = -1;
    return ::close(fd) == 0;
  }

private:
  int fd_;
};

bool sync_directory(const std::filesystem::path &dir) {
  ScopedFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY));
  return fd.valid() && ::fsync(fd.get()) == 0;
}

std::string temp_name_for(const std::filesystem::path &path) {
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<unsigned> dis(0, 0xFFFF);
  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), ".tmp.%04x", dis(gen));
  return path.string() + suffix;
}

bool write_all(int fd, const std::string &data) {
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    total += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path, const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("Cannot create directory {}", parent.string());
    return false;
  }

  const std::filesystem::path temp_path = temp_name_for(path);
  std::error_code ignored;

  ScopedFd fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode));
  if (!fd.valid()) {
    LOG_ERROR("Cannot open {} for writing: {}", temp_path.string(), std::strerror(errno));
    return false;
  }

  // The umask must not widen or narrow what was asked for (0600 key files)
  bool ok = ::fchmod(fd.get(), static_cast<mode_t>(mode)) == 0 && write_all(fd.get(), data) &&
            ::fsync(fd.get()) == 0;
  ok = fd.close() && ok;
  if (!ok) {
    LOG_ERROR("Failed writing {}: {}", temp_path.string(), std::strerror(errno));
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("Cannot replace {}: {}", path.string(), ec.message());
    std::filesystem::remove(temp_path, ignored);
    return false;
  }

  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("fsync of directory {} failed", parent.string());
  }
  return true;
}

std::optional<std::string> read_file_string(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  std::streamsize size = static_cast<std::streamsize>(file.tellg());
  if (size < 0 || size > MAX_FILE_SIZE) {
    LOG_WARN("Refusing to read {} ({} bytes)", path.string(), static_cast<long long>(size));
    return std::nullopt;
  }

  std::string data(static_cast<size_t>(size), '\0');
  file.seekg(0);
  if (!file.read(data.data(), size)) {
    return std::nullopt;
  }
  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  if (const char *override_dir = std::getenv("WHISPERLINK_DATADIR"); override_dir && *override_dir) {
    return override_dir;
  }
  if (const char *home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".whisperlink";
  }
  return std::filesystem::current_path() / ".whisperlink";
}

} // namespace util
} // namespace whisperlink
