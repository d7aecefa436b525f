// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace trustledger {
namespace util {

namespace {

// Chain state images are JSON; anything beyond this is not ours.
constexpr std::uintmax_t MAX_FILE_SIZE = 512ull * 1024 * 1024;

bool sync_fd(int fd) {
#if defined(__APPLE__)
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool sync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0) {
    return false;
  }
  const bool ok = sync_fd(fd);
  close(fd);
  return ok;
}

std::string temp_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  char buf[20];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
  return buf;
}

}  // namespace

bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode) {
  const auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_STORAGE_ERROR("atomic_write_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + temp_suffix();

  // O_EXCL: never reuse a pre-existing temp file. O_NOFOLLOW: never write through a symlink.
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_STORAGE_ERROR("atomic_write_file: cannot create {}: {} (errno={})", temp_path.string(), std::strerror(errno),
                      errno);
    return false;
  }

  std::error_code ec;
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n <= 0) {
      LOG_STORAGE_ERROR("atomic_write_file: write to {} failed after {}/{} bytes: {}", temp_path.string(), written,
                        data.size(), std::strerror(errno));
      close(fd);
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (!sync_fd(fd)) {
    LOG_STORAGE_ERROR("atomic_write_file: fsync of {} failed: {}", temp_path.string(), std::strerror(errno));
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_STORAGE_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(),
                      ec.message());
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  // Make the rename itself durable
  if (!parent.empty() && !sync_directory(parent)) {
    LOG_STORAGE_WARN("atomic_write_file: fsync of directory {} failed: {}", parent.string(), std::strerror(errno));
  }
  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
  return atomic_write_file(path, data, 0644);
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  return atomic_write_file(path, std::vector<uint8_t>(data.begin(), data.end()), mode);
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_STORAGE_ERROR("read_file_string: cannot stat {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > MAX_FILE_SIZE) {
    LOG_STORAGE_ERROR("read_file_string: {} is {} bytes, refusing to read more than {}", path.string(), size,
                      MAX_FILE_SIZE);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    LOG_STORAGE_ERROR("read_file_string: cannot open {}: {}", path.string(), std::strerror(errno));
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    LOG_STORAGE_ERROR("read_file_string: read error on {}", path.string());
    return std::nullopt;
  }
  return contents.str();
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (!home || *home == '\0') {
    LOG_ERROR("get_default_datadir: HOME is not set, use --datadir");
    return {};
  }
#if defined(__APPLE__)
  return std::filesystem::path(home) / "Library" / "Application Support" / "Trustledger";
#else
  return std::filesystem::path(home) / ".trustledger";
#endif
}

}  // namespace util
}  // namespace trustledger
