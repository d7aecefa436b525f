// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace trustledger {
namespace util {

namespace {

std::mutex g_dir_locks_mutex;

// lock file path -> held lock
std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;

}  // namespace

FileLock::FileLock(const fs::path& file) {
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  return true;
}

LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);

  const fs::path lockfile_path = directory / lockfile_name;
  if (g_dir_locks.count(lockfile_path.string()) > 0) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->IsOpen()) {
    LOG_STORAGE_ERROR("Cannot open lock file {}: {}", lockfile_path.string(), file_lock->GetReason());
    return LockResult::ErrorWrite;
  }
  if (!file_lock->TryLock()) {
    LOG_STORAGE_ERROR("Cannot lock data directory {}: {}", directory.string(), file_lock->GetReason());
    return LockResult::ErrorLock;
  }

  g_dir_locks.emplace(lockfile_path.string(), std::move(file_lock));
  LOG_STORAGE_TRACE("Locked data directory {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);
  if (g_dir_locks.erase((directory / lockfile_name).string()) > 0) {
    LOG_STORAGE_TRACE("Unlocked data directory {}", directory.string());
  }
}

void ReleaseAllDirectoryLocks() {
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);
  g_dir_locks.clear();
}

}  // namespace util
}  // namespace trustledger
