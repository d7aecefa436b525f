// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace trustledger {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive fcntl() lock on a file (POSIX only).
 * The lock is released when the object is destroyed.
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  explicit FileLock(const fs::path& file);
  ~FileLock();

  bool IsOpen() const { return fd_ != -1; }

  // Non-blocking. False if another process holds the lock.
  bool TryLock();

  const std::string& GetReason() const { return reason_; }

private:
  std::string reason_;
  int fd_{-1};
};

enum class LockResult {
  Success,
  ErrorWrite,  // lock file could not be created
  ErrorLock,   // another process holds the lock
};

// Lock a data directory for the lifetime of the process (or until UnlockDirectory).
// Locking a directory this process already holds succeeds.
LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

void ReleaseAllDirectoryLocks();

}  // namespace util
}  // namespace trustledger
