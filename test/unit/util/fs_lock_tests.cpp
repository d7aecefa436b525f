// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for data directory locking (fs_lock.cpp)

#include <catch2/catch_test_macros.hpp>

#include "util/fs_lock.hpp"

#include <filesystem>

#include <sys/wait.h>
#include <unistd.h>

using namespace trustledger::util;

namespace {

std::filesystem::path FreshDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

// Runs `body` in a child process and returns its exit code
template <typename Fn>
int InChild(Fn body) {
    const pid_t pid = fork();
    if (pid == 0) {
        _exit(body());
    }
    int status = 0;
    waitpid(pid, &status, 0);
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

}  // namespace

TEST_CASE("Directory lock - single process", "[fs_lock]") {
    const auto datadir = FreshDir("trustledger_lock_basic");

    SECTION("Lock creates the lock file") {
        REQUIRE(LockDirectory(datadir) == LockResult::Success);
        REQUIRE(std::filesystem::exists(datadir / ".lock"));
        UnlockDirectory(datadir);
    }

    SECTION("Locking a directory already held is a no-op") {
        REQUIRE(LockDirectory(datadir) == LockResult::Success);
        REQUIRE(LockDirectory(datadir) == LockResult::Success);
        UnlockDirectory(datadir);
    }

    SECTION("Separate lock file names are separate locks") {
        REQUIRE(LockDirectory(datadir, ".import") == LockResult::Success);
        REQUIRE(std::filesystem::exists(datadir / ".import"));
        REQUIRE(LockDirectory(datadir) == LockResult::Success);
        ReleaseAllDirectoryLocks();
    }

    SECTION("Missing directory cannot be locked") {
        REQUIRE(LockDirectory(datadir / "absent") == LockResult::ErrorWrite);
    }

    std::filesystem::remove_all(datadir);
}

TEST_CASE("Directory lock - FileLock", "[fs_lock]") {
    const auto datadir = FreshDir("trustledger_lock_file");

    FileLock lock(datadir / "chainstate.lock");
    REQUIRE(lock.IsOpen());
    REQUIRE(lock.TryLock());

    FileLock unopened(datadir / "absent" / "chainstate.lock");
    REQUIRE_FALSE(unopened.IsOpen());
    REQUIRE_FALSE(unopened.TryLock());
    REQUIRE_FALSE(unopened.GetReason().empty());

    std::filesystem::remove_all(datadir);
}

TEST_CASE("Directory lock - second process", "[fs_lock][multiprocess]") {
    const auto datadir = FreshDir("trustledger_lock_mp");

    SECTION("Held lock keeps another process out") {
        REQUIRE(LockDirectory(datadir) == LockResult::Success);

        // fcntl locks are not inherited across fork, so the child is a real contender
        const int rc = InChild([&datadir]() {
            FileLock contender(datadir / ".lock");
            return contender.IsOpen() && !contender.TryLock() ? 42 : 1;
        });
        REQUIRE(rc == 42);

        UnlockDirectory(datadir);
    }

    SECTION("Lock freed when the holder exits") {
        const int rc = InChild([&datadir]() { return LockDirectory(datadir) == LockResult::Success ? 0 : 1; });
        REQUIRE(rc == 0);

        REQUIRE(LockDirectory(datadir) == LockResult::Success);
        UnlockDirectory(datadir);
    }

    SECTION("Released lock can be taken by another process") {
        REQUIRE(LockDirectory(datadir) == LockResult::Success);
        UnlockDirectory(datadir);

        const int rc = InChild([&datadir]() {
            FileLock contender(datadir / ".lock");
            return contender.TryLock() ? 0 : 1;
        });
        REQUIRE(rc == 0);
    }

    std::filesystem::remove_all(datadir);
}
