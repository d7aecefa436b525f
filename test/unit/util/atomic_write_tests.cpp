// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for atomic file writes and reads (files.cpp)

#include <catch2/catch_test_macros.hpp>

#include "util/files.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

using namespace trustledger::util;

namespace {

std::filesystem::path FreshDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace

TEST_CASE("Atomic write - symlink target is not followed", "[atomic_write][security]") {
    const auto test_dir = FreshDir("trustledger_atomic_symlink");

#if defined(__APPLE__) || defined(__linux__)
    const auto real_file = test_dir / "real.json";
    const auto link = test_dir / "chainstate.json";
    {
        std::ofstream f(real_file);
        f << "original";
    }
    std::filesystem::create_symlink(real_file, link);

    // Either the write fails or the link itself gets replaced
    (void)atomic_write_file(link, std::string("{\"replaced\":true}"));
    REQUIRE(read_file_string(real_file) == std::string("original"));
#endif

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write - file permissions", "[atomic_write][permissions]") {
    const auto test_dir = FreshDir("trustledger_atomic_perms");

#if defined(__APPLE__) || defined(__linux__)
    SECTION("File created with the requested mode") {
        const auto file_path = test_dir / "private.json";
        REQUIRE(atomic_write_file(file_path, std::string("{}"), 0600));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("Default mode is owner readable") {
        const auto file_path = test_dir / "default.json";
        REQUIRE(atomic_write_file(file_path, std::string("{}")));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0400) != 0);
    }
#endif

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write - overwrite", "[atomic_write][overwrite]") {
    const auto test_dir = FreshDir("trustledger_atomic_overwrite");
    const auto file_path = test_dir / "chainstate.json";

    SECTION("New content fully replaces the old") {
        REQUIRE(atomic_write_file(file_path, std::string(5000, 'a')));
        REQUIRE(atomic_write_file(file_path, std::string("short")));
        REQUIRE(read_file_string(file_path) == std::string("short"));
    }

    SECTION("Binary content kept byte for byte") {
        const std::vector<uint8_t> data(1024 * 1024, 0xAA);
        REQUIRE(atomic_write_file(file_path, data));
        REQUIRE(std::filesystem::file_size(file_path) == data.size());

        const auto read_back = read_file_string(file_path);
        REQUIRE(read_back.has_value());
        REQUIRE(std::vector<uint8_t>(read_back->begin(), read_back->end()) == data);
    }

    SECTION("Embedded NUL survives") {
        const std::string text("a\0b\n\t", 5);
        REQUIRE(atomic_write_file(file_path, text));
        REQUIRE(read_file_string(file_path) == text);
    }

    SECTION("Empty content") {
        REQUIRE(atomic_write_file(file_path, std::string()));
        REQUIRE(std::filesystem::file_size(file_path) == 0);
        REQUIRE(read_file_string(file_path) == std::string());
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write - temp files", "[atomic_write][tempfile]") {
    const auto test_dir = FreshDir("trustledger_atomic_temp");

    SECTION("Concurrent writers to different files") {
        const auto file1 = test_dir / "one.json";
        const auto file2 = test_dir / "two.json";
        bool ok1 = false;
        bool ok2 = false;

        std::thread t1([&]() { ok1 = atomic_write_file(file1, std::string("1")); });
        std::thread t2([&]() { ok2 = atomic_write_file(file2, std::string("2")); });
        t1.join();
        t2.join();

        REQUIRE(ok1);
        REQUIRE(ok2);
        REQUIRE(read_file_string(file1) == std::string("1"));
        REQUIRE(read_file_string(file2) == std::string("2"));
    }

    SECTION("No temp file left behind") {
        REQUIRE(atomic_write_file(test_dir / "clean.json", std::string("{}")));

        int temp_file_count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
                temp_file_count++;
            }
        }
        REQUIRE(temp_file_count == 0);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write - directories", "[atomic_write][mkdir]") {
    const auto test_dir = std::filesystem::temp_directory_path() / "trustledger_atomic_mkdir";
    std::filesystem::remove_all(test_dir);

    SECTION("Parent directories created") {
        const auto file_path = test_dir / "a" / "b" / "chainstate.json";
        REQUIRE(atomic_write_file(file_path, std::string("{}")));
        REQUIRE(std::filesystem::is_directory(test_dir / "a" / "b"));
    }

    SECTION("ensure_directory on an existing directory") {
        REQUIRE(ensure_directory(test_dir));
        REQUIRE(ensure_directory(test_dir));
    }

#if defined(__APPLE__) || defined(__linux__)
    SECTION("Read-only directory refuses the write") {
        if (geteuid() == 0) {
            WARN("Skipping read-only test when running as root");
        } else {
            std::filesystem::create_directories(test_dir);
            std::filesystem::permissions(test_dir,
                                         std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec,
                                         std::filesystem::perm_options::replace);
            REQUIRE_FALSE(atomic_write_file(test_dir / "fail.json", std::string("{}")));
            std::filesystem::permissions(test_dir, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace);
        }
    }
#endif

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Read file - missing file", "[atomic_write][read]") {
    const auto test_dir = FreshDir("trustledger_read_missing");
    REQUIRE_FALSE(read_file_string(test_dir / "absent.json").has_value());
    std::filesystem::remove_all(test_dir);
}
