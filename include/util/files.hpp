// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trustledger {
namespace util {

// Write `data` to `path` through a temp file, fsync and rename. Readers of
// `path` see either the old content or the new one, never a mix.
bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Whole file contents, std::nullopt on any read failure.
std::optional<std::string> read_file_string(const std::filesystem::path& path);

bool ensure_directory(const std::filesystem::path& dir);

// ~/.trustledger, or an empty path when HOME is unset.
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace trustledger
