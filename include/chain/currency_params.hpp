// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace trustledger {
namespace chain {

// Per-currency parameters supplied to the chain core at startup.
class CurrencyParams {
public:
  static std::unique_ptr<CurrencyParams> CreateDefault();

  // Small windows and validity periods for tests and local networks
  static std::unique_ptr<CurrencyParams> CreateRegTest();

  // nullptr when the file is missing or malformed (logged)
  static std::unique_ptr<CurrencyParams> LoadFromFile(const std::filesystem::path& path);
  bool SaveToFile(const std::filesystem::path& path) const;

  nlohmann::json ToJson() const;
  // Missing keys keep their default; throws nlohmann::json::exception on type mismatch
  void MergeJson(const nlohmann::json& j);

  std::string currency_name{"g1"};

  // Forks rooted deeper than this many blocks behind the tip are dropped
  uint32_t fork_window_size{100};
  uint32_t max_forks{100};

  // A fork replaces the main chain only when its head is at least this many
  // blocks above the tip and its median time at least this many seconds past
  // the main chain time.
  uint32_t fork_advance_blocks{1};
  int64_t fork_advance_time{0};

  uint32_t cert_validity_blocks{105120};
  int64_t ms_period{5259600};   // membership renewal spacing, seconds
  int64_t sig_period{432000};   // certification spacing per issuer, seconds

  size_t max_orphan_blocks{100};
  int64_t orphan_expire_seconds{600};
};

}  // namespace chain
}  // namespace trustledger
