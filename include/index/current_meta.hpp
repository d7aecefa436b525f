// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "index/chain_index.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace trustledger {
namespace index {

// Schema version of the persisted chain state
inline constexpr uint32_t CHAINSTATE_DB_VERSION = 1;

// CurrentMeta - chain-wide singleton: schema version, currency, current
// blockstamp, chain time and monetary mass. Owned by the chain state and
// reached by readers only through a snapshot handle.
class CurrentMeta : public ChainIndex {
public:
  const char* GetName() const override { return "current_meta"; }
  bool Apply(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;
  bool Revert(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;

  uint32_t GetDbVersion() const { return db_version_; }
  const std::string& GetCurrency() const { return currency_; }
  const std::optional<Blockstamp>& GetCurrentBlockstamp() const { return current_; }
  int64_t GetChainTime() const { return chain_time_; }
  int64_t GetMonetaryMass() const { return monetary_mass_; }

  nlohmann::json ToJson() const;
  // Throws when db_version is not CHAINSTATE_DB_VERSION
  static CurrentMeta FromJson(const nlohmann::json& j);

private:
  // Amount created by the block's dividend (members as of after the block's
  // identity changes), nullopt if it does not fit in an int64_t
  static std::optional<int64_t> DividendIssued(const Block& block, const IndexContext& ctx);

  uint32_t db_version_{CHAINSTATE_DB_VERSION};
  std::string currency_;
  std::optional<Blockstamp> current_;
  int64_t chain_time_{0};
  int64_t monetary_mass_{0};
};

}  // namespace index
}  // namespace trustledger
