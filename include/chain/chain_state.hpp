// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block_repository.hpp"
#include "chain/fork_tracker.hpp"
#include "index/balances.hpp"
#include "index/cert_expiry.hpp"
#include "index/current_meta.hpp"
#include "index/identities.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace trustledger {
namespace chain {

class CurrencyParams;

// ChainState - everything one write transaction touches: block stores, fork
// links, every derived index and the current metadata.
//
// A published ChainState is immutable. The writer copies it, mutates the copy
// and publishes the copy as a whole (see WriteCoordinator), so readers holding
// a ChainSnapshot never observe a partially applied block.
struct ChainState {
  BlockRepository blocks;
  ForkTracker forks;
  index::IdentityIndex identities;
  index::CertExpiryIndex certifications;
  index::BalancesIndex balances;
  index::CurrentMeta meta;

  // Blocks that failed full validation; their descendants are never selected
  std::set<Blockstamp> invalid_blocks;

  // Indexes in apply order. Revert walks the array backwards.
  std::array<index::ChainIndex*, 4> Indexes() { return {&identities, &certifications, &balances, &meta}; }

  index::IndexContext MakeIndexContext(const CurrencyParams& params) const {
    return index::IndexContext{params, blocks, identities};
  }

  nlohmann::json ToJson() const;
  // Throws on malformed input or schema version mismatch
  static ChainState FromJson(const nlohmann::json& j);
};

// Read handle over one published ChainState. Cheap to copy; the state it
// refers to stays alive and unchanged for the handle's lifetime.
class ChainSnapshot {
public:
  explicit ChainSnapshot(std::shared_ptr<const ChainState> state) : state_(std::move(state)) {}

  std::optional<Blockstamp> GetCurrentBlockstamp() const { return state_->meta.GetCurrentBlockstamp(); }
  std::optional<Block> GetBlockAt(BlockHeight height) const;
  std::optional<index::BalanceEntry> GetBalanceOf(const ConditionGroup& conditions) const;
  std::optional<std::string> GetUidFor(const PubKey& pubkey) const;
  std::vector<index::TrustEdge> GetExpiringCertifications(BlockHeight height) const;

  int64_t GetMonetaryMass() const { return state_->meta.GetMonetaryMass(); }
  int64_t GetChainTime() const { return state_->meta.GetChainTime(); }

  const ChainState& State() const { return *state_; }

private:
  std::shared_ptr<const ChainState> state_;
};

}  // namespace chain
}  // namespace trustledger
