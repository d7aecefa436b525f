// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "index/chain_index.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace trustledger {
namespace index {

// Balance of one condition group. amount == sum of the referenced outputs.
struct BalanceEntry {
  int64_t amount{0};
  std::set<UtxoId> utxos;

  bool operator==(const BalanceEntry&) const = default;
};

// BalancesIndex - unspent outputs, per-condition balances and dividend history.
//
// Outputs consumed by a block are moved to a per-block shadow record instead
// of being dropped, so the block can be reverted exactly. Shadow records are
// pruned once their block leaves the fork window. Condition groups whose
// balance drops to zero with no outputs left are removed.
class BalancesIndex : public ChainIndex {
public:
  const char* GetName() const override { return "balances"; }
  bool Apply(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;
  bool Revert(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;

  std::optional<BalanceEntry> GetBalance(const ConditionGroup& conditions) const;
  const TxOutput* GetUtxo(const UtxoId& id) const;

  // Heights at which `member` received a dividend
  std::set<BlockHeight> GetDividendsOf(const PubKey& member) const;

  // Both throw std::overflow_error when the sum does not fit in an int64_t
  int64_t GetTotalBalances() const;
  int64_t GetTotalUtxoAmount() const;
  size_t GetUtxoCount() const { return utxos_.size(); }

  bool HasConsumedRecord(BlockHeight height) const { return consumed_.count(height) > 0; }
  size_t PruneConsumedBelow(BlockHeight cutoff);

  nlohmann::json ToJson() const;
  static BalancesIndex FromJson(const nlohmann::json& j);

private:
  bool Credit(const UtxoId& id, const TxOutput& output, validation::ValidationState& state);
  // Removes the output from the UTXO set and its balance; returns it through `out`
  bool Debit(const UtxoId& id, TxOutput& out, validation::ValidationState& state);

  std::map<UtxoId, TxOutput> utxos_;
  std::map<ConditionGroup, BalanceEntry> balances_;
  std::map<BlockHeight, std::vector<std::pair<UtxoId, TxOutput>>> consumed_;
  std::map<PubKey, std::set<BlockHeight>> dividends_;
};

}  // namespace index
}  // namespace trustledger
