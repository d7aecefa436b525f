// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "index/balances.hpp"

#include "chain/validation.hpp"
#include "index/identities.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>

#include <iterator>
#include <stdexcept>

namespace trustledger {
namespace index {

using validation::StoreError;
using validation::ValidationState;

bool BalancesIndex::Credit(const UtxoId& id, const TxOutput& output, ValidationState& state) {
  if (utxos_.count(id) > 0) {
    return state.Error(StoreError::WRITE_ABORT, "output " + id.ToString() + " already exists");
  }
  BalanceEntry& entry = balances_[output.conditions];
  if (!AddAmount(entry.amount, output.amount)) {
    if (entry.utxos.empty()) {
      balances_.erase(output.conditions);
    }
    return state.Error(StoreError::WRITE_ABORT, "balance of " + output.conditions + " overflows");
  }
  utxos_.emplace(id, output);
  entry.utxos.insert(id);
  return true;
}

bool BalancesIndex::Debit(const UtxoId& id, TxOutput& out, ValidationState& state) {
  auto utxo = utxos_.find(id);
  if (utxo == utxos_.end()) {
    return state.Error(StoreError::WRITE_ABORT, "output " + id.ToString() + " is not unspent");
  }
  out = utxo->second;

  auto balance = balances_.find(out.conditions);
  if (balance == balances_.end() || balance->second.utxos.erase(id) == 0) {
    return state.Error(StoreError::CORRUPTION, "output " + id.ToString() + " missing from balance " + out.conditions);
  }
  balance->second.amount -= out.amount;
  if (balance->second.amount < 0) {
    return state.Error(StoreError::CORRUPTION, "negative balance for " + out.conditions);
  }
  if (balance->second.utxos.empty()) {
    if (balance->second.amount != 0) {
      return state.Error(StoreError::CORRUPTION, "balance " + out.conditions + " out of sync with its outputs");
    }
    balances_.erase(balance);
  }
  utxos_.erase(utxo);
  return true;
}

bool BalancesIndex::Apply(const Block& block, const IndexContext& ctx, ValidationState& state) {
  for (const auto& tx : block.transactions) {
    int64_t total_in = 0;
    int64_t total_out = 0;
    for (const auto& input : tx.inputs) {
      const TxOutput* utxo = GetUtxo(input);
      if (!utxo) {
        return state.Error(StoreError::WRITE_ABORT,
                           "tx " + tx.hash.ToString().substr(0, 16) + " spends unknown output " + input.ToString());
      }
      if (!AddAmount(total_in, utxo->amount)) {
        return state.Error(StoreError::WRITE_ABORT, "tx " + tx.hash.ToString().substr(0, 16) + " input total overflows");
      }
    }
    for (const auto& output : tx.outputs) {
      if (output.amount <= 0) {
        return state.Error(StoreError::WRITE_ABORT, "tx " + tx.hash.ToString().substr(0, 16) + " has non-positive output");
      }
      if (!AddAmount(total_out, output.amount)) {
        return state.Error(StoreError::WRITE_ABORT,
                           "tx " + tx.hash.ToString().substr(0, 16) + " output total overflows");
      }
    }
    if (total_in != total_out) {
      return state.Error(StoreError::WRITE_ABORT, "tx " + tx.hash.ToString().substr(0, 16) + " inputs " +
                                                      std::to_string(total_in) + " != outputs " +
                                                      std::to_string(total_out));
    }

    auto& consumed = consumed_[block.height];
    for (const auto& input : tx.inputs) {
      TxOutput spent;
      if (!Debit(input, spent, state)) {
        return false;
      }
      consumed.emplace_back(input, std::move(spent));
    }
    for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
      if (!Credit(UtxoId::Transaction(tx.hash, i), tx.outputs[i], state)) {
        return false;
      }
    }
  }

  if (block.dividend && *block.dividend > 0) {
    const auto members = ctx.identities.GetMembers();
    for (const auto& member : members) {
      if (!Credit(UtxoId::Dividend(member, block.height), TxOutput{*block.dividend, SingleSigCondition(member)},
                  state)) {
        return false;
      }
      dividends_[member].insert(block.height);
    }
    LOG_INDEX_DEBUG("Dividend {} credited to {} members at height {}", *block.dividend, members.size(),
                    block.height);
  }
  return true;
}

bool BalancesIndex::Revert(const Block& block, const IndexContext& ctx, ValidationState& state) {
  (void)ctx;

  for (auto it = dividends_.begin(); it != dividends_.end();) {
    if (it->second.erase(block.height) == 0) {
      ++it;
      continue;
    }
    TxOutput removed;
    if (!Debit(UtxoId::Dividend(it->first, block.height), removed, state)) {
      return state.Error(StoreError::CORRUPTION, "dividend of " + it->first + " at " +
                                                     std::to_string(block.height) + " cannot be reverted");
    }
    it = it->second.empty() ? dividends_.erase(it) : std::next(it);
  }

  auto consumed = consumed_.find(block.height);
  for (auto tx = block.transactions.rbegin(); tx != block.transactions.rend(); ++tx) {
    for (uint32_t i = static_cast<uint32_t>(tx->outputs.size()); i-- > 0;) {
      TxOutput removed;
      if (!Debit(UtxoId::Transaction(tx->hash, i), removed, state)) {
        return state.Error(StoreError::CORRUPTION, "output " + UtxoId::Transaction(tx->hash, i).ToString() +
                                                       " was spent or lost, cannot revert block " +
                                                       std::to_string(block.height));
      }
    }
    for (auto input = tx->inputs.rbegin(); input != tx->inputs.rend(); ++input) {
      if (consumed == consumed_.end() || consumed->second.empty() || consumed->second.back().first != *input) {
        return state.Error(StoreError::CORRUPTION,
                           "no consumed record for " + input->ToString() + " at " + std::to_string(block.height));
      }
      auto [id, output] = std::move(consumed->second.back());
      consumed->second.pop_back();
      if (!Credit(id, output, state)) {
        return state.Error(StoreError::CORRUPTION, "restored output " + id.ToString() + " already unspent");
      }
    }
  }
  if (consumed != consumed_.end()) {
    if (!consumed->second.empty()) {
      return state.Error(StoreError::CORRUPTION, "consumed record at " + std::to_string(block.height) +
                                                     " does not match block transactions");
    }
    consumed_.erase(consumed);
  }
  return true;
}

std::optional<BalanceEntry> BalancesIndex::GetBalance(const ConditionGroup& conditions) const {
  auto it = balances_.find(conditions);
  if (it == balances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const TxOutput* BalancesIndex::GetUtxo(const UtxoId& id) const {
  auto it = utxos_.find(id);
  return it == utxos_.end() ? nullptr : &it->second;
}

std::set<BlockHeight> BalancesIndex::GetDividendsOf(const PubKey& member) const {
  auto it = dividends_.find(member);
  return it == dividends_.end() ? std::set<BlockHeight>{} : it->second;
}

int64_t BalancesIndex::GetTotalBalances() const {
  int64_t total = 0;
  for (const auto& [conditions, entry] : balances_) {
    if (!AddAmount(total, entry.amount)) {
      throw std::overflow_error("sum of balances overflows");
    }
  }
  return total;
}

int64_t BalancesIndex::GetTotalUtxoAmount() const {
  int64_t total = 0;
  for (const auto& [id, output] : utxos_) {
    if (!AddAmount(total, output.amount)) {
      throw std::overflow_error("sum of unspent outputs overflows");
    }
  }
  return total;
}

size_t BalancesIndex::PruneConsumedBelow(BlockHeight cutoff) {
  auto end = consumed_.lower_bound(cutoff);
  size_t removed = std::distance(consumed_.begin(), end);
  consumed_.erase(consumed_.begin(), end);
  if (removed > 0) {
    LOG_INDEX_TRACE("Pruned consumed outputs of {} blocks below height {}", removed, cutoff);
  }
  return removed;
}

nlohmann::json BalancesIndex::ToJson() const {
  using json = nlohmann::json;
  json utxos = json::array();
  for (const auto& [id, output] : utxos_) {
    utxos.push_back(json{{"id", id}, {"amount", output.amount}, {"conditions", output.conditions}});
  }
  json consumed = json::array();
  for (const auto& [height, outputs] : consumed_) {
    json entries = json::array();
    for (const auto& [id, output] : outputs) {
      entries.push_back(json{{"id", id}, {"amount", output.amount}, {"conditions", output.conditions}});
    }
    consumed.push_back(json{{"height", height}, {"outputs", std::move(entries)}});
  }
  json dividends = json::object();
  for (const auto& [member, heights] : dividends_) {
    dividends[member] = heights;
  }
  // Balances are derived from the UTXO set on load
  return json{{"utxos", std::move(utxos)}, {"consumed", std::move(consumed)}, {"dividends", std::move(dividends)}};
}

BalancesIndex BalancesIndex::FromJson(const nlohmann::json& j) {
  BalancesIndex index;
  ValidationState state;
  for (const auto& entry : j.at("utxos")) {
    TxOutput output{entry.at("amount").get<int64_t>(), entry.at("conditions").get<ConditionGroup>()};
    if (output.amount <= 0 || !index.Credit(entry.at("id").get<UtxoId>(), output, state)) {
      throw std::runtime_error("invalid unspent output entry: " + entry.dump());
    }
  }
  for (const auto& record : j.at("consumed")) {
    auto& outputs = index.consumed_[record.at("height").get<BlockHeight>()];
    for (const auto& entry : record.at("outputs")) {
      outputs.emplace_back(entry.at("id").get<UtxoId>(),
                           TxOutput{entry.at("amount").get<int64_t>(), entry.at("conditions").get<ConditionGroup>()});
    }
  }
  for (const auto& [member, heights] : j.at("dividends").items()) {
    index.dividends_[member] = heights.get<std::set<BlockHeight>>();
  }
  return index;
}

}  // namespace index
}  // namespace trustledger
