// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/chain_state.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace trustledger {
namespace chain {

nlohmann::json ChainState::ToJson() const {
  using json = nlohmann::json;
  json root;
  root["current_meta"] = meta.ToJson();
  root["blocks"] = blocks.ToJson();
  root["forks"] = forks.ToJson();
  root["identities"] = identities.ToJson();
  root["certifications"] = certifications.ToJson();
  root["balances"] = balances.ToJson();
  root["invalid_blocks"] = invalid_blocks;
  return root;
}

ChainState ChainState::FromJson(const nlohmann::json& j) {
  ChainState state;
  // Version gate first so an unknown layout is reported as such
  state.meta = index::CurrentMeta::FromJson(j.at("current_meta"));
  state.blocks = BlockRepository::FromJson(j.at("blocks"));
  state.forks = ForkTracker::FromJson(j.at("forks"));
  state.identities = index::IdentityIndex::FromJson(j.at("identities"));
  state.certifications = index::CertExpiryIndex::FromJson(j.at("certifications"));
  state.balances = index::BalancesIndex::FromJson(j.at("balances"));
  state.invalid_blocks = j.at("invalid_blocks").get<std::set<Blockstamp>>();

  if (state.meta.GetCurrentBlockstamp() != state.blocks.GetTipBlockstamp()) {
    throw std::runtime_error("current blockstamp does not match the main chain tip");
  }
  if (state.balances.GetTotalUtxoAmount() != state.meta.GetMonetaryMass()) {
    throw std::runtime_error("unspent outputs do not add up to the monetary mass");
  }
  return state;
}

std::optional<Block> ChainSnapshot::GetBlockAt(BlockHeight height) const {
  const Block* block = state_->blocks.GetMain(height);
  if (!block) {
    return std::nullopt;
  }
  return *block;
}

std::optional<index::BalanceEntry> ChainSnapshot::GetBalanceOf(const ConditionGroup& conditions) const {
  return state_->balances.GetBalance(conditions);
}

std::optional<std::string> ChainSnapshot::GetUidFor(const PubKey& pubkey) const {
  return state_->identities.GetUid(pubkey);
}

std::vector<index::TrustEdge> ChainSnapshot::GetExpiringCertifications(BlockHeight height) const {
  return state_->certifications.ExpiringAt(height);
}

}  // namespace chain
}  // namespace trustledger
