// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "index/current_meta.hpp"

#include "chain/block_repository.hpp"
#include "chain/validation.hpp"
#include "index/identities.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace trustledger {
namespace index {

using validation::StoreError;
using validation::ValidationState;

std::optional<int64_t> CurrentMeta::DividendIssued(const Block& block, const IndexContext& ctx) {
  if (!block.dividend || *block.dividend <= 0) {
    return 0;
  }
  int64_t issued = 0;
  if (__builtin_mul_overflow(*block.dividend, static_cast<int64_t>(ctx.identities.GetMemberCount()), &issued)) {
    return std::nullopt;
  }
  return issued;
}

bool CurrentMeta::Apply(const Block& block, const IndexContext& ctx, ValidationState& state) {
  if (block.IsGenesis()) {
    if (current_) {
      return state.Error(StoreError::WRITE_ABORT, "genesis applied on a non-empty chain");
    }
    currency_ = block.currency;
  } else if (!current_ || *current_ != block.GetPreviousBlockstamp()) {
    return state.Error(StoreError::WRITE_ABORT, "block " + block.GetBlockstamp().ToString() +
                                                    " does not extend current " +
                                                    (current_ ? current_->ToString() : std::string("(none)")));
  }

  const std::optional<int64_t> issued = DividendIssued(block, ctx);
  int64_t mass = monetary_mass_;
  if (!issued || !AddAmount(mass, *issued)) {
    return state.Error(StoreError::WRITE_ABORT, "dividend of " + block.GetBlockstamp().ToString() +
                                                    " overflows the monetary mass");
  }

  current_ = block.GetBlockstamp();
  chain_time_ = block.median_time;
  monetary_mass_ = mass;
  return true;
}

bool CurrentMeta::Revert(const Block& block, const IndexContext& ctx, ValidationState& state) {
  if (!current_ || *current_ != block.GetBlockstamp()) {
    return state.Error(StoreError::CORRUPTION, "revert of " + block.GetBlockstamp().ToString() +
                                                   " but current is " +
                                                   (current_ ? current_->ToString() : std::string("(none)")));
  }

  const std::optional<int64_t> issued = DividendIssued(block, ctx);
  if (!issued || *issued > monetary_mass_) {
    return state.Error(StoreError::CORRUPTION, "dividend of " + block.GetBlockstamp().ToString() +
                                                   " exceeds the monetary mass");
  }
  monetary_mass_ -= *issued;

  if (block.IsGenesis()) {
    current_.reset();
    chain_time_ = 0;
    currency_.clear();
    return true;
  }

  const Block* previous = ctx.blocks.GetMain(block.height - 1);
  if (!previous || previous->hash != block.previous_hash) {
    return state.Error(StoreError::CORRUPTION, "previous block of " + block.GetBlockstamp().ToString() +
                                                   " missing from the main chain");
  }
  current_ = previous->GetBlockstamp();
  chain_time_ = previous->median_time;
  return true;
}

nlohmann::json CurrentMeta::ToJson() const {
  using json = nlohmann::json;
  return json{{"db_version", db_version_},
              {"currency", currency_},
              {"current", current_ ? json(*current_) : json(nullptr)},
              {"chain_time", chain_time_},
              {"monetary_mass", monetary_mass_}};
}

CurrentMeta CurrentMeta::FromJson(const nlohmann::json& j) {
  CurrentMeta meta;
  meta.db_version_ = j.at("db_version").get<uint32_t>();
  if (meta.db_version_ != CHAINSTATE_DB_VERSION) {
    throw std::runtime_error("unsupported chain state version " + std::to_string(meta.db_version_));
  }
  meta.currency_ = j.at("currency").get<std::string>();
  if (!j.at("current").is_null()) {
    meta.current_ = j.at("current").get<Blockstamp>();
  }
  meta.chain_time_ = j.at("chain_time").get<int64_t>();
  meta.monetary_mass_ = j.at("monetary_mass").get<int64_t>();
  return meta;
}

}  // namespace index
}  // namespace trustledger
