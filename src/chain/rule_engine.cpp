// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/rule_engine.hpp"

#include "util/logging.hpp"

#include <fmt/format.h>

#include <iterator>

namespace trustledger {
namespace validation {

void RuleEngine::Register(RuleNumber number, const std::string& name, ProtocolVersion since, RuleFn fn,
                          bool requires_state) {
  Rule& rule = rules_[number];
  rule.number = number;
  rule.name = name;
  rule.requires_state = rule.requires_state || requires_state;
  rule.versions[since] = std::move(fn);
}

const RuleFn* RuleEngine::Resolve(const Rule& rule, ProtocolVersion version) {
  auto it = rule.versions.upper_bound(version);
  if (it == rule.versions.begin()) {
    return nullptr;
  }
  return &std::prev(it)->second;
}

bool RuleEngine::Validate(const Block& block, const Block* previous, const RuleReadContext& ctx,
                          ValidationState& state) const {
  return Evaluate(block, previous, ctx, false, state);
}

bool RuleEngine::ValidateLinkage(const Block& block, const Block* previous, ValidationState& state) const {
  return Evaluate(block, previous, RuleReadContext{}, true, state);
}

bool RuleEngine::Evaluate(const Block& block, const Block* previous, const RuleReadContext& ctx,
                          bool stateless_only, ValidationState& state) const {
  if (block.version < MIN_PROTOCOL_VERSION) {
    return state.Invalid("bad-version", fmt::format("protocol version {} unsupported, minimum {}", block.version,
                                                    MIN_PROTOCOL_VERSION));
  }
  if (block.IsGenesis()) {
    // Every registered rule compares against a parent
    return true;
  }
  if (!previous || previous->height + 1 != block.height || previous->hash != block.previous_hash) {
    return state.Invalid(RuleNumber::NO_PREVIOUS_BLOCK, "no-previous-block",
                         "parent " + block.GetPreviousBlockstamp().ToString() + " unknown");
  }

  for (const auto& [number, rule] : rules_) {
    if (rule.requires_state && (stateless_only || !ctx.identities)) {
      continue;
    }
    const RuleFn* fn = Resolve(rule, block.version);
    if (!fn) {
      continue;
    }
    if (!(*fn)(block, *previous, ctx, state)) {
      LOG_CHAIN_DEBUG_RL("Block {} failed rule {} ({}): {}", block.GetBlockstamp().ToString(),
                         static_cast<uint32_t>(number), rule.name, state.GetRejectReason());
      return false;
    }
  }
  return true;
}

}  // namespace validation
}  // namespace trustledger
