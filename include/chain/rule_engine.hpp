// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/validation.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>

namespace trustledger {

namespace index {
class IdentityIndex;
}

namespace validation {

// Chain state a rule may read: the derived state as of the block's parent.
// `identities` is null when only stateless checks are requested (blocks
// stored on a fork are checked again in full when their fork is promoted).
struct RuleReadContext {
  const index::IdentityIndex* identities{nullptr};
};

// A rule function: block, its parent (never null, genesis skips rules),
// read context. Returns false after recording the violation in `state`.
using RuleFn =
    std::function<bool(const Block& block, const Block& previous, const RuleReadContext& ctx, ValidationState& state)>;

struct Rule {
  RuleNumber number{RuleNumber::NONE};
  std::string name;
  bool requires_state{false};
  // Implementation in force from each protocol version on
  std::map<ProtocolVersion, RuleFn> versions;
};

// First protocol version handled by this node
inline constexpr ProtocolVersion MIN_PROTOCOL_VERSION = 10;

// RuleEngine - registry of numbered, versioned rules.
//
// For a block of version V each rule runs the implementation registered for
// the highest version <= V; rules with no such implementation do not apply.
// Blocks older than MIN_PROTOCOL_VERSION, genesis included, fail "bad-version".
// Rules run lowest number first and evaluation stops at the first failure.
class RuleEngine {
public:
  // Engine with the consensus rules of this node registered
  static RuleEngine CreateDefault();

  // Add an implementation for `number` in force from `since` on. Replaces an
  // implementation already registered for the same version.
  void Register(RuleNumber number, const std::string& name, ProtocolVersion since, RuleFn fn,
                bool requires_state = false);

  // Implementation of `rule` for a block of `version`, nullptr if none applies
  static const RuleFn* Resolve(const Rule& rule, ProtocolVersion version);

  // Full validation of `block` on top of `previous` (null only for genesis).
  // A non-genesis block without parent fails NO_PREVIOUS_BLOCK.
  bool Validate(const Block& block, const Block* previous, const RuleReadContext& ctx, ValidationState& state) const;

  // Rules that do not read chain state (fork blocks on arrival)
  bool ValidateLinkage(const Block& block, const Block* previous, ValidationState& state) const;

  size_t GetRuleCount() const { return rules_.size(); }
  const std::map<RuleNumber, Rule>& GetRules() const { return rules_; }

private:
  bool Evaluate(const Block& block, const Block* previous, const RuleReadContext& ctx, bool stateless_only,
                ValidationState& state) const;

  std::map<RuleNumber, Rule> rules_;
};

}  // namespace validation
}  // namespace trustledger
