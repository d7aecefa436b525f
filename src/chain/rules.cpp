// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/rule_engine.hpp"
#include "index/identities.hpp"

namespace trustledger {
namespace validation {

namespace {

bool CheckPreviousIssuer(const Block& block, const Block& previous, const RuleReadContext&,
                         ValidationState& state) {
  if (!block.previous_issuer || *block.previous_issuer != previous.issuer) {
    return state.Invalid(RuleNumber::PREVIOUS_ISSUER, "wrong-previous-issuer",
                         "declared " + block.previous_issuer.value_or("(none)") + ", block " +
                             std::to_string(previous.height) + " issued by " + previous.issuer);
  }
  return true;
}

bool CheckIssuerIsMember(const Block& block, const Block&, const RuleReadContext& ctx, ValidationState& state) {
  const index::IdentityRecord* record = ctx.identities->Get(block.issuer);
  if (!record) {
    return state.Invalid(RuleNumber::ISSUER_IS_MEMBER, "issuer-not-exist", "issuer " + block.issuer);
  }
  if (!record->IsMember()) {
    return state.Invalid(RuleNumber::ISSUER_IS_MEMBER, "issuer-not-member",
                         "issuer " + block.issuer + " is " + index::MemberStateName(record->status.state));
  }
  return true;
}

bool CheckVersionNotDecreasing(const Block& block, const Block& previous, const RuleReadContext&,
                               ValidationState& state) {
  if (block.version < previous.version) {
    return state.Invalid(RuleNumber::VERSION_NOT_DECREASING, "version-decrease",
                         "version " + std::to_string(block.version) + " after " + std::to_string(previous.version));
  }
  return true;
}

}  // namespace

RuleEngine RuleEngine::CreateDefault() {
  RuleEngine engine;
  engine.Register(RuleNumber::PREVIOUS_ISSUER, "previous-issuer", MIN_PROTOCOL_VERSION, CheckPreviousIssuer);
  engine.Register(RuleNumber::ISSUER_IS_MEMBER, "issuer-is-member", MIN_PROTOCOL_VERSION, CheckIssuerIsMember,
                  /*requires_state=*/true);
  engine.Register(RuleNumber::VERSION_NOT_DECREASING, "version-not-decreasing", MIN_PROTOCOL_VERSION,
                  CheckVersionNotDecreasing);
  return engine;
}

}  // namespace validation
}  // namespace trustledger
