// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "index/chain_index.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trustledger {
namespace index {

enum class MemberState : uint8_t {
  MEMBER,
  EXPIRE_MEMBER,
  EXPLICIT_REVOKED,
  EXPLICIT_EXPIRE_REVOKED,  // revoked after expiry
  IMPLICIT_REVOKED
};

const char* MemberStateName(MemberState state);
std::optional<MemberState> MemberStateFromName(const std::string& name);

// Membership status plus one renewal counter per membership period
// (a new period starts each time an expired member comes back).
struct IdentityStatus {
  MemberState state{MemberState::MEMBER};
  std::vector<uint32_t> renewed_counts{0};

  bool operator==(const IdentityStatus&) const = default;
};

// Status held immediately before `status` in the membership state machine.
// std::nullopt for a freshly created member.
std::optional<IdentityStatus> PredecessorOf(const IdentityStatus& status);

struct IdentityRecord {
  std::string uid;
  Blockstamp idty_blockstamp;  // blockstamp the identity document was signed against

  IdentityStatus status;
  // Two-deep history: one level of undo, enough for block-by-block revert
  std::optional<IdentityStatus> previous_status;

  Blockstamp joined_on;
  std::vector<Blockstamp> expired_on;  // one entry per exclusion
  std::optional<Blockstamp> revoked_on;

  std::vector<int64_t> ms_chainable_on;    // next allowed membership renewal time
  std::vector<int64_t> cert_chainable_on;  // next allowed certification time

  bool IsMember() const { return status.state == MemberState::MEMBER; }
};

// IdentityIndex - membership state of every identity written to the chain.
//
// Apply order within a block: new identities, renewals (actives and joiners
// of existing identities), exclusions, revocations, certification chainable
// times. Revert walks the same steps backwards. Leavers do not change state.
class IdentityIndex : public ChainIndex {
public:
  const char* GetName() const override { return "identities"; }
  bool Apply(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;
  bool Revert(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;

  const IdentityRecord* Get(const PubKey& pubkey) const;
  std::optional<std::string> GetUid(const PubKey& pubkey) const;
  std::optional<PubKey> GetPubkeyByUid(const std::string& uid) const;

  bool IsMember(const PubKey& pubkey) const;
  std::vector<PubKey> GetMembers() const;  // sorted by pubkey
  size_t GetMemberCount() const;
  size_t Size() const { return identities_.size(); }

  nlohmann::json ToJson() const;
  static IdentityIndex FromJson(const nlohmann::json& j);

private:
  // Status transition with the two-deep record kept in step
  static void Transition(IdentityRecord& record, const IdentityStatus& next);
  static bool RestorePrevious(const PubKey& pubkey, IdentityRecord& record, validation::ValidationState& state);

  std::map<PubKey, IdentityRecord> identities_;
};

}  // namespace index
}  // namespace trustledger
