// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "index/identities.hpp"

#include "chain/currency_params.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

namespace trustledger {
namespace index {

using validation::StoreError;
using validation::ValidationState;

namespace {

constexpr const char* kStateNames[] = {"member", "expire_member", "explicit_revoked", "explicit_expire_revoked",
                                       "implicit_revoked"};

std::set<PubKey> NewcomersOf(const Block& block) {
  std::set<PubKey> out;
  for (const auto& idty : block.identities) {
    out.insert(idty.pubkey);
  }
  return out;
}

// Memberships that renew an existing identity, in block order
std::vector<const MembershipDoc*> RenewalsOf(const Block& block) {
  const auto newcomers = NewcomersOf(block);
  std::vector<const MembershipDoc*> out;
  for (const auto& ms : block.joiners) {
    if (newcomers.count(ms.pubkey) == 0) {
      out.push_back(&ms);
    }
  }
  for (const auto& ms : block.actives) {
    out.push_back(&ms);
  }
  return out;
}

nlohmann::json StatusToJson(const IdentityStatus& status) {
  return nlohmann::json{{"state", MemberStateName(status.state)}, {"renewed_counts", status.renewed_counts}};
}

IdentityStatus StatusFromJson(const nlohmann::json& j) {
  IdentityStatus status;
  auto state = MemberStateFromName(j.at("state").get<std::string>());
  if (!state) {
    throw std::runtime_error("unknown member state " + j.at("state").get<std::string>());
  }
  status.state = *state;
  status.renewed_counts = j.at("renewed_counts").get<std::vector<uint32_t>>();
  if (status.renewed_counts.empty()) {
    throw std::runtime_error("empty renewal counters");
  }
  return status;
}

}  // namespace

const char* MemberStateName(MemberState state) {
  return kStateNames[static_cast<size_t>(state)];
}

std::optional<MemberState> MemberStateFromName(const std::string& name) {
  for (size_t i = 0; i < std::size(kStateNames); ++i) {
    if (name == kStateNames[i]) {
      return static_cast<MemberState>(i);
    }
  }
  return std::nullopt;
}

std::optional<IdentityStatus> PredecessorOf(const IdentityStatus& status) {
  switch (status.state) {
  case MemberState::MEMBER: {
    if (status.renewed_counts.empty()) {
      return std::nullopt;
    }
    IdentityStatus prev = status;
    if (prev.renewed_counts.back() > 0) {
      prev.renewed_counts.back() -= 1;
      return prev;
    }
    if (prev.renewed_counts.size() > 1) {
      // Period opened by the renewal of an expired member
      prev.renewed_counts.pop_back();
      prev.state = MemberState::EXPIRE_MEMBER;
      return prev;
    }
    return std::nullopt;
  }
  case MemberState::EXPIRE_MEMBER:
  case MemberState::EXPLICIT_REVOKED:
  case MemberState::IMPLICIT_REVOKED:
    return IdentityStatus{MemberState::MEMBER, status.renewed_counts};
  case MemberState::EXPLICIT_EXPIRE_REVOKED:
    return IdentityStatus{MemberState::EXPIRE_MEMBER, status.renewed_counts};
  }
  return std::nullopt;
}

void IdentityIndex::Transition(IdentityRecord& record, const IdentityStatus& next) {
  record.previous_status = record.status;
  record.status = next;
}

bool IdentityIndex::RestorePrevious(const PubKey& pubkey, IdentityRecord& record, ValidationState& state) {
  if (!record.previous_status) {
    return state.Error(StoreError::CORRUPTION, "identity " + pubkey + " has no previous status to restore");
  }
  record.status = *record.previous_status;
  record.previous_status = PredecessorOf(record.status);
  return true;
}

bool IdentityIndex::Apply(const Block& block, const IndexContext& ctx, ValidationState& state) {
  const Blockstamp bs = block.GetBlockstamp();

  for (const auto& idty : block.identities) {
    if (identities_.count(idty.pubkey) > 0) {
      return state.Error(StoreError::WRITE_ABORT, "identity " + idty.pubkey + " already written");
    }
    IdentityRecord record;
    record.uid = idty.uid;
    record.idty_blockstamp = idty.blockstamp;
    record.joined_on = bs;
    record.ms_chainable_on.push_back(block.median_time + ctx.params.ms_period);
    identities_.emplace(idty.pubkey, std::move(record));
    LOG_INDEX_TRACE("New member {} ({}) at {}", idty.uid, idty.pubkey, bs.ToString());
  }

  for (const MembershipDoc* ms : RenewalsOf(block)) {
    auto it = identities_.find(ms->pubkey);
    if (it == identities_.end()) {
      return state.Error(StoreError::WRITE_ABORT, "renewal of unknown identity " + ms->pubkey);
    }
    IdentityRecord& record = it->second;
    IdentityStatus next = record.status;
    if (record.status.state == MemberState::MEMBER) {
      next.renewed_counts.back() += 1;
    } else if (record.status.state == MemberState::EXPIRE_MEMBER) {
      next.state = MemberState::MEMBER;
      next.renewed_counts.push_back(0);
    } else {
      return state.Error(StoreError::WRITE_ABORT, "renewal of revoked identity " + ms->pubkey);
    }
    Transition(record, next);
    record.ms_chainable_on.push_back(block.median_time + ctx.params.ms_period);
  }

  for (const auto& pubkey : block.excluded) {
    auto it = identities_.find(pubkey);
    if (it == identities_.end()) {
      return state.Error(StoreError::WRITE_ABORT, "exclusion of unknown identity " + pubkey);
    }
    IdentityRecord& record = it->second;
    if (record.status.state != MemberState::MEMBER) {
      return state.Error(StoreError::WRITE_ABORT,
                         "exclusion of " + pubkey + " in state " + MemberStateName(record.status.state));
    }
    Transition(record, IdentityStatus{MemberState::EXPIRE_MEMBER, record.status.renewed_counts});
    record.expired_on.push_back(bs);
  }

  for (const auto& revocation : block.revoked) {
    auto it = identities_.find(revocation.pubkey);
    if (it == identities_.end()) {
      return state.Error(StoreError::WRITE_ABORT, "revocation of unknown identity " + revocation.pubkey);
    }
    IdentityRecord& record = it->second;
    IdentityStatus next = record.status;
    if (record.status.state == MemberState::MEMBER) {
      next.state = revocation.implicit ? MemberState::IMPLICIT_REVOKED : MemberState::EXPLICIT_REVOKED;
    } else if (record.status.state == MemberState::EXPIRE_MEMBER) {
      next.state = MemberState::EXPLICIT_EXPIRE_REVOKED;
    } else {
      return state.Error(StoreError::WRITE_ABORT, "identity " + revocation.pubkey + " already revoked");
    }
    Transition(record, next);
    record.revoked_on = bs;
  }

  for (const auto& cert : block.certifications) {
    auto issuer = identities_.find(cert.issuer);
    if (issuer == identities_.end() || identities_.count(cert.target) == 0) {
      return state.Error(StoreError::WRITE_ABORT,
                         "certification " + cert.issuer + " -> " + cert.target + " references unknown identity");
    }
    issuer->second.cert_chainable_on.push_back(block.median_time + ctx.params.sig_period);
  }

  return true;
}

bool IdentityIndex::Revert(const Block& block, const IndexContext& ctx, ValidationState& state) {
  (void)ctx;
  const Blockstamp bs = block.GetBlockstamp();

  auto lookup = [&](const PubKey& pubkey) -> IdentityRecord* {
    auto it = identities_.find(pubkey);
    return it == identities_.end() ? nullptr : &it->second;
  };

  for (auto cert = block.certifications.rbegin(); cert != block.certifications.rend(); ++cert) {
    IdentityRecord* issuer = lookup(cert->issuer);
    if (!issuer || issuer->cert_chainable_on.empty()) {
      return state.Error(StoreError::CORRUPTION, "cannot revert certification issued by " + cert->issuer);
    }
    issuer->cert_chainable_on.pop_back();
  }

  for (auto rev = block.revoked.rbegin(); rev != block.revoked.rend(); ++rev) {
    IdentityRecord* record = lookup(rev->pubkey);
    if (!record || record->revoked_on != bs) {
      return state.Error(StoreError::CORRUPTION, "revocation of " + rev->pubkey + " not recorded at " + bs.ToString());
    }
    if (!RestorePrevious(rev->pubkey, *record, state)) {
      return false;
    }
    record->revoked_on.reset();
  }

  for (auto pk = block.excluded.rbegin(); pk != block.excluded.rend(); ++pk) {
    IdentityRecord* record = lookup(*pk);
    if (!record || record->expired_on.empty() || record->expired_on.back() != bs) {
      return state.Error(StoreError::CORRUPTION, "exclusion of " + *pk + " not recorded at " + bs.ToString());
    }
    if (!RestorePrevious(*pk, *record, state)) {
      return false;
    }
    record->expired_on.pop_back();
  }

  const auto renewals = RenewalsOf(block);
  for (auto ms = renewals.rbegin(); ms != renewals.rend(); ++ms) {
    IdentityRecord* record = lookup((*ms)->pubkey);
    if (!record || record->ms_chainable_on.empty()) {
      return state.Error(StoreError::CORRUPTION, "cannot revert renewal of " + (*ms)->pubkey);
    }
    if (!RestorePrevious((*ms)->pubkey, *record, state)) {
      return false;
    }
    record->ms_chainable_on.pop_back();
  }

  for (auto idty = block.identities.rbegin(); idty != block.identities.rend(); ++idty) {
    IdentityRecord* record = lookup(idty->pubkey);
    if (!record || record->joined_on != bs) {
      return state.Error(StoreError::CORRUPTION, "identity " + idty->pubkey + " not created at " + bs.ToString());
    }
    identities_.erase(idty->pubkey);
  }

  return true;
}

const IdentityRecord* IdentityIndex::Get(const PubKey& pubkey) const {
  auto it = identities_.find(pubkey);
  return it == identities_.end() ? nullptr : &it->second;
}

std::optional<std::string> IdentityIndex::GetUid(const PubKey& pubkey) const {
  const IdentityRecord* record = Get(pubkey);
  if (!record) {
    return std::nullopt;
  }
  return record->uid;
}

std::optional<PubKey> IdentityIndex::GetPubkeyByUid(const std::string& uid) const {
  for (const auto& [pubkey, record] : identities_) {
    if (record.uid == uid) {
      return pubkey;
    }
  }
  return std::nullopt;
}

bool IdentityIndex::IsMember(const PubKey& pubkey) const {
  const IdentityRecord* record = Get(pubkey);
  return record && record->IsMember();
}

std::vector<PubKey> IdentityIndex::GetMembers() const {
  std::vector<PubKey> out;
  for (const auto& [pubkey, record] : identities_) {
    if (record.IsMember()) {
      out.push_back(pubkey);
    }
  }
  return out;
}

size_t IdentityIndex::GetMemberCount() const {
  return std::count_if(identities_.begin(), identities_.end(),
                       [](const auto& entry) { return entry.second.IsMember(); });
}

nlohmann::json IdentityIndex::ToJson() const {
  using json = nlohmann::json;
  json out = json::object();
  for (const auto& [pubkey, record] : identities_) {
    json entry;
    entry["uid"] = record.uid;
    entry["idty_blockstamp"] = record.idty_blockstamp;
    entry["status"] = StatusToJson(record.status);
    entry["previous_status"] = record.previous_status ? StatusToJson(*record.previous_status) : json(nullptr);
    entry["joined_on"] = record.joined_on;
    entry["expired_on"] = record.expired_on;
    entry["revoked_on"] = record.revoked_on ? json(*record.revoked_on) : json(nullptr);
    entry["ms_chainable_on"] = record.ms_chainable_on;
    entry["cert_chainable_on"] = record.cert_chainable_on;
    out[pubkey] = std::move(entry);
  }
  return out;
}

IdentityIndex IdentityIndex::FromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("'identities' is not an object");
  }
  IdentityIndex index;
  for (const auto& [pubkey, entry] : j.items()) {
    IdentityRecord record;
    record.uid = entry.at("uid").get<std::string>();
    record.idty_blockstamp = entry.at("idty_blockstamp").get<Blockstamp>();
    record.status = StatusFromJson(entry.at("status"));
    if (!entry.at("previous_status").is_null()) {
      record.previous_status = StatusFromJson(entry.at("previous_status"));
    }
    if (record.previous_status != PredecessorOf(record.status)) {
      throw std::runtime_error("identity " + pubkey + " has inconsistent status history");
    }
    record.joined_on = entry.at("joined_on").get<Blockstamp>();
    record.expired_on = entry.at("expired_on").get<std::vector<Blockstamp>>();
    if (!entry.at("revoked_on").is_null()) {
      record.revoked_on = entry.at("revoked_on").get<Blockstamp>();
    }
    record.ms_chainable_on = entry.at("ms_chainable_on").get<std::vector<int64_t>>();
    record.cert_chainable_on = entry.at("cert_chainable_on").get<std::vector<int64_t>>();
    index.identities_.emplace(pubkey, std::move(record));
  }
  return index;
}

}  // namespace index
}  // namespace trustledger
