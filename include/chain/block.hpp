// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "util/hash.hpp"

#include <nlohmann/json_fwd.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustledger {

using PubKey = std::string;
using BlockHeight = uint32_t;
using ProtocolVersion = uint32_t;

// Spending-condition group keying a balance entry, e.g. "SIG(<pubkey>)"
using ConditionGroup = std::string;

// Condition group for outputs spendable by a single signature of `pubkey`
ConditionGroup SingleSigCondition(const PubKey& pubkey);

// Chain position: (height, hash)
struct Blockstamp {
  BlockHeight height{0};
  Hash hash;

  // "<height>-<HASH>"
  std::string ToString() const;
  static std::optional<Blockstamp> FromString(std::string_view str);

  auto operator<=>(const Blockstamp&) const = default;
  bool operator==(const Blockstamp&) const = default;
};

// Identifier of an unspent output. Transaction outputs are addressed by
// (tx hash, output index), dividends by (member, height).
struct UtxoId {
  enum class Kind : uint8_t { TRANSACTION = 0, DIVIDEND = 1 };

  Kind kind{Kind::TRANSACTION};
  Hash tx_hash;
  uint32_t output_index{0};
  PubKey member;
  BlockHeight height{0};

  static UtxoId Transaction(const Hash& tx_hash, uint32_t output_index);
  static UtxoId Dividend(const PubKey& member, BlockHeight height);

  // "T:<hash>:<index>" or "D:<pubkey>:<height>"
  std::string ToString() const;
  static std::optional<UtxoId> FromString(std::string_view str);

  auto operator<=>(const UtxoId&) const = default;
  bool operator==(const UtxoId&) const = default;
};

// Documents carried by a block. Signatures and document hashes are checked
// before a block reaches this core.

struct IdentityDoc {
  PubKey pubkey;
  std::string uid;
  Blockstamp blockstamp;

  bool operator==(const IdentityDoc&) const = default;
};

struct MembershipDoc {
  PubKey pubkey;
  Blockstamp blockstamp;

  bool operator==(const MembershipDoc&) const = default;
};

struct CertificationDoc {
  PubKey issuer;
  PubKey target;
  BlockHeight block_height{0};  // height the certification was signed against

  bool operator==(const CertificationDoc&) const = default;
};

struct RevocationDoc {
  PubKey pubkey;
  bool implicit{false};

  bool operator==(const RevocationDoc&) const = default;
};

// Adds `value` to `total`. Returns false, leaving `total` unchanged, when the
// sum does not fit in an int64_t.
bool AddAmount(int64_t& total, int64_t value);

struct TxOutput {
  int64_t amount{0};
  ConditionGroup conditions;

  bool operator==(const TxOutput&) const = default;
};

struct TransactionDoc {
  Hash hash;
  std::vector<UtxoId> inputs;
  std::vector<TxOutput> outputs;

  bool operator==(const TransactionDoc&) const = default;
};

// A block as accepted into the chain. Immutable once stored.
struct Block {
  BlockHeight height{0};
  Hash hash;
  Hash previous_hash;  // null for genesis
  PubKey issuer;
  std::optional<PubKey> previous_issuer;  // absent for genesis
  ProtocolVersion version{0};
  std::string currency;
  int64_t median_time{0};
  std::optional<int64_t> dividend;
  int64_t monetary_mass{0};

  std::vector<IdentityDoc> identities;
  std::vector<MembershipDoc> joiners;
  std::vector<MembershipDoc> actives;
  std::vector<MembershipDoc> leavers;
  std::vector<PubKey> excluded;
  std::vector<RevocationDoc> revoked;
  std::vector<CertificationDoc> certifications;
  std::vector<TransactionDoc> transactions;

  Blockstamp GetBlockstamp() const { return Blockstamp{height, hash}; }

  // Position this block extends. Meaningless for genesis.
  Blockstamp GetPreviousBlockstamp() const { return Blockstamp{height > 0 ? height - 1 : 0, previous_hash}; }

  bool IsGenesis() const { return height == 0; }

  bool operator==(const Block&) const = default;
};

// JSON codec (nlohmann ADL hooks). from_json throws nlohmann::json::exception
// or std::invalid_argument on malformed input; loaders catch and report.
void to_json(nlohmann::json& j, const Hash& hash);
void from_json(const nlohmann::json& j, Hash& hash);
void to_json(nlohmann::json& j, const Blockstamp& bs);
void from_json(const nlohmann::json& j, Blockstamp& bs);
void to_json(nlohmann::json& j, const UtxoId& id);
void from_json(const nlohmann::json& j, UtxoId& id);
void to_json(nlohmann::json& j, const Block& block);
void from_json(const nlohmann::json& j, Block& block);

}  // namespace trustledger
