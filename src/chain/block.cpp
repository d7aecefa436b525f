// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/block.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <stdexcept>

namespace trustledger {

namespace {

template <typename T>
std::optional<T> ParseUnsigned(std::string_view str) {
  if (str.empty()) {
    return std::nullopt;
  }
  T value{};
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

// Document lists are optional in the JSON form; absent means empty.
template <typename T>
void ReadList(const nlohmann::json& j, const char* key, std::vector<T>& out) {
  out.clear();
  if (!j.contains(key)) {
    return;
  }
  for (const auto& item : j.at(key)) {
    out.push_back(item.get<T>());
  }
}

}  // namespace

bool AddAmount(int64_t& total, int64_t value) {
  int64_t sum = 0;
  if (__builtin_add_overflow(total, value, &sum)) {
    return false;
  }
  total = sum;
  return true;
}

ConditionGroup SingleSigCondition(const PubKey& pubkey) {
  return "SIG(" + pubkey + ")";
}

std::string Blockstamp::ToString() const {
  return std::to_string(height) + "-" + hash.ToString();
}

std::optional<Blockstamp> Blockstamp::FromString(std::string_view str) {
  const auto dash = str.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  auto height = ParseUnsigned<BlockHeight>(str.substr(0, dash));
  auto hash = Hash::FromHex(str.substr(dash + 1));
  if (!height || !hash) {
    return std::nullopt;
  }
  return Blockstamp{*height, *hash};
}

UtxoId UtxoId::Transaction(const Hash& tx_hash, uint32_t output_index) {
  UtxoId id;
  id.kind = Kind::TRANSACTION;
  id.tx_hash = tx_hash;
  id.output_index = output_index;
  return id;
}

UtxoId UtxoId::Dividend(const PubKey& member, BlockHeight height) {
  UtxoId id;
  id.kind = Kind::DIVIDEND;
  id.member = member;
  id.height = height;
  return id;
}

std::string UtxoId::ToString() const {
  if (kind == Kind::DIVIDEND) {
    return "D:" + member + ":" + std::to_string(height);
  }
  return "T:" + tx_hash.ToString() + ":" + std::to_string(output_index);
}

std::optional<UtxoId> UtxoId::FromString(std::string_view str) {
  if (str.size() < 4 || str[1] != ':') {
    return std::nullopt;
  }
  const auto last = str.rfind(':');
  if (last <= 2) {
    return std::nullopt;
  }
  const std::string_view middle = str.substr(2, last - 2);
  const std::string_view tail = str.substr(last + 1);

  if (str[0] == 'T') {
    auto hash = Hash::FromHex(middle);
    auto index = ParseUnsigned<uint32_t>(tail);
    if (!hash || !index) {
      return std::nullopt;
    }
    return Transaction(*hash, *index);
  }
  if (str[0] == 'D') {
    auto height = ParseUnsigned<BlockHeight>(tail);
    if (!height) {
      return std::nullopt;
    }
    return Dividend(PubKey(middle), *height);
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Hash& hash) {
  j = hash.ToString();
}

void from_json(const nlohmann::json& j, Hash& hash) {
  auto parsed = Hash::FromHex(j.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument("invalid hash: " + j.get<std::string>());
  }
  hash = *parsed;
}

void to_json(nlohmann::json& j, const Blockstamp& bs) {
  j = bs.ToString();
}

void from_json(const nlohmann::json& j, Blockstamp& bs) {
  auto parsed = Blockstamp::FromString(j.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument("invalid blockstamp: " + j.get<std::string>());
  }
  bs = *parsed;
}

void to_json(nlohmann::json& j, const UtxoId& id) {
  j = id.ToString();
}

void from_json(const nlohmann::json& j, UtxoId& id) {
  auto parsed = UtxoId::FromString(j.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument("invalid utxo id: " + j.get<std::string>());
  }
  id = *parsed;
}

void to_json(nlohmann::json& j, const IdentityDoc& doc) {
  j = nlohmann::json{{"pubkey", doc.pubkey}, {"uid", doc.uid}, {"blockstamp", doc.blockstamp}};
}

void from_json(const nlohmann::json& j, IdentityDoc& doc) {
  doc.pubkey = j.at("pubkey").get<PubKey>();
  doc.uid = j.at("uid").get<std::string>();
  doc.blockstamp = j.at("blockstamp").get<Blockstamp>();
}

void to_json(nlohmann::json& j, const MembershipDoc& doc) {
  j = nlohmann::json{{"pubkey", doc.pubkey}, {"blockstamp", doc.blockstamp}};
}

void from_json(const nlohmann::json& j, MembershipDoc& doc) {
  doc.pubkey = j.at("pubkey").get<PubKey>();
  doc.blockstamp = j.at("blockstamp").get<Blockstamp>();
}

void to_json(nlohmann::json& j, const CertificationDoc& doc) {
  j = nlohmann::json{{"issuer", doc.issuer}, {"target", doc.target}, {"block_height", doc.block_height}};
}

void from_json(const nlohmann::json& j, CertificationDoc& doc) {
  doc.issuer = j.at("issuer").get<PubKey>();
  doc.target = j.at("target").get<PubKey>();
  doc.block_height = j.at("block_height").get<BlockHeight>();
}

void to_json(nlohmann::json& j, const RevocationDoc& doc) {
  j = nlohmann::json{{"pubkey", doc.pubkey}, {"implicit", doc.implicit}};
}

void from_json(const nlohmann::json& j, RevocationDoc& doc) {
  doc.pubkey = j.at("pubkey").get<PubKey>();
  doc.implicit = j.value("implicit", false);
}

void to_json(nlohmann::json& j, const TxOutput& out) {
  j = nlohmann::json{{"amount", out.amount}, {"conditions", out.conditions}};
}

void from_json(const nlohmann::json& j, TxOutput& out) {
  out.amount = j.at("amount").get<int64_t>();
  out.conditions = j.at("conditions").get<ConditionGroup>();
}

void to_json(nlohmann::json& j, const TransactionDoc& tx) {
  j = nlohmann::json{{"hash", tx.hash}, {"inputs", tx.inputs}, {"outputs", tx.outputs}};
}

void from_json(const nlohmann::json& j, TransactionDoc& tx) {
  tx.hash = j.at("hash").get<Hash>();
  ReadList(j, "inputs", tx.inputs);
  ReadList(j, "outputs", tx.outputs);
}

void to_json(nlohmann::json& j, const Block& block) {
  j = nlohmann::json::object();
  j["height"] = block.height;
  j["hash"] = block.hash;
  j["previous_hash"] = block.previous_hash;
  j["issuer"] = block.issuer;
  j["previous_issuer"] = block.previous_issuer ? nlohmann::json(*block.previous_issuer) : nlohmann::json(nullptr);
  j["version"] = block.version;
  j["currency"] = block.currency;
  j["median_time"] = block.median_time;
  j["dividend"] = block.dividend ? nlohmann::json(*block.dividend) : nlohmann::json(nullptr);
  j["monetary_mass"] = block.monetary_mass;
  j["identities"] = block.identities;
  j["joiners"] = block.joiners;
  j["actives"] = block.actives;
  j["leavers"] = block.leavers;
  j["excluded"] = block.excluded;
  j["revoked"] = block.revoked;
  j["certifications"] = block.certifications;
  j["transactions"] = block.transactions;
}

void from_json(const nlohmann::json& j, Block& block) {
  block.height = j.at("height").get<BlockHeight>();
  block.hash = j.at("hash").get<Hash>();
  if (j.contains("previous_hash") && !j.at("previous_hash").is_null()) {
    block.previous_hash = j.at("previous_hash").get<Hash>();
  } else {
    block.previous_hash.SetNull();
  }
  block.issuer = j.at("issuer").get<PubKey>();
  if (j.contains("previous_issuer") && !j.at("previous_issuer").is_null()) {
    block.previous_issuer = j.at("previous_issuer").get<PubKey>();
  } else {
    block.previous_issuer.reset();
  }
  block.version = j.at("version").get<ProtocolVersion>();
  block.currency = j.value("currency", std::string{});
  block.median_time = j.value("median_time", int64_t{0});
  if (j.contains("dividend") && !j.at("dividend").is_null()) {
    block.dividend = j.at("dividend").get<int64_t>();
  } else {
    block.dividend.reset();
  }
  block.monetary_mass = j.value("monetary_mass", int64_t{0});

  ReadList(j, "identities", block.identities);
  ReadList(j, "joiners", block.joiners);
  ReadList(j, "actives", block.actives);
  ReadList(j, "leavers", block.leavers);
  ReadList(j, "excluded", block.excluded);
  ReadList(j, "revoked", block.revoked);
  ReadList(j, "certifications", block.certifications);
  ReadList(j, "transactions", block.transactions);
}

}  // namespace trustledger
