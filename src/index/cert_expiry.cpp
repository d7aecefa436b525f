// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "index/cert_expiry.hpp"

#include "chain/currency_params.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <iterator>
#include <limits>
#include <stdexcept>

namespace trustledger {
namespace index {

using validation::StoreError;
using validation::ValidationState;

bool CertExpiryIndex::AddEdge(const TrustEdge& edge) {
  edges_[edge] += 1;
  return true;
}

bool CertExpiryIndex::RemoveEdge(const TrustEdge& edge) {
  auto it = edges_.find(edge);
  if (it == edges_.end()) {
    return false;
  }
  if (--it->second == 0) {
    edges_.erase(it);
  }
  return true;
}

std::optional<BlockHeight> CertExpiryIndex::ExpiryHeight(const CertificationDoc& cert, const IndexContext& ctx) {
  const uint64_t height = static_cast<uint64_t>(cert.block_height) + ctx.params.cert_validity_blocks;
  if (height > std::numeric_limits<BlockHeight>::max()) {
    return std::nullopt;
  }
  return static_cast<BlockHeight>(height);
}

bool CertExpiryIndex::Apply(const Block& block, const IndexContext& ctx, ValidationState& state) {
  for (const auto& cert : block.certifications) {
    const auto expiry_height = ExpiryHeight(cert, ctx);
    if (cert.block_height > block.height || !expiry_height || *expiry_height <= block.height) {
      return state.Error(StoreError::WRITE_ABORT, fmt::format("certification {} -> {} signed at height {} is not "
                                                              "live at height {}",
                                                              cert.issuer, cert.target, cert.block_height,
                                                              block.height));
    }
  }

  // Expire first: edges scheduled for this height leave the graph
  auto due = expiry_.find(block.height);
  if (due != expiry_.end()) {
    for (const auto& edge : due->second) {
      if (!RemoveEdge(edge)) {
        return state.Error(StoreError::CORRUPTION,
                           "scheduled certification " + edge.first + " -> " + edge.second + " not in trust graph");
      }
    }
    LOG_INDEX_DEBUG("Expired {} certifications at height {}", due->second.size(), block.height);
  }

  for (const auto& cert : block.certifications) {
    TrustEdge edge{cert.issuer, cert.target};
    AddEdge(edge);
    expiry_[*ExpiryHeight(cert, ctx)].push_back(std::move(edge));
  }
  return true;
}

bool CertExpiryIndex::Revert(const Block& block, const IndexContext& ctx, ValidationState& state) {
  // Buckets fill in block order, so this block's entries are at their backs
  for (auto cert = block.certifications.rbegin(); cert != block.certifications.rend(); ++cert) {
    const TrustEdge edge{cert->issuer, cert->target};
    const auto expiry_height = ExpiryHeight(*cert, ctx);
    auto bucket = expiry_height ? expiry_.find(*expiry_height) : expiry_.end();
    if (bucket == expiry_.end() || bucket->second.empty() || bucket->second.back() != edge || !RemoveEdge(edge)) {
      return state.Error(StoreError::CORRUPTION, fmt::format("certification {} -> {} signed at height {} not "
                                                             "scheduled for expiry",
                                                             edge.first, edge.second, cert->block_height));
    }
    bucket->second.pop_back();
    if (bucket->second.empty()) {
      expiry_.erase(bucket);
    }
  }

  auto due = expiry_.find(block.height);
  if (due != expiry_.end()) {
    for (const auto& edge : due->second) {
      AddEdge(edge);
    }
  }
  return true;
}

std::vector<TrustEdge> CertExpiryIndex::ExpiringAt(BlockHeight height) const {
  auto it = expiry_.find(height);
  return it == expiry_.end() ? std::vector<TrustEdge>{} : it->second;
}

bool CertExpiryIndex::HasEdge(const PubKey& issuer, const PubKey& target) const {
  return edges_.count(TrustEdge{issuer, target}) > 0;
}

std::vector<PubKey> CertExpiryIndex::GetCertifiersOf(const PubKey& target) const {
  std::vector<PubKey> out;
  for (const auto& [edge, count] : edges_) {
    if (edge.second == target) {
      out.push_back(edge.first);
    }
  }
  return out;
}

size_t CertExpiryIndex::PruneBucketsBelow(BlockHeight cutoff) {
  auto end = expiry_.lower_bound(cutoff);
  size_t removed = std::distance(expiry_.begin(), end);
  expiry_.erase(expiry_.begin(), end);
  return removed;
}

nlohmann::json CertExpiryIndex::ToJson() const {
  using json = nlohmann::json;
  json edges = json::array();
  for (const auto& [edge, count] : edges_) {
    edges.push_back(json{{"issuer", edge.first}, {"target", edge.second}, {"count", count}});
  }
  json schedule = json::array();
  for (const auto& [height, bucket] : expiry_) {
    json pairs = json::array();
    for (const auto& edge : bucket) {
      pairs.push_back(json::array({edge.first, edge.second}));
    }
    schedule.push_back(json{{"height", height}, {"edges", std::move(pairs)}});
  }
  return json{{"edges", std::move(edges)}, {"expiry", std::move(schedule)}};
}

CertExpiryIndex CertExpiryIndex::FromJson(const nlohmann::json& j) {
  CertExpiryIndex index;
  for (const auto& entry : j.at("edges")) {
    const uint32_t count = entry.at("count").get<uint32_t>();
    if (count == 0) {
      throw std::runtime_error("trust edge with zero count");
    }
    index.edges_[TrustEdge{entry.at("issuer").get<PubKey>(), entry.at("target").get<PubKey>()}] = count;
  }
  for (const auto& entry : j.at("expiry")) {
    auto& bucket = index.expiry_[entry.at("height").get<BlockHeight>()];
    for (const auto& pair : entry.at("edges")) {
      bucket.emplace_back(pair.at(0).get<PubKey>(), pair.at(1).get<PubKey>());
    }
  }
  return index;
}

}  // namespace index
}  // namespace trustledger
