// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "index/chain_index.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace trustledger {
namespace index {

// (issuer, target)
using TrustEdge = std::pair<PubKey, PubKey>;

// CertExpiryIndex - trust graph edges plus their expiry schedule.
//
// A certification signed against height C is scheduled in the bucket for
// height C + cert_validity_blocks, whatever block it is written in. Applying
// the block at that height removes every edge in its bucket from the trust
// graph; the bucket itself is kept so the removal can be reverted.
// Re-certifying an existing edge stacks (count). A block carrying a
// certification signed above its own height, or one already due, is refused
// with WRITE_ABORT.
class CertExpiryIndex : public ChainIndex {
public:
  const char* GetName() const override { return "certifications"; }
  bool Apply(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;
  bool Revert(const Block& block, const IndexContext& ctx, validation::ValidationState& state) override;

  // Edges scheduled to expire at `height`, in write order
  std::vector<TrustEdge> ExpiringAt(BlockHeight height) const;

  bool HasEdge(const PubKey& issuer, const PubKey& target) const;
  size_t GetEdgeCount() const { return edges_.size(); }

  // Certifications received by `target` that are still live
  std::vector<PubKey> GetCertifiersOf(const PubKey& target) const;

  // Drop buckets whose height is below `cutoff` (already applied and out of
  // the revert window). Returns number of buckets removed.
  size_t PruneBucketsBelow(BlockHeight cutoff);

  nlohmann::json ToJson() const;
  static CertExpiryIndex FromJson(const nlohmann::json& j);

private:
  // Bucket of `cert`, nullopt past the last block height
  static std::optional<BlockHeight> ExpiryHeight(const CertificationDoc& cert, const IndexContext& ctx);

  bool AddEdge(const TrustEdge& edge);
  bool RemoveEdge(const TrustEdge& edge);

  std::map<TrustEdge, uint32_t> edges_;
  std::map<BlockHeight, std::vector<TrustEdge>> expiry_;
};

}  // namespace index
}  // namespace trustledger
