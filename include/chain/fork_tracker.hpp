// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace trustledger {
namespace chain {

class BlockRepository;

using ForkId = uint32_t;

// Fork 0 holds the main chain linkage
inline constexpr ForkId MAIN_FORK = 0;

enum class ForkStatus {
  FREE,       // no links
  STACKABLE,  // extends the current tip directly
  ROLLBACK,   // roots on the main chain below the tip, within the window
  TOO_OLD,    // roots on the main chain deeper than the window
  ISOLATE     // no root on the main chain known
};

const char* ForkStatusName(ForkStatus status);

struct ForkInfo {
  ForkId id{0};
  ForkStatus status{ForkStatus::FREE};
  BlockHeight common_height{0};  // ROLLBACK only: highest main block the fork roots on
  Blockstamp head;               // highest block of the fork
  size_t length{0};              // number of links
};

// ForkTracker - arena of forks, each a flat map previous-blockstamp -> hash
// of the block extending it. No node objects, no back pointers.
//
// THREAD SAFETY: NO internal synchronization (lives inside ChainState).
class ForkTracker {
public:
  using Links = std::map<Blockstamp, Hash>;

  void RecordLink(ForkId fork_id, const Blockstamp& previous, const Hash& next_hash);
  bool RemoveLink(ForkId fork_id, const Blockstamp& previous);

  // Fork (id >= 1) that already has a block extending `previous`
  std::optional<ForkId> ForkContaining(const Blockstamp& previous) const;

  // Fork (id >= 1) holding the block `bs`
  std::optional<ForkId> ForkOfBlock(const Blockstamp& bs) const;

  // Place a new non-canonical block. Continues the fork whose last link is the
  // block's parent; otherwise opens the lowest free fork id. std::nullopt when
  // all `max_forks` ids are taken.
  std::optional<ForkId> AssignForkToNewBlock(const Blockstamp& previous, const Hash& hash, uint32_t max_forks);

  // Fork blocks (all forks >= 1) whose previous blockstamp is `current`
  std::vector<const Block*> StackableBlocks(const Blockstamp& current, const BlockRepository& repo) const;

  // Forks (>= 1) with a link from `current`
  std::vector<ForkId> StackableForks(const Blockstamp& current) const;

  ForkStatus GetForkStatus(ForkId fork_id, const Blockstamp& current, uint32_t window_size,
                           BlockHeight* common_height = nullptr) const;

  // Every fork >= 1 with its status
  std::vector<ForkInfo> GetForks(const Blockstamp& current, uint32_t window_size) const;

  // Head of a fork (highest linked block), std::nullopt if empty or unknown
  std::optional<Blockstamp> GetForkHead(ForkId fork_id) const;

  // Delete the fork and return the blockstamps of the blocks it linked.
  std::vector<Blockstamp> DeleteFork(ForkId fork_id);

  // Drop forks whose head is more than `window_size` below `canonical_height`.
  // Returns the removed fork ids with their block blockstamps.
  std::map<ForkId, std::vector<Blockstamp>> PruneOlderThan(uint32_t window_size, BlockHeight canonical_height);
  bool HasForksOlderThan(uint32_t window_size, BlockHeight canonical_height) const;

  // Drop main chain links whose previous height is below `cutoff`
  size_t PruneMainLinksBelow(BlockHeight cutoff);
  std::optional<BlockHeight> GetOldestMainLinkHeight() const;

  // True when the main chain links `bs` to a successor or `bs` is the tip
  bool IsMainPosition(const Blockstamp& bs, const std::optional<Blockstamp>& tip) const;

  const Links* GetLinks(ForkId fork_id) const;
  size_t GetForkCount() const;  // excluding the main chain entry

  nlohmann::json ToJson() const;
  static ForkTracker FromJson(const nlohmann::json& j);

  bool operator==(const ForkTracker&) const = default;

private:
  // Head more than `window_size` below `canonical_height`, or no links left
  bool IsStale(ForkId fork_id, uint32_t window_size, BlockHeight canonical_height) const;

  std::map<ForkId, Links> forks_;
};

}  // namespace chain
}  // namespace trustledger
