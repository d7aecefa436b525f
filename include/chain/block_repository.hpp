// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace trustledger {
namespace chain {

// Result of loading chain state from disk
enum class LoadResult {
  SUCCESS,         // Loaded successfully
  FILE_NOT_FOUND,  // File doesn't exist (OK to start fresh)
  CORRUPTED        // File exists but is corrupted/invalid (FATAL - requires manual intervention)
};

// BlockRepository - storage for main-chain blocks (by height) and for blocks
// of not-yet-canonical forks (by blockstamp, since forks share heights).
//
// THREAD SAFETY: NO internal synchronization. A repository lives inside a
// ChainState; the published state is immutable and the writer mutates only
// its private working copy. Blocks are held by shared_ptr so that copying a
// repository does not copy block bodies.
//
// Does not touch indexes or fork links.
class BlockRepository {
public:
  enum class PutResult {
    OK,
    CONFLICT  // a different block already occupies that height
  };

  // Store a block on the main chain at block.height. Storing the identical
  // block again is a no-op returning OK.
  PutResult PutMain(std::shared_ptr<const Block> block);
  PutResult PutMain(const Block& block) { return PutMain(std::make_shared<const Block>(block)); }

  // Store a non-canonical block keyed by its blockstamp
  void PutFork(std::shared_ptr<const Block> block);
  void PutFork(const Block& block) { PutFork(std::make_shared<const Block>(block)); }

  // nullptr if absent
  const Block* GetMain(BlockHeight height) const;
  std::shared_ptr<const Block> GetMainShared(BlockHeight height) const;

  // Main chain first, then fork storage. nullptr if absent.
  const Block* GetByBlockstamp(const Blockstamp& bs) const;
  std::shared_ptr<const Block> GetSharedByBlockstamp(const Blockstamp& bs) const;

  // Fork storage only
  const Block* GetFork(const Blockstamp& bs) const;

  // Used only by revert and reorganization. Return false when absent.
  bool RemoveMain(BlockHeight height);
  bool RemoveFork(const Blockstamp& bs);

  // Main blocks with from <= height <= to, ascending
  std::vector<const Block*> RangeMain(BlockHeight from, BlockHeight to) const;

  const Block* GetTip() const;
  std::optional<Blockstamp> GetTipBlockstamp() const;

  bool IsMain(const Blockstamp& bs) const;
  bool AlreadyHave(const Blockstamp& bs) const { return GetByBlockstamp(bs) != nullptr; }

  // True when any stored block (main or fork) has this height
  bool HasBlockAtHeight(BlockHeight height) const;

  // Drop fork-stored blocks with height < cutoff. Returns number removed.
  size_t PruneForkBlocksBelow(BlockHeight cutoff);

  size_t GetMainCount() const { return main_.size(); }
  size_t GetForkCount() const { return forks_.size(); }
  bool Empty() const { return main_.empty(); }

  nlohmann::json ToJson() const;
  // Throws on malformed input (caller reports CORRUPTED)
  static BlockRepository FromJson(const nlohmann::json& j);

private:
  std::map<BlockHeight, std::shared_ptr<const Block>> main_;
  std::map<Blockstamp, std::shared_ptr<const Block>> forks_;
};

}  // namespace chain
}  // namespace trustledger
