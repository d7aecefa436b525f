// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/block_repository.hpp"
#include "chain/chain_state.hpp"
#include "chain/fork_tracker.hpp"
#include "chain/notifications.hpp"
#include "chain/rule_engine.hpp"
#include "chain/validation.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustledger {

namespace chain {
class CurrencyParams;
}

namespace validation {

enum class SubmitStatus {
  ACCEPTED,  // stored (main chain or fork)
  REJECTED,  // rule violation or submission policy; see state
  BUFFERED,  // parent unknown, held in the orphan pool
  FAILED     // storage error; see state.GetStoreError()
};

enum class Placement { NONE, MAIN, FORK };

struct SubmitOutcome {
  SubmitStatus status{SubmitStatus::REJECTED};
  Placement placement{Placement::NONE};
  std::optional<chain::ForkId> fork_id;  // FORK placement only
  bool reorganized{false};               // the submission switched the main chain to a fork
};

const char* SubmitStatusName(SubmitStatus status);

// WriteCoordinator - single writer over the chain state.
//
// Every mutation runs under validation_mutex_ on a private copy of the
// published ChainState; a finished step replaces the copy it started from and
// the last copy is published with one pointer swap. Readers take a
// ChainSnapshot and never wait on the writer.
//
// Failures:
// - rule violations and policy rejections leave the state untouched
// - WRITE_ABORT discards the working copy of the failing block only
// - CORRUPTION halts the writer; every later write fails with CORRUPTION
// - an exception escaping a write poisons the writer (POISONED_LOCK)
// Fatal conditions are logged and sent through Notifications().NotifyFatalError.
class WriteCoordinator {
public:
  // LIFETIME: CurrencyParams reference must outlive this WriteCoordinator
  explicit WriteCoordinator(const chain::CurrencyParams& params,
                            RuleEngine rules = RuleEngine::CreateDefault());
  virtual ~WriteCoordinator() = default;

  WriteCoordinator(const WriteCoordinator&) = delete;
  WriteCoordinator& operator=(const WriteCoordinator&) = delete;

  // Entry point for blocks from peers or local production. `claimed_previous`
  // is the position the sender says the block extends.
  SubmitOutcome SubmitBlock(const Block& block, const Blockstamp& claimed_previous, ValidationState& state);

  // Store `block` on the main chain (fork_hint == MAIN_FORK; the block must
  // extend the tip, rules and every index run in one transaction) or on fork
  // `fork_hint` (stateless rules, fork storage and fork link only).
  bool ApplyBlock(const Block& block, chain::ForkId fork_hint, ValidationState& state);

  // Switch the main chain to the highest block of `fork_id`: revert main
  // blocks above the common ancestor (descending), apply the fork blocks
  // (ascending). Either the whole switch is published or nothing is.
  bool Reorganize(chain::ForkId fork_id, ValidationState& state);

  // Revert the main chain tip and drop it from the repository
  bool RevertTip(ValidationState& state);

  // Consistent read handle over the last published state
  chain::ChainSnapshot GetSnapshot() const;

  std::optional<Blockstamp> GetTipBlockstamp() const { return GetSnapshot().GetCurrentBlockstamp(); }

  std::vector<chain::ForkInfo> GetForks() const;

  bool IsKnownInvalid(const Blockstamp& bs) const;

  size_t GetOrphanCount() const;

  // Remove expired orphans (and the oldest one when the pool is full).
  // Returns number evicted.
  size_t EvictOrphans();

  // Replace the whole state with an empty chain
  void Reset();

  chain::LoadResult Load(const std::string& filepath);
  bool Save(const std::string& filepath) const;

  // Set after an exception escaped a write
  bool IsPoisoned() const;

  const chain::CurrencyParams& GetParams() const { return params_; }
  const RuleEngine& GetRules() const { return rules_; }

protected:
  // Full rule check of `block` on top of `previous` against `state`
  // (virtual for test injection)
  virtual bool CheckBlockRules(const Block& block, const Block* previous, const chain::ChainState& state,
                               ValidationState& validation_state) const;

private:
  using StatePtr = std::shared_ptr<const chain::ChainState>;

  enum class NotifyType { BlockConnected, BlockDisconnected, ChainTip };
  struct PendingNotification {
    NotifyType type;
    BlockConnectedEvent block_event;
    BlockDisconnectedEvent disconnect_event;
    ChainTipEvent tip_event;
  };

  struct OrphanBlock {
    Block block;
    int64_t time_received;
  };

  // Run `step` on a private copy of `head`; on success the copy becomes `head`.
  // A fatal error reported by `step` through `state` halts the writer.
  bool Transact(StatePtr& head, ValidationState& state, const std::function<bool(chain::ChainState&)>& step);

  // Remember `bs` as invalid in `head`
  void MarkInvalid(StatePtr& head, const Blockstamp& bs);

  // Guard every public write: halted or poisoned writer refuses work
  bool CheckWritable(ValidationState& state) const;

  // Record a fatal condition seen by the last write
  void Halt(const ValidationState& state, const std::string& context);
  void Poison(const std::string& what);

  void Publish(StatePtr head);
  StatePtr Published() const;

  SubmitOutcome ProcessBlock(StatePtr& head, const Block& block, const Blockstamp& claimed_previous,
                             std::vector<PendingNotification>& events, ValidationState& state);

  // Apply `block` on top of the tip of `work`: rules, repository, fork 0 link,
  // indexes. Removes the block from fork storage if it was held there.
  bool ConnectBlock(chain::ChainState& work, const Block& block, ValidationState& state) const;

  // Revert the tip of `work`; the block is returned through `reverted`
  bool DisconnectTip(chain::ChainState& work, std::shared_ptr<const Block>& reverted, ValidationState& state) const;

  // Store a non-canonical block under fork `fork_id`
  void StoreForkBlock(chain::ChainState& work, const Block& block, chain::ForkId fork_id) const;

  // After the tip moved: connect stackable fork blocks, replay orphans,
  // switch to a winning fork, prune. Returns false only on storage errors.
  bool AfterTipChange(StatePtr& head, std::vector<PendingNotification>& events, ValidationState& state);

  // Switch to the best eligible fork if one beats the tip
  bool TryResolveForks(StatePtr& head, std::vector<PendingNotification>& events, ValidationState& state,
                       bool* switched);

  bool ReorganizeTo(StatePtr& head, const Blockstamp& fork_head, std::vector<PendingNotification>& events,
                    ValidationState& state);

  // Fork blocks from the main chain up to `fork_head`, ascending, and the
  // common ancestor. std::nullopt when the branch does not reach the main chain.
  std::optional<std::pair<std::vector<std::shared_ptr<const Block>>, Blockstamp>>
  CollectBranch(const chain::ChainState& state, const Blockstamp& fork_head) const;

  // Replay orphans waiting on `parent`. Their outcomes are logged, not returned.
  void ProcessOrphans(StatePtr& head, const Blockstamp& parent, std::vector<PendingNotification>& events);
  bool TryAddOrphan(const Block& block);
  bool HasOrphanAtHeight(BlockHeight height) const;

  void Prune(StatePtr& head);

  void DispatchNotifications(const std::vector<PendingNotification>& events);

  const chain::CurrencyParams& params_;
  RuleEngine rules_;

  // Published state, swapped under snapshot_mutex_
  StatePtr state_;
  mutable std::mutex snapshot_mutex_;

  // Orphans keyed by their own blockstamp
  std::map<Blockstamp, OrphanBlock> orphans_;

  std::optional<StoreError> halted_;

  // THREAD SAFETY: serializes all writes
  // Protected: orphans_, halted_, publication of state_
  // Readers use GetSnapshot() and never take this lock
  mutable std::recursive_mutex validation_mutex_;
};

}  // namespace validation
}  // namespace trustledger
