// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/write_coordinator.hpp"
#include "chain/currency_params.hpp"
#include "index/chain_index.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

namespace trustledger {
namespace validation {

using chain::ChainState;

const char* SubmitStatusName(SubmitStatus status) {
  switch (status) {
  case SubmitStatus::ACCEPTED:
    return "accepted";
  case SubmitStatus::REJECTED:
    return "rejected";
  case SubmitStatus::BUFFERED:
    return "buffered";
  case SubmitStatus::FAILED:
    return "failed";
  }
  return "unknown";
}

// Helper: format block for logging (hash prefix @ height)
static std::string LogBlock(const Blockstamp& bs) {
  return fmt::format("{} @ {}", bs.hash.ToString().substr(0, 16), bs.height);
}

static BlockConnectedEvent MakeConnectedEvent(const Block& block) {
  return BlockConnectedEvent{block.GetBlockstamp(), block.median_time, block.transactions.size(), block.dividend};
}

WriteCoordinator::WriteCoordinator(const chain::CurrencyParams& params, RuleEngine rules)
    : params_(params), rules_(std::move(rules)), state_(std::make_shared<const ChainState>()) {}

// ---------------------------------------------------------------------------
// Publication
// ---------------------------------------------------------------------------

WriteCoordinator::StatePtr WriteCoordinator::Published() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return state_;
}

void WriteCoordinator::Publish(StatePtr head) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  state_ = std::move(head);
}

chain::ChainSnapshot WriteCoordinator::GetSnapshot() const {
  return chain::ChainSnapshot(Published());
}

bool WriteCoordinator::Transact(StatePtr& head, ValidationState& state,
                                const std::function<bool(ChainState&)>& step) {
  auto work = std::make_shared<ChainState>(*head);
  if (!step(*work)) {
    if (state.IsFatal()) {
      Halt(state, "write transaction failed");
    }
    return false;
  }
  head = std::move(work);
  return true;
}

void WriteCoordinator::MarkInvalid(StatePtr& head, const Blockstamp& bs) {
  if (head->invalid_blocks.count(bs) > 0) {
    return;
  }
  ValidationState unused;
  Transact(head, unused, [&](ChainState& work) {
    work.invalid_blocks.insert(bs);
    return true;
  });
}

// ---------------------------------------------------------------------------
// Writer health
// ---------------------------------------------------------------------------

bool WriteCoordinator::CheckWritable(ValidationState& state) const {
  if (halted_) {
    return state.Error(*halted_, fmt::format("writer halted ({})", StoreErrorName(*halted_)));
  }
  return true;
}

void WriteCoordinator::Halt(const ValidationState& state, const std::string& context) {
  if (halted_) {
    return;
  }
  halted_ = state.GetStoreError();
  LOG_CHAIN_ERROR("CRITICAL: {}: {}", context, state.ToString());
  Notifications().NotifyFatalError(fmt::format("{}: {}", context, state.ToString()),
                                   "Chain state is corrupted. Reset the data directory and re-import.");
}

void WriteCoordinator::Poison(const std::string& what) {
  halted_ = StoreError::POISONED_LOCK;
  LOG_CHAIN_ERROR("CRITICAL: exception during chain write, writer poisoned: {}", what);
  Notifications().NotifyFatalError(fmt::format("Exception during chain write: {}", what),
                                   "Chain writer stopped. Restart the node.");
}

bool WriteCoordinator::IsPoisoned() const {
  std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
  return halted_ == StoreError::POISONED_LOCK;
}

// ---------------------------------------------------------------------------
// Single block steps (run on a working copy)
// ---------------------------------------------------------------------------

bool WriteCoordinator::CheckBlockRules(const Block& block, const Block* previous, const ChainState& state,
                                       ValidationState& validation_state) const {
  const RuleReadContext ctx{&state.identities};
  return rules_.Validate(block, previous, ctx, validation_state);
}

bool WriteCoordinator::ConnectBlock(ChainState& work, const Block& block, ValidationState& state) const {
  const Blockstamp bs = block.GetBlockstamp();
  const Block* tip = work.blocks.GetTip();

  if (block.IsGenesis() && tip) {
    return state.Invalid("genesis-on-non-empty-chain", "chain already has blocks up to " + tip->GetBlockstamp().ToString());
  }
  if (block.currency != params_.currency_name) {
    return state.Invalid("bad-currency", fmt::format("block currency '{}', expected '{}'", block.currency,
                                                     params_.currency_name));
  }

  const Block* previous = nullptr;
  if (tip && tip->GetBlockstamp() == block.GetPreviousBlockstamp()) {
    previous = tip;
  }
  if (!CheckBlockRules(block, previous, work, state)) {
    return false;
  }

  // Held as a fork block until now
  std::shared_ptr<const Block> stored = work.blocks.GetSharedByBlockstamp(bs);
  if (stored && !work.blocks.IsMain(bs)) {
    if (auto fork_id = work.forks.ForkOfBlock(bs)) {
      work.forks.RemoveLink(*fork_id, block.GetPreviousBlockstamp());
    }
    work.blocks.RemoveFork(bs);
  } else {
    stored = std::make_shared<const Block>(block);
  }

  const index::IndexContext ctx = work.MakeIndexContext(params_);
  for (index::ChainIndex* idx : work.Indexes()) {
    if (!idx->Apply(block, ctx, state)) {
      LOG_CHAIN_DEBUG("ConnectBlock: {} rejected by index {}: {}", LogBlock(bs), idx->GetName(), state.ToString());
      return false;
    }
  }

  if (work.blocks.PutMain(stored) != chain::BlockRepository::PutResult::OK) {
    return state.Error(StoreError::WRITE_ABORT, "main chain already holds a different block at " + bs.ToString());
  }
  if (!block.IsGenesis()) {
    work.forks.RecordLink(chain::MAIN_FORK, block.GetPreviousBlockstamp(), block.hash);
  }
  return true;
}

bool WriteCoordinator::DisconnectTip(ChainState& work, std::shared_ptr<const Block>& reverted,
                                     ValidationState& state) const {
  const Block* tip = work.blocks.GetTip();
  if (!tip) {
    return state.Error(StoreError::CORRUPTION, "DisconnectTip: no tip to disconnect");
  }
  std::shared_ptr<const Block> block = work.blocks.GetMainShared(tip->height);

  // Current metadata reads block N-1, which must still be stored here
  const index::IndexContext ctx = work.MakeIndexContext(params_);
  auto indexes = work.Indexes();
  for (auto it = indexes.rbegin(); it != indexes.rend(); ++it) {
    ValidationState revert_state;
    if (!(*it)->Revert(*block, ctx, revert_state)) {
      return state.Error(StoreError::CORRUPTION, fmt::format("revert of {} failed in index {}: {}",
                                                             LogBlock(block->GetBlockstamp()), (*it)->GetName(),
                                                             revert_state.ToString()));
    }
  }

  work.blocks.RemoveMain(block->height);
  if (!block->IsGenesis()) {
    work.forks.RemoveLink(chain::MAIN_FORK, block->GetPreviousBlockstamp());
  }
  reverted = std::move(block);
  return true;
}

void WriteCoordinator::StoreForkBlock(ChainState& work, const Block& block, chain::ForkId fork_id) const {
  work.blocks.PutFork(block);
  work.forks.RecordLink(fork_id, block.GetPreviousBlockstamp(), block.hash);
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

SubmitOutcome WriteCoordinator::SubmitBlock(const Block& block, const Blockstamp& claimed_previous,
                                            ValidationState& state) {
  std::unique_lock<std::recursive_mutex> lock(validation_mutex_);
  SubmitOutcome outcome;
  if (!CheckWritable(state)) {
    outcome.status = SubmitStatus::FAILED;
    return outcome;
  }

  std::vector<PendingNotification> pending_events;
  StatePtr head = Published();
  const auto old_tip = head->blocks.GetTipBlockstamp();

  try {
    outcome = ProcessBlock(head, block, claimed_previous, pending_events, state);
  } catch (const std::exception& e) {
    Poison(e.what());
    state.Error(StoreError::POISONED_LOCK, e.what());
    outcome = SubmitOutcome{};
    outcome.status = SubmitStatus::FAILED;
    return outcome;
  }

  if (halted_) {
    if (!state.IsFatal()) {
      state.Error(*halted_, "writer halted while processing " + block.GetBlockstamp().ToString());
    }
    outcome = SubmitOutcome{};
    outcome.status = SubmitStatus::FAILED;
    return outcome;
  }

  Publish(head);

  const auto new_tip = head->blocks.GetTipBlockstamp();
  if (new_tip && new_tip != old_tip) {
    const bool reorganized =
        std::any_of(pending_events.begin(), pending_events.end(),
                    [](const PendingNotification& ev) { return ev.type == NotifyType::BlockDisconnected; });
    outcome.reorganized = outcome.reorganized || reorganized;
    PendingNotification tip_event{NotifyType::ChainTip, {}, {}, ChainTipEvent{*new_tip, reorganized}};
    pending_events.push_back(tip_event);
  }

  // Release lock, then dispatch notifications
  lock.unlock();
  DispatchNotifications(pending_events);
  return outcome;
}

SubmitOutcome WriteCoordinator::ProcessBlock(StatePtr& head, const Block& block, const Blockstamp& claimed_previous,
                                             std::vector<PendingNotification>& events, ValidationState& state) {
  SubmitOutcome outcome;
  outcome.status = SubmitStatus::REJECTED;

  const Blockstamp bs = block.GetBlockstamp();
  const Blockstamp prev = block.GetPreviousBlockstamp();

  if (!block.IsGenesis() && claimed_previous != prev) {
    state.Invalid("bad-claimed-previous",
                  fmt::format("claimed {}, block links to {}", claimed_previous.ToString(), prev.ToString()));
    return outcome;
  }
  if (head->blocks.AlreadyHave(bs) || orphans_.count(bs) > 0) {
    state.Invalid("already-have-block", bs.ToString());
    return outcome;
  }
  if (head->invalid_blocks.count(bs) > 0) {
    state.Invalid("invalid-block", bs.ToString() + " failed validation before");
    return outcome;
  }
  if (!block.IsGenesis() && head->invalid_blocks.count(prev) > 0) {
    MarkInvalid(head, bs);
    state.Invalid("bad-prevblk", "previous block " + prev.ToString() + " is invalid");
    return outcome;
  }

  const auto tip = head->blocks.GetTipBlockstamp();

  // Extends the main chain
  if (block.IsGenesis() || (tip && prev == *tip)) {
    if (!Transact(head, state, [&](ChainState& work) { return ConnectBlock(work, block, state); })) {
      if (state.IsError()) {
        outcome.status = SubmitStatus::FAILED;
      }
      LOG_CHAIN_DEBUG("Block {} refused: {}", LogBlock(bs), state.ToString());
      return outcome;
    }
    events.push_back(PendingNotification{NotifyType::BlockConnected, MakeConnectedEvent(block), {}, {}});
    LOG_CHAIN_INFO("UpdateTip: new best={} height={} version={} mass={} date='{}'", bs.hash.ToString().substr(0, 16),
                   bs.height, block.version, head->meta.GetMonetaryMass(), util::FormatTime(block.median_time));

    outcome.status = SubmitStatus::ACCEPTED;
    outcome.placement = Placement::MAIN;

    ProcessOrphans(head, bs, events);
    if (!halted_ && !AfterTipChange(head, events, state)) {
      outcome.status = SubmitStatus::FAILED;
    }
    return outcome;
  }

  // Extends a known non-tip block: fork
  const Block* parent = head->blocks.GetByBlockstamp(prev);
  if (parent) {
    if (tip && head->blocks.IsMain(prev) &&
        static_cast<uint64_t>(prev.height) + params_.fork_window_size < tip->height) {
      state.Invalid("out-of-fork-window", fmt::format("fork roots at {}, tip {}, window {}", prev.ToString(),
                                                      tip->ToString(), params_.fork_window_size));
      return outcome;
    }
    if (!rules_.ValidateLinkage(block, parent, state)) {
      // Stateless violations hold wherever the block would go
      MarkInvalid(head, bs);
      return outcome;
    }

    std::optional<chain::ForkId> fork_id;
    const bool stored = Transact(head, state, [&](ChainState& work) {
      fork_id = work.forks.AssignForkToNewBlock(prev, block.hash, params_.max_forks);
      if (!fork_id) {
        return false;
      }
      work.blocks.PutFork(block);
      return true;
    });
    if (!stored) {
      state.Invalid("too-many-forks", fmt::format("all {} fork slots in use", params_.max_forks));
      return outcome;
    }
    LOG_CHAIN_DEBUG("Stored fork block {} in fork {}", LogBlock(bs), *fork_id);

    outcome.status = SubmitStatus::ACCEPTED;
    outcome.placement = Placement::FORK;
    outcome.fork_id = fork_id;

    ProcessOrphans(head, bs, events);
    if (halted_) {
      outcome.status = SubmitStatus::FAILED;
      return outcome;
    }
    bool switched = false;
    if (!TryResolveForks(head, events, state, &switched) || (switched && !AfterTipChange(head, events, state))) {
      outcome.status = SubmitStatus::FAILED;
      return outcome;
    }
    outcome.reorganized = switched;
    return outcome;
  }

  // Parent unknown: buffer only if something sits at height N-1 already
  if (head->blocks.HasBlockAtHeight(prev.height) || HasOrphanAtHeight(prev.height)) {
    if (!TryAddOrphan(block)) {
      state.Invalid("orphan-pool-full", fmt::format("{} orphans held", orphans_.size()));
      return outcome;
    }
    LOG_CHAIN_DEBUG_RL("Buffered orphan {} (parent {} unknown)", LogBlock(bs), prev.ToString());
    outcome.status = SubmitStatus::BUFFERED;
    return outcome;
  }

  state.Invalid(RuleNumber::NO_PREVIOUS_BLOCK, "no-previous-block",
                fmt::format("nothing known at height {}", prev.height));
  return outcome;
}

bool WriteCoordinator::AfterTipChange(StatePtr& head, std::vector<PendingNotification>& events,
                                      ValidationState& state) {
  bool progressed = true;
  while (progressed) {
    progressed = false;
    const auto tip = head->blocks.GetTipBlockstamp();
    if (!tip) {
      break;
    }

    // Copies: `head` is replaced by every successful step
    std::vector<Block> candidates;
    for (const Block* block : head->forks.StackableBlocks(*tip, head->blocks)) {
      candidates.push_back(*block);
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const Block& a, const Block& b) { return a.hash < b.hash; });

    for (const Block& candidate : candidates) {
      if (head->invalid_blocks.count(candidate.GetBlockstamp()) > 0) {
        continue;
      }
      ValidationState block_state;
      if (Transact(head, block_state, [&](ChainState& work) { return ConnectBlock(work, candidate, block_state); })) {
        events.push_back(PendingNotification{NotifyType::BlockConnected, MakeConnectedEvent(candidate), {}, {}});
        LOG_CHAIN_INFO("UpdateTip: new best={} height={} version={} mass={} date='{}' (stacked from fork)",
                       candidate.hash.ToString().substr(0, 16), candidate.height, candidate.version,
                       head->meta.GetMonetaryMass(), util::FormatTime(candidate.median_time));
        progressed = true;
        break;
      }
      if (block_state.IsFatal()) {
        state = block_state;
        return false;
      }
      LOG_CHAIN_WARN_RL("Stackable fork block {} is invalid: {}", LogBlock(candidate.GetBlockstamp()),
                        block_state.ToString());
      MarkInvalid(head, candidate.GetBlockstamp());
    }

    if (!progressed) {
      bool switched = false;
      if (!TryResolveForks(head, events, state, &switched)) {
        return false;
      }
      progressed = switched;
    }
  }

  Prune(head);
  return true;
}

// ---------------------------------------------------------------------------
// Forks
// ---------------------------------------------------------------------------

std::optional<std::pair<std::vector<std::shared_ptr<const Block>>, Blockstamp>>
WriteCoordinator::CollectBranch(const ChainState& state, const Blockstamp& fork_head) const {
  std::vector<std::shared_ptr<const Block>> branch;
  Blockstamp cursor = fork_head;
  while (!state.blocks.IsMain(cursor)) {
    std::shared_ptr<const Block> block = state.blocks.GetSharedByBlockstamp(cursor);
    if (!block || block->IsGenesis()) {
      return std::nullopt;
    }
    branch.push_back(block);
    cursor = block->GetPreviousBlockstamp();
  }
  std::reverse(branch.begin(), branch.end());
  return std::make_pair(std::move(branch), cursor);
}

bool WriteCoordinator::TryResolveForks(StatePtr& head, std::vector<PendingNotification>& events,
                                       ValidationState& state, bool* switched) {
  *switched = false;
  const auto tip = head->blocks.GetTipBlockstamp();
  if (!tip) {
    return true;
  }

  const uint32_t advance_blocks = std::max<uint32_t>(1, params_.fork_advance_blocks);
  std::optional<Blockstamp> best;
  for (const chain::ForkInfo& info : head->forks.GetForks(*tip, params_.fork_window_size)) {
    if (info.status == chain::ForkStatus::FREE || info.status == chain::ForkStatus::TOO_OLD) {
      continue;
    }
    if (static_cast<uint64_t>(info.head.height) < static_cast<uint64_t>(tip->height) + advance_blocks) {
      continue;
    }
    const Block* head_block = head->blocks.GetFork(info.head);
    if (!head_block || head_block->median_time < head->meta.GetChainTime() + params_.fork_advance_time) {
      continue;
    }
    auto branch = CollectBranch(*head, info.head);
    if (!branch || static_cast<uint64_t>(branch->second.height) + params_.fork_window_size < tip->height) {
      continue;
    }
    const bool tainted = std::any_of(branch->first.begin(), branch->first.end(), [&](const auto& block) {
      return head->invalid_blocks.count(block->GetBlockstamp()) > 0;
    });
    if (tainted) {
      continue;
    }
    // GetForks is ordered by id, so ties keep the lowest id
    if (!best || info.head.height > best->height) {
      best = info.head;
    }
  }

  if (!best) {
    return true;
  }

  ValidationState reorg_state;
  if (ReorganizeTo(head, *best, events, reorg_state)) {
    *switched = true;
    return true;
  }
  if (reorg_state.IsFatal()) {
    state = reorg_state;
    return false;
  }
  // The failing block is now marked invalid; look again without it
  return TryResolveForks(head, events, state, switched);
}

bool WriteCoordinator::ReorganizeTo(StatePtr& head, const Blockstamp& fork_head,
                                    std::vector<PendingNotification>& events, ValidationState& state) {
  auto collected = CollectBranch(*head, fork_head);
  if (!collected) {
    return state.Invalid("fork-isolated", fork_head.ToString() + " does not reach the main chain");
  }
  const auto& branch = collected->first;
  const Blockstamp common = collected->second;
  const auto old_tip = head->blocks.GetTipBlockstamp();
  if (!old_tip) {
    return state.Invalid("no-main-chain");
  }
  if (static_cast<uint64_t>(common.height) + params_.fork_window_size < old_tip->height) {
    return state.Invalid("out-of-fork-window",
                         fmt::format("fork @ {}, tip {}", common.height, old_tip->ToString()));
  }
  for (const auto& block : branch) {
    if (head->invalid_blocks.count(block->GetBlockstamp()) > 0) {
      return state.Invalid("bad-fork-block", block->GetBlockstamp().ToString() + " is known invalid");
    }
  }

  std::vector<PendingNotification> reorg_events;
  std::optional<Blockstamp> failed_block;
  size_t disconnect_count = 0;

  const bool ok = Transact(head, state, [&](ChainState& work) {
    std::vector<std::shared_ptr<const Block>> demoted;
    while (work.blocks.GetTip() && work.blocks.GetTip()->height > common.height) {
      std::shared_ptr<const Block> reverted;
      if (!DisconnectTip(work, reverted, state)) {
        return false;
      }
      reorg_events.push_back(
          PendingNotification{NotifyType::BlockDisconnected, {}, BlockDisconnectedEvent{reverted->GetBlockstamp()}, {}});
      demoted.push_back(std::move(reverted));
    }
    disconnect_count = demoted.size();

    for (const auto& block : branch) {
      if (!ConnectBlock(work, *block, state)) {
        if (!state.IsFatal()) {
          failed_block = block->GetBlockstamp();
        }
        return false;
      }
      reorg_events.push_back(PendingNotification{NotifyType::BlockConnected, MakeConnectedEvent(*block), {}, {}});
    }

    // The old main blocks stay available as a fork rooted at the common block
    for (auto it = demoted.rbegin(); it != demoted.rend(); ++it) {
      const Block& old_block = **it;
      auto fork_id = work.forks.AssignForkToNewBlock(old_block.GetPreviousBlockstamp(), old_block.hash,
                                                     params_.max_forks);
      if (!fork_id) {
        LOG_CHAIN_WARN("REORGANIZE: no fork slot left, dropping {} old main blocks from {}",
                       std::distance(it, demoted.rend()), LogBlock(old_block.GetBlockstamp()));
        break;
      }
      work.blocks.PutFork(*it);
    }
    return true;
  });

  if (!ok) {
    if (failed_block) {
      LOG_CHAIN_WARN("REORGANIZE to {} aborted: block {} invalid ({})", LogBlock(fork_head),
                     LogBlock(*failed_block), state.ToString());
      MarkInvalid(head, *failed_block);
    }
    return false;
  }

  events.insert(events.end(), reorg_events.begin(), reorg_events.end());
  LOG_CHAIN_INFO("REORGANIZE: {} blocks disconnected, {} connected - old tip {}, new tip {}, fork @ {}",
                 disconnect_count, branch.size(), LogBlock(*old_tip), LogBlock(fork_head), common.height);
  return true;
}

// ---------------------------------------------------------------------------
// Orphans
// ---------------------------------------------------------------------------

void WriteCoordinator::ProcessOrphans(StatePtr& head, const Blockstamp& parent,
                                      std::vector<PendingNotification>& events) {
  std::vector<Blockstamp> ready;
  for (const auto& [bs, orphan] : orphans_) {
    if (orphan.block.GetPreviousBlockstamp() == parent) {
      ready.push_back(bs);
    }
  }

  for (const Blockstamp& bs : ready) {
    auto it = orphans_.find(bs);
    if (it == orphans_.end()) {
      continue;  // consumed by a nested replay
    }
    Block block = std::move(it->second.block);
    orphans_.erase(it);

    ValidationState orphan_state;
    const SubmitOutcome outcome = ProcessBlock(head, block, block.GetPreviousBlockstamp(), events, orphan_state);
    if (halted_) {
      return;
    }
    LOG_CHAIN_DEBUG("Replayed orphan {}: {} {}", LogBlock(bs), SubmitStatusName(outcome.status),
                    orphan_state.IsValid() ? "" : orphan_state.ToString());
  }
}

bool WriteCoordinator::TryAddOrphan(const Block& block) {
  if (orphans_.size() >= params_.max_orphan_blocks) {
    if (EvictOrphans() == 0) {
      return false;
    }
  }
  orphans_[block.GetBlockstamp()] = OrphanBlock{block, util::GetTime()};
  return true;
}

bool WriteCoordinator::HasOrphanAtHeight(BlockHeight height) const {
  return std::any_of(orphans_.begin(), orphans_.end(),
                     [height](const auto& entry) { return entry.first.height == height; });
}

size_t WriteCoordinator::EvictOrphans() {
  std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

  if (orphans_.empty()) {
    return 0;
  }

  const int64_t now = util::GetTime();
  size_t evicted_expired = 0;
  size_t evicted_oldest = 0;

  for (auto it = orphans_.begin(); it != orphans_.end();) {
    if (now - it->second.time_received > params_.orphan_expire_seconds) {
      it = orphans_.erase(it);
      evicted_expired++;
    } else {
      ++it;
    }
  }

  // If still at limit, evict oldest
  if (evicted_expired == 0 && orphans_.size() >= params_.max_orphan_blocks) {
    auto oldest = std::min_element(orphans_.begin(), orphans_.end(), [](const auto& a, const auto& b) {
      return a.second.time_received < b.second.time_received;
    });
    orphans_.erase(oldest);
    evicted_oldest++;
  }

  if (evicted_expired + evicted_oldest > 0) {
    LOG_CHAIN_DEBUG("Evicted {} orphan blocks ({} expired, {} oldest), {} left", evicted_expired + evicted_oldest,
                    evicted_expired, evicted_oldest, orphans_.size());
  }
  return evicted_expired + evicted_oldest;
}

size_t WriteCoordinator::GetOrphanCount() const {
  std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
  return orphans_.size();
}

// ---------------------------------------------------------------------------
// Pruning
// ---------------------------------------------------------------------------

void WriteCoordinator::Prune(StatePtr& head) {
  const auto tip = head->blocks.GetTipBlockstamp();
  if (!tip || tip->height <= params_.fork_window_size) {
    return;
  }
  const BlockHeight cutoff = tip->height - params_.fork_window_size;

  // Main chain bookkeeping below the cutoff is dropped a whole window at a time
  const bool stale_forks = head->forks.HasForksOlderThan(params_.fork_window_size, tip->height);
  const bool stale_invalid = !head->invalid_blocks.empty() && head->invalid_blocks.begin()->height < cutoff;
  const auto oldest_link = head->forks.GetOldestMainLinkHeight();
  const bool stale_history =
      oldest_link && static_cast<uint64_t>(*oldest_link) + params_.fork_window_size < cutoff;
  if (!stale_forks && !stale_invalid && !stale_history) {
    return;
  }

  ValidationState unused;
  Transact(head, unused, [&](ChainState& work) {
    size_t dropped = 0;
    for (const auto& [fork_id, blockstamps] : work.forks.PruneOlderThan(params_.fork_window_size, tip->height)) {
      for (const Blockstamp& bs : blockstamps) {
        dropped += work.blocks.RemoveFork(bs) ? 1 : 0;
      }
      LOG_CHAIN_DEBUG("Pruned fork {} ({} links) below the window", fork_id, blockstamps.size());
    }
    dropped += work.blocks.PruneForkBlocksBelow(cutoff);
    work.forks.PruneMainLinksBelow(cutoff);
    work.balances.PruneConsumedBelow(cutoff);
    work.certifications.PruneBucketsBelow(cutoff);
    for (auto it = work.invalid_blocks.begin(); it != work.invalid_blocks.end();) {
      it = it->height < cutoff ? work.invalid_blocks.erase(it) : std::next(it);
    }
    if (dropped > 0) {
      LOG_CHAIN_DEBUG("Pruned {} fork blocks below height {}", dropped, cutoff);
    }
    return true;
  });
}

// ---------------------------------------------------------------------------
// Direct write primitives
// ---------------------------------------------------------------------------

bool WriteCoordinator::ApplyBlock(const Block& block, chain::ForkId fork_hint, ValidationState& state) {
  std::unique_lock<std::recursive_mutex> lock(validation_mutex_);
  if (!CheckWritable(state)) {
    return false;
  }

  std::vector<PendingNotification> pending_events;
  StatePtr head = Published();
  const Blockstamp bs = block.GetBlockstamp();

  try {
    if (head->blocks.AlreadyHave(bs)) {
      return state.Invalid("already-have-block", bs.ToString());
    }

    if (fork_hint == chain::MAIN_FORK) {
      if (!Transact(head, state, [&](ChainState& work) { return ConnectBlock(work, block, state); })) {
        return false;
      }
      pending_events.push_back(PendingNotification{NotifyType::BlockConnected, MakeConnectedEvent(block), {}, {}});
      pending_events.push_back(PendingNotification{NotifyType::ChainTip, {}, {}, ChainTipEvent{bs, false}});
      LOG_CHAIN_INFO("UpdateTip: new best={} height={} version={} mass={} date='{}'",
                     bs.hash.ToString().substr(0, 16), bs.height, block.version, head->meta.GetMonetaryMass(),
                     util::FormatTime(block.median_time));
    } else {
      const Block* parent = head->blocks.GetByBlockstamp(block.GetPreviousBlockstamp());
      if (!parent) {
        return state.Invalid(RuleNumber::NO_PREVIOUS_BLOCK, "no-previous-block",
                             block.GetPreviousBlockstamp().ToString() + " unknown");
      }
      if (!rules_.ValidateLinkage(block, parent, state)) {
        return false;
      }
      if (!Transact(head, state, [&](ChainState& work) {
            StoreForkBlock(work, block, fork_hint);
            return true;
          })) {
        return false;
      }
    }
  } catch (const std::exception& e) {
    Poison(e.what());
    return state.Error(StoreError::POISONED_LOCK, e.what());
  }

  Publish(head);
  lock.unlock();
  DispatchNotifications(pending_events);
  return true;
}

bool WriteCoordinator::Reorganize(chain::ForkId fork_id, ValidationState& state) {
  std::unique_lock<std::recursive_mutex> lock(validation_mutex_);
  if (!CheckWritable(state)) {
    return false;
  }

  std::vector<PendingNotification> pending_events;
  StatePtr head = Published();

  const auto fork_head = head->forks.GetForkHead(fork_id);
  if (fork_id == chain::MAIN_FORK || !fork_head) {
    return state.Invalid("unknown-fork", fmt::format("fork {} holds no blocks", fork_id));
  }

  try {
    if (!ReorganizeTo(head, *fork_head, pending_events, state)) {
      if (!halted_) {
        Publish(head);  // keeps the invalid mark of the failing block
      }
      return false;
    }
    Prune(head);
  } catch (const std::exception& e) {
    Poison(e.what());
    return state.Error(StoreError::POISONED_LOCK, e.what());
  }

  Publish(head);
  pending_events.push_back(PendingNotification{NotifyType::ChainTip, {}, {}, ChainTipEvent{*fork_head, true}});

  lock.unlock();
  DispatchNotifications(pending_events);
  return true;
}

bool WriteCoordinator::RevertTip(ValidationState& state) {
  std::unique_lock<std::recursive_mutex> lock(validation_mutex_);
  if (!CheckWritable(state)) {
    return false;
  }

  std::vector<PendingNotification> pending_events;
  StatePtr head = Published();
  if (head->blocks.Empty()) {
    return state.Invalid("empty-chain", "no block to revert");
  }

  try {
    std::shared_ptr<const Block> reverted;
    if (!Transact(head, state, [&](ChainState& work) { return DisconnectTip(work, reverted, state); })) {
      return false;
    }
    LOG_CHAIN_INFO("RevertTip: reverted {}", LogBlock(reverted->GetBlockstamp()));
    pending_events.push_back(
        PendingNotification{NotifyType::BlockDisconnected, {}, BlockDisconnectedEvent{reverted->GetBlockstamp()}, {}});
    if (const auto new_tip = head->blocks.GetTipBlockstamp()) {
      pending_events.push_back(PendingNotification{NotifyType::ChainTip, {}, {}, ChainTipEvent{*new_tip, false}});
    }
  } catch (const std::exception& e) {
    Poison(e.what());
    return state.Error(StoreError::POISONED_LOCK, e.what());
  }

  Publish(head);
  lock.unlock();
  DispatchNotifications(pending_events);
  return true;
}

// ---------------------------------------------------------------------------
// Read side
// ---------------------------------------------------------------------------

std::vector<chain::ForkInfo> WriteCoordinator::GetForks() const {
  const StatePtr state = Published();
  const auto tip = state->blocks.GetTipBlockstamp();
  if (!tip) {
    return {};
  }
  return state->forks.GetForks(*tip, params_.fork_window_size);
}

bool WriteCoordinator::IsKnownInvalid(const Blockstamp& bs) const {
  return Published()->invalid_blocks.count(bs) > 0;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void WriteCoordinator::Reset() {
  std::lock_guard<std::recursive_mutex> lock(validation_mutex_);
  Publish(std::make_shared<const ChainState>());
  orphans_.clear();
  halted_.reset();
  LOG_CHAIN_INFO("Chain state reset to an empty chain");
}

chain::LoadResult WriteCoordinator::Load(const std::string& filepath) {
  std::lock_guard<std::recursive_mutex> lock(validation_mutex_);

  std::error_code ec;
  if (!std::filesystem::exists(filepath, ec)) {
    LOG_CHAIN_TRACE("Chain state file not found: {}", filepath);
    return chain::LoadResult::FILE_NOT_FOUND;
  }

  const auto content = util::read_file_string(filepath);
  if (!content) {
    LOG_CHAIN_ERROR("Failed to read chain state file: {}", filepath);
    return chain::LoadResult::CORRUPTED;
  }

  try {
    const nlohmann::json root = nlohmann::json::parse(*content);
    auto loaded = std::make_shared<const ChainState>(ChainState::FromJson(root));
    const auto tip = loaded->blocks.GetTipBlockstamp();
    LOG_CHAIN_INFO("Loaded chain state: tip {}, {} main blocks, {} fork blocks, {} forks",
                   tip ? LogBlock(*tip) : "none", loaded->blocks.GetMainCount(), loaded->blocks.GetForkCount(),
                   loaded->forks.GetForkCount());
    Publish(std::move(loaded));
    orphans_.clear();
    halted_.reset();
    return chain::LoadResult::SUCCESS;
  } catch (const std::exception& e) {
    LOG_CHAIN_ERROR("Chain state file {} is corrupted: {}", filepath, e.what());
    return chain::LoadResult::CORRUPTED;
  }
}

bool WriteCoordinator::Save(const std::string& filepath) const {
  const StatePtr state = Published();
  try {
    const std::string data = state->ToJson().dump(2);
    if (!util::atomic_write_file(filepath, data)) {
      LOG_CHAIN_ERROR("Failed to write chain state to {}", filepath);
      return false;
    }
    LOG_CHAIN_DEBUG("Saved chain state ({} main blocks) to {}", state->blocks.GetMainCount(), filepath);
    return true;
  } catch (const std::exception& e) {
    LOG_CHAIN_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

// ---------------------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------------------

void WriteCoordinator::DispatchNotifications(const std::vector<PendingNotification>& events) {
  for (const auto& ev : events) {
    switch (ev.type) {
    case NotifyType::BlockConnected:
      Notifications().NotifyBlockConnected(ev.block_event);
      break;
    case NotifyType::BlockDisconnected:
      Notifications().NotifyBlockDisconnected(ev.disconnect_event);
      break;
    case NotifyType::ChainTip:
      Notifications().NotifyChainTip(ev.tip_event);
      break;
    }
  }
}

}  // namespace validation
}  // namespace trustledger
