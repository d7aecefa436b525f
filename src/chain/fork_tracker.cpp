// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/fork_tracker.hpp"

#include "chain/block_repository.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace trustledger {
namespace chain {

namespace {

Blockstamp NextOf(const Blockstamp& previous, const Hash& hash) {
  return Blockstamp{previous.height + 1, hash};
}

}  // namespace

const char* ForkStatusName(ForkStatus status) {
  switch (status) {
  case ForkStatus::FREE:
    return "free";
  case ForkStatus::STACKABLE:
    return "stackable";
  case ForkStatus::ROLLBACK:
    return "rollback";
  case ForkStatus::TOO_OLD:
    return "too-old";
  case ForkStatus::ISOLATE:
    return "isolate";
  }
  return "unknown";
}

void ForkTracker::RecordLink(ForkId fork_id, const Blockstamp& previous, const Hash& next_hash) {
  forks_[fork_id][previous] = next_hash;
}

bool ForkTracker::RemoveLink(ForkId fork_id, const Blockstamp& previous) {
  auto it = forks_.find(fork_id);
  if (it == forks_.end()) {
    return false;
  }
  const bool removed = it->second.erase(previous) > 0;
  if (it->second.empty()) {
    forks_.erase(it);
  }
  return removed;
}

std::optional<ForkId> ForkTracker::ForkContaining(const Blockstamp& previous) const {
  for (const auto& [id, links] : forks_) {
    if (id != MAIN_FORK && links.count(previous) > 0) {
      return id;
    }
  }
  return std::nullopt;
}

std::optional<ForkId> ForkTracker::ForkOfBlock(const Blockstamp& bs) const {
  if (bs.height == 0) {
    return std::nullopt;
  }
  for (const auto& [id, links] : forks_) {
    if (id == MAIN_FORK) {
      continue;
    }
    // Links are keyed by previous blockstamp; the block's own key sits one below
    auto lo = links.lower_bound(Blockstamp{bs.height - 1, Hash{}});
    for (auto it = lo; it != links.end() && it->first.height == bs.height - 1; ++it) {
      if (it->second == bs.hash) {
        return id;
      }
    }
  }
  return std::nullopt;
}

std::optional<ForkId> ForkTracker::AssignForkToNewBlock(const Blockstamp& previous, const Hash& hash,
                                                        uint32_t max_forks) {
  // Continue a fork that ends at (or passes through) the parent
  for (auto& [id, links] : forks_) {
    if (id == MAIN_FORK || links.count(previous) > 0) {
      continue;
    }
    for (const auto& [prev, next] : links) {
      if (NextOf(prev, next) == previous) {
        links.emplace(previous, hash);
        return id;
      }
    }
  }

  for (ForkId id = 1; id <= max_forks; ++id) {
    auto it = forks_.find(id);
    if (it == forks_.end() || it->second.empty()) {
      forks_[id] = Links{{previous, hash}};
      LOG_CHAIN_DEBUG("Opened fork {} at {}", id, previous.ToString());
      return id;
    }
  }

  LOG_CHAIN_WARN_RL("All {} fork slots taken, dropping block {}", max_forks, NextOf(previous, hash).ToString());
  return std::nullopt;
}

std::vector<const Block*> ForkTracker::StackableBlocks(const Blockstamp& current,
                                                       const BlockRepository& repo) const {
  std::vector<const Block*> out;
  for (const auto& [id, links] : forks_) {
    if (id == MAIN_FORK) {
      continue;
    }
    auto it = links.find(current);
    if (it == links.end()) {
      continue;
    }
    if (const Block* block = repo.GetFork(NextOf(current, it->second))) {
      out.push_back(block);
    }
  }
  return out;
}

std::vector<ForkId> ForkTracker::StackableForks(const Blockstamp& current) const {
  std::vector<ForkId> out;
  for (const auto& [id, links] : forks_) {
    if (id != MAIN_FORK && links.count(current) > 0) {
      out.push_back(id);
    }
  }
  return out;
}

bool ForkTracker::IsMainPosition(const Blockstamp& bs, const std::optional<Blockstamp>& tip) const {
  if (tip && bs == *tip) {
    return true;
  }
  auto it = forks_.find(MAIN_FORK);
  return it != forks_.end() && it->second.count(bs) > 0;
}

ForkStatus ForkTracker::GetForkStatus(ForkId fork_id, const Blockstamp& current, uint32_t window_size,
                                      BlockHeight* common_height) const {
  auto it = forks_.find(fork_id);
  if (fork_id == MAIN_FORK || it == forks_.end() || it->second.empty()) {
    return ForkStatus::FREE;
  }
  const Links& links = it->second;
  if (links.count(current) > 0) {
    if (common_height) *common_height = current.height;
    return ForkStatus::STACKABLE;
  }

  const BlockHeight rollback_floor = current.height > window_size ? current.height - window_size : 0;
  std::optional<BlockHeight> best_common;
  bool below_window = false;
  for (const auto& [previous, next] : links) {
    if (!IsMainPosition(previous, current)) {
      continue;
    }
    if (previous.height >= rollback_floor) {
      if (!best_common || previous.height > *best_common) {
        best_common = previous.height;
      }
    } else {
      below_window = true;
    }
  }

  if (best_common) {
    if (common_height) *common_height = *best_common;
    return ForkStatus::ROLLBACK;
  }
  return below_window ? ForkStatus::TOO_OLD : ForkStatus::ISOLATE;
}

std::vector<ForkInfo> ForkTracker::GetForks(const Blockstamp& current, uint32_t window_size) const {
  std::vector<ForkInfo> out;
  for (const auto& [id, links] : forks_) {
    if (id == MAIN_FORK) {
      continue;
    }
    ForkInfo info;
    info.id = id;
    info.status = GetForkStatus(id, current, window_size, &info.common_height);
    info.head = GetForkHead(id).value_or(Blockstamp{});
    info.length = links.size();
    out.push_back(info);
  }
  return out;
}

std::optional<Blockstamp> ForkTracker::GetForkHead(ForkId fork_id) const {
  auto it = forks_.find(fork_id);
  if (it == forks_.end() || it->second.empty()) {
    return std::nullopt;
  }
  // Highest previous blockstamp; ties between sibling links resolve to the
  // lowest hash, which is stable across restarts.
  const Links& links = it->second;
  auto last = std::prev(links.end());
  auto first_at_height = links.lower_bound(Blockstamp{last->first.height, Hash{}});
  return NextOf(first_at_height->first, first_at_height->second);
}

std::vector<Blockstamp> ForkTracker::DeleteFork(ForkId fork_id) {
  std::vector<Blockstamp> blocks;
  auto it = forks_.find(fork_id);
  if (fork_id == MAIN_FORK || it == forks_.end()) {
    return blocks;
  }
  for (const auto& [previous, next] : it->second) {
    blocks.push_back(NextOf(previous, next));
  }
  forks_.erase(it);
  return blocks;
}

bool ForkTracker::IsStale(ForkId fork_id, uint32_t window_size, BlockHeight canonical_height) const {
  if (fork_id == MAIN_FORK) {
    return false;
  }
  auto head = GetForkHead(fork_id);
  return !head || static_cast<uint64_t>(head->height) + window_size < canonical_height;
}

bool ForkTracker::HasForksOlderThan(uint32_t window_size, BlockHeight canonical_height) const {
  return std::any_of(forks_.begin(), forks_.end(), [&](const auto& entry) {
    return IsStale(entry.first, window_size, canonical_height);
  });
}

std::map<ForkId, std::vector<Blockstamp>> ForkTracker::PruneOlderThan(uint32_t window_size,
                                                                     BlockHeight canonical_height) {
  std::vector<ForkId> stale;
  for (const auto& [id, links] : forks_) {
    if (IsStale(id, window_size, canonical_height)) {
      stale.push_back(id);
    }
  }

  std::map<ForkId, std::vector<Blockstamp>> removed;
  for (ForkId id : stale) {
    removed[id] = DeleteFork(id);
    LOG_CHAIN_DEBUG("Pruned fork {} ({} blocks) behind height {}", id, removed[id].size(), canonical_height);
  }
  return removed;
}

size_t ForkTracker::PruneMainLinksBelow(BlockHeight cutoff) {
  auto it = forks_.find(MAIN_FORK);
  if (it == forks_.end()) {
    return 0;
  }
  auto end = it->second.lower_bound(Blockstamp{cutoff, Hash{}});
  size_t removed = std::distance(it->second.begin(), end);
  it->second.erase(it->second.begin(), end);
  return removed;
}

std::optional<BlockHeight> ForkTracker::GetOldestMainLinkHeight() const {
  auto it = forks_.find(MAIN_FORK);
  if (it == forks_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.begin()->first.height;
}

const ForkTracker::Links* ForkTracker::GetLinks(ForkId fork_id) const {
  auto it = forks_.find(fork_id);
  return it == forks_.end() ? nullptr : &it->second;
}

size_t ForkTracker::GetForkCount() const {
  size_t count = 0;
  for (const auto& [id, links] : forks_) {
    if (id != MAIN_FORK && !links.empty()) {
      ++count;
    }
  }
  return count;
}

nlohmann::json ForkTracker::ToJson() const {
  using json = nlohmann::json;
  json forks = json::array();
  for (const auto& [id, links] : forks_) {
    json entries = json::array();
    for (const auto& [previous, next] : links) {
      entries.push_back(json{{"previous", previous}, {"hash", next}});
    }
    forks.push_back(json{{"id", id}, {"links", std::move(entries)}});
  }
  return forks;
}

ForkTracker ForkTracker::FromJson(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::runtime_error("'forks' is not an array");
  }
  ForkTracker tracker;
  for (const auto& fork : j) {
    const ForkId id = fork.at("id").get<ForkId>();
    if (tracker.forks_.count(id) > 0) {
      throw std::runtime_error("duplicate fork id " + std::to_string(id));
    }
    Links& links = tracker.forks_[id];
    for (const auto& link : fork.at("links")) {
      links[link.at("previous").get<Blockstamp>()] = link.at("hash").get<Hash>();
    }
  }
  return tracker;
}

}  // namespace chain
}  // namespace trustledger
