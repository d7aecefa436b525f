// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/block_repository.hpp"

#include "util/logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace trustledger {
namespace chain {

BlockRepository::PutResult BlockRepository::PutMain(std::shared_ptr<const Block> block) {
  auto it = main_.find(block->height);
  if (it != main_.end()) {
    if (it->second->hash == block->hash) {
      return PutResult::OK;
    }
    LOG_STORAGE_WARN("PutMain: height {} already holds {}, refusing {}", block->height,
                     it->second->hash.ToString().substr(0, 16), block->hash.ToString().substr(0, 16));
    return PutResult::CONFLICT;
  }
  LOG_STORAGE_TRACE("PutMain: {}", block->GetBlockstamp().ToString());
  main_.emplace(block->height, std::move(block));
  return PutResult::OK;
}

void BlockRepository::PutFork(std::shared_ptr<const Block> block) {
  LOG_STORAGE_TRACE("PutFork: {}", block->GetBlockstamp().ToString());
  forks_[block->GetBlockstamp()] = std::move(block);
}

const Block* BlockRepository::GetMain(BlockHeight height) const {
  auto it = main_.find(height);
  return it == main_.end() ? nullptr : it->second.get();
}

std::shared_ptr<const Block> BlockRepository::GetMainShared(BlockHeight height) const {
  auto it = main_.find(height);
  return it == main_.end() ? nullptr : it->second;
}

const Block* BlockRepository::GetByBlockstamp(const Blockstamp& bs) const {
  return GetSharedByBlockstamp(bs).get();
}

std::shared_ptr<const Block> BlockRepository::GetSharedByBlockstamp(const Blockstamp& bs) const {
  auto main_it = main_.find(bs.height);
  if (main_it != main_.end() && main_it->second->hash == bs.hash) {
    return main_it->second;
  }
  auto fork_it = forks_.find(bs);
  return fork_it == forks_.end() ? nullptr : fork_it->second;
}

const Block* BlockRepository::GetFork(const Blockstamp& bs) const {
  auto it = forks_.find(bs);
  return it == forks_.end() ? nullptr : it->second.get();
}

bool BlockRepository::RemoveMain(BlockHeight height) {
  return main_.erase(height) > 0;
}

bool BlockRepository::RemoveFork(const Blockstamp& bs) {
  return forks_.erase(bs) > 0;
}

std::vector<const Block*> BlockRepository::RangeMain(BlockHeight from, BlockHeight to) const {
  std::vector<const Block*> out;
  if (from > to) {
    return out;
  }
  for (auto it = main_.lower_bound(from); it != main_.end() && it->first <= to; ++it) {
    out.push_back(it->second.get());
  }
  return out;
}

const Block* BlockRepository::GetTip() const {
  return main_.empty() ? nullptr : main_.rbegin()->second.get();
}

std::optional<Blockstamp> BlockRepository::GetTipBlockstamp() const {
  const Block* tip = GetTip();
  if (!tip) {
    return std::nullopt;
  }
  return tip->GetBlockstamp();
}

bool BlockRepository::IsMain(const Blockstamp& bs) const {
  auto it = main_.find(bs.height);
  return it != main_.end() && it->second->hash == bs.hash;
}

bool BlockRepository::HasBlockAtHeight(BlockHeight height) const {
  if (main_.count(height) > 0) {
    return true;
  }
  auto it = forks_.lower_bound(Blockstamp{height, Hash{}});
  return it != forks_.end() && it->first.height == height;
}

size_t BlockRepository::PruneForkBlocksBelow(BlockHeight cutoff) {
  size_t removed = 0;
  auto end = forks_.lower_bound(Blockstamp{cutoff, Hash{}});
  for (auto it = forks_.begin(); it != end;) {
    it = forks_.erase(it);
    ++removed;
  }
  if (removed > 0) {
    LOG_STORAGE_DEBUG("Pruned {} fork blocks below height {}", removed, cutoff);
  }
  return removed;
}

nlohmann::json BlockRepository::ToJson() const {
  using json = nlohmann::json;
  json main_blocks = json::array();
  for (const auto& [height, block] : main_) {
    main_blocks.push_back(*block);
  }
  json fork_blocks = json::array();
  for (const auto& [bs, block] : forks_) {
    fork_blocks.push_back(*block);
  }
  return json{{"main", std::move(main_blocks)}, {"fork", std::move(fork_blocks)}};
}

BlockRepository BlockRepository::FromJson(const nlohmann::json& j) {
  BlockRepository repo;

  std::optional<Blockstamp> previous;
  for (const auto& entry : j.at("main")) {
    auto block = std::make_shared<const Block>(entry.get<Block>());
    // Main blocks must form one contiguous linked chain from genesis
    if (!previous) {
      if (!block->IsGenesis()) {
        throw std::runtime_error("main chain does not start at genesis");
      }
    } else if (block->GetPreviousBlockstamp() != *previous) {
      throw std::runtime_error("main chain broken at " + block->GetBlockstamp().ToString());
    }
    previous = block->GetBlockstamp();
    repo.main_.emplace(block->height, std::move(block));
  }

  for (const auto& entry : j.at("fork")) {
    auto block = std::make_shared<const Block>(entry.get<Block>());
    repo.forks_[block->GetBlockstamp()] = std::move(block);
  }
  return repo;
}

}  // namespace chain
}  // namespace trustledger
