// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

namespace trustledger {

namespace chain {
class BlockRepository;
class CurrencyParams;
}  // namespace chain

namespace validation {
class ValidationState;
}

namespace index {

class IdentityIndex;

// Read-only view handed to indexes during apply/revert. Refers to the
// working copy being mutated, not to the published state.
struct IndexContext {
  const chain::CurrencyParams& params;
  const chain::BlockRepository& blocks;
  const IdentityIndex& identities;
};

// Derived secondary index maintained block by block.
//
// Apply and Revert are an exact inverse pair: Revert(B) after Apply(B)
// restores the index to its previous state. Only the write coordinator
// calls them, in height order for Apply and reverse height order for Revert.
//
// A false return from Apply (state.Error(WRITE_ABORT) or CORRUPTION) aborts
// the enclosing transaction. A false return from Revert is always corruption.
class ChainIndex {
public:
  virtual ~ChainIndex() = default;

  virtual const char* GetName() const = 0;
  virtual bool Apply(const Block& block, const IndexContext& ctx, validation::ValidationState& state) = 0;
  virtual bool Revert(const Block& block, const IndexContext& ctx, validation::ValidationState& state) = 0;

protected:
  // Indexes are copied whole when the writer forks a working state
  ChainIndex() = default;
  ChainIndex(const ChainIndex&) = default;
  ChainIndex(ChainIndex&&) = default;
  ChainIndex& operator=(const ChainIndex&) = default;
  ChainIndex& operator=(ChainIndex&&) = default;
};

}  // namespace index
}  // namespace trustledger
