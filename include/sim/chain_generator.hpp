// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace chainsync {
namespace sim {

// ChainGenerator - deterministic chain of blocks 0..height for simulated peers
//
// Block 0 is the genesis block. Every header passes CompositeHeaderValidator::CreateDefault()
// and links to its parent by hash. The same (height, seed) always yields the same chain.
class ChainGenerator {
public:
  static constexpr uint64_t GAS_LIMIT = 8000000;
  static constexpr uint64_t BASE_DIFFICULTY = 131072;
  static constexpr uint64_t GENESIS_TIMESTAMP = 1700000000;
  static constexpr uint64_t BLOCK_INTERVAL = 13;

  ChainGenerator(uint64_t height, uint64_t seed);

  uint64_t Height() const { return blocks_.size() - 1; }
  bool Has(uint64_t number) const { return number < blocks_.size(); }

  // Throws std::out_of_range past Height()
  const sync::Block& GetBlock(uint64_t number) const;
  const sync::BlockHeader& GetHeader(uint64_t number) const { return GetBlock(number).header; }

  std::optional<uint64_t> NumberOf(const sync::Hash256& hash) const;

  // Up to count headers starting at `start`, `step` numbers apart (step 0 is treated as 1),
  // descending when reverse is set. Stops at either end of the chain.
  std::vector<sync::BlockHeader> Headers(uint64_t start, uint32_t count, uint32_t step, bool reverse) const;

private:
  std::vector<sync::Block> blocks_;
  std::map<sync::Hash256, uint64_t> index_;
};

}  // namespace sim
}  // namespace chainsync
