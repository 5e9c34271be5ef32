// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/chain_generator.hpp"

#include <array>
#include <random>
#include <stdexcept>
#include <string>

namespace chainsync {
namespace sim {

namespace {

// Fill a 32-byte hash from a generator seeded by the chain seed, the block number and
// the parent hash, so a block's hash commits to its ancestry.
sync::Hash256 DeriveHash(uint64_t seed, uint64_t number, const sync::Hash256& parent) {
  std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32), static_cast<uint32_t>(number),
                    static_cast<uint32_t>(number >> 32), static_cast<uint32_t>(parent.begin()[0]),
                    static_cast<uint32_t>(parent.begin()[1]), static_cast<uint32_t>(parent.begin()[2]),
                    static_cast<uint32_t>(parent.begin()[3])};
  std::mt19937_64 rng(seq);

  std::array<uint8_t, sync::Hash256::SIZE> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    const uint64_t word = rng();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(word >> (8 * j));
    }
  }
  // Never produce the null hash
  bytes[0] |= 0x01;
  return sync::Hash256(bytes);
}

}  // namespace

ChainGenerator::ChainGenerator(uint64_t height, uint64_t seed) {
  blocks_.reserve(height + 1);
  std::mt19937_64 rng(seed);

  sync::Hash256 parent;
  for (uint64_t number = 0; number <= height; ++number) {
    sync::Block block;
    sync::BlockHeader& header = block.header;
    header.number = number;
    header.parent_hash = parent;
    header.timestamp = GENESIS_TIMESTAMP + number * BLOCK_INTERVAL;
    header.difficulty = BASE_DIFFICULTY + rng() % 1024;
    header.gas_limit = GAS_LIMIT;

    const size_t tx_count = number == 0 ? 0 : rng() % 4;
    for (size_t i = 0; i < tx_count; ++i) {
      std::vector<uint8_t> tx(16 + rng() % 48);
      for (auto& byte : tx) {
        byte = static_cast<uint8_t>(rng());
      }
      block.transactions.push_back(std::move(tx));
    }
    header.gas_used = tx_count * 21000;

    const std::string tag = "sim/" + std::to_string(seed);
    header.extra_data.assign(tag.begin(), tag.end());
    if (header.extra_data.size() > 32) {
      header.extra_data.resize(32);
    }

    header.hash = DeriveHash(seed, number, parent);
    parent = header.hash;

    index_.emplace(header.hash, number);
    blocks_.push_back(std::move(block));
  }
}

const sync::Block& ChainGenerator::GetBlock(uint64_t number) const {
  if (!Has(number)) {
    throw std::out_of_range("ChainGenerator: no block #" + std::to_string(number));
  }
  return blocks_[number];
}

std::optional<uint64_t> ChainGenerator::NumberOf(const sync::Hash256& hash) const {
  auto it = index_.find(hash);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<sync::BlockHeader> ChainGenerator::Headers(uint64_t start, uint32_t count, uint32_t step,
                                                       bool reverse) const {
  std::vector<sync::BlockHeader> out;
  if (step == 0) {
    step = 1;
  }

  uint64_t number = start;
  while (out.size() < count && Has(number)) {
    out.push_back(blocks_[number].header);
    if (reverse) {
      if (number < step) {
        break;
      }
      number -= step;
    } else {
      number += step;
    }
  }
  return out;
}

}  // namespace sim
}  // namespace chainsync
