// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <vector>

namespace chainsync {
namespace sync {

// Node identity of a remote peer. Stable for the lifetime of a connection; a peer that
// reconnects keeps its identity, which lets block requests be routed back to the peer
// that supplied a header.
using PeerId = std::string;

// 256-bit hash value
class Hash256 {
public:
  static constexpr size_t SIZE = 32;

  Hash256() { data_.fill(0); }
  explicit Hash256(const std::array<uint8_t, SIZE>& bytes) : data_(bytes) {}

  bool IsNull() const;
  void SetNull() { data_.fill(0); }

  // Lowercase hex, most significant byte first
  std::string ToHex() const;
  // First 8 hex characters, for log lines
  std::string ShortHex() const { return ToHex().substr(0, 8); }

  // Parses 64 hex characters; returns a null hash on malformed input.
  static Hash256 FromHex(const std::string& hex);

  uint8_t* begin() { return data_.data(); }
  uint8_t* end() { return data_.data() + SIZE; }
  const uint8_t* begin() const { return data_.data(); }
  const uint8_t* end() const { return data_.data() + SIZE; }

  auto operator<=>(const Hash256&) const = default;

private:
  std::array<uint8_t, SIZE> data_;
};

struct BlockHeader {
  uint64_t number{0};
  Hash256 hash;
  Hash256 parent_hash;
  uint64_t timestamp{0};
  uint64_t difficulty{0};
  uint64_t gas_limit{0};
  uint64_t gas_used{0};
  std::vector<uint8_t> extra_data;

  // "#<number> (<hash prefix>)"
  std::string ShortDescr() const;

  bool operator==(const BlockHeader&) const = default;
};

struct Block {
  BlockHeader header;
  std::vector<std::vector<uint8_t>> transactions;  // opaque encoded transactions
  std::vector<BlockHeader> uncles;

  uint64_t Number() const { return header.number; }
  const Hash256& Hash() const { return header.hash; }
  std::string ShortDescr() const { return header.ShortDescr(); }

  bool operator==(const Block&) const = default;
};

// A validated header together with the peer that supplied it
struct HeaderEnvelope {
  BlockHeader header;
  PeerId origin;
};

// A block accepted by the pending-work queue together with the peer that supplied it
struct BlockEnvelope {
  Block block;
  PeerId origin;
};

}  // namespace sync
}  // namespace chainsync
