// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/types.hpp"

#include <algorithm>

namespace chainsync {
namespace sync {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

bool Hash256::IsNull() const {
  return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

std::string Hash256::ToHex() const {
  std::string out;
  out.reserve(SIZE * 2);
  for (uint8_t b : data_) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}

Hash256 Hash256::FromHex(const std::string& hex) {
  Hash256 result;
  if (hex.size() != SIZE * 2) {
    return result;
  }
  std::array<uint8_t, SIZE> bytes{};
  for (size_t i = 0; i < SIZE; ++i) {
    int hi = HexValue(hex[2 * i]);
    int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return result;
    }
    bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return Hash256(bytes);
}

std::string BlockHeader::ShortDescr() const {
  return "#" + std::to_string(number) + " (" + hash.ShortHex() + ")";
}

}  // namespace sync
}  // namespace chainsync
