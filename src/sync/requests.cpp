// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/requests.hpp"

#include <algorithm>
#include <stdexcept>

namespace chainsync {
namespace sync {

HeaderRangeRequest::HeaderRangeRequest(uint64_t start, uint32_t count, bool reverse)
    : start_(start), count_(count), reverse_(reverse) {
  if (count == 0) {
    throw std::invalid_argument("header range request with zero count");
  }
}

HeaderRangeRequest::HeaderRangeRequest(const Hash256& hash, uint64_t start, uint32_t count, uint32_t step,
                                       bool reverse)
    : start_(start), hash_(hash), count_(count), step_(step), reverse_(reverse) {
  if (count == 0) {
    throw std::invalid_argument("header range request with zero count");
  }
}

std::string HeaderRangeRequest::ToString() const {
  std::string out = "headers[";
  if (hash_) {
    out += hash_->ShortHex() + " step=" + std::to_string(step_);
  } else {
    out += std::to_string(start_);
  }
  out += " count=" + std::to_string(count_);
  if (reverse_) {
    out += " reverse";
  }
  out += "]";
  return out;
}

std::vector<BodyBatchRequest> BodyBatchRequest::Split(size_t max_size) const {
  std::vector<BodyBatchRequest> parts;
  if (max_size == 0) {
    throw std::invalid_argument("body batch split size must be positive");
  }
  for (size_t offset = 0; offset < headers_.size(); offset += max_size) {
    const size_t end = std::min(offset + max_size, headers_.size());
    parts.emplace_back(std::vector<HeaderEnvelope>(headers_.begin() + static_cast<std::ptrdiff_t>(offset),
                                                   headers_.begin() + static_cast<std::ptrdiff_t>(end)));
  }
  return parts;
}

}  // namespace sync
}  // namespace chainsync
