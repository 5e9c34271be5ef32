// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {
namespace sync {

// A contiguous (or, when anchored by hash, strided) run of headers to fetch.
// Immutable once built by the pending-work queue.
class HeaderRangeRequest {
public:
  // Range anchored by block number
  HeaderRangeRequest(uint64_t start, uint32_t count, bool reverse = false);
  // Skip sequence anchored by hash: count headers, `step` blocks apart
  HeaderRangeRequest(const Hash256& hash, uint64_t start, uint32_t count, uint32_t step, bool reverse = false);

  uint64_t start() const { return start_; }
  const std::optional<Hash256>& hash() const { return hash_; }
  uint32_t count() const { return count_; }
  uint32_t step() const { return step_; }
  bool reverse() const { return reverse_; }

  std::string ToString() const;

  bool operator==(const HeaderRangeRequest&) const = default;

private:
  uint64_t start_;
  std::optional<Hash256> hash_;
  uint32_t count_;
  uint32_t step_{0};
  bool reverse_;
};

// Headers whose bodies still need fetching, in the order the queue handed them out
class BodyBatchRequest {
public:
  BodyBatchRequest() = default;
  explicit BodyBatchRequest(std::vector<HeaderEnvelope> headers) : headers_(std::move(headers)) {}

  const std::vector<HeaderEnvelope>& headers() const { return headers_; }
  size_t size() const { return headers_.size(); }
  bool empty() const { return headers_.empty(); }

  // Consecutive sub-batches of at most max_size headers, order preserved.
  std::vector<BodyBatchRequest> Split(size_t max_size) const;

private:
  std::vector<HeaderEnvelope> headers_;
};

}  // namespace sync
}  // namespace chainsync
