// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_queue.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace chainsync {
namespace sync {

namespace {

// How many grid ranges past the delivery point RequestHeaderRanges() looks at, in units of
// max_requests. Bounds the scan when most of the window is already in flight.
constexpr size_t HEADER_SCAN_FACTOR = 4;

}  // namespace

SyncQueue::SyncQueue(const Config& config)
    : config_(config), next_header_(config.first_block) {
  if (config.last_block < config.first_block) {
    throw std::invalid_argument("SyncQueue: last_block < first_block");
  }
}

bool SyncQueue::IsFresh(std::chrono::steady_clock::time_point requested_at,
                        std::chrono::steady_clock::time_point now) const {
  return now - requested_at < config_.request_timeout;
}

size_t SyncQueue::PendingHeaderCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return received_headers_.size() + awaiting_body_.size();
}

std::vector<HeaderRangeRequest> SyncQueue::RequestHeaderRanges(uint32_t max_span, size_t max_requests) {
  if (max_span == 0 || max_requests == 0) {
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HeaderRangeRequest> out;
  if (HeadersCompleteLocked()) {
    return out;
  }

  const auto now = util::GetSteadyTime();
  const uint64_t last = config_.last_block;

  // Ranges sit on a fixed grid anchored at first_block so that a range keeps its key
  // while the delivery point moves through it.
  struct Candidate {
    uint64_t grid_start;
    uint64_t first_missing;
    uint64_t last_missing;
    std::chrono::steady_clock::time_point requested_at;
  };
  std::optional<Candidate> stalest;

  uint64_t grid_start = config_.first_block + ((next_header_ - config_.first_block) / max_span) * max_span;
  size_t scanned = 0;
  const size_t scan_limit = max_requests * HEADER_SCAN_FACTOR;

  for (; grid_start <= last && out.size() < max_requests && scanned < scan_limit; grid_start += max_span) {
    ++scanned;
    const uint64_t grid_end = std::min<uint64_t>(grid_start + max_span - 1, last);

    std::optional<uint64_t> first_missing;
    uint64_t last_missing = 0;
    for (uint64_t n = std::max(grid_start, next_header_); n <= grid_end; ++n) {
      if (received_headers_.count(n) == 0) {
        if (!first_missing) {
          first_missing = n;
        }
        last_missing = n;
      }
    }
    if (!first_missing) {
      continue;
    }

    auto existing = header_requests_.find(grid_start);
    if (existing != header_requests_.end() && IsFresh(existing->second.requested_at, now)) {
      if (!stalest || existing->second.requested_at < stalest->requested_at) {
        stalest = Candidate{grid_start, *first_missing, last_missing, existing->second.requested_at};
      }
      continue;
    }

    out.emplace_back(*first_missing, static_cast<uint32_t>(last_missing - *first_missing + 1));
    header_requests_[grid_start] = RangeRequest{grid_end, now};
  }

  // Everything still missing is already in flight. An empty answer would read as
  // "header download complete", so hand out the oldest outstanding range again.
  if (out.empty() && stalest) {
    out.emplace_back(stalest->first_missing, static_cast<uint32_t>(stalest->last_missing - stalest->first_missing + 1));
    header_requests_[stalest->grid_start].requested_at = now;
  }

  return out;
}

std::vector<HeaderEnvelope> SyncQueue::SubmitHeaders(std::vector<HeaderEnvelope> headers) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (auto& envelope : headers) {
    const uint64_t number = envelope.header.number;
    if (number < next_header_ || number > config_.last_block) {
      continue;
    }
    received_headers_.emplace(number, std::move(envelope));  // keeps the first copy
  }

  std::vector<HeaderEnvelope> ready;
  for (auto it = received_headers_.find(next_header_); it != received_headers_.end();
       it = received_headers_.find(next_header_)) {
    const BlockHeader& header = it->second.header;
    if (!last_delivered_hash_.IsNull() && header.parent_hash != last_delivered_hash_) {
      // Whatever else that peer sent past this point builds on the same broken link
      const PeerId origin = it->second.origin;
      LOG_SYNC_DEBUG("header {} from {} does not connect to {}, discarding its headers", header.ShortDescr(), origin,
                     last_delivered_hash_.ShortHex());
      while (it != received_headers_.end()) {
        if (it->second.origin == origin) {
          it = received_headers_.erase(it);
        } else {
          ++it;
        }
      }
      break;
    }

    last_delivered_hash_ = header.hash;
    if (config_.bodies_required) {
      awaiting_body_.emplace(header.number, it->second);
    }
    ready.push_back(std::move(it->second));
    received_headers_.erase(it);
    ++next_header_;
  }

  // Forget bookkeeping for ranges that are fully delivered
  for (auto it = header_requests_.begin(); it != header_requests_.end();) {
    if (it->second.end < next_header_) {
      it = header_requests_.erase(it);
    } else {
      ++it;
    }
  }

  return ready;
}

BodyBatchRequest SyncQueue::RequestBodyBatch(size_t max_headers) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!config_.bodies_required || max_headers == 0 || awaiting_body_.empty()) {
    return {};
  }

  const auto now = util::GetSteadyTime();
  std::vector<HeaderEnvelope> batch;
  for (const auto& [number, envelope] : awaiting_body_) {
    if (batch.size() >= max_headers) {
      break;
    }
    auto requested = body_requests_.find(number);
    if (requested != body_requests_.end() && IsFresh(requested->second, now)) {
      continue;
    }
    batch.push_back(envelope);
    body_requests_[number] = now;
  }

  // Every missing body is in flight; re-offer the one import is waiting on.
  if (batch.empty()) {
    const auto& [number, envelope] = *awaiting_body_.begin();
    batch.push_back(envelope);
    body_requests_[number] = now;
  }

  return BodyBatchRequest(std::move(batch));
}

std::vector<Block> SyncQueue::SubmitBlocks(std::vector<Block> blocks) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Block> accepted;
  for (auto& block : blocks) {
    auto it = awaiting_body_.find(block.Number());
    if (it == awaiting_body_.end()) {
      continue;  // unknown or already received
    }
    if (it->second.header.hash != block.Hash()) {
      LOG_SYNC_DEBUG("block {} does not match requested header {}", block.ShortDescr(),
                     it->second.header.ShortDescr());
      continue;
    }
    awaiting_body_.erase(it);
    body_requests_.erase(block.Number());
    ++bodies_received_;
    accepted.push_back(std::move(block));
  }
  return accepted;
}

bool SyncQueue::IsHeadersComplete() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return HeadersCompleteLocked();
}

bool SyncQueue::IsBodiesComplete() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return HeadersCompleteLocked() && awaiting_body_.empty();
}

uint64_t SyncQueue::NextHeaderNumber() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_header_;
}

size_t SyncQueue::BodiesReceived() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bodies_received_;
}

}  // namespace sync
}  // namespace chainsync
