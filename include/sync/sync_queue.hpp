// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PendingWorkQueue — bookkeeping of what still has to be downloaded

 The download engine asks it for work (header ranges, body batches), hands it every
 validated response, and forwards whatever it reports as ready. Reassembly of
 out-of-order responses and deduplication live here, not in the engine.

 Contract the engine relies on:
 - RequestHeaderRanges() returns an empty vector only when no header work remains.
 - RequestBodyBatch() returns an empty batch when no body work is available right now;
   the engine treats that as "done" only once header download has completed.

 SyncQueue is an in-memory implementation over a fixed block-number range
 [first, last]. It is internally synchronized.
*/

#include "sync/requests.hpp"
#include "sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace chainsync {
namespace sync {

class PendingWorkQueue {
public:
  virtual ~PendingWorkQueue() = default;

  // Headers held by the queue that have not yet been turned into imported blocks
  virtual size_t PendingHeaderCount() const = 0;

  virtual std::vector<HeaderRangeRequest> RequestHeaderRanges(uint32_t max_span, size_t max_requests) = 0;

  virtual BodyBatchRequest RequestBodyBatch(size_t max_headers) = 0;

  // Returns the subset now ready for delivery downstream (possibly empty)
  virtual std::vector<HeaderEnvelope> SubmitHeaders(std::vector<HeaderEnvelope> headers) = 0;

  // Returns the blocks accepted by this call (duplicates and unknown blocks dropped)
  virtual std::vector<Block> SubmitBlocks(std::vector<Block> blocks) = 0;
};

class SyncQueue : public PendingWorkQueue {
public:
  struct Config {
    uint64_t first_block;                   // First block number to download
    uint64_t last_block;                    // Last block number to download (inclusive)
    std::chrono::seconds request_timeout;   // Age after which an unanswered request is re-offered
    bool bodies_required;                   // false = headers-only sync (no body bookkeeping)

    Config() : first_block(1), last_block(0), request_timeout(std::chrono::seconds(20)), bodies_required(true) {}
  };

  explicit SyncQueue(const Config& config);

  SyncQueue(const SyncQueue&) = delete;
  SyncQueue& operator=(const SyncQueue&) = delete;

  size_t PendingHeaderCount() const override;
  std::vector<HeaderRangeRequest> RequestHeaderRanges(uint32_t max_span, size_t max_requests) override;
  BodyBatchRequest RequestBodyBatch(size_t max_headers) override;
  std::vector<HeaderEnvelope> SubmitHeaders(std::vector<HeaderEnvelope> headers) override;
  std::vector<Block> SubmitBlocks(std::vector<Block> blocks) override;

  bool IsHeadersComplete() const;
  bool IsBodiesComplete() const;

  // Next header number that has not been delivered yet
  uint64_t NextHeaderNumber() const;
  size_t BodiesReceived() const;

private:
  struct RangeRequest {
    uint64_t end;  // inclusive
    std::chrono::steady_clock::time_point requested_at;
  };

  // Requires mutex_
  bool IsFresh(std::chrono::steady_clock::time_point requested_at, std::chrono::steady_clock::time_point now) const;
  bool HeadersCompleteLocked() const { return next_header_ > config_.last_block; }

  const Config config_;

  mutable std::mutex mutex_;
  uint64_t next_header_;                                // next number to deliver
  Hash256 last_delivered_hash_;                         // hash of header next_header_ - 1
  std::map<uint64_t, HeaderEnvelope> received_headers_; // validated, not yet delivered
  std::map<uint64_t, RangeRequest> header_requests_;    // keyed by range start
  std::map<uint64_t, HeaderEnvelope> awaiting_body_;    // delivered, body not yet received
  std::map<uint64_t, std::chrono::steady_clock::time_point> body_requests_;
  size_t bodies_received_{0};
};

}  // namespace sync
}  // namespace chainsync
