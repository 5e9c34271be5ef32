// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ImportSink — DownstreamSink standing in for a node's block import pipeline

 Headers are recorded as they are delivered. Blocks land in a buffer keyed by number
 (responses from different peers arrive in any order); an importer thread takes them off
 in ascending order, checks each one links to the previously imported block, and advances
 the imported height. FreeBodyQueueCapacity() reports capacity minus what is buffered.
*/

#include "sync/block_downloader.hpp"
#include "sync/downstream.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <thread>

namespace chainsync {
namespace sim {

class ImportSink : public sync::DownstreamSink {
public:
  struct Config {
    uint64_t first_block;                   // First block expected from the engine
    uint64_t last_block;                    // Import target (inclusive)
    size_t capacity;                        // Block import queue size
    uint64_t sync_done_distance;            // IsSyncDone() once imported within this many blocks of target
    std::chrono::microseconds import_delay; // Simulated per-block import cost

    Config()
        : first_block(1), last_block(0), capacity(sync::DEFAULT_BLOCK_QUEUE_LIMIT), sync_done_distance(64),
          import_delay(0) {}
  };

  explicit ImportSink(const Config& config);
  ~ImportSink() override;

  ImportSink(const ImportSink&) = delete;
  ImportSink& operator=(const ImportSink&) = delete;

  void Start();
  void Stop();

  void OnHeadersReady(std::vector<sync::HeaderEnvelope> headers) override;
  void OnBlocksReady(std::vector<sync::BlockEnvelope> blocks) override;
  size_t FreeBodyQueueCapacity() override;
  void OnDownloadComplete() override;
  bool IsSyncDone() const override;

  // Wait until last_block has been imported. Returns false on timeout.
  bool WaitForImport(std::chrono::milliseconds timeout);

  uint64_t ImportedHeight() const { return imported_height_.load(); }
  uint64_t HeadersReceived() const { return headers_received_.load(); }
  uint64_t BestHeaderNumber() const { return best_header_.load(); }
  uint64_t BlocksReceived() const { return blocks_received_.load(); }
  uint64_t OutOfOrderHeaders() const { return out_of_order_headers_.load(); }
  uint64_t ImportErrors() const { return import_errors_.load(); }
  bool DownloadCompleteSignaled() const { return download_complete_.load(); }

  size_t Buffered() const;

  // Imported blocks per supplying peer
  std::map<sync::PeerId, uint64_t> BlocksByOrigin() const;

private:
  void ImportLoop();

  const Config config_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<uint64_t, sync::BlockEnvelope> buffer_;  // guarded by mutex_
  std::map<sync::PeerId, uint64_t> by_origin_;      // guarded by mutex_
  sync::Hash256 last_imported_hash_;                // importer thread only
  bool stop_{false};                                // guarded by mutex_

  std::atomic<uint64_t> imported_height_;
  std::atomic<uint64_t> headers_received_{0};
  std::atomic<uint64_t> best_header_{0};
  std::atomic<uint64_t> blocks_received_{0};
  std::atomic<uint64_t> out_of_order_headers_{0};
  std::atomic<uint64_t> import_errors_{0};
  std::atomic<bool> download_complete_{false};

  std::thread importer_;
};

}  // namespace sim
}  // namespace chainsync
