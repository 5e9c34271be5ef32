// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 * BlockDownloader — header and block-body retrieval engine
 *
 * Two worker threads poll the pending-work queue and fan requests out to idle peers:
 * - Header loop: asks the queue for up to 32 header ranges of up to 192 headers,
 *   sends each to an idle peer, and keeps whatever could not be sent for the next pass.
 *   Backs off while the queue already holds header_queue_limit headers.
 * - Block loop: sizes a body batch to the sink's free import capacity, splits it
 *   into requests of up to 192 bodies, and sends each to an idle peer. Batches of three
 *   or fewer are also sent straight to the peers that supplied their headers.
 *
 * Each iteration ends on a fresh CountingGate: a quarter of the dispatched header requests
 * (all of the body requests) must answer, or the timeout must expire, before the next poll.
 *
 * Responses arrive on the peers' threads. Headers are validated outside any lock; a single
 * bad header rejects the whole response and the peer is disconnected. Queue submission and
 * the downstream push run under one mutex shared by header and block ingestion, so the sink
 * never observes a half-applied response.
 *
 * Failed requests are not retried here: the peer is dropped, and the queue re-offers the
 * work on a later poll once its own request timeout passes.
 *
 * Stop() only requests shutdown (AwaitStopRequested() returns as soon as it was called).
 * Join() waits for both worker threads to exit.
 */

#include "sync/downstream.hpp"
#include "sync/gate.hpp"
#include "sync/header_validator.hpp"
#include "sync/peer_pool.hpp"
#include "sync/sync_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace chainsync {

// Forward declaration for test access
namespace test {
class BlockDownloaderTestAccess;
}  // namespace test

namespace sync {

// Default configuration constants
static constexpr size_t DEFAULT_HEADER_QUEUE_LIMIT{10000};
static constexpr size_t DEFAULT_BLOCK_QUEUE_LIMIT{2000};
static constexpr std::chrono::milliseconds DEFAULT_HEADER_WAIT{2000};
static constexpr std::chrono::milliseconds DEFAULT_HEADER_WAIT_SYNC_DONE{10000};
static constexpr std::chrono::milliseconds DEFAULT_BLOCK_WAIT{2000};

// Which idle peer the retrieval loops hand a request to
enum class PeerSelection {
  kAnyIdle,            // PeerPool::AnyIdle() always
  kPreferBestNearTip,  // PeerPool::BestIdle() once the sink reports sync done, AnyIdle() before
};

struct DownloadStats {
  std::atomic<uint64_t> header_requests_sent{0};
  std::atomic<uint64_t> body_requests_sent{0};
  std::atomic<uint64_t> fast_path_requests_sent{0};  // single-body requests to the header's origin peer
  std::atomic<uint64_t> headers_received{0};
  std::atomic<uint64_t> blocks_received{0};
  std::atomic<uint64_t> blocks_accepted{0};
  std::atomic<uint64_t> rejected_header_responses{0};
  std::atomic<uint64_t> failed_requests{0};
  std::atomic<uint64_t> loop_errors{0};
};

class BlockDownloader {
public:
  // Max headers per header request, and max bodies per body request
  static constexpr uint32_t MAX_IN_REQUEST = 192;
  // Max header ranges requested from the queue per pass, and max concurrent body requests
  static constexpr size_t MAX_REQUESTS = 32;
  // Body batches this small are also requested from the peers that sent their headers
  static constexpr size_t FAST_PATH_MAX_BATCH = 3;

  struct Config {
    size_t header_queue_limit;  // Stop requesting headers while the queue holds this many
    size_t block_queue_limit;   // Import queue size the sink is expected to enforce
    bool headers_download;      // Run the header retrieval loop
    bool bodies_download;       // Run the block retrieval loop
    PeerSelection peer_selection;

    std::chrono::milliseconds header_wait;            // Header gate timeout during sync
    std::chrono::milliseconds header_wait_sync_done;  // Header gate timeout once the sink reports sync done
    std::chrono::milliseconds block_wait;             // Block gate timeout

    Config()
        : header_queue_limit(DEFAULT_HEADER_QUEUE_LIMIT), block_queue_limit(DEFAULT_BLOCK_QUEUE_LIMIT),
          headers_download(true), bodies_download(true), peer_selection(PeerSelection::kAnyIdle),
          header_wait(DEFAULT_HEADER_WAIT), header_wait_sync_done(DEFAULT_HEADER_WAIT_SYNC_DONE),
          block_wait(DEFAULT_BLOCK_WAIT) {}
  };

  BlockDownloader(HeaderValidator& validator, DownstreamSink& sink, const Config& config = Config{});

  // Stops, joins the worker threads and waits for running response handlers.
  // Handlers that fire afterwards are ignored.
  ~BlockDownloader();

  BlockDownloader(const BlockDownloader&) = delete;
  BlockDownloader& operator=(const BlockDownloader&) = delete;
  BlockDownloader(BlockDownloader&&) = delete;
  BlockDownloader& operator=(BlockDownloader&&) = delete;

  // Attach the queue and pool (both must outlive this object) and start the loops enabled
  // in the config. Returns false if already started.
  bool Start(PendingWorkQueue& queue, PeerPool& pool);

  // Interrupt both loops. Idempotent, callable from any thread.
  void Stop();

  // Returns once Stop() has been called. Says nothing about the worker threads.
  void AwaitStopRequested();

  // Wait for both worker threads to exit. Must not be called from a worker thread.
  void Join();

  // Close the peer pool, then Stop()
  void Close();

  bool IsDownloadComplete() const { return download_complete_.load(); }
  bool IsHeadersDownloadComplete() const { return headers_download_complete_.load(); }
  bool IsStopRequested() const { return stop_requested_.load(); }

  const Config& config() const { return config_; }
  const DownloadStats& stats() const { return stats_; }

  // Peer selectors. The loops use whichever one Config::peer_selection names.
  SyncPeerPtr AnyIdlePeer();
  SyncPeerPtr PreferredIdlePeer();

private:
  friend class test::BlockDownloaderTestAccess;

  enum class LoopStep { kContinue, kFinished };

  // Keeps response handlers from touching a destroyed downloader
  struct LifetimeGuard {
    std::shared_mutex mutex;
    bool alive{true};
  };

  void HeaderRetrieveLoop();
  void BlockRetrieveLoop();

  // One pass of each loop up to (not including) the wait: dispatch and arm the gate.
  LoopStep HeaderIteration();
  LoopStep BlockIteration();

  std::chrono::milliseconds HeaderWaitTimeout() const;

  CountingGatePtr ArmHeaderGate(size_t required);
  CountingGatePtr ArmBlockGate(size_t required);
  CountingGatePtr CurrentHeaderGate() const;
  CountingGatePtr CurrentBlockGate() const;
  void ReleaseHeaderGate();
  void ReleaseBlockGate();

  bool DispatchHeaderRequest(const SyncPeerPtr& peer, const HeaderRangeRequest& request);
  bool DispatchBodyRequest(const SyncPeerPtr& peer, const std::vector<HeaderEnvelope>& headers);

  void OnHeadersResponse(const SyncPeerPtr& peer, const std::error_code& ec, std::vector<BlockHeader> headers);
  void OnBodiesResponse(const SyncPeerPtr& peer, const std::error_code& ec, std::vector<Block> blocks);
  void OnRequestFailed(const SyncPeerPtr& peer, const std::error_code& ec, const char* what);

  // Validate, submit to the queue and forward what is ready. Returns false (and changes
  // nothing) if any header fails validation.
  bool IngestHeaders(const std::vector<BlockHeader>& headers, const PeerId& origin);
  void IngestBlocks(std::vector<Block> blocks, const PeerId& origin);

  SyncPeerPtr SelectPeer();
  void FinishDownload();

  HeaderValidator& validator_;
  DownstreamSink& sink_;
  const Config config_;

  PendingWorkQueue* queue_{nullptr};
  PeerPool* pool_{nullptr};

  // Header ranges handed out by the queue but not yet sent (header loop thread only)
  std::vector<HeaderRangeRequest> pending_header_requests_;

  // Serializes queue submission + downstream push across all response handlers
  std::mutex ingest_mutex_;

  mutable std::mutex gate_mutex_;
  CountingGatePtr header_gate_;  // guarded by gate_mutex_
  CountingGatePtr block_gate_;   // guarded by gate_mutex_

  std::atomic<bool> started_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> headers_download_complete_{false};
  std::atomic<bool> download_complete_{false};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::mutex join_mutex_;
  std::thread headers_thread_;
  std::thread bodies_thread_;

  std::shared_ptr<LifetimeGuard> guard_;
  DownloadStats stats_;
};

}  // namespace sync
}  // namespace chainsync
