// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/block_downloader.hpp"

#include "sync/sync_error.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <string>

namespace chainsync {
namespace sync {

BlockDownloader::BlockDownloader(HeaderValidator& validator, DownstreamSink& sink, const Config& config)
    : validator_(validator),
      sink_(sink),
      config_(config),
      header_gate_(std::make_shared<CountingGate>(0)),
      block_gate_(std::make_shared<CountingGate>(0)),
      guard_(std::make_shared<LifetimeGuard>()) {}

BlockDownloader::~BlockDownloader() {
  Stop();
  Join();

  // Wait for handlers that are running right now; later ones see alive == false
  std::unique_lock<std::shared_mutex> lock(guard_->mutex);
  guard_->alive = false;
}

bool BlockDownloader::Start(PendingWorkQueue& queue, PeerPool& pool) {
  if (started_.exchange(true)) {
    LOG_SYNC_ERROR("block downloader already started");
    return false;
  }

  queue_ = &queue;
  pool_ = &pool;

  LOG_SYNC_INFO("initializing block downloader (headers={}, bodies={}, header queue limit={})",
                config_.headers_download, config_.bodies_download, config_.header_queue_limit);

  // Without our own header loop the headers are already in the queue
  if (!config_.headers_download) {
    headers_download_complete_ = true;
  }

  std::lock_guard<std::mutex> lock(join_mutex_);
  if (config_.headers_download) {
    headers_thread_ = std::thread([this] { HeaderRetrieveLoop(); });
  }
  if (config_.bodies_download) {
    bodies_thread_ = std::thread([this] { BlockRetrieveLoop(); });
  }
  return true;
}

void BlockDownloader::Stop() {
  const bool first = !stop_requested_.exchange(true);

  {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    header_gate_->Interrupt();
    block_gate_->Interrupt();
  }

  // Empty critical section orders the flag store before a waiter's predicate check
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
  }
  stop_cv_.notify_all();

  if (first) {
    LOG_SYNC_INFO("block downloader stop requested");
  }
}

void BlockDownloader::AwaitStopRequested() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait(lock, [this] { return stop_requested_.load(); });
}

void BlockDownloader::Join() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  for (std::thread* worker : {&headers_thread_, &bodies_thread_}) {
    if (!worker->joinable()) {
      continue;
    }
    if (worker->get_id() == std::this_thread::get_id()) {
      // Called from the loop's own completion callback; the thread ends right after it
      LOG_SYNC_WARN("Join() called from a retrieval thread, detaching it");
      worker->detach();
      continue;
    }
    worker->join();
  }
}

void BlockDownloader::Close() {
  try {
    if (pool_) {
      pool_->Close();
    }
  } catch (const std::exception& e) {
    LOG_SYNC_WARN("problems closing peer pool: {}", e.what());
  }
  Stop();
}

SyncPeerPtr BlockDownloader::AnyIdlePeer() {
  return pool_ ? pool_->AnyIdle() : nullptr;
}

SyncPeerPtr BlockDownloader::PreferredIdlePeer() {
  if (!pool_) {
    return nullptr;
  }
  // Near the tip one good peer is enough and determinism does no harm
  return sink_.IsSyncDone() ? pool_->BestIdle() : pool_->AnyIdle();
}

SyncPeerPtr BlockDownloader::SelectPeer() {
  return config_.peer_selection == PeerSelection::kPreferBestNearTip ? PreferredIdlePeer() : AnyIdlePeer();
}

void BlockDownloader::FinishDownload() {
  if (download_complete_.exchange(true)) {
    return;
  }
  sink_.OnDownloadComplete();
}

std::chrono::milliseconds BlockDownloader::HeaderWaitTimeout() const {
  return sink_.IsSyncDone() ? config_.header_wait_sync_done : config_.header_wait;
}

// ============================================================================
// Gates
// ============================================================================

CountingGatePtr BlockDownloader::ArmHeaderGate(size_t required) {
  auto gate = std::make_shared<CountingGate>(required);
  std::lock_guard<std::mutex> lock(gate_mutex_);
  // Stop() may have run between the loop's check and here
  if (stop_requested_) {
    gate->Interrupt();
  }
  header_gate_ = gate;
  return gate;
}

CountingGatePtr BlockDownloader::ArmBlockGate(size_t required) {
  auto gate = std::make_shared<CountingGate>(required);
  std::lock_guard<std::mutex> lock(gate_mutex_);
  if (stop_requested_) {
    gate->Interrupt();
  }
  block_gate_ = gate;
  return gate;
}

CountingGatePtr BlockDownloader::CurrentHeaderGate() const {
  std::lock_guard<std::mutex> lock(gate_mutex_);
  return header_gate_;
}

CountingGatePtr BlockDownloader::CurrentBlockGate() const {
  std::lock_guard<std::mutex> lock(gate_mutex_);
  return block_gate_;
}

void BlockDownloader::ReleaseHeaderGate() {
  CurrentHeaderGate()->Release();
}

void BlockDownloader::ReleaseBlockGate() {
  CurrentBlockGate()->Release();
}

// ============================================================================
// Header retrieval
// ============================================================================

void BlockDownloader::HeaderRetrieveLoop() {
  LOG_SYNC_DEBUG("header retrieval loop started");

  while (!stop_requested_) {
    try {
      if (HeaderIteration() == LoopStep::kFinished) {
        break;
      }
    } catch (const std::exception& e) {
      ++stats_.loop_errors;
      LOG_SYNC_ERROR_RL("header retrieval loop: unexpected error: {}", e.what());
      ArmHeaderGate(1);
    }

    if (CurrentHeaderGate()->WaitFor(HeaderWaitTimeout()) == CountingGate::WaitResult::kInterrupted) {
      break;
    }
  }

  LOG_SYNC_DEBUG("header retrieval loop exited");
}

BlockDownloader::LoopStep BlockDownloader::HeaderIteration() {
  const size_t queued = queue_->PendingHeaderCount();
  if (queued >= config_.header_queue_limit) {
    LOG_SYNC_TRACE("header retrieval: header queue is full ({} >= {})", queued, config_.header_queue_limit);
    ArmHeaderGate(1);
    return LoopStep::kContinue;
  }

  if (pending_header_requests_.empty()) {
    std::lock_guard<std::mutex> lock(ingest_mutex_);
    pending_header_requests_ = queue_->RequestHeaderRanges(MAX_IN_REQUEST, MAX_REQUESTS);
  }

  if (pending_header_requests_.empty()) {
    LOG_SYNC_INFO("headers download complete");
    headers_download_complete_ = true;
    if (!config_.bodies_download) {
      FinishDownload();
    }
    return LoopStep::kFinished;
  }

  size_t dispatched = 0;
  for (auto it = pending_header_requests_.begin(); it != pending_header_requests_.end();) {
    if (stop_requested_) {
      break;
    }
    SyncPeerPtr peer = SelectPeer();
    if (!peer) {
      // Keep the rest, in order, for the next pass
      LOG_SYNC_TRACE("header retrieval: no idle peers ({} ranges deferred)",
                     std::distance(it, pending_header_requests_.end()));
      break;
    }
    if (DispatchHeaderRequest(peer, *it)) {
      it = pending_header_requests_.erase(it);
      ++dispatched;
    } else {
      ++it;
    }
  }

  ArmHeaderGate(std::max<size_t>(dispatched / 4, 1));
  return LoopStep::kContinue;
}

bool BlockDownloader::DispatchHeaderRequest(const SyncPeerPtr& peer, const HeaderRangeRequest& request) {
  LOG_SYNC_DEBUG("requesting {} from peer {}", request.ToString(), peer->Identity());

  auto guard = guard_;
  HeadersHandler handler = [this, guard, peer](const std::error_code& ec, std::vector<BlockHeader> headers) {
    std::shared_lock<std::shared_mutex> lock(guard->mutex);
    if (!guard->alive) {
      return;
    }
    OnHeadersResponse(peer, ec, std::move(headers));
  };

  const bool sent = request.hash()
                        ? peer->SendGetHeaders(*request.hash(), request.count(), request.step(), request.reverse(),
                                               std::move(handler))
                        : peer->SendGetHeaders(request.start(), request.count(), request.reverse(), std::move(handler));
  if (sent) {
    ++stats_.header_requests_sent;
  } else {
    LOG_SYNC_TRACE("peer {} declined {}", peer->Identity(), request.ToString());
  }
  return sent;
}

void BlockDownloader::OnHeadersResponse(const SyncPeerPtr& peer, const std::error_code& ec,
                                        std::vector<BlockHeader> headers) {
  if (ec) {
    OnRequestFailed(peer, ec, "headers");
    return;
  }
  try {
    if (!IngestHeaders(headers, peer->Identity())) {
      OnRequestFailed(peer, make_error_code(sync_error::header_validation_failed), "headers");
    }
  } catch (const std::exception& e) {
    LOG_SYNC_ERROR_RL("error ingesting headers from peer {}: {}", peer->Identity(), e.what());
    OnRequestFailed(peer, make_error_code(sync_error::invalid_response), "headers");
  }
}

bool BlockDownloader::IngestHeaders(const std::vector<BlockHeader>& headers, const PeerId& origin) {
  if (headers.empty()) {
    return true;
  }

  std::vector<HeaderEnvelope> envelopes;
  envelopes.reserve(headers.size());
  for (const auto& header : headers) {
    if (!validator_.Validate(header)) {
      ++stats_.rejected_header_responses;
      LOG_SYNC_WARN_RL("invalid header {} from peer {}: {}", header.ShortDescr(), origin,
                       validator_.DescribeLastErrors());
      return false;
    }
    envelopes.push_back(HeaderEnvelope{header, origin});
  }

  size_t ready_count = 0;
  {
    std::lock_guard<std::mutex> lock(ingest_mutex_);
    std::vector<HeaderEnvelope> ready = queue_->SubmitHeaders(std::move(envelopes));
    ready_count = ready.size();
    if (!ready.empty()) {
      sink_.OnHeadersReady(std::move(ready));
    }
  }

  stats_.headers_received += headers.size();
  ReleaseHeaderGate();

  LOG_SYNC_DEBUG("{} headers added from peer {} ({} ready)", headers.size(), origin, ready_count);
  return true;
}

// ============================================================================
// Block retrieval
// ============================================================================

void BlockDownloader::BlockRetrieveLoop() {
  LOG_SYNC_DEBUG("block retrieval loop started");

  while (!stop_requested_) {
    try {
      if (BlockIteration() == LoopStep::kFinished) {
        break;
      }
    } catch (const std::exception& e) {
      ++stats_.loop_errors;
      LOG_SYNC_ERROR_RL("block retrieval loop: unexpected error: {}", e.what());
      ArmBlockGate(1);
    }

    if (CurrentBlockGate()->WaitFor(config_.block_wait) == CountingGate::WaitResult::kInterrupted) {
      break;
    }
  }

  LOG_SYNC_DEBUG("block retrieval loop exited");
}

BlockDownloader::LoopStep BlockDownloader::BlockIteration() {
  const size_t free_slots = sink_.FreeBodyQueueCapacity();
  if (free_slots <= MAX_IN_REQUEST) {
    LOG_SYNC_TRACE("block retrieval: block queue is full ({} free)", free_slots);
    ArmBlockGate(1);
    return LoopStep::kContinue;
  }

  // Read before asking for work: the flag is set only after the last header reached the queue
  const bool headers_done = headers_download_complete_;
  const size_t max_requests = std::min(free_slots / MAX_IN_REQUEST, MAX_REQUESTS);
  BodyBatchRequest batch = queue_->RequestBodyBatch(MAX_IN_REQUEST * max_requests);

  if (batch.empty() && headers_done) {
    LOG_SYNC_INFO("block download complete");
    FinishDownload();
    return LoopStep::kFinished;
  }

  if (batch.size() <= FAST_PATH_MAX_BATCH) {
    // Fresh blocks: the peer that announced the header most likely has the body already
    for (const auto& envelope : batch.headers()) {
      SyncPeerPtr origin = pool_->ByIdentity(envelope.origin);
      if (!origin) {
        continue;
      }
      if (DispatchBodyRequest(origin, {envelope})) {
        ++stats_.fast_path_requests_sent;
      }
    }
  }

  size_t dispatched = 0;
  for (const auto& part : batch.Split(MAX_IN_REQUEST)) {
    if (stop_requested_) {
      break;
    }
    SyncPeerPtr peer = SelectPeer();
    if (!peer) {
      LOG_SYNC_TRACE("block retrieval: no idle peers");
      break;
    }
    if (DispatchBodyRequest(peer, part.headers())) {
      ++dispatched;
    }
  }

  ArmBlockGate(std::max<size_t>(dispatched, 1));
  return LoopStep::kContinue;
}

bool BlockDownloader::DispatchBodyRequest(const SyncPeerPtr& peer, const std::vector<HeaderEnvelope>& headers) {
  LOG_SYNC_DEBUG("requesting {} bodies from peer {}", headers.size(), peer->Identity());

  auto guard = guard_;
  BodiesHandler handler = [this, guard, peer](const std::error_code& ec, std::vector<Block> blocks) {
    std::shared_lock<std::shared_mutex> lock(guard->mutex);
    if (!guard->alive) {
      return;
    }
    OnBodiesResponse(peer, ec, std::move(blocks));
  };

  const bool sent = peer->SendGetBodies(headers, std::move(handler));
  if (sent) {
    ++stats_.body_requests_sent;
  }
  return sent;
}

void BlockDownloader::OnBodiesResponse(const SyncPeerPtr& peer, const std::error_code& ec,
                                       std::vector<Block> blocks) {
  if (ec) {
    OnRequestFailed(peer, ec, "blocks");
    return;
  }
  try {
    IngestBlocks(std::move(blocks), peer->Identity());
  } catch (const std::exception& e) {
    LOG_SYNC_ERROR_RL("error ingesting blocks from peer {}: {}", peer->Identity(), e.what());
    OnRequestFailed(peer, make_error_code(sync_error::invalid_response), "blocks");
  }
}

void BlockDownloader::IngestBlocks(std::vector<Block> blocks, const PeerId& origin) {
  if (blocks.empty()) {
    return;
  }

  const size_t received = blocks.size();
  const std::string first = blocks.front().ShortDescr();
  const std::string last = blocks.back().ShortDescr();

  size_t accepted_count = 0;
  {
    std::lock_guard<std::mutex> lock(ingest_mutex_);
    LOG_SYNC_DEBUG("adding {} blocks to sync queue: {} ... {}", received, first, last);

    std::vector<Block> accepted = queue_->SubmitBlocks(std::move(blocks));
    std::vector<BlockEnvelope> envelopes;
    envelopes.reserve(accepted.size());
    for (auto& block : accepted) {
      envelopes.push_back(BlockEnvelope{std::move(block), origin});
    }

    accepted_count = envelopes.size();
    if (!envelopes.empty()) {
      LOG_SYNC_DEBUG("pushing {} blocks to import queue: {} ... {}", envelopes.size(),
                     envelopes.front().block.ShortDescr(), envelopes.back().block.ShortDescr());
      sink_.OnBlocksReady(std::move(envelopes));
    }
  }

  stats_.blocks_received += received;
  stats_.blocks_accepted += accepted_count;
  ReleaseBlockGate();
}

void BlockDownloader::OnRequestFailed(const SyncPeerPtr& peer, const std::error_code& ec, const char* what) {
  ++stats_.failed_requests;
  LOG_SYNC_WARN_RL("error receiving {} from peer {}: {}, dropping the peer", what, peer->Identity(), ec.message());
  peer->Disconnect();
}

}  // namespace sync
}  // namespace chainsync
