// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/simulated_peer.hpp"

#include "sync/sync_error.hpp"
#include "util/logging.hpp"

#include <algorithm>

namespace chainsync {
namespace sim {

SimulatedPeer::SimulatedPeer(asio::io_context& io_context, sync::PeerId id, const ChainGenerator& chain,
                             const PeerBehavior& behavior, uint64_t seed)
    : strand_(asio::make_strand(io_context)),
      id_(std::move(id)),
      chain_(chain),
      behavior_(behavior),
      rng_(seed) {}

bool SimulatedPeer::IsIdle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_ && !busy_;
}

bool SimulatedPeer::IsConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

void SimulatedPeer::SetDisconnectCallback(DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_callback_ = std::move(callback);
}

uint64_t SimulatedPeer::TryBegin() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!connected_ || busy_) {
    return 0;
  }
  busy_ = true;
  return epoch_;
}

bool SimulatedPeer::Complete(uint64_t epoch) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (epoch != epoch_) {
    // The request belonged to a connection that is gone; busy_ was cleared on disconnect
    return false;
  }
  busy_ = false;
  return connected_;
}

bool SimulatedPeer::Roll(double probability) {
  if (probability <= 0.0) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < probability;
}

std::chrono::milliseconds SimulatedPeer::NextLatency() {
  const auto lo = behavior_.min_latency.count();
  const auto hi = std::max(behavior_.max_latency.count(), lo);
  std::lock_guard<std::mutex> lock(mutex_);
  return std::chrono::milliseconds(std::uniform_int_distribution<int64_t>(lo, hi)(rng_));
}

size_t SimulatedPeer::NextIndex(size_t bound) {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::uniform_int_distribution<size_t>(0, bound - 1)(rng_);
}

void SimulatedPeer::Schedule(uint64_t epoch, std::chrono::milliseconds delay, bool dropped,
                             std::function<void(const std::error_code&)> deliver) {
  asio::post(strand_, [this, self = shared_from_this(), epoch, delay, dropped, deliver = std::move(deliver)]() {
    auto timer = std::make_shared<asio::steady_timer>(strand_, delay);
    timer_ = timer;
    timer->async_wait([this, self, timer, epoch, dropped, deliver](const asio::error_code& ec) {
      if (timer_ == timer) {
        timer_.reset();
      }
      const bool still_connected = Complete(epoch);
      if (ec == asio::error::operation_aborted || !still_connected) {
        deliver(make_error_code(sync::sync_error::peer_disconnected));
        return;
      }
      if (dropped) {
        deliver(make_error_code(sync::sync_error::request_timeout));
        return;
      }
      ++stats_.requests_served;
      deliver(std::error_code{});
    });
  });
}

bool SimulatedPeer::SendGetHeaders(uint64_t start, uint32_t count, bool reverse, sync::HeadersHandler handler) {
  return ServeHeaders(start, count, 1, reverse, std::move(handler));
}

bool SimulatedPeer::SendGetHeaders(const sync::Hash256& hash, uint32_t count, uint32_t step, bool reverse,
                                   sync::HeadersHandler handler) {
  // Unknown anchor: answer with nothing, as a real node would
  const uint64_t start = chain_.NumberOf(hash).value_or(chain_.Height() + 1);
  return ServeHeaders(start, count, step, reverse, std::move(handler));
}

bool SimulatedPeer::ServeHeaders(uint64_t start, uint32_t count, uint32_t step, bool reverse,
                                 sync::HeadersHandler handler) {
  const uint64_t epoch = TryBegin();
  if (epoch == 0) {
    return false;
  }

  if (Roll(behavior_.drop_rate)) {
    ++stats_.requests_dropped;
    LOG_SIM_DEBUG("peer {} drops header request #{}+{}", id_, start, count);
    Schedule(epoch, behavior_.request_timeout, true,
             [handler = std::move(handler)](const std::error_code& ec) { handler(ec, {}); });
    return true;
  }

  std::vector<sync::BlockHeader> headers = chain_.Headers(start, count, step, reverse);
  if (!headers.empty() && Roll(behavior_.partial_rate)) {
    headers.resize(1 + NextIndex(headers.size()));
  }
  if (!headers.empty() && Roll(behavior_.invalid_header_rate)) {
    ++stats_.invalid_responses;
    headers[NextIndex(headers.size())].difficulty = 0;
  }

  Schedule(epoch, NextLatency(), false,
           [handler = std::move(handler), headers = std::move(headers)](const std::error_code& ec) mutable {
             if (ec) {
               handler(ec, {});
               return;
             }
             handler(ec, std::move(headers));
           });
  return true;
}

bool SimulatedPeer::SendGetBodies(const std::vector<sync::HeaderEnvelope>& headers, sync::BodiesHandler handler) {
  const uint64_t epoch = TryBegin();
  if (epoch == 0) {
    return false;
  }

  if (Roll(behavior_.drop_rate)) {
    ++stats_.requests_dropped;
    LOG_SIM_DEBUG("peer {} drops body request for {} blocks", id_, headers.size());
    Schedule(epoch, behavior_.request_timeout, true,
             [handler = std::move(handler)](const std::error_code& ec) { handler(ec, {}); });
    return true;
  }

  std::vector<sync::Block> blocks;
  blocks.reserve(headers.size());
  for (const auto& envelope : headers) {
    const uint64_t number = envelope.header.number;
    // Bodies the peer does not have are left out of the response
    if (!chain_.Has(number) || chain_.GetHeader(number).hash != envelope.header.hash) {
      continue;
    }
    blocks.push_back(chain_.GetBlock(number));
  }
  if (!blocks.empty() && Roll(behavior_.partial_rate)) {
    blocks.resize(1 + NextIndex(blocks.size()));
  }

  Schedule(epoch, NextLatency(), false,
           [handler = std::move(handler), blocks = std::move(blocks)](const std::error_code& ec) mutable {
             if (ec) {
               handler(ec, {});
               return;
             }
             handler(ec, std::move(blocks));
           });
  return true;
}

void SimulatedPeer::Disconnect() {
  DisconnectCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
      return;
    }
    connected_ = false;
    busy_ = false;
    ++epoch_;
    callback = disconnect_callback_;
  }
  ++stats_.disconnects;
  LOG_SIM_DEBUG("peer {} disconnected", id_);

  asio::post(strand_, [this, self = shared_from_this()]() {
    if (timer_) {
      timer_->cancel();
    }
  });

  if (callback) {
    callback(id_);
  }
}

void SimulatedPeer::Reconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = true;
}

}  // namespace sim
}  // namespace chainsync
