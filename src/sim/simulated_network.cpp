// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/simulated_network.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace chainsync {
namespace sim {

SimulatedNetwork::SimulatedNetwork(const ChainGenerator& chain, const NetworkConfig& config)
    : chain_(chain), config_(config), registry_(config.seed) {}

SimulatedNetwork::~SimulatedNetwork() {
  Stop();
}

PeerBehavior SimulatedNetwork::BehaviorFor(size_t index, bool bad) const {
  PeerBehavior behavior;
  const auto mean = config_.latency.count();
  behavior.min_latency = std::chrono::milliseconds(mean / 2);
  behavior.max_latency = std::chrono::milliseconds(mean + mean / 2);
  behavior.request_timeout = config_.request_timeout;
  behavior.drop_rate = config_.drop_rate;
  if (bad) {
    behavior.invalid_header_rate = 0.5;
    behavior.partial_rate = 0.5;
    behavior.score = 10 + index;
  } else {
    behavior.score = 100 + index;
  }
  return behavior;
}

bool SimulatedNetwork::Start() {
  if (started_.exchange(true)) {
    return false;
  }

  const size_t total = config_.peers + config_.bad_peers;
  for (size_t i = 0; i < total; ++i) {
    const bool bad = i >= config_.peers;
    const std::string id = (bad ? "bad-" : "peer-") + std::to_string(i);
    auto peer = std::make_shared<SimulatedPeer>(io_context_, id, chain_, BehaviorFor(i, bad), config_.seed + i + 1);

    std::weak_ptr<SimulatedPeer> weak = peer;
    peer->SetDisconnectCallback([this, weak](const sync::PeerId&) {
      if (auto p = weak.lock()) {
        OnPeerDisconnected(p);
      }
    });

    registry_.Add(peer);
    peers_.push_back(std::move(peer));
  }

  work_guard_.emplace(asio::make_work_guard(io_context_));
  const size_t threads = std::max<size_t>(config_.io_threads, 1);
  for (size_t i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        LOG_SIM_WARN("io thread exited with error: {}", e.what());
      }
    });
  }

  LOG_SIM_INFO("simulated network started: {} peers ({} bad), {} io threads, chain height {}", total,
               config_.bad_peers, threads, chain_.Height());
  return true;
}

void SimulatedNetwork::Stop() {
  if (stopping_.exchange(true)) {
    return;
  }
  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  // Break the peer -> callback -> network reference before the network goes away
  for (auto& peer : peers_) {
    peer->SetDisconnectCallback(nullptr);
  }
  LOG_SIM_DEBUG("simulated network stopped ({} reconnects)", reconnects_.load());
}

void SimulatedNetwork::OnPeerDisconnected(const SimulatedPeerPtr& peer) {
  if (stopping_) {
    return;
  }
  auto timer = std::make_shared<asio::steady_timer>(io_context_, config_.reconnect_delay);
  timer->async_wait([this, timer, peer](const asio::error_code& ec) {
    if (ec || stopping_) {
      return;
    }
    peer->Reconnect();
    ++reconnects_;
    // Still registered if the registry has not pruned it yet
    if (!registry_.Add(peer)) {
      LOG_SIM_DEBUG("peer {} reconnected (already registered)", peer->Identity());
    } else {
      LOG_SIM_DEBUG("peer {} reconnected", peer->Identity());
    }
  });
}

}  // namespace sim
}  // namespace chainsync
