// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sim/chain_generator.hpp"
#include "sim/simulated_peer.hpp"
#include "sync/peer_pool.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace chainsync {
namespace sim {

struct NetworkConfig {
  size_t peers;                               // Well-behaved peers
  size_t bad_peers;                           // Peers that send invalid and truncated responses
  std::chrono::milliseconds latency;          // Mean response latency
  double drop_rate;                           // Per-request drop probability for every peer
  std::chrono::milliseconds request_timeout;  // When a dropped request fails
  std::chrono::milliseconds reconnect_delay;  // Disconnected peers come back after this
  size_t io_threads;
  uint64_t seed;

  NetworkConfig()
      : peers(8), bad_peers(0), latency(20), drop_rate(0.0), request_timeout(1000), reconnect_delay(500),
        io_threads(2), seed(1) {}
};

// SimulatedNetwork - a set of SimulatedPeers serving one chain, registered in a PeerRegistry
//
// Owns the io_context and the threads running it. Peers that get disconnected (by the
// download engine or by Close()) are re-added to the registry after reconnect_delay
// until Stop() is called.
class SimulatedNetwork {
public:
  SimulatedNetwork(const ChainGenerator& chain, const NetworkConfig& config);
  ~SimulatedNetwork();

  SimulatedNetwork(const SimulatedNetwork&) = delete;
  SimulatedNetwork& operator=(const SimulatedNetwork&) = delete;

  // Create the peers and start the io threads. Returns false if already started.
  bool Start();

  // Stop reconnecting, stop the io_context and join its threads. Outstanding requests
  // are abandoned (their handlers are never invoked).
  void Stop();

  sync::PeerRegistry& registry() { return registry_; }
  const std::vector<SimulatedPeerPtr>& peers() const { return peers_; }
  const NetworkConfig& config() const { return config_; }

  uint64_t Reconnects() const { return reconnects_.load(); }

private:
  PeerBehavior BehaviorFor(size_t index, bool bad) const;
  void OnPeerDisconnected(const SimulatedPeerPtr& peer);

  const ChainGenerator& chain_;
  const NetworkConfig config_;

  asio::io_context io_context_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  sync::PeerRegistry registry_;
  std::vector<SimulatedPeerPtr> peers_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> reconnects_{0};
};

}  // namespace sim
}  // namespace chainsync
