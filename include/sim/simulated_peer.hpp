// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 SimulatedPeer — SyncPeer served from a generated chain on an asio::io_context

 Each request is answered after a random latency on the peer's strand, never from inside
 the Send* call. Knobs make a peer misbehave:
 - invalid_header_rate: probability that one header of a response fails validation
 - drop_rate: probability that a request is never answered; the handler then receives
   sync_error::request_timeout after request_timeout
 - partial_rate: probability that a response carries only a prefix of what was asked

 A peer serves one request at a time and is busy until that request completes.
 Disconnect() completes the outstanding request with sync_error::peer_disconnected.
*/

#include "sim/chain_generator.hpp"
#include "sync/peer.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>

namespace chainsync {
namespace sim {

struct PeerBehavior {
  std::chrono::milliseconds min_latency;
  std::chrono::milliseconds max_latency;
  std::chrono::milliseconds request_timeout;  // How long a dropped request takes to fail
  double invalid_header_rate;
  double drop_rate;
  double partial_rate;
  uint64_t score;

  PeerBehavior()
      : min_latency(5), max_latency(30), request_timeout(1000), invalid_header_rate(0.0), drop_rate(0.0),
        partial_rate(0.0), score(100) {}
};

struct SimulatedPeerStats {
  std::atomic<uint64_t> requests_served{0};
  std::atomic<uint64_t> requests_dropped{0};
  std::atomic<uint64_t> invalid_responses{0};
  std::atomic<uint64_t> disconnects{0};
};

class SimulatedPeer : public sync::SyncPeer, public std::enable_shared_from_this<SimulatedPeer> {
public:
  using DisconnectCallback = std::function<void(const sync::PeerId&)>;

  SimulatedPeer(asio::io_context& io_context, sync::PeerId id, const ChainGenerator& chain,
                const PeerBehavior& behavior, uint64_t seed);

  const sync::PeerId& Identity() const override { return id_; }
  bool IsIdle() const override;
  bool IsConnected() const override;
  uint64_t Score() const override { return behavior_.score; }

  bool SendGetHeaders(uint64_t start, uint32_t count, bool reverse, sync::HeadersHandler handler) override;
  bool SendGetHeaders(const sync::Hash256& hash, uint32_t count, uint32_t step, bool reverse,
                      sync::HeadersHandler handler) override;
  bool SendGetBodies(const std::vector<sync::HeaderEnvelope>& headers, sync::BodiesHandler handler) override;

  void Disconnect() override;

  // Bring a disconnected peer back under the same identity
  void Reconnect();

  // Invoked (outside the peer's lock) every time the peer disconnects
  void SetDisconnectCallback(DisconnectCallback callback);

  const PeerBehavior& behavior() const { return behavior_; }
  const SimulatedPeerStats& stats() const { return stats_; }

private:
  // Claim the peer for one request. Returns the connection epoch, or 0 if busy/disconnected.
  uint64_t TryBegin();

  bool Roll(double probability);
  std::chrono::milliseconds NextLatency();
  size_t NextIndex(size_t bound);

  bool ServeHeaders(uint64_t start, uint32_t count, uint32_t step, bool reverse, sync::HeadersHandler handler);

  // Run `deliver` on the strand after `delay`, with the error it should report:
  // none, request_timeout (when dropped) or peer_disconnected.
  void Schedule(uint64_t epoch, std::chrono::milliseconds delay, bool dropped,
                std::function<void(const std::error_code&)> deliver);

  // Ends the outstanding request; returns true if the connection it was sent on is still up
  bool Complete(uint64_t epoch);

  asio::strand<asio::io_context::executor_type> strand_;
  const sync::PeerId id_;
  const ChainGenerator& chain_;
  const PeerBehavior behavior_;

  mutable std::mutex mutex_;
  bool connected_{true};   // guarded by mutex_
  bool busy_{false};       // guarded by mutex_
  uint64_t epoch_{1};      // guarded by mutex_; bumped on every disconnect
  std::mt19937_64 rng_;    // guarded by mutex_
  DisconnectCallback disconnect_callback_;  // guarded by mutex_

  std::shared_ptr<asio::steady_timer> timer_;  // strand only

  SimulatedPeerStats stats_;
};

using SimulatedPeerPtr = std::shared_ptr<SimulatedPeer>;

}  // namespace sim
}  // namespace chainsync
