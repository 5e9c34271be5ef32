// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PeerPool — peer selection contract used by the download engine, plus PeerRegistry,
 a thread-safe reference pool.

 The engine never adds or removes peers; it only picks one and commands it. Membership,
 scoring and connection lifecycle belong to whoever owns the pool.
*/

#include "sync/peer.hpp"

#include <map>
#include <mutex>
#include <random>
#include <vector>

namespace chainsync {
namespace sync {

class PeerPool {
public:
  virtual ~PeerPool() = default;

  // An idle peer chosen without preference, or nullptr when every peer is busy
  virtual SyncPeerPtr AnyIdle() = 0;

  // The highest-scored idle peer, or nullptr
  virtual SyncPeerPtr BestIdle() = 0;

  // The connected peer with this identity, idle or not, or nullptr
  virtual SyncPeerPtr ByIdentity(const PeerId& id) = 0;

  // Disconnect all peers and stop handing them out
  virtual void Close() = 0;
};

class PeerRegistry : public PeerPool {
public:
  explicit PeerRegistry(uint64_t seed = std::random_device{}());

  PeerRegistry(const PeerRegistry&) = delete;
  PeerRegistry& operator=(const PeerRegistry&) = delete;

  // Returns false if a peer with the same identity is already registered, or after Close()
  bool Add(SyncPeerPtr peer);
  bool Remove(const PeerId& id);
  size_t Size() const;
  std::vector<SyncPeerPtr> Snapshot() const;

  SyncPeerPtr AnyIdle() override;
  SyncPeerPtr BestIdle() override;
  SyncPeerPtr ByIdentity(const PeerId& id) override;
  void Close() override;

private:
  // Requires mutex_. Drops peers that have disconnected since they were added.
  void PruneDisconnectedLocked();

  mutable std::mutex mutex_;
  std::map<PeerId, SyncPeerPtr> peers_;
  std::mt19937_64 rng_;
  bool closed_{false};
};

}  // namespace sync
}  // namespace chainsync
