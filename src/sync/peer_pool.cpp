// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/peer_pool.hpp"

#include "util/logging.hpp"

namespace chainsync {
namespace sync {

PeerRegistry::PeerRegistry(uint64_t seed) : rng_(seed) {}

bool PeerRegistry::Add(SyncPeerPtr peer) {
  if (!peer) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  auto [it, inserted] = peers_.emplace(peer->Identity(), peer);
  if (inserted) {
    LOG_NET_DEBUG("peer {} added to pool ({} peers)", it->first, peers_.size());
  }
  return inserted;
}

bool PeerRegistry::Remove(const PeerId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.erase(id) > 0;
}

size_t PeerRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

std::vector<SyncPeerPtr> PeerRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SyncPeerPtr> out;
  out.reserve(peers_.size());
  for (const auto& [id, peer] : peers_) {
    out.push_back(peer);
  }
  return out;
}

void PeerRegistry::PruneDisconnectedLocked() {
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (!it->second->IsConnected()) {
      LOG_NET_DEBUG("pruning disconnected peer {}", it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
}

SyncPeerPtr PeerRegistry::AnyIdle() {
  std::lock_guard<std::mutex> lock(mutex_);
  PruneDisconnectedLocked();

  std::vector<SyncPeerPtr> idle;
  for (const auto& [id, peer] : peers_) {
    if (peer->IsIdle()) {
      idle.push_back(peer);
    }
  }
  if (idle.empty()) {
    return nullptr;
  }
  std::uniform_int_distribution<size_t> pick(0, idle.size() - 1);
  return idle[pick(rng_)];
}

SyncPeerPtr PeerRegistry::BestIdle() {
  std::lock_guard<std::mutex> lock(mutex_);
  PruneDisconnectedLocked();

  SyncPeerPtr best;
  for (const auto& [id, peer] : peers_) {
    if (peer->IsIdle() && (!best || peer->Score() > best->Score())) {
      best = peer;
    }
  }
  return best;
}

SyncPeerPtr PeerRegistry::ByIdentity(const PeerId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end() || !it->second->IsConnected()) {
    return nullptr;
  }
  return it->second;
}

void PeerRegistry::Close() {
  std::map<PeerId, SyncPeerPtr> peers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    peers.swap(peers_);
  }

  // Disconnect outside the lock; a peer may report back into the pool
  for (auto& [id, peer] : peers) {
    peer->Disconnect();
  }
  LOG_NET_DEBUG("peer pool closed ({} peers disconnected)", peers.size());
}

}  // namespace sync
}  // namespace chainsync
