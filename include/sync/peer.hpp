// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>
#include <vector>

namespace chainsync {
namespace sync {

class SyncPeer;
using SyncPeerPtr = std::shared_ptr<SyncPeer>;

// Response handlers. Invoked exactly once per dispatched request, on whatever thread the
// peer delivers responses on (never synchronously from inside the Send* call).
// A non-zero error code means the payload is empty and must be ignored.
using HeadersHandler = std::function<void(const std::error_code& ec, std::vector<BlockHeader> headers)>;
using BodiesHandler = std::function<void(const std::error_code& ec, std::vector<Block> blocks)>;

// SyncPeer - the view of a connected remote endpoint the download engine needs
//
// Owned by the peer pool; the engine keeps a SyncPeerPtr only while a request is in flight.
// Send* return false when the request could not be dispatched (peer went busy or
// disconnected between selection and dispatch); the handler is then never called.
class SyncPeer {
public:
  virtual ~SyncPeer() = default;

  virtual const PeerId& Identity() const = 0;

  // Connected and not serving an outstanding request
  virtual bool IsIdle() const = 0;
  virtual bool IsConnected() const = 0;

  // Higher is better (e.g. advertised chain weight, observed throughput)
  virtual uint64_t Score() const = 0;

  // GET_BLOCK_HEADERS anchored by number
  virtual bool SendGetHeaders(uint64_t start, uint32_t count, bool reverse, HeadersHandler handler) = 0;

  // GET_BLOCK_HEADERS anchored by hash, `step` blocks between consecutive headers
  virtual bool SendGetHeaders(const Hash256& hash, uint32_t count, uint32_t step, bool reverse,
                              HeadersHandler handler) = 0;

  virtual bool SendGetBodies(const std::vector<HeaderEnvelope>& headers, BodiesHandler handler) = 0;

  // Drop the connection. Safe to call more than once and from any thread.
  virtual void Disconnect() = 0;
};

}  // namespace sync
}  // namespace chainsync
