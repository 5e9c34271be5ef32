// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"

#include <cstddef>
#include <vector>

namespace chainsync {
namespace sync {

// DownstreamSink - where downloaded data goes, and how much more it can take
//
// OnHeadersReady/OnBlocksReady are called with the engine's ingestion lock held, from
// response-delivery threads; calls never overlap. Implementations must not call back
// into the engine from them.
class DownstreamSink {
public:
  virtual ~DownstreamSink() = default;

  virtual void OnHeadersReady(std::vector<HeaderEnvelope> headers) = 0;
  virtual void OnBlocksReady(std::vector<BlockEnvelope> blocks) = 0;

  // Free slots in the block import queue. Polled by the block retrieval loop.
  virtual size_t FreeBodyQueueCapacity() = 0;

  // Called once, from the loop thread that detects completion
  virtual void OnDownloadComplete() {}

  // True once the node considers itself near the chain tip (short sync). Lengthens the
  // header poll interval and, when configured, makes peer selection prefer the best peer.
  virtual bool IsSyncDone() const { return false; }
};

}  // namespace sync
}  // namespace chainsync
