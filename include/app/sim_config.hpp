// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sync/block_downloader.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chainsync {
namespace app {

// Everything the syncsim program can be told, from a JSON file and/or the command line
struct SimConfig {
  uint64_t blocks;              // Chain height to sync (blocks 1..blocks)
  size_t peers;                 // Well-behaved peers
  size_t bad_peers;             // Peers sending invalid / truncated responses
  uint32_t latency_ms;          // Mean response latency
  double drop_rate;             // Per-request drop probability
  uint64_t seed;
  size_t header_queue_limit;
  size_t block_queue_limit;
  bool prefer_best_peer;        // PeerSelection::kPreferBestNearTip
  uint32_t timeout_s;           // Give up after this long
  std::string loglevel;
  std::string logfile;          // Empty = console only
  bool help;

  SimConfig()
      : blocks(5000), peers(8), bad_peers(0), latency_ms(20), drop_rate(0.0), seed(1),
        header_queue_limit(sync::DEFAULT_HEADER_QUEUE_LIMIT), block_queue_limit(sync::DEFAULT_BLOCK_QUEUE_LIMIT),
        prefer_best_peer(false), timeout_s(300), loglevel("info"), help(false) {}
};

// Apply the keys present in a JSON object file (same names as the long options, with
// '-' or '_'). Unknown keys are an error. Returns false and sets `error` on failure.
bool LoadConfigFile(const std::string& path, SimConfig& config, std::string& error);

// Parse argv: --config=<file> is loaded first, then every other option overrides it.
bool ParseCommandLine(const std::vector<std::string>& args, SimConfig& config, std::string& error);

// Range checks that cut across options
bool ValidateConfig(const SimConfig& config, std::string& error);

}  // namespace app
}  // namespace chainsync
