// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite rate limiting for log output driven by peer input

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chainsync {
namespace util {

/**
 * RateLimiter - token bucket keyed by log callsite
 *
 * A peer that keeps answering with garbage would otherwise produce one warning per
 * response. Each callsite gets `burst` tokens which refill linearly over `period`.
 * Messages dropped while a bucket is empty are counted, and the count is handed back
 * with the next allowed message so the log still shows that something was suppressed.
 */
class RateLimiter {
public:
  struct Decision {
    bool allowed{false};
    uint64_t suppressed{0};  // messages dropped at this callsite since the last allowed one
  };

  Decision Check(const std::string& callsite_key, int burst, std::chrono::seconds period);

  // Convenience wrapper returning only whether the message may be logged.
  bool should_log(const std::string& callsite_key, int burst, int period_seconds) {
    return Check(callsite_key, burst, std::chrono::seconds(period_seconds)).allowed;
  }

  // Forget all buckets (tests).
  void Reset();

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    uint64_t suppressed{0};
    bool initialized{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace chainsync
