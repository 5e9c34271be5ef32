// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace chainsync {
namespace util {

RateLimiter::Decision RateLimiter::Check(const std::string& callsite_key, int burst, std::chrono::seconds period) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = GetSteadyTime();
  auto& bucket = buckets_[callsite_key];

  // A fresh callsite starts with a full bucket
  if (!bucket.initialized) {
    bucket.tokens = static_cast<double>(burst);
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed > 0 && period.count() > 0) {
    const double refill_rate = static_cast<double>(burst) / static_cast<double>(period.count());
    bucket.tokens = std::min(bucket.tokens + refill_rate * static_cast<double>(elapsed), static_cast<double>(burst));
    bucket.last_refill = now;
  }

  Decision decision;
  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    decision.allowed = true;
    decision.suppressed = bucket.suppressed;
    bucket.suppressed = 0;
  } else {
    ++bucket.suppressed;
  }
  return decision;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace chainsync
