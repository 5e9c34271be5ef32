// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/gate.hpp"

namespace chainsync {
namespace sync {

CountingGate::CountingGate(size_t required) : required_(required), remaining_(required) {}

void CountingGate::Release() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (remaining_ == 0) {
    return;
  }
  if (--remaining_ == 0) {
    cv_.notify_all();
  }
}

void CountingGate::Interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

CountingGate::WaitResult CountingGate::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool woken = cv_.wait_for(lock, timeout, [this] { return interrupted_ || remaining_ == 0; });
  // Interruption wins over a count that reached zero at the same moment
  if (interrupted_) {
    return WaitResult::kInterrupted;
  }
  return woken ? WaitResult::kReleased : WaitResult::kTimedOut;
}

size_t CountingGate::Remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return remaining_;
}

bool CountingGate::IsInterrupted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interrupted_;
}

}  // namespace sync
}  // namespace chainsync
