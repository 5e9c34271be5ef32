// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace chainsync {
namespace sync {

// CountingGate - one-shot counting latch with a timed, interruptible wait
//
// A retrieval loop arms a fresh gate every iteration and waits until `required`
// responses have arrived, the timeout expires, or the engine is stopped. Gates are
// never reset; the loop swaps in a new one. Release() on an open (or abandoned) gate
// is a no-op, so a slow response aimed at an earlier iteration's gate is harmless.
class CountingGate {
public:
  enum class WaitResult {
    kReleased,     // count reached zero
    kTimedOut,     // timeout expired first
    kInterrupted,  // Interrupt() was called
  };

  explicit CountingGate(size_t required);

  CountingGate(const CountingGate&) = delete;
  CountingGate& operator=(const CountingGate&) = delete;

  // Count down by one; saturates at zero
  void Release();

  // Wake every waiter with kInterrupted; sticky
  void Interrupt();

  WaitResult WaitFor(std::chrono::milliseconds timeout);

  size_t Required() const { return required_; }
  size_t Remaining() const;
  bool IsInterrupted() const;

private:
  const size_t required_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  size_t remaining_;         // guarded by mutex_
  bool interrupted_{false};  // guarded by mutex_
};

using CountingGatePtr = std::shared_ptr<CountingGate>;

}  // namespace sync
}  // namespace chainsync
