// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace chainsync {
namespace util {

// Current wall-clock time in seconds since the epoch (mockable).
int64_t GetTime();

// Monotonic clock (mockable). While mock time is set, advancing the mock time by N seconds
// advances the returned time point by N seconds as well.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mocking and returns to the real clocks).
void SetMockTime(int64_t time);
int64_t GetMockTime();

// RAII helper for tests: sets mock time on construction, restores the previous value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace chainsync
