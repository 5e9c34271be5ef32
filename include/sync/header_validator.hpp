// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {
namespace sync {

// Pass/fail check applied to every header before it reaches the pending-work queue.
// Called concurrently from response-delivery threads.
class HeaderValidator {
public:
  virtual ~HeaderValidator() = default;

  virtual bool Validate(const BlockHeader& header) = 0;

  // Human-readable reasons for the most recent failure (diagnostics only; under concurrent
  // use this is the failure of whichever call finished last)
  virtual std::string DescribeLastErrors() const = 0;
};

// A single structural check. Returns an error message when the header fails.
class HeaderRule {
public:
  virtual ~HeaderRule() = default;
  virtual std::optional<std::string> Check(const BlockHeader& header) const = 0;
};

class ExtraDataRule : public HeaderRule {
public:
  static constexpr size_t MAX_EXTRA_DATA_SIZE = 32;
  std::optional<std::string> Check(const BlockHeader& header) const override;
};

class GasValueRule : public HeaderRule {
public:
  std::optional<std::string> Check(const BlockHeader& header) const override;
};

class GasLimitRule : public HeaderRule {
public:
  static constexpr uint64_t MIN_GAS_LIMIT = 125000;
  std::optional<std::string> Check(const BlockHeader& header) const override;
};

class DifficultyRule : public HeaderRule {
public:
  std::optional<std::string> Check(const BlockHeader& header) const override;
};

// Hash must be set, and every block but genesis must name a parent
class LinkageRule : public HeaderRule {
public:
  std::optional<std::string> Check(const BlockHeader& header) const override;
};

// Runs every rule; a header is valid when no rule objects
class CompositeHeaderValidator : public HeaderValidator {
public:
  CompositeHeaderValidator() = default;

  // ExtraData, GasValue, GasLimit, Difficulty, Linkage
  static std::unique_ptr<CompositeHeaderValidator> CreateDefault();

  void AddRule(std::unique_ptr<HeaderRule> rule) { rules_.push_back(std::move(rule)); }
  size_t RuleCount() const { return rules_.size(); }

  bool Validate(const BlockHeader& header) override;
  std::string DescribeLastErrors() const override;

private:
  std::vector<std::unique_ptr<HeaderRule>> rules_;

  mutable std::mutex errors_mutex_;
  std::vector<std::string> last_errors_;  // guarded by errors_mutex_
};

}  // namespace sync
}  // namespace chainsync
