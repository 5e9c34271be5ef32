// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/header_validator.hpp"

namespace chainsync {
namespace sync {

std::optional<std::string> ExtraDataRule::Check(const BlockHeader& header) const {
  if (header.extra_data.size() > MAX_EXTRA_DATA_SIZE) {
    return "extra data too long: " + std::to_string(header.extra_data.size()) + " > " +
           std::to_string(MAX_EXTRA_DATA_SIZE) + " bytes";
  }
  return std::nullopt;
}

std::optional<std::string> GasValueRule::Check(const BlockHeader& header) const {
  if (header.gas_used > header.gas_limit) {
    return "gas used " + std::to_string(header.gas_used) + " exceeds gas limit " + std::to_string(header.gas_limit);
  }
  return std::nullopt;
}

std::optional<std::string> GasLimitRule::Check(const BlockHeader& header) const {
  if (header.gas_limit < MIN_GAS_LIMIT) {
    return "gas limit " + std::to_string(header.gas_limit) + " below minimum " + std::to_string(MIN_GAS_LIMIT);
  }
  return std::nullopt;
}

std::optional<std::string> DifficultyRule::Check(const BlockHeader& header) const {
  if (header.difficulty == 0) {
    return "zero difficulty";
  }
  return std::nullopt;
}

std::optional<std::string> LinkageRule::Check(const BlockHeader& header) const {
  if (header.hash.IsNull()) {
    return "missing block hash";
  }
  if (header.number > 0 && header.parent_hash.IsNull()) {
    return "missing parent hash";
  }
  if (header.parent_hash == header.hash) {
    return "header is its own parent";
  }
  return std::nullopt;
}

std::unique_ptr<CompositeHeaderValidator> CompositeHeaderValidator::CreateDefault() {
  auto validator = std::make_unique<CompositeHeaderValidator>();
  validator->AddRule(std::make_unique<ExtraDataRule>());
  validator->AddRule(std::make_unique<GasValueRule>());
  validator->AddRule(std::make_unique<GasLimitRule>());
  validator->AddRule(std::make_unique<DifficultyRule>());
  validator->AddRule(std::make_unique<LinkageRule>());
  return validator;
}

bool CompositeHeaderValidator::Validate(const BlockHeader& header) {
  std::vector<std::string> errors;
  for (const auto& rule : rules_) {
    if (auto error = rule->Check(header)) {
      errors.push_back(std::move(*error));
    }
  }
  if (errors.empty()) {
    return true;
  }

  std::lock_guard<std::mutex> lock(errors_mutex_);
  last_errors_ = std::move(errors);
  return false;
}

std::string CompositeHeaderValidator::DescribeLastErrors() const {
  std::lock_guard<std::mutex> lock(errors_mutex_);
  std::string out;
  for (const auto& error : last_errors_) {
    if (!out.empty()) {
      out += "; ";
    }
    out += error;
  }
  return out;
}

}  // namespace sync
}  // namespace chainsync
