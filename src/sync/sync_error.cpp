// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_error.hpp"

namespace chainsync {
namespace sync {

namespace {

class SyncCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "sync"; }

  std::string message(int value) const override {
    switch (static_cast<sync_error>(value)) {
    case sync_error::success:
      return "success";
    case sync_error::request_timeout:
      return "request timed out";
    case sync_error::peer_disconnected:
      return "peer disconnected";
    case sync_error::invalid_response:
      return "invalid response";
    case sync_error::header_validation_failed:
      return "received headers failed validation";
    }
    return "unknown sync error";
  }
};

}  // namespace

const std::error_category& sync_category() noexcept {
  static const SyncCategory category;
  return category;
}

}  // namespace sync
}  // namespace chainsync
