// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <system_error>

namespace chainsync {
namespace sync {

// Why a header or body request did not produce a usable response.
// Peers may also report errors from other categories (e.g. asio transport errors).
enum class sync_error {
  success = 0,
  request_timeout = 1,
  peer_disconnected = 2,
  invalid_response = 3,
  header_validation_failed = 4,
};

const std::error_category& sync_category() noexcept;

inline std::error_code make_error_code(sync_error e) noexcept {
  return {static_cast<int>(e), sync_category()};
}

}  // namespace sync
}  // namespace chainsync

namespace std {
template <>
struct is_error_code_enum<chainsync::sync::sync_error> : true_type {};
}  // namespace std
