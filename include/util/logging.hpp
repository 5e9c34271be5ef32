// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace chainsync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "sync", "network", "sim"), all sharing the same
 * sinks (stdout, plus a file sink when requested).
 *
 * Thread-safety: all methods are thread-safe. Initialize() runs exactly once per process
 * (std::call_once); later calls are no-ops. GetLogger() auto-initializes with level "off"
 * so library code may log before the application configured anything.
 */
class LogManager {
public:
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "chainsync.log");

  // Flushes and drops all loggers. Logging after shutdown re-creates them with the last level.
  static void Shutdown();

  // Unknown component names map to the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace chainsync

#define LOG_TRACE(...) chainsync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) chainsync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) chainsync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) chainsync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) chainsync::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SYNC_TRACE(...) chainsync::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...) chainsync::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...) chainsync::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...) chainsync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...) chainsync::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_NET_TRACE(...) chainsync::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) chainsync::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) chainsync::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) chainsync::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)

#define LOG_SIM_DEBUG(...) chainsync::util::LogManager::GetLogger("sim")->debug(__VA_ARGS__)
#define LOG_SIM_INFO(...) chainsync::util::LogManager::GetLogger("sim")->info(__VA_ARGS__)
#define LOG_SIM_WARN(...) chainsync::util::LogManager::GetLogger("sim")->warn(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For messages triggered by peer input (invalid headers, failed requests): a single
// misbehaving peer must not be able to flood the log. 200 messages per hour per callsite;
// the first message after a quiet period reports how many were dropped.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_RL_(component, lvl, ...)                                                                                   \
  do {                                                                                                                 \
    auto rl_decision_ =                                                                                                \
        chainsync::util::RateLimiter::instance().Check(CALLSITE_KEY_, 200, std::chrono::seconds(3600));                \
    if (rl_decision_.allowed) {                                                                                        \
      auto rl_logger_ = chainsync::util::LogManager::GetLogger(component);                                             \
      if (rl_decision_.suppressed > 0) {                                                                               \
        rl_logger_->lvl("{} similar messages suppressed", rl_decision_.suppressed);                                    \
      }                                                                                                                \
      rl_logger_->lvl(__VA_ARGS__);                                                                                    \
    }                                                                                                                  \
  } while (0)

#define LOG_ERROR_RL(...) LOG_RL_("default", error, __VA_ARGS__)
#define LOG_SYNC_ERROR_RL(...) LOG_RL_("sync", error, __VA_ARGS__)
#define LOG_SYNC_WARN_RL(...) LOG_RL_("sync", warn, __VA_ARGS__)
#define LOG_NET_WARN_RL(...) LOG_RL_("network", warn, __VA_ARGS__)
