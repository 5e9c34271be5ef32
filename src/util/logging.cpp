// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace chainsync {
namespace util {

namespace {

const std::vector<std::string> kComponents = {"default", "sync", "network", "sim"};

std::once_flag g_init_flag;
std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;  // guarded by g_mutex
std::vector<spdlog::sink_ptr> g_sinks;                              // guarded by g_mutex
spdlog::level::level_enum g_level = spdlog::level::off;             // guarded by g_mutex

// Requires g_mutex
void CreateLoggersLocked() {
  if (g_sinks.empty()) {
    g_sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  for (const auto& component : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(component, g_sinks.begin(), g_sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
    logger->set_level(g_level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[component] = std::move(logger);
  }
}

void InitializeOnce(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_level = spdlog::level::from_str(log_level);
  g_sinks.clear();
  g_sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (log_to_file && !log_file_path.empty()) {
    try {
      g_sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      // Keep console logging; report once the loggers exist
      CreateLoggersLocked();
      g_loggers["default"]->error("failed to open log file {}: {}", log_file_path, e.what());
      return;
    }
  }
  CreateLoggersLocked();
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::call_once(g_init_flag, InitializeOnce, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    CreateLoggersLocked();
  }
  auto it = g_loggers.find(name);
  if (it == g_loggers.end()) {
    return g_loggers["default"];
  }
  return it->second;
}

void LogManager::SetLogLevel(const std::string& level) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_mutex);
  g_level = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(g_level);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

}  // namespace util
}  // namespace chainsync
