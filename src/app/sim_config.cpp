// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/sim_config.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chainsync {
namespace app {

namespace {

// Canonical option name: lowercase with '-' separators
std::string NormalizeKey(std::string key) {
  std::replace(key.begin(), key.end(), '_', '-');
  return key;
}

bool ParseUnsigned(const std::string& value, uint64_t& out) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    out = std::stoull(value);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

bool ParseProbability(const std::string& value, double& out) {
  try {
    size_t used = 0;
    out = std::stod(value, &used);
    return used == value.size() && out >= 0.0 && out <= 1.0;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseBool(const std::string& value, bool& out) {
  if (value.empty() || value == "1" || value == "true") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false") {
    out = false;
    return true;
  }
  return false;
}

// Apply one option given as text. Returns false and sets error on an unknown key or bad value.
bool ApplyOption(const std::string& raw_key, const std::string& value, SimConfig& config, std::string& error) {
  const std::string key = NormalizeKey(raw_key);
  uint64_t number = 0;

  auto unsigned_option = [&](auto& field) {
    using Field = std::remove_reference_t<decltype(field)>;
    if (!ParseUnsigned(value, number)) {
      error = "--" + key + " requires a non-negative integer, got '" + value + "'";
      return false;
    }
    if constexpr (sizeof(Field) < sizeof(uint64_t)) {
      if (number > std::numeric_limits<Field>::max()) {
        error = "--" + key + " requires a non-negative integer up to " +
                std::to_string(std::numeric_limits<Field>::max()) + ", got '" + value + "'";
        return false;
      }
    }
    field = static_cast<Field>(number);
    return true;
  };

  if (key == "blocks") {
    return unsigned_option(config.blocks);
  } else if (key == "peers") {
    return unsigned_option(config.peers);
  } else if (key == "bad-peers") {
    return unsigned_option(config.bad_peers);
  } else if (key == "latency-ms") {
    return unsigned_option(config.latency_ms);
  } else if (key == "seed") {
    return unsigned_option(config.seed);
  } else if (key == "header-queue-limit") {
    return unsigned_option(config.header_queue_limit);
  } else if (key == "block-queue-limit") {
    return unsigned_option(config.block_queue_limit);
  } else if (key == "timeout") {
    return unsigned_option(config.timeout_s);
  } else if (key == "drop-rate") {
    if (!ParseProbability(value, config.drop_rate)) {
      error = "--drop-rate requires a probability in [0, 1], got '" + value + "'";
      return false;
    }
    return true;
  } else if (key == "prefer-best-peer") {
    if (!ParseBool(value, config.prefer_best_peer)) {
      error = "--prefer-best-peer takes no value, or true/false";
      return false;
    }
    return true;
  } else if (key == "loglevel") {
    config.loglevel = value;
    return true;
  } else if (key == "logfile") {
    config.logfile = value;
    return true;
  }

  error = "unknown option '" + raw_key + "'";
  return false;
}

// JSON scalars as the text the command line would carry
std::string JsonToOptionText(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? "true" : "false";
  }
  return value.dump();
}

}  // namespace

bool LoadConfigFile(const std::string& path, SimConfig& config, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open config file " + path;
    return false;
  }

  try {
    json j;
    file >> j;
    if (!j.is_object()) {
      error = path + ": top-level value must be an object";
      return false;
    }
    for (const auto& [key, value] : j.items()) {
      if (value.is_object() || value.is_array() || value.is_null()) {
        error = path + ": '" + key + "' must be a scalar";
        return false;
      }
      if (!ApplyOption(key, JsonToOptionText(value), config, error)) {
        error = path + ": " + error;
        return false;
      }
    }
  } catch (const std::exception& e) {
    error = "failed to parse " + path + ": " + e.what();
    return false;
  }
  return true;
}

bool ParseCommandLine(const std::vector<std::string>& args, SimConfig& config, std::string& error) {
  // The file provides the base; explicit options win regardless of position
  for (const auto& arg : args) {
    if (arg.starts_with("--config=")) {
      const std::string path = arg.substr(9);
      if (path.empty()) {
        error = "--config requires a non-empty path";
        return false;
      }
      if (!LoadConfigFile(path, config, error)) {
        return false;
      }
    }
  }

  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      config.help = true;
      continue;
    }
    if (arg.starts_with("--config=")) {
      continue;
    }
    if (!arg.starts_with("--")) {
      error = "unexpected argument '" + arg + "'";
      return false;
    }
    const auto eq = arg.find('=');
    const std::string key = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
    const std::string value = eq == std::string::npos ? std::string() : arg.substr(eq + 1);
    if (!ApplyOption(key, value, config, error)) {
      return false;
    }
  }
  return true;
}

bool ValidateConfig(const SimConfig& config, std::string& error) {
  if (config.blocks == 0) {
    error = "--blocks must be at least 1";
    return false;
  }
  if (config.peers + config.bad_peers == 0) {
    error = "at least one peer is required";
    return false;
  }
  if (config.block_queue_limit <= sync::BlockDownloader::MAX_IN_REQUEST) {
    error = "--block-queue-limit must exceed " + std::to_string(sync::BlockDownloader::MAX_IN_REQUEST);
    return false;
  }
  if (config.header_queue_limit == 0) {
    error = "--header-queue-limit must be at least 1";
    return false;
  }
  if (config.timeout_s == 0) {
    error = "--timeout must be at least 1";
    return false;
  }
  // spdlog maps unknown names to "off" without complaint
  static const std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn",
                                                          "error", "critical", "off"};
  if (std::find(kLogLevels.begin(), kLogLevels.end(), config.loglevel) == kLogLevels.end()) {
    error = "--loglevel must be one of trace, debug, info, warn, error, critical, off; got '" + config.loglevel + "'";
    return false;
  }
  return true;
}

}  // namespace app
}  // namespace chainsync
