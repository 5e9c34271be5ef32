// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/import_sink.hpp"

#include "util/logging.hpp"

#include <stdexcept>

namespace chainsync {
namespace sim {

ImportSink::ImportSink(const Config& config)
    : config_(config), imported_height_(config.first_block == 0 ? 0 : config.first_block - 1) {
  if (config.first_block == 0) {
    throw std::invalid_argument("ImportSink: the genesis block is never imported");
  }
  if (config.last_block < config.first_block) {
    throw std::invalid_argument("ImportSink: last_block < first_block");
  }
}

ImportSink::~ImportSink() {
  Stop();
}

void ImportSink::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (importer_.joinable()) {
    return;
  }
  stop_ = false;
  importer_ = std::thread([this]() { ImportLoop(); });
}

void ImportSink::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (importer_.joinable()) {
    importer_.join();
  }
}

void ImportSink::OnHeadersReady(std::vector<sync::HeaderEnvelope> headers) {
  for (const auto& envelope : headers) {
    const uint64_t number = envelope.header.number;
    const uint64_t best = best_header_.load();
    if (best != 0 && number != best + 1) {
      ++out_of_order_headers_;
      LOG_SIM_WARN("header {} delivered after #{}", envelope.header.ShortDescr(), best);
    }
    best_header_ = number;
  }
  headers_received_ += headers.size();
}

void ImportSink::OnBlocksReady(std::vector<sync::BlockEnvelope> blocks) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& envelope : blocks) {
      const uint64_t number = envelope.block.Number();
      buffer_.emplace(number, std::move(envelope));
    }
  }
  blocks_received_ += blocks.size();
  cv_.notify_all();
}

size_t ImportSink::FreeBodyQueueCapacity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size() >= config_.capacity ? 0 : config_.capacity - buffer_.size();
}

void ImportSink::OnDownloadComplete() {
  download_complete_ = true;
  LOG_SIM_INFO("download complete signaled (imported height {})", imported_height_.load());
  cv_.notify_all();
}

bool ImportSink::IsSyncDone() const {
  return imported_height_.load() + config_.sync_done_distance >= config_.last_block;
}

bool ImportSink::WaitForImport(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return imported_height_.load() >= config_.last_block; });
}

size_t ImportSink::Buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

std::map<sync::PeerId, uint64_t> ImportSink::BlocksByOrigin() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_origin_;
}

void ImportSink::ImportLoop() {
  LOG_SIM_DEBUG("importer started at #{}", imported_height_.load() + 1);

  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this]() {
      return stop_ || buffer_.count(imported_height_.load() + 1) != 0;
    });
    if (stop_) {
      break;
    }

    auto it = buffer_.find(imported_height_.load() + 1);
    sync::BlockEnvelope envelope = std::move(it->second);
    buffer_.erase(it);
    lock.unlock();

    const sync::Block& block = envelope.block;
    if (!last_imported_hash_.IsNull() && block.header.parent_hash != last_imported_hash_) {
      ++import_errors_;
      LOG_SIM_WARN("block {} does not extend the imported chain", block.ShortDescr());
    }
    if (config_.import_delay.count() > 0) {
      std::this_thread::sleep_for(config_.import_delay);
    }
    last_imported_hash_ = block.Hash();

    lock.lock();
    ++by_origin_[envelope.origin];
    imported_height_ = block.Number();
    if (block.Number() >= config_.last_block) {
      LOG_SIM_INFO("imported target block {}", block.ShortDescr());
    }
    cv_.notify_all();
  }

  LOG_SIM_DEBUG("importer stopped at #{}", imported_height_.load());
}

}  // namespace sim
}  // namespace chainsync
