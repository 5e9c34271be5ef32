// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/sim_config.hpp"
#include "sim/chain_generator.hpp"
#include "sim/import_sink.hpp"
#include "sim/simulated_network.hpp"
#include "sync/block_downloader.hpp"
#include "sync/header_validator.hpp"
#include "sync/sync_queue.hpp"
#include "util/logging.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace chainsync;

namespace {

void PrintUsage(const char* program_name) {
  std::cout
      << "syncsim - run the block downloader against a simulated peer network\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --config=<file>            JSON file with any of the options below\n"
      << "  --blocks=<n>               Chain height to sync (default: 5000)\n"
      << "  --peers=<n>                Well-behaved peers (default: 8)\n"
      << "  --bad-peers=<n>            Peers sending invalid headers (default: 0)\n"
      << "  --latency-ms=<n>           Mean response latency (default: 20)\n"
      << "  --drop-rate=<p>            Probability a request goes unanswered (default: 0)\n"
      << "  --seed=<n>                 Chain and network seed (default: 1)\n"
      << "  --header-queue-limit=<n>   Pending header backlog (default: 10000)\n"
      << "  --block-queue-limit=<n>    Import queue size (default: 2000)\n"
      << "  --prefer-best-peer         Prefer the best-scored peer near the tip\n"
      << "  --timeout=<s>              Give up after this many seconds (default: 300)\n"
      << "  --loglevel=<level>         trace|debug|info|warn|error|critical|off (default: info)\n"
      << "  --logfile=<path>           Also log to this file\n"
      << "  --help                     Show this help message\n"
      << std::endl;
}

void PrintSummary(const app::SimConfig& config, const sync::BlockDownloader& downloader,
                  const sim::ImportSink& sink, const sim::SimulatedNetwork& network,
                  std::chrono::steady_clock::duration elapsed) {
  const auto& stats = downloader.stats();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

  std::cout << "\nSync summary\n"
            << "  target height:         " << config.blocks << "\n"
            << "  imported height:       " << sink.ImportedHeight() << "\n"
            << "  headers delivered:     " << sink.HeadersReceived() << "\n"
            << "  elapsed:               " << ms << " ms\n"
            << "  header requests:       " << stats.header_requests_sent.load() << "\n"
            << "  body requests:         " << stats.body_requests_sent.load() << " ("
            << stats.fast_path_requests_sent.load() << " fast path)\n"
            << "  rejected header resp.: " << stats.rejected_header_responses.load() << "\n"
            << "  failed requests:       " << stats.failed_requests.load() << "\n"
            << "  peer reconnects:       " << network.Reconnects() << "\n"
            << "  blocks by peer:\n";
  for (const auto& [peer, count] : sink.BlocksByOrigin()) {
    std::cout << "    " << peer << ": " << count << "\n";
  }
  std::cout << std::flush;
}

int RunSimulation(const app::SimConfig& config) {
  LOG_INFO("generating chain of {} blocks (seed {})", config.blocks, config.seed);
  sim::ChainGenerator chain(config.blocks, config.seed);

  sim::NetworkConfig net_config;
  net_config.peers = config.peers;
  net_config.bad_peers = config.bad_peers;
  net_config.latency = std::chrono::milliseconds(config.latency_ms);
  net_config.drop_rate = config.drop_rate;
  net_config.seed = config.seed;
  sim::SimulatedNetwork network(chain, net_config);

  sync::SyncQueue::Config queue_config;
  queue_config.first_block = 1;
  queue_config.last_block = config.blocks;
  queue_config.request_timeout = std::chrono::seconds(2);
  sync::SyncQueue queue(queue_config);

  sim::ImportSink::Config sink_config;
  sink_config.first_block = 1;
  sink_config.last_block = config.blocks;
  sink_config.capacity = config.block_queue_limit;
  sim::ImportSink sink(sink_config);

  sync::BlockDownloader::Config dl_config;
  dl_config.header_queue_limit = config.header_queue_limit;
  dl_config.block_queue_limit = config.block_queue_limit;
  dl_config.peer_selection =
      config.prefer_best_peer ? sync::PeerSelection::kPreferBestNearTip : sync::PeerSelection::kAnyIdle;

  auto validator = sync::CompositeHeaderValidator::CreateDefault();
  sync::BlockDownloader downloader(*validator, sink, dl_config);

  const auto started = std::chrono::steady_clock::now();
  network.Start();
  sink.Start();
  if (!downloader.Start(queue, network.registry())) {
    LOG_ERROR("failed to start block downloader");
    return 1;
  }

  const bool imported = sink.WaitForImport(std::chrono::seconds(config.timeout_s));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  if (!imported) {
    LOG_ERROR("sync did not complete within {}s (imported {} of {})", config.timeout_s, sink.ImportedHeight(),
              config.blocks);
  }

  downloader.Close();
  downloader.Join();
  network.Stop();
  sink.Stop();

  PrintSummary(config, downloader, sink, network, elapsed);
  return imported && sink.ImportErrors() == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    const std::vector<std::string> args(argv + 1, argv + argc);

    app::SimConfig config;
    std::string error;
    if (!app::ParseCommandLine(args, config, error)) {
      std::cerr << "Error: " << error << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
    if (config.help) {
      PrintUsage(argv[0]);
      return 0;
    }
    if (!app::ValidateConfig(config, error)) {
      std::cerr << "Error: " << error << "\n";
      return 1;
    }

    util::LogManager::Initialize(config.loglevel, !config.logfile.empty(), config.logfile);
    const int rc = RunSimulation(config);
    util::LogManager::Shutdown();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
