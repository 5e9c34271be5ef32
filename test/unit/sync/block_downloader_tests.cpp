// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for BlockDownloader retrieval-loop passes (no worker threads)

#include <catch2/catch_test_macros.hpp>

#include "common/downloader_fixture.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

using namespace chainsync;
using namespace chainsync::sync;
using test::BlockDownloaderTestAccess;
using test::DownloaderFixture;
using test::Envelop;
using test::MakeHeaders;
using test::MakeRanges;

// ============================================================================
// Header retrieval
// ============================================================================

TEST_CASE("BlockDownloader: header queue at limit sends nothing", "[sync][block_downloader]") {
    DownloaderFixture f(2);
    BlockDownloader::Config config;
    config.header_queue_limit = 500;
    auto d = f.MakeDownloader(config);

    f.queue.QueueHeaderRanges(MakeRanges(1, 4));
    f.queue.pending_header_count = 500;

    REQUIRE_FALSE(BlockDownloaderTestAccess::RunHeaderIteration(*d));
    REQUIRE(f.queue.header_range_calls == 0);
    REQUIRE(f.TotalHeaderRequests() == 0);
    REQUIRE(BlockDownloaderTestAccess::HeaderGate(*d)->Required() == 1);

    SECTION("Requests resume below the limit") {
        f.queue.pending_header_count = 499;
        REQUIRE_FALSE(BlockDownloaderTestAccess::RunHeaderIteration(*d));
        REQUIRE(f.TotalHeaderRequests() == 4);
    }
}

TEST_CASE("BlockDownloader: header gate requires a quarter of the dispatched requests", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    auto d = f.MakeDownloader();

    SECTION("32 requests") {
        f.queue.QueueHeaderRanges(MakeRanges(1, 32));
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.TotalHeaderRequests() == 32);
        REQUIRE(BlockDownloaderTestAccess::HeaderGate(*d)->Required() == 8);
    }

    SECTION("9 requests") {
        f.queue.QueueHeaderRanges(MakeRanges(1, 9));
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(BlockDownloaderTestAccess::HeaderGate(*d)->Required() == 2);
    }

    SECTION("Fewer than 4 requests still wait for one") {
        f.queue.QueueHeaderRanges(MakeRanges(1, 3));
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.TotalHeaderRequests() == 3);
        REQUIRE(BlockDownloaderTestAccess::HeaderGate(*d)->Required() == 1);
    }
}

TEST_CASE("BlockDownloader: header ranges are asked for in 32 x 192 batches", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    auto d = f.MakeDownloader();
    f.queue.QueueHeaderRanges(MakeRanges(1000, 2));

    BlockDownloaderTestAccess::RunHeaderIteration(*d);
    REQUIRE(f.queue.last_max_span == BlockDownloader::MAX_IN_REQUEST);
    REQUIRE(f.queue.last_max_requests == BlockDownloader::MAX_REQUESTS);

    auto requests = f.peers[0]->HeaderRequests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].start == 1000);
    REQUIRE(requests[0].count == 192);
    REQUIRE_FALSE(requests[0].hash.has_value());
    REQUIRE(requests[1].start == 1192);
}

TEST_CASE("BlockDownloader: hash-anchored ranges use the skip request", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    auto d = f.MakeDownloader();
    const Hash256 anchor = MakeHeaders(500, 1).front().hash;
    f.queue.QueueHeaderRanges({HeaderRangeRequest(anchor, 500, 16, 8, true)});

    BlockDownloaderTestAccess::RunHeaderIteration(*d);
    auto requests = f.peers[0]->HeaderRequests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].hash.has_value());
    REQUIRE(*requests[0].hash == anchor);
    REQUIRE(requests[0].count == 16);
    REQUIRE(requests[0].step == 8);
    REQUIRE(requests[0].reverse);
}

TEST_CASE("BlockDownloader: undispatched header ranges carry over", "[sync][block_downloader]") {
    DownloaderFixture f(2);
    auto d = f.MakeDownloader();
    f.queue.QueueHeaderRanges(MakeRanges(1, 5));

    SECTION("No idle peer defers the whole batch") {
        for (auto& peer : f.peers) {
            peer->idle = false;
        }
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.TotalHeaderRequests() == 0);
        REQUIRE(BlockDownloaderTestAccess::DeferredHeaderRequests(*d) == 5);
        REQUIRE(BlockDownloaderTestAccess::HeaderGate(*d)->Required() == 1);

        // Next pass sends the cached ranges without asking the queue again
        f.peers[0]->idle = true;
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.queue.header_range_calls == 1);
        auto requests = f.peers[0]->HeaderRequests();
        REQUIRE(requests.size() == 5);
        for (size_t i = 0; i < requests.size(); ++i) {
            REQUIRE(requests[i].start == 1 + i * 192);
        }
        REQUIRE(BlockDownloaderTestAccess::DeferredHeaderRequests(*d) == 0);
    }

    SECTION("Peers going busy leave the tail cached in order") {
        for (auto& peer : f.peers) {
            peer->busy_on_send = true;
        }
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.TotalHeaderRequests() == 2);
        REQUIRE(BlockDownloaderTestAccess::DeferredHeaderRequests(*d) == 3);

        f.peers[1]->idle = true;
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        auto requests = f.peers[1]->HeaderRequests();
        REQUIRE(requests.back().start == 1 + 2 * 192);
        REQUIRE(BlockDownloaderTestAccess::DeferredHeaderRequests(*d) == 2);
    }

    SECTION("Declined requests stay cached") {
        for (auto& peer : f.peers) {
            peer->accept = false;
        }
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.TotalHeaderRequests() == 0);
        REQUIRE(BlockDownloaderTestAccess::DeferredHeaderRequests(*d) == 5);
        REQUIRE(d->stats().header_requests_sent == 0);
    }
}

TEST_CASE("BlockDownloader: header download completion", "[sync][block_downloader]") {
    DownloaderFixture f(1);

    SECTION("Bodies disabled: empty batch completes the download once") {
        BlockDownloader::Config config;
        config.bodies_download = false;
        auto d = f.MakeDownloader(config);

        REQUIRE(BlockDownloaderTestAccess::RunHeaderIteration(*d));
        REQUIRE(d->IsHeadersDownloadComplete());
        REQUIRE(d->IsDownloadComplete());
        REQUIRE(f.sink.complete_calls == 1);

        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.sink.complete_calls == 1);
    }

    SECTION("Bodies enabled: only headers are complete") {
        auto d = f.MakeDownloader();
        REQUIRE(BlockDownloaderTestAccess::RunHeaderIteration(*d));
        REQUIRE(d->IsHeadersDownloadComplete());
        REQUIRE_FALSE(d->IsDownloadComplete());
        REQUIRE(f.sink.complete_calls == 0);
    }

    SECTION("Cached ranges keep the loop alive") {
        auto d = f.MakeDownloader();
        f.peers[0]->idle = false;
        f.queue.QueueHeaderRanges(MakeRanges(1, 1));
        REQUIRE_FALSE(BlockDownloaderTestAccess::RunHeaderIteration(*d));
        REQUIRE_FALSE(BlockDownloaderTestAccess::RunHeaderIteration(*d));
        REQUIRE_FALSE(d->IsHeadersDownloadComplete());
    }
}

TEST_CASE("BlockDownloader: header wait timeout follows sync state", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    BlockDownloader::Config config;
    config.header_wait = std::chrono::milliseconds(150);
    config.header_wait_sync_done = std::chrono::milliseconds(900);
    auto d = f.MakeDownloader(config);

    REQUIRE(BlockDownloaderTestAccess::HeaderWaitTimeout(*d) == std::chrono::milliseconds(150));
    f.sink.sync_done = true;
    REQUIRE(BlockDownloaderTestAccess::HeaderWaitTimeout(*d) == std::chrono::milliseconds(900));

    BlockDownloader::Config defaults;
    REQUIRE(defaults.header_wait == std::chrono::seconds(2));
    REQUIRE(defaults.header_wait_sync_done == std::chrono::seconds(10));
    REQUIRE(defaults.block_wait == std::chrono::seconds(2));
    REQUIRE(defaults.header_queue_limit == 10000);
    REQUIRE(defaults.block_queue_limit == 2000);
}

// ============================================================================
// Block retrieval
// ============================================================================

TEST_CASE("BlockDownloader: full import queue sends nothing", "[sync][block_downloader]") {
    DownloaderFixture f(2);
    auto d = f.MakeDownloader();
    f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 10), "peer-0")));

    for (size_t free_slots : {size_t{0}, size_t{100}, size_t{192}}) {
        f.sink.free_capacity = free_slots;
        REQUIRE_FALSE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE(f.queue.body_batch_calls == 0);
        REQUIRE(f.TotalBodyRequests() == 0);
        REQUIRE(BlockDownloaderTestAccess::BlockGate(*d)->Required() == 1);
    }
}

TEST_CASE("BlockDownloader: body batch is sized to free capacity", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    auto d = f.MakeDownloader();

    SECTION("Just above one request") {
        f.sink.free_capacity = 193;
        BlockDownloaderTestAccess::RunBlockIteration(*d);
        REQUIRE(f.queue.last_max_headers == 192);
    }

    SECTION("Several requests") {
        f.sink.free_capacity = 1000;
        BlockDownloaderTestAccess::RunBlockIteration(*d);
        REQUIRE(f.queue.last_max_headers == 192 * 5);
    }

    SECTION("Capped at 32 requests") {
        f.sink.free_capacity = 100000;
        BlockDownloaderTestAccess::RunBlockIteration(*d);
        REQUIRE(f.queue.last_max_headers == 192 * 32);
    }
}

TEST_CASE("BlockDownloader: block gate requires every dispatched request", "[sync][block_downloader]") {
    DownloaderFixture f(3);
    auto d = f.MakeDownloader();
    f.sink.free_capacity = 2000;
    for (auto& peer : f.peers) {
        peer->busy_on_send = true;
    }

    SECTION("Split into 192-body requests, one per idle peer") {
        f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 400), "peer-9")));
        BlockDownloaderTestAccess::RunBlockIteration(*d);

        std::vector<size_t> sizes;
        for (const auto& peer : f.peers) {
            for (const auto& request : peer->BodyRequests()) {
                sizes.push_back(request.headers.size());
            }
        }
        std::sort(sizes.begin(), sizes.end());
        REQUIRE(sizes == std::vector<size_t>{16, 192, 192});
        REQUIRE(BlockDownloaderTestAccess::BlockGate(*d)->Required() == 3);
    }

    SECTION("Chunks without a peer are dropped, not cached") {
        f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 192 * 5), "peer-9")));
        BlockDownloaderTestAccess::RunBlockIteration(*d);
        REQUIRE(f.TotalBodyRequests() == 3);
        REQUIRE(BlockDownloaderTestAccess::BlockGate(*d)->Required() == 3);

        for (auto& peer : f.peers) {
            peer->idle = true;
        }
        BlockDownloaderTestAccess::RunBlockIteration(*d);
        REQUIRE(f.queue.body_batch_calls == 2);
        REQUIRE(f.TotalBodyRequests() == 3);  // queue had nothing more to hand out
    }

    SECTION("Nothing dispatched still waits for one") {
        for (auto& peer : f.peers) {
            peer->idle = false;
        }
        f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 100), "peer-9")));
        BlockDownloaderTestAccess::RunBlockIteration(*d);
        REQUIRE(f.TotalBodyRequests() == 0);
        REQUIRE(BlockDownloaderTestAccess::BlockGate(*d)->Required() == 1);
    }
}

TEST_CASE("BlockDownloader: small batches also go to the header origin", "[sync][block_downloader]") {
    DownloaderFixture f(3);
    auto d = f.MakeDownloader();
    f.sink.free_capacity = 2000;

    const auto headers = MakeHeaders(1, 3);
    std::vector<HeaderEnvelope> batch{{headers[0], "peer-0"}, {headers[1], "peer-1"}, {headers[2], "gone"}};
    f.queue.QueueBodyBatch(BodyBatchRequest(batch));

    BlockDownloaderTestAccess::RunBlockIteration(*d);

    // One direct single-header request per origin that is still connected
    for (size_t i = 0; i < 2; ++i) {
        size_t direct = 0;
        for (const auto& request : f.peers[i]->BodyRequests()) {
            if (request.headers.size() == 1) {
                REQUIRE(request.headers[0].header.number == headers[i].number);
                ++direct;
            }
        }
        REQUIRE(direct == 1);
    }
    REQUIRE(d->stats().fast_path_requests_sent == 2);

    // Plus the regular request covering the whole batch
    size_t full = 0;
    for (const auto& peer : f.peers) {
        for (const auto& request : peer->BodyRequests()) {
            if (request.headers.size() == 3) {
                ++full;
            }
        }
    }
    REQUIRE(full == 1);
    REQUIRE(f.TotalBodyRequests() == 3);
    REQUIRE(BlockDownloaderTestAccess::BlockGate(*d)->Required() == 1);
}

TEST_CASE("BlockDownloader: larger batches skip the origin fast path", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    auto d = f.MakeDownloader();
    f.sink.free_capacity = 2000;
    f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 4), "peer-0")));

    BlockDownloaderTestAccess::RunBlockIteration(*d);
    auto requests = f.peers[0]->BodyRequests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].headers.size() == 4);
    REQUIRE(d->stats().fast_path_requests_sent == 0);
}

TEST_CASE("BlockDownloader: block download completion", "[sync][block_downloader]") {
    DownloaderFixture f(1);
    auto d = f.MakeDownloader();
    f.sink.free_capacity = 2000;

    SECTION("Empty batch while headers are incomplete keeps polling") {
        REQUIRE_FALSE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE_FALSE(d->IsDownloadComplete());
        REQUIRE(f.sink.complete_calls == 0);
        REQUIRE(BlockDownloaderTestAccess::BlockGate(*d)->Required() == 1);
    }

    SECTION("Empty batch after headers completed finishes") {
        BlockDownloaderTestAccess::SetHeadersDownloadComplete(*d, true);
        REQUIRE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE(d->IsDownloadComplete());
        REQUIRE(f.sink.complete_calls == 1);
    }

    SECTION("Headers completing while the batch is fetched keeps the loop running") {
        // The header loop delivers the last headers and finishes between the
        // queue returning an empty batch and the completion check
        bool header_loop_finished = false;
        f.queue.on_body_batch = [&] {
            if (header_loop_finished) {
                return;
            }
            header_loop_finished = true;
            f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 4), "peer-0")));
            BlockDownloaderTestAccess::SetHeadersDownloadComplete(*d, true);
        };

        REQUIRE_FALSE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE_FALSE(d->IsDownloadComplete());
        REQUIRE(f.sink.complete_calls == 0);

        REQUIRE_FALSE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE(f.TotalBodyRequests() == 1);
        REQUIRE(f.peers[0]->BodyRequests()[0].headers.size() == 4);
        REQUIRE_FALSE(d->IsDownloadComplete());

        REQUIRE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE(d->IsDownloadComplete());
        REQUIRE(f.sink.complete_calls == 1);
    }

    SECTION("Outstanding body work blocks completion") {
        BlockDownloaderTestAccess::SetHeadersDownloadComplete(*d, true);
        f.queue.QueueBodyBatch(BodyBatchRequest(Envelop(MakeHeaders(1, 10), "peer-0")));
        REQUIRE_FALSE(BlockDownloaderTestAccess::RunBlockIteration(*d));
        REQUIRE_FALSE(d->IsDownloadComplete());
    }
}

// ============================================================================
// Peer selection
// ============================================================================

TEST_CASE("BlockDownloader: peer selection", "[sync][block_downloader]") {
    DownloaderFixture f(3);  // scores 10, 20, 30
    f.sink.sync_done = true;

    SECTION("Any idle peer by default, even near the tip") {
        auto d = f.MakeDownloader();
        f.queue.QueueHeaderRanges(MakeRanges(1, 3));
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.pool.best_idle_calls == 0);
        REQUIRE(f.pool.any_idle_calls == 3);
    }

    SECTION("Best peer near the tip when configured") {
        BlockDownloader::Config config;
        config.peer_selection = PeerSelection::kPreferBestNearTip;
        auto d = f.MakeDownloader(config);
        f.queue.QueueHeaderRanges(MakeRanges(1, 3));
        BlockDownloaderTestAccess::RunHeaderIteration(*d);
        REQUIRE(f.pool.any_idle_calls == 0);
        REQUIRE(f.peers[2]->HeaderRequests().size() == 3);
    }

    SECTION("Any idle peer while far from the tip") {
        f.sink.sync_done = false;
        BlockDownloader::Config config;
        config.peer_selection = PeerSelection::kPreferBestNearTip;
        auto d = f.MakeDownloader(config);
        REQUIRE(d->PreferredIdlePeer() != nullptr);
        REQUIRE(f.pool.any_idle_calls == 1);
        REQUIRE(f.pool.best_idle_calls == 0);
    }

    SECTION("Selectors return nothing before the pool is attached") {
        BlockDownloader d(f.validator, f.sink);
        REQUIRE(d.AnyIdlePeer() == nullptr);
        REQUIRE(d.PreferredIdlePeer() == nullptr);
    }
}
