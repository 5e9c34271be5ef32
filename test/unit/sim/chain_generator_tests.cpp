// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "sim/chain_generator.hpp"
#include "sync/header_validator.hpp"

#include <stdexcept>

using namespace chainsync::sim;
using namespace chainsync::sync;

TEST_CASE("ChainGenerator: builds a linked chain", "[sim][chain]") {
    ChainGenerator chain(200, 7);
    REQUIRE(chain.Height() == 200);
    REQUIRE(chain.Has(0));
    REQUIRE(chain.Has(200));
    REQUIRE_FALSE(chain.Has(201));

    REQUIRE(chain.GetHeader(0).parent_hash.IsNull());
    for (uint64_t n = 1; n <= chain.Height(); ++n) {
        const BlockHeader& header = chain.GetHeader(n);
        REQUIRE(header.number == n);
        REQUIRE(header.parent_hash == chain.GetHeader(n - 1).hash);
        REQUIRE(header.timestamp > chain.GetHeader(n - 1).timestamp);
        REQUIRE(chain.NumberOf(header.hash) == n);
    }
}

TEST_CASE("ChainGenerator: every header passes the default validator", "[sim][chain]") {
    ChainGenerator chain(500, 3);
    auto validator = CompositeHeaderValidator::CreateDefault();
    for (uint64_t n = 0; n <= chain.Height(); ++n) {
        INFO("block #" << n);
        REQUIRE(validator->Validate(chain.GetHeader(n)));
    }
}

TEST_CASE("ChainGenerator: deterministic per seed", "[sim][chain]") {
    ChainGenerator a(50, 11);
    ChainGenerator b(50, 11);
    ChainGenerator c(50, 12);

    REQUIRE(a.GetBlock(50) == b.GetBlock(50));
    REQUIRE(a.GetHeader(50).hash != c.GetHeader(50).hash);
    REQUIRE(a.GetHeader(1).hash != c.GetHeader(1).hash);
}

TEST_CASE("ChainGenerator: block bodies", "[sim][chain]") {
    ChainGenerator chain(100, 5);
    REQUIRE(chain.GetBlock(0).transactions.empty());

    for (uint64_t n = 1; n <= chain.Height(); ++n) {
        const Block& block = chain.GetBlock(n);
        REQUIRE(block.transactions.size() <= 3);
        REQUIRE(block.header.gas_used == block.transactions.size() * 21000);
        REQUIRE(block.header.gas_limit == ChainGenerator::GAS_LIMIT);
    }
}

TEST_CASE("ChainGenerator: lookups", "[sim][chain]") {
    ChainGenerator chain(20, 1);

    REQUIRE_THROWS_AS(chain.GetBlock(21), std::out_of_range);
    REQUIRE_FALSE(chain.NumberOf(Hash256()).has_value());
}

TEST_CASE("ChainGenerator: header ranges", "[sim][chain]") {
    ChainGenerator chain(20, 1);

    SECTION("Forward, stopping at the tip") {
        auto headers = chain.Headers(15, 10, 1, false);
        REQUIRE(headers.size() == 6);
        REQUIRE(headers.front().number == 15);
        REQUIRE(headers.back().number == 20);
    }

    SECTION("Reverse, stopping at genesis") {
        auto headers = chain.Headers(3, 10, 1, true);
        REQUIRE(headers.size() == 4);
        REQUIRE(headers.front().number == 3);
        REQUIRE(headers.back().number == 0);
    }

    SECTION("Skipping") {
        auto headers = chain.Headers(2, 4, 5, false);
        REQUIRE(headers.size() == 4);
        REQUIRE(headers[1].number == 7);
        REQUIRE(headers[3].number == 17);

        auto reversed = chain.Headers(20, 10, 8, true);
        REQUIRE(reversed.size() == 3);
        REQUIRE(reversed.back().number == 4);
    }

    SECTION("Step zero behaves as one") {
        REQUIRE(chain.Headers(5, 3, 0, false) == chain.Headers(5, 3, 1, false));
    }

    SECTION("Past the tip is empty") {
        REQUIRE(chain.Headers(21, 5, 1, false).empty());
    }
}
