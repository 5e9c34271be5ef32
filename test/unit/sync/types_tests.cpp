// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "sync/sync_error.hpp"
#include "sync/types.hpp"

#include <cctype>

using namespace chainsync::sync;

TEST_CASE("Hash256: hex encoding", "[sync][types]") {
    const std::string hex = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    Hash256 hash = Hash256::FromHex(hex);

    REQUIRE_FALSE(hash.IsNull());
    REQUIRE(hash.ToHex() == hex);
    REQUIRE(hash.ShortHex() == "00112233");

    SECTION("Uppercase input is accepted") {
        std::string upper = hex;
        for (auto& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        REQUIRE(Hash256::FromHex(upper) == hash);
    }

    SECTION("Malformed input yields the null hash") {
        REQUIRE(Hash256::FromHex("abc").IsNull());
        REQUIRE(Hash256::FromHex(std::string(64, 'g')).IsNull());
    }

    SECTION("SetNull clears") {
        hash.SetNull();
        REQUIRE(hash.IsNull());
        REQUIRE(hash == Hash256());
    }
}

TEST_CASE("BlockHeader: short description", "[sync][types]") {
    BlockHeader header;
    header.number = 42;
    header.hash = Hash256::FromHex("deadbeef" + std::string(56, '0'));
    REQUIRE(header.ShortDescr() == "#42 (deadbeef)");

    Block block;
    block.header = header;
    REQUIRE(block.Number() == 42);
    REQUIRE(block.Hash() == header.hash);
    REQUIRE(block.ShortDescr() == header.ShortDescr());
}

TEST_CASE("sync_error: error codes", "[sync][types]") {
    std::error_code ec = sync_error::request_timeout;
    REQUIRE(ec);
    REQUIRE(ec.category() == sync_category());
    REQUIRE(std::string(ec.category().name()) == "sync");
    REQUIRE(ec.message() == "request timed out");

    REQUIRE_FALSE(make_error_code(sync_error::success));
    REQUIRE(make_error_code(sync_error::peer_disconnected) != make_error_code(sync_error::invalid_response));
    REQUIRE(make_error_code(sync_error::header_validation_failed).message() == "received headers failed validation");
}
