// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "common/mock_sync.hpp"
#include "sync/header_validator.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace chainsync::sync;
using chainsync::test::MakeHeaders;

namespace {

BlockHeader ValidHeader() {
    return MakeHeaders(100, 1).front();
}

}  // namespace

TEST_CASE("CompositeHeaderValidator: default rules", "[sync][validator]") {
    auto validator = CompositeHeaderValidator::CreateDefault();
    REQUIRE(validator->RuleCount() == 5);

    BlockHeader header = ValidHeader();
    REQUIRE(validator->Validate(header));

    SECTION("Extra data longer than 32 bytes") {
        header.extra_data.assign(32, 0x01);
        REQUIRE(validator->Validate(header));
        header.extra_data.push_back(0x02);
        REQUIRE_FALSE(validator->Validate(header));
        REQUIRE(validator->DescribeLastErrors() == "extra data too long: 33 > 32 bytes");
    }

    SECTION("Gas used above gas limit") {
        header.gas_used = header.gas_limit + 1;
        REQUIRE_FALSE(validator->Validate(header));
    }

    SECTION("Gas limit below minimum") {
        header.gas_limit = GasLimitRule::MIN_GAS_LIMIT - 1;
        header.gas_used = 0;
        REQUIRE_FALSE(validator->Validate(header));
        header.gas_limit = GasLimitRule::MIN_GAS_LIMIT;
        REQUIRE(validator->Validate(header));
    }

    SECTION("Zero difficulty") {
        header.difficulty = 0;
        REQUIRE_FALSE(validator->Validate(header));
        REQUIRE(validator->DescribeLastErrors() == "zero difficulty");
    }

    SECTION("Missing hashes") {
        BlockHeader no_hash = header;
        no_hash.hash.SetNull();
        REQUIRE_FALSE(validator->Validate(no_hash));

        BlockHeader no_parent = header;
        no_parent.parent_hash.SetNull();
        REQUIRE_FALSE(validator->Validate(no_parent));

        // Genesis has no parent
        BlockHeader genesis = no_parent;
        genesis.number = 0;
        REQUIRE(validator->Validate(genesis));
    }

    SECTION("Every failing rule is reported") {
        header.difficulty = 0;
        header.gas_used = header.gas_limit + 1;
        REQUIRE_FALSE(validator->Validate(header));
        const std::string errors = validator->DescribeLastErrors();
        REQUIRE(errors.find("zero difficulty") != std::string::npos);
        REQUIRE(errors.find("exceeds gas limit") != std::string::npos);
        REQUIRE(errors.find("; ") != std::string::npos);
    }
}

TEST_CASE("CompositeHeaderValidator: custom rules", "[sync][validator]") {
    class MaxNumberRule : public HeaderRule {
    public:
        std::optional<std::string> Check(const BlockHeader& header) const override {
            if (header.number > 1000) {
                return "beyond checkpoint";
            }
            return std::nullopt;
        }
    };

    CompositeHeaderValidator validator;
    REQUIRE(validator.Validate(ValidHeader()));  // no rules, everything passes

    validator.AddRule(std::make_unique<MaxNumberRule>());
    REQUIRE(validator.Validate(MakeHeaders(1000, 1).front()));
    REQUIRE_FALSE(validator.Validate(MakeHeaders(1001, 1).front()));
    REQUIRE(validator.DescribeLastErrors() == "beyond checkpoint");
}

TEST_CASE("CompositeHeaderValidator: concurrent validation", "[sync][validator][threading]") {
    auto validator = CompositeHeaderValidator::CreateDefault();
    const auto headers = MakeHeaders(1, 500);
    std::atomic<int> valid{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (const auto& header : headers) {
                if (validator->Validate(header)) {
                    ++valid;
                }
                BlockHeader bad = header;
                bad.difficulty = 0;
                validator->Validate(bad);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(valid == 4 * 500);
    REQUIRE(validator->DescribeLastErrors() == "zero difficulty");
}
