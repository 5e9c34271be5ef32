// Fuzz target for header validation
// Tests CompositeHeaderValidator::CreateDefault() and each structural rule on arbitrary headers
//
// Header validation is the engine's only defence against peers feeding garbage into the
// pending-work queue. Bugs in this code can:
// - Let malformed headers reach the queue and the downstream sink
// - Reject honest headers and stall sync
// - Crash a response-delivery thread
//
// Target code:
// - src/sync/header_validator.cpp

#include "sync/header_validator.hpp"
#include "sync/types.hpp"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

using namespace chainsync::sync;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    void read_bytes(uint8_t *out, size_t n) {
        for (size_t i = 0; i < n; i++) {
            out[i] = read<uint8_t>();
        }
    }

    size_t remaining() const {
        return offset_ < size_ ? size_ - offset_ : 0;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

static BlockHeader ReadHeader(FuzzInput& input) {
    BlockHeader header;
    header.number = input.read<uint64_t>();
    input.read_bytes(header.hash.begin(), Hash256::SIZE);
    input.read_bytes(header.parent_hash.begin(), Hash256::SIZE);
    header.timestamp = input.read<uint64_t>();
    header.difficulty = input.read<uint64_t>();
    header.gas_limit = input.read<uint64_t>();
    header.gas_used = input.read<uint64_t>();

    // Up to 63 bytes so both sides of the 32-byte limit get exercised
    size_t extra = input.read<uint8_t>() % 64;
    header.extra_data.resize(extra);
    input.read_bytes(header.extra_data.data(), extra);
    return header;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    // 1 mode + 40 scalar bytes + 64 hash bytes + 1 extra-data length
    if (size < 106) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();

    auto validator = CompositeHeaderValidator::CreateDefault();

    // CRITICAL TEST 1: the composite agrees with its rules, and is deterministic
    if ((mode & 0x03) == 0) {
        BlockHeader header = ReadHeader(input);
        try {
            bool result = validator->Validate(header);

            bool expected = !ExtraDataRule().Check(header) && !GasValueRule().Check(header) &&
                            !GasLimitRule().Check(header) && !DifficultyRule().Check(header) &&
                            !LinkageRule().Check(header);
            if (result != expected) {
                // Composite disagrees with its own rules - BUG!
                __builtin_trap();
            }

            // Invalid but no reason - BUG!
            if (!result && validator->DescribeLastErrors().empty()) {
                __builtin_trap();
            }

            if (validator->Validate(header) != result) {
                // Non-deterministic validation - BUG!
                __builtin_trap();
            }
        } catch (const std::exception&) {
            // Validate should not throw (returns false on error)
            __builtin_trap();
        }
    }

    // CRITICAL TEST 2: accepted headers satisfy every structural bound
    if ((mode & 0x03) == 1) {
        BlockHeader header = ReadHeader(input);
        if (validator->Validate(header)) {
            if (header.extra_data.size() > ExtraDataRule::MAX_EXTRA_DATA_SIZE) __builtin_trap();
            if (header.gas_used > header.gas_limit) __builtin_trap();
            if (header.gas_limit < GasLimitRule::MIN_GAS_LIMIT) __builtin_trap();
            if (header.difficulty == 0) __builtin_trap();
            if (header.hash.IsNull()) __builtin_trap();
            if (header.number != 0 && header.parent_hash.IsNull()) __builtin_trap();
        }
    }

    // CRITICAL TEST 3: verdicts on a batch do not depend on what was validated before
    if ((mode & 0x03) == 2) {
        std::vector<BlockHeader> headers;
        size_t batch_size = (input.read<uint8_t>() % 10) + 1;
        for (size_t i = 0; i < batch_size && input.remaining() >= 105; i++) {
            headers.push_back(ReadHeader(input));
        }

        std::vector<bool> verdicts;
        for (const auto& header : headers) {
            verdicts.push_back(validator->Validate(header));
        }
        auto fresh = CompositeHeaderValidator::CreateDefault();
        for (size_t i = headers.size(); i-- > 0;) {
            if (fresh->Validate(headers[i]) != verdicts[i]) {
                __builtin_trap();
            }
        }
    }

    // CRITICAL TEST 4: an empty composite accepts anything
    if ((mode & 0x03) == 3) {
        BlockHeader header = ReadHeader(input);
        CompositeHeaderValidator empty;
        if (!empty.Validate(header)) {
            __builtin_trap();
        }
    }

    return 0;
}
