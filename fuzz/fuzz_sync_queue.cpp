// Fuzz target for the pending-work queue
// Drives SyncQueue with arbitrary interleavings of requests and (possibly forked,
// duplicated, out-of-order) responses
//
// The queue decides what the engine asks for and what reaches the sink. Bugs in this
// code can:
// - Deliver headers out of order, twice, or off the requested chain
// - Report no work while headers are still missing (sync stops early)
// - Accept the same block twice
//
// Target code:
// - src/sync/sync_queue.cpp
// - src/sync/requests.cpp

#include "sync/sync_queue.hpp"
#include "sync/types.hpp"
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <exception>
#include <set>
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

    size_t remaining() const {
        return offset_ < size_ ? size_ - offset_ : 0;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

static constexpr uint64_t kLastBlock = 300;

// Hash of block `number` on branch `branch` (branch 0 is the requested chain)
static Hash256 HashFor(uint64_t number, uint8_t branch) {
    Hash256 hash;
    memcpy(hash.begin(), &number, sizeof(number));
    hash.begin()[30] = branch;
    hash.begin()[31] = 0xAA;
    return hash;
}

static BlockHeader HeaderFor(uint64_t number, uint8_t branch) {
    BlockHeader header;
    header.number = number;
    header.hash = HashFor(number, branch);
    header.parent_hash = number == 0 ? Hash256() : HashFor(number - 1, branch);
    header.difficulty = 1000;
    header.gas_limit = 8000000;
    return header;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 4) return 0;

    FuzzInput input(data, size);

    SyncQueue::Config config;
    config.first_block = 1 + input.read<uint8_t>() % 16;
    config.last_block = config.first_block + input.read<uint16_t>() % kLastBlock;
    config.request_timeout = std::chrono::seconds(0);
    config.bodies_required = (input.read<uint8_t>() & 1) == 0;

    SyncQueue queue(config);
    uint64_t next_delivered = config.first_block;
    std::set<uint64_t> accepted_blocks;

    while (input.remaining() > 0) {
        uint8_t op = input.read<uint8_t>();
        try {
            switch (op % 4) {
            case 0: {
                // CRITICAL TEST 1: no empty answer while headers are missing
                uint32_t span = 1 + input.read<uint8_t>() % 192;
                size_t max_requests = 1 + input.read<uint8_t>() % 32;
                auto ranges = queue.RequestHeaderRanges(span, max_requests);
                if (ranges.empty() != queue.IsHeadersComplete()) {
                    __builtin_trap();
                }
                if (ranges.size() > max_requests) {
                    __builtin_trap();
                }
                for (const auto& range : ranges) {
                    if (range.count() == 0 || range.count() > span) {
                        __builtin_trap();
                    }
                }
                break;
            }
            case 1: {
                // CRITICAL TEST 2: delivered headers are contiguous, main-chain, exactly once
                uint64_t start = config.first_block + input.read<uint16_t>() % (kLastBlock + 16);
                size_t count = 1 + input.read<uint8_t>() % 64;
                // The queue has nothing to link the first block against, so forks start later
                uint8_t branch = input.read<uint8_t>() % 3 == 0 && start > config.first_block ? 1 : 0;
                std::vector<HeaderEnvelope> envelopes;
                for (size_t i = 0; i < count; i++) {
                    envelopes.push_back(HeaderEnvelope{HeaderFor(start + i, branch), branch ? "fork" : "main"});
                }
                auto ready = queue.SubmitHeaders(std::move(envelopes));
                for (const auto& envelope : ready) {
                    if (envelope.header.number != next_delivered) __builtin_trap();
                    if (envelope.header.hash != HashFor(next_delivered, 0)) __builtin_trap();
                    if (envelope.header.number > config.last_block) __builtin_trap();
                    next_delivered++;
                }
                if (queue.NextHeaderNumber() != next_delivered) {
                    __builtin_trap();
                }
                break;
            }
            case 2: {
                // CRITICAL TEST 3: body batches only name delivered headers
                size_t max_headers = input.read<uint8_t>() % 200;
                auto batch = queue.RequestBodyBatch(max_headers);
                if (batch.size() > max_headers) __builtin_trap();
                if (!config.bodies_required && !batch.empty()) __builtin_trap();
                for (const auto& envelope : batch.headers()) {
                    if (envelope.header.number >= next_delivered) __builtin_trap();
                    if (accepted_blocks.count(envelope.header.number)) __builtin_trap();
                }
                break;
            }
            case 3: {
                // CRITICAL TEST 4: each block is accepted once, and only if it matches
                uint64_t start = config.first_block + input.read<uint16_t>() % (kLastBlock + 16);
                size_t count = 1 + input.read<uint8_t>() % 32;
                uint8_t branch = input.read<uint8_t>() % 4 == 0 ? 1 : 0;
                std::vector<Block> blocks;
                for (size_t i = 0; i < count; i++) {
                    blocks.push_back(Block{HeaderFor(start + i, branch), {}, {}});
                }
                auto accepted = queue.SubmitBlocks(std::move(blocks));
                for (const auto& block : accepted) {
                    if (block.Hash() != HashFor(block.Number(), 0)) __builtin_trap();
                    if (!accepted_blocks.insert(block.Number()).second) __builtin_trap();
                }
                if (queue.BodiesReceived() != accepted_blocks.size()) __builtin_trap();
                break;
            }
            }
        } catch (const std::exception&) {
            // Queue operations should not throw on peer data
            __builtin_trap();
        }
    }

    return 0;
}
