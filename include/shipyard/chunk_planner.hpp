#pragma once

#include "shipyard/result.hpp"

#include <cstdint>
#include <vector>

namespace shipyard {

// ============================================================================
// Part Size Limits
// ============================================================================

constexpr uint64_t kDefaultPartSize = 5242880;        // 5 MiB
constexpr uint64_t kMinPartSize = 5242880;
constexpr uint64_t kMaxPartSize = 50000000000;        // exclusive
constexpr uint32_t kMaxParts = 10000;

// One contiguous slice of the content. Indexes are 1-based.
struct ChunkSpec {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
};

Result<void> validate_part_size(uint64_t part_size);

// ceil(total / part_size), 0 for empty content
uint64_t chunk_count(uint64_t total_size, uint64_t part_size);

// Every chunk has part_size bytes except the last, which holds the remainder.
// Fails on an invalid part size, empty content, or more than kMaxParts chunks.
Result<std::vector<ChunkSpec>> plan_chunks(uint64_t total_size, uint64_t part_size);

} // namespace shipyard
