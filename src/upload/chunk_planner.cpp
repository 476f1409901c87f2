#include "shipyard/chunk_planner.hpp"

#include <algorithm>
#include <string>

namespace shipyard {

Result<void> validate_part_size(uint64_t part_size) {
    if (part_size < kMinPartSize) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "binary part size " + std::to_string(part_size) +
            " is below the minimum of " + std::to_string(kMinPartSize) + " bytes"));
    }
    if (part_size >= kMaxPartSize) {
        return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
            "binary part size " + std::to_string(part_size) +
            " must be less than " + std::to_string(kMaxPartSize) + " bytes"));
    }
    return Result<void>::ok();
}

uint64_t chunk_count(uint64_t total_size, uint64_t part_size) {
    if (part_size == 0) return 0;
    return (total_size + part_size - 1) / part_size;
}

Result<std::vector<ChunkSpec>> plan_chunks(uint64_t total_size, uint64_t part_size) {
    using R = Result<std::vector<ChunkSpec>>;

    auto valid = validate_part_size(part_size);
    if (valid.isErr()) {
        return R::err(valid.error());
    }

    if (total_size == 0) {
        return R::err(Error(ErrorCode::INVALID_INPUT, "cannot upload empty content"));
    }

    uint64_t count = chunk_count(total_size, part_size);
    if (count > kMaxParts) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            "content of " + std::to_string(total_size) + " bytes needs " +
            std::to_string(count) + " parts at part size " + std::to_string(part_size) +
            ", the limit is " + std::to_string(kMaxParts) + "; use a larger part size"));
    }

    std::vector<ChunkSpec> chunks;
    chunks.reserve(static_cast<size_t>(count));
    uint64_t offset = 0;
    for (uint64_t i = 0; i < count; ++i) {
        ChunkSpec chunk;
        chunk.index = static_cast<uint32_t>(i + 1);
        chunk.offset = offset;
        chunk.size = std::min(part_size, total_size - offset);
        offset += chunk.size;
        chunks.push_back(chunk);
    }
    return R::ok(std::move(chunks));
}

} // namespace shipyard
