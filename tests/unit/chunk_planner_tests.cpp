#include <doctest/doctest.h>
#include "shipyard/chunk_planner.hpp"

using namespace shipyard;

namespace {

constexpr uint64_t MiB = 1024 * 1024;

} // namespace

TEST_CASE("part size must lie in [5 MiB, 50 GB)") {
    CHECK(validate_part_size(kMinPartSize).isOk());
    CHECK(validate_part_size(kMaxPartSize - 1).isOk());

    auto small = validate_part_size(kMinPartSize - 1);
    REQUIRE(small.isErr());
    CHECK(small.error().code() == ErrorCode::INVALID_INPUT);
    CHECK(validate_part_size(kMaxPartSize).isErr());
    CHECK(validate_part_size(0).isErr());
}

TEST_CASE("chunk count is the ceiling of size over part size") {
    CHECK(chunk_count(0, 5 * MiB) == 0);
    CHECK(chunk_count(1, 5 * MiB) == 1);
    CHECK(chunk_count(5 * MiB, 5 * MiB) == 1);
    CHECK(chunk_count(5 * MiB + 1, 5 * MiB) == 2);
    CHECK(chunk_count(12 * MiB, 5 * MiB) == 3);
}

TEST_CASE("12 MiB at 5 MiB parts plans 5, 5 and 2 MiB") {
    auto plan = plan_chunks(12 * MiB, 5 * MiB);
    REQUIRE(plan.isOk());
    const auto& chunks = plan.value();
    REQUIRE(chunks.size() == 3);

    CHECK(chunks[0].index == 1);
    CHECK(chunks[0].offset == 0);
    CHECK(chunks[0].size == 5 * MiB);
    CHECK(chunks[1].index == 2);
    CHECK(chunks[1].offset == 5 * MiB);
    CHECK(chunks[1].size == 5 * MiB);
    CHECK(chunks[2].index == 3);
    CHECK(chunks[2].offset == 10 * MiB);
    CHECK(chunks[2].size == 2 * MiB);
}

TEST_CASE("chunks tile the content and the last one holds the remainder") {
    for (uint64_t total : {uint64_t{1}, 5 * MiB, 5 * MiB + 1, 23 * MiB + 12345}) {
        CAPTURE(total);
        auto plan = plan_chunks(total, 5 * MiB);
        REQUIRE(plan.isOk());
        const auto& chunks = plan.value();
        CHECK(chunks.size() == chunk_count(total, 5 * MiB));

        uint64_t expected_offset = 0;
        for (size_t i = 0; i < chunks.size(); ++i) {
            CHECK(chunks[i].index == i + 1);
            CHECK(chunks[i].offset == expected_offset);
            if (i + 1 < chunks.size()) {
                CHECK(chunks[i].size == 5 * MiB);
            }
            expected_offset += chunks[i].size;
        }
        CHECK(chunks.back().size > 0);
        CHECK(chunks.back().size <= 5 * MiB);
        CHECK(expected_offset == total);
    }
}

TEST_CASE("empty content cannot be planned") {
    auto plan = plan_chunks(0, 5 * MiB);
    REQUIRE(plan.isErr());
    CHECK(plan.error().code() == ErrorCode::INVALID_INPUT);
}

TEST_CASE("plans over the part limit ask for a larger part size") {
    auto plan = plan_chunks(uint64_t{kMaxParts} * 5 * MiB + 1, 5 * MiB);
    REQUIRE(plan.isErr());
    CHECK(plan.error().message().find("larger part size") != std::string::npos);

    CHECK(plan_chunks(uint64_t{kMaxParts} * 5 * MiB, 5 * MiB).isOk());
}
