// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/range_planner.hpp>
#include <algorithm>
#include <vector>

using namespace volley::core;

namespace {

std::vector<std::uint64_t> sizes(const ChunkPlan& chunks) {
    std::vector<std::uint64_t> out;
    for (const auto& c : chunks) out.push_back(c.byte_count);
    return out;
}

} // namespace

TEST_CASE("plan splits evenly", "[planner]") {
    SECTION("1000 bytes over 4") {
        auto chunks = plan(1000, 4);
        REQUIRE(chunks.size() == 4);
        CHECK(sizes(chunks) == std::vector<std::uint64_t>{250, 250, 250, 250});

        CHECK(chunks[0].start_offset == 0);
        CHECK(chunks[0].end_offset == 249);
        CHECK(chunks[1].start_offset == 250);
        CHECK(chunks[1].end_offset == 499);
        CHECK(chunks[2].start_offset == 500);
        CHECK(chunks[2].end_offset == 749);
        CHECK(chunks[3].start_offset == 750);
        CHECK(chunks[3].end_offset == 999);
    }

    SECTION("Remainder goes to the first chunks") {
        CHECK(sizes(plan(1001, 4)) == std::vector<std::uint64_t>{251, 250, 250, 250});
        CHECK(sizes(plan(1003, 4)) == std::vector<std::uint64_t>{251, 251, 251, 250});
    }

    SECTION("Indices are sequential") {
        auto chunks = plan(12345, 7);
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            CHECK(chunks[i].index == i);
        }
    }
}

TEST_CASE("plan clamps for tiny resources", "[planner]") {
    SECTION("Fewer bytes than workers: one byte per chunk") {
        auto chunks = plan(3, 8);
        REQUIRE(chunks.size() == 3);
        CHECK(sizes(chunks) == std::vector<std::uint64_t>{1, 1, 1});
        CHECK(chunks[2].start_offset == 2);
        CHECK(chunks[2].end_offset == 2);
    }

    SECTION("Zero concurrency still yields one chunk") {
        auto chunks = plan(100, 0);
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].byte_count == 100);
    }

    SECTION("Empty resource is one zero-length chunk") {
        auto chunks = plan(0, 4);
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].empty());
        CHECK(chunks[0].start_offset == 0);
        CHECK(validate_plan(chunks, 0) == std::error_code{});
    }
}

TEST_CASE("plan covers the resource exactly", "[planner]") {
    auto total = GENERATE(as<std::uint64_t>{}, 1, 2, 7, 999, 1000, 1001, 65536, 1'000'003, 5'000'000'000ULL);
    auto concurrency = GENERATE(as<std::uint32_t>{}, 1, 3, 4, 8, 16, 64);

    auto chunks = plan(total, concurrency);
    CAPTURE(total, concurrency);

    REQUIRE(validate_plan(chunks, total) == std::error_code{});
    CHECK(chunks.size() == std::min<std::uint64_t>(concurrency, total));

    auto [lo, hi] = std::ranges::minmax(sizes(chunks));
    CHECK(hi - lo <= 1);

    SECTION("Same inputs give the same plan") {
        CHECK(plan(total, concurrency) == chunks);
    }
}

TEST_CASE("plan_fixed", "[planner]") {
    SECTION("Last chunk is shorter") {
        auto chunks = plan_fixed(10, 4);
        REQUIRE(chunks.has_value());
        CHECK(sizes(*chunks) == std::vector<std::uint64_t>{4, 4, 2});
        CHECK(validate_plan(*chunks, 10) == std::error_code{});
    }

    SECTION("Exact multiple") {
        auto chunks = plan_fixed(SUGGESTED_CHUNK_SIZE * 3, SUGGESTED_CHUNK_SIZE);
        REQUIRE(chunks.has_value());
        CHECK(chunks->size() == 3);
        CHECK(chunks->back().end_offset == SUGGESTED_CHUNK_SIZE * 3 - 1);
    }

    SECTION("Chunk larger than the resource") {
        auto chunks = plan_fixed(100, 1000);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == 1);
        CHECK(chunks->front().byte_count == 100);
    }

    SECTION("Zero chunk size is rejected") {
        auto chunks = plan_fixed(100, 0);
        REQUIRE(!chunks.has_value());
        CHECK(chunks.error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("Degraded plans", "[planner]") {
    SECTION("Single chunk") {
        auto chunks = plan_single(4096);
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].end_offset == 4095);
        CHECK(validate_plan(chunks, 4096) == std::error_code{});
    }

    SECTION("Unbounded chunk") {
        auto chunks = plan_unbounded();
        REQUIRE(chunks.size() == 1);
        CHECK(!chunks[0].bounded());
        CHECK(validate_plan(chunks, UNBOUNDED) == std::error_code{});
        CHECK(validate_plan(chunks, 100) == DownloadErrc::integrity_error);
    }
}

TEST_CASE("validate_plan rejects broken plans", "[planner]") {
    auto chunks = plan(1000, 4);

    SECTION("Gap") {
        chunks[2].start_offset += 1;
        CHECK(validate_plan(chunks, 1000) == DownloadErrc::integrity_error);
    }

    SECTION("Overlap") {
        chunks[1].start_offset -= 1;
        chunks[1].byte_count += 1;
        CHECK(validate_plan(chunks, 1000) == DownloadErrc::integrity_error);
    }

    SECTION("Short coverage") {
        chunks.pop_back();
        CHECK(validate_plan(chunks, 1000) == DownloadErrc::integrity_error);
    }

    SECTION("Out of order") {
        std::swap(chunks[0], chunks[1]);
        CHECK(validate_plan(chunks, 1000) == DownloadErrc::integrity_error);
    }

    SECTION("Empty plan") {
        CHECK(validate_plan({}, 0) == DownloadErrc::integrity_error);
    }
}
