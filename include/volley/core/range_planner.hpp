// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <cstdint>
#include <expected>
#include <limits>
#include <vector>

namespace volley::core {

// Marks a chunk whose length is not known up front (server sent no size)
constexpr std::uint64_t UNBOUNDED = std::numeric_limits<std::uint64_t>::max();

// One contiguous byte range of the resource, [start_offset, end_offset] inclusive
struct ChunkPlanEntry {
    std::uint32_t index{0};
    std::uint64_t start_offset{0};
    std::uint64_t end_offset{0};
    std::uint64_t byte_count{0};

    [[nodiscard]] bool bounded() const noexcept { return byte_count != UNBOUNDED; }
    [[nodiscard]] bool empty() const noexcept { return byte_count == 0; }

    bool operator==(const ChunkPlanEntry&) const = default;
};

using ChunkPlan = std::vector<ChunkPlanEntry>;

// Split total_size into min(concurrency, total_size) parts (at least one).
// Sizes differ by at most one byte; the first total_size % n chunks carry the extra byte.
// total_size == 0 yields a single zero-length chunk.
[[nodiscard]] ChunkPlan plan(std::uint64_t total_size, std::uint32_t concurrency);

// Fixed-size chunks of chunk_size bytes, the last one shorter
[[nodiscard]] std::expected<ChunkPlan, std::error_code>
plan_fixed(std::uint64_t total_size, std::uint64_t chunk_size);

// Whole resource as one chunk (server ignores ranges)
[[nodiscard]] ChunkPlan plan_single(std::uint64_t total_size);

// One open-ended chunk for a resource of unknown length
[[nodiscard]] ChunkPlan plan_unbounded();

// Check that the plan is ordered, contiguous, non-overlapping and covers [0, total_size)
[[nodiscard]] std::error_code validate_plan(const ChunkPlan& chunks, std::uint64_t total_size) noexcept;

} // namespace volley::core
