// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/chunk.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace volley::core {

using ChunkStates = std::vector<std::unique_ptr<ChunkState>>;

// The fatal error that ended a job, with the chunk that raised it
struct ChunkFailure {
    ChunkPlanEntry entry;
    std::error_code error;
    std::uint32_t attempts{0};
};

struct ChunkCounts {
    std::uint32_t pending{0};
    std::uint32_t active{0};
    std::uint32_t retrying{0};
    std::uint32_t completed{0};
    std::uint32_t failed{0};
};

// Read-only view over a job's chunk states plus the first-failure latch
class ProgressAggregator {
public:
    ProgressAggregator(const ChunkStates& chunks, std::optional<std::uint64_t> total_size) noexcept
        : chunks_(chunks), total_size_(total_size) {}

    [[nodiscard]] std::uint64_t bytes_complete() const noexcept;

    // bytes_complete / total_size in [0, 1]; 0 while the size is unknown
    [[nodiscard]] double overall_progress() const noexcept;

    // Every chunk has reached complete or failed
    [[nodiscard]] bool is_done() const noexcept;

    [[nodiscard]] bool succeeded() const noexcept;

    [[nodiscard]] ChunkCounts counts() const noexcept;

    // Latch the first fatal failure. Returns true if this call was first.
    bool record_failure(const ChunkState& chunk, std::error_code ec) noexcept;

    [[nodiscard]] std::optional<ChunkFailure> first_failure() const noexcept;

    [[nodiscard]] std::optional<std::uint64_t> total_size() const noexcept { return total_size_; }

private:
    const ChunkStates& chunks_;
    std::optional<std::uint64_t> total_size_;

    mutable std::mutex failure_mutex_;
    std::optional<ChunkFailure> failure_;
};

} // namespace volley::core
