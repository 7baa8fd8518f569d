// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/range_planner.hpp>
#include <algorithm>

namespace volley::core {

namespace {

ChunkPlanEntry make_entry(std::uint32_t index, std::uint64_t offset, std::uint64_t size) noexcept {
    // A zero-length chunk has no last byte; keep end_offset at the start so it stays ordered
    std::uint64_t end = size == 0 ? offset : offset + size - 1;
    return ChunkPlanEntry{index, offset, end, size};
}

} // namespace

ChunkPlan plan(std::uint64_t total_size, std::uint32_t concurrency) {
    if (total_size == 0) {
        return {make_entry(0, 0, 0)};
    }

    std::uint64_t count = std::max<std::uint64_t>(1, std::min<std::uint64_t>(concurrency, total_size));
    std::uint64_t base = total_size / count;
    std::uint64_t remainder = total_size % count;

    ChunkPlan chunks;
    chunks.reserve(static_cast<std::size_t>(count));

    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t this_size = base + (i < remainder ? 1 : 0);
        chunks.push_back(make_entry(static_cast<std::uint32_t>(i), offset, this_size));
        offset += this_size;
    }
    return chunks;
}

std::expected<ChunkPlan, std::error_code>
plan_fixed(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
    if (total_size == 0) {
        return ChunkPlan{make_entry(0, 0, 0)};
    }

    std::uint64_t count = (total_size + chunk_size - 1) / chunk_size;  // Round up
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }

    ChunkPlan chunks;
    chunks.reserve(static_cast<std::size_t>(count));

    std::uint64_t offset = 0;
    std::uint32_t index = 0;
    while (offset < total_size) {
        std::uint64_t this_size = std::min(chunk_size, total_size - offset);
        chunks.push_back(make_entry(index++, offset, this_size));
        offset += this_size;
    }
    return chunks;
}

ChunkPlan plan_single(std::uint64_t total_size) {
    return {make_entry(0, 0, total_size)};
}

ChunkPlan plan_unbounded() {
    return {ChunkPlanEntry{0, 0, UNBOUNDED, UNBOUNDED}};
}

std::error_code validate_plan(const ChunkPlan& chunks, std::uint64_t total_size) noexcept {
    if (chunks.empty()) {
        return make_error_code(DownloadErrc::integrity_error);
    }

    // Unknown-length download is always a single open chunk
    if (total_size == UNBOUNDED) {
        return chunks.size() == 1 && chunks.front().start_offset == 0 && !chunks.front().bounded()
            ? std::error_code{}
            : make_error_code(DownloadErrc::integrity_error);
    }

    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        if (c.index != i || c.start_offset != expected_start || !c.bounded()) {
            return make_error_code(DownloadErrc::integrity_error);
        }
        if (c.byte_count > 0 && c.end_offset != c.start_offset + c.byte_count - 1) {
            return make_error_code(DownloadErrc::integrity_error);
        }
        expected_start += c.byte_count;
    }

    if (expected_start != total_size) {
        return make_error_code(DownloadErrc::integrity_error);
    }
    // Only an empty resource may contain a zero-length chunk
    if (total_size > 0 && std::any_of(chunks.begin(), chunks.end(),
                                      [](const ChunkPlanEntry& c) { return c.empty(); })) {
        return make_error_code(DownloadErrc::integrity_error);
    }
    return {};
}

} // namespace volley::core
