// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/progress.hpp>
#include <algorithm>

namespace volley::core {

std::uint64_t ProgressAggregator::bytes_complete() const noexcept {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks_) {
        total += chunk->bytes_written();
    }
    return total;
}

double ProgressAggregator::overall_progress() const noexcept {
    if (!total_size_) return 0.0;
    if (*total_size_ == 0) return is_done() ? 1.0 : 0.0;

    auto done = static_cast<double>(bytes_complete()) / static_cast<double>(*total_size_);
    return std::clamp(done, 0.0, 1.0);
}

bool ProgressAggregator::is_done() const noexcept {
    return std::ranges::all_of(chunks_, [](const auto& c) { return c->terminal(); });
}

bool ProgressAggregator::succeeded() const noexcept {
    return std::ranges::all_of(chunks_, [](const auto& c) { return c->status() == ChunkStatus::complete; });
}

ChunkCounts ProgressAggregator::counts() const noexcept {
    ChunkCounts counts;
    for (const auto& chunk : chunks_) {
        switch (chunk->status()) {
            case ChunkStatus::pending:      ++counts.pending; break;
            case ChunkStatus::in_progress:  ++counts.active; break;
            case ChunkStatus::retrying:     ++counts.retrying; break;
            case ChunkStatus::complete:     ++counts.completed; break;
            case ChunkStatus::failed:       ++counts.failed; break;
        }
    }
    return counts;
}

bool ProgressAggregator::record_failure(const ChunkState& chunk, std::error_code ec) noexcept {
    std::lock_guard lock(failure_mutex_);
    if (failure_) return false;
    failure_ = ChunkFailure{chunk.entry(), ec, chunk.attempt_count()};
    return true;
}

std::optional<ChunkFailure> ProgressAggregator::first_failure() const noexcept {
    std::lock_guard lock(failure_mutex_);
    return failure_;
}

} // namespace volley::core
