// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/range_planner.hpp>
#include <volley/core/transport.hpp>
#include <volley/disk/file_writer.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string_view>

namespace volley::core {

// Per-chunk state machine: pending -> in_progress -> (retrying -> in_progress)* -> complete | failed
enum class ChunkStatus : std::uint8_t {
    pending,
    in_progress,
    retrying,    // Waiting out a backoff delay
    complete,
    failed       // Retries exhausted, fatal error, or cancelled
};

[[nodiscard]] std::string_view to_string(ChunkStatus status) noexcept;

// Copy of a ChunkState taken at one instant
struct ChunkSnapshot {
    ChunkPlanEntry entry;
    ChunkStatus status{ChunkStatus::pending};
    std::uint64_t bytes_written{0};
    std::uint32_t attempt_count{0};
    std::error_code error;
};

// Live state of one chunk. Written only by the worker fetching it, read by the aggregator.
class ChunkState {
public:
    explicit ChunkState(ChunkPlanEntry entry) noexcept : entry_(entry) {}

    // Non-copyable, non-movable (atomic members)
    ChunkState(const ChunkState&) = delete;
    ChunkState& operator=(const ChunkState&) = delete;

    [[nodiscard]] const ChunkPlanEntry& entry() const noexcept { return entry_; }
    [[nodiscard]] ChunkStatus status() const noexcept { return status_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint32_t attempt_count() const noexcept { return attempt_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::error_code error() const noexcept;

    [[nodiscard]] bool terminal() const noexcept {
        auto s = status();
        return s == ChunkStatus::complete || s == ChunkStatus::failed;
    }

    [[nodiscard]] ChunkSnapshot snapshot() const noexcept;

    // Start a new attempt from the chunk's first byte; returns its 1-based number
    std::uint32_t begin_attempt() noexcept;
    void add_bytes(std::uint64_t n) noexcept { bytes_written_.fetch_add(n, std::memory_order_relaxed); }
    void mark_retrying(std::error_code cause) noexcept;
    void mark_complete() noexcept;
    void mark_failed(std::error_code ec) noexcept;

private:
    void set_error(std::error_code ec) noexcept;

    ChunkPlanEntry entry_;
    std::atomic<ChunkStatus> status_{ChunkStatus::pending};
    std::atomic<std::uint64_t> bytes_written_{0};
    std::atomic<std::uint32_t> attempt_count_{0};
    mutable std::mutex error_mutex_;
    std::error_code error_;
};

// Fetches one chunk into its sink, retrying transient failures with exponential backoff.
// Stateless between calls; one instance is shared by every worker of a job.
class ChunkFetcher {
public:
    ChunkFetcher(Transport& transport, TransferOptions options, RetryPolicy policy) noexcept
        : transport_(transport), options_(std::move(options)), policy_(policy) {}

    // Drive `state` to complete or failed. Returns the error it failed with, empty on success.
    // A stop request aborts the current attempt or backoff and fails with DownloadErrc::cancelled.
    [[nodiscard]] std::error_code fetch(ChunkState& state,
                                        const ResourceInfo& resource,
                                        disk::ChunkSink& sink,
                                        std::stop_token stop) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    [[nodiscard]] std::error_code attempt(ChunkState& state,
                                          const ResourceInfo& resource,
                                          disk::ChunkSink& sink,
                                          std::stop_token stop) const;

    // Sleep for `delay` unless stopped first. Returns false if stopped.
    [[nodiscard]] static bool wait(std::chrono::milliseconds delay, std::stop_token stop);

    Transport& transport_;
    TransferOptions options_;
    RetryPolicy policy_;
};

} // namespace volley::core
