// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/chunk.hpp>
#include <volley/core/config.hpp>
#include <volley/core/error.hpp>
#include <volley/core/progress.hpp>
#include <volley/core/range_planner.hpp>
#include <volley/core/transport.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace volley::core {

// Overall job state
enum class DownloadState : std::uint8_t {
    idle,
    probing,
    planning,
    downloading,
    reassembling,
    succeeded,
    failed,
    cancelled
};

[[nodiscard]] std::string_view to_string(DownloadState state) noexcept;

// Where in the job an error surfaced
enum class Phase : std::uint8_t {
    setup,
    probe,
    plan,
    download,
    reassemble
};

[[nodiscard]] std::string_view to_string(Phase phase) noexcept;

// The single root-cause error a failed or cancelled job reports
struct JobError {
    std::error_code code;
    ErrorClass kind{ErrorClass::none};
    Phase phase{Phase::setup};
    std::optional<ChunkPlanEntry> chunk;
    std::uint32_t attempts{0};
    std::string detail;

    [[nodiscard]] static JobError make(std::error_code ec, Phase phase, std::string detail = {});

    // e.g. "network error in chunk 3 [750-999] after 5 attempts: Operation timed out"
    [[nodiscard]] std::string message() const;
};

struct DownloadProgress {
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t downloaded_bytes{0};
    std::uint64_t speed_bps{0};           // Over the last sample interval
    std::uint64_t average_speed_bps{0};   // Since the download phase started
    std::uint32_t active_chunks{0};
    std::uint32_t completed_chunks{0};
    std::uint32_t failed_chunks{0};
    std::uint32_t retrying_chunks{0};
    std::uint32_t total_chunks{0};
    double percent{0.0};
    std::uint64_t eta_seconds{0};         // 0 when unknown
    DownloadState state{DownloadState::idle};
};

struct DownloadReport {
    ResourceInfo resource;
    std::string output_path;
    std::uint64_t bytes{0};
    std::size_t chunks{0};
    std::uint32_t total_attempts{0};
    std::chrono::milliseconds elapsed{0};
};

using ProgressCallback = std::function<void(const DownloadProgress&)>;

// Coordinates one download at a time: probe, plan, fetch chunks on a bounded
// worker pool, then reassemble. Temp artifacts never outlive a failed job.
class DownloadEngine {
public:
    DownloadEngine(Transport& transport, DownloadConfig config) noexcept;
    ~DownloadEngine();

    // Non-copyable, non-movable (atomic members, workers hold `this`)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) = delete;
    DownloadEngine& operator=(DownloadEngine&&) = delete;

    // Blocking. An empty output path derives the name from the server or URL.
    // A cancel() issued before run() makes it return cancelled without a request.
    [[nodiscard]] std::expected<DownloadReport, JobError>
    run(std::string_view url, const std::filesystem::path& output = {});

    // Probe only
    [[nodiscard]] std::expected<ResourceInfo, JobError> probe(std::string_view url);

    // Thread-safe, idempotent, sticky for the engine's lifetime. Stops in-flight
    // chunks at their next suspension point. Ignored once every chunk is complete.
    void cancel() noexcept;

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Set progress callback (thread-safe). Invoked every sample interval and once at the end.
    // Exceptions it throws are logged and dropped.
    void callback(ProgressCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] DownloadProgress progress() const;

    [[nodiscard]] std::vector<ChunkSnapshot> chunk_states() const;

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

private:
    struct Job;

    [[nodiscard]] TransferOptions transfer_options() const;
    [[nodiscard]] std::expected<ChunkPlan, std::error_code> make_plan(const ResourceInfo& resource) const;

    // New stop source for a job, already stopped if cancel() came first
    [[nodiscard]] std::stop_source arm_stop_source();
    void reset_chunks(const ChunkPlan& chunk_plan);

    [[nodiscard]] std::optional<JobError> download(Job& job);
    void worker(Job& job);
    [[nodiscard]] std::expected<std::unique_ptr<disk::ChunkSink>, std::error_code>
    open_sink(Job& job, const ChunkPlanEntry& entry);

    void update_progress(const ProgressAggregator& aggregator);
    void set_state(DownloadState state) noexcept;
    [[nodiscard]] std::unexpected<JobError> fail(JobError error);

    Transport& transport_;
    DownloadConfig config_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::atomic<bool> cancel_requested_{false};
    std::stop_source stop_source_;

    ChunkStates chunks_;
    DownloadProgress progress_;
    std::uint64_t last_sample_bytes_{0};
    std::chrono::steady_clock::time_point last_sample_time_;
    std::chrono::steady_clock::time_point download_start_;

    ProgressCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access
    mutable std::mutex mutex_;   // Protects chunks_ (the vector), progress_, stop_source_
};

} // namespace volley::core
