// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cmath>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>

namespace volley::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 8;
constexpr std::uint32_t DEFAULT_MAX_RETRIES = 5;                     // Attempts per chunk, first one included
constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY{500};
constexpr std::chrono::milliseconds DEFAULT_MAX_DELAY{30'000};
constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};                  // Connect and read-stall

constexpr std::uint64_t SUGGESTED_CHUNK_SIZE = 4 * 1024 * 1024;      // Shown in --help for -c (4 MiB)
constexpr double MAX_DURATION_SECONDS = 24.0 * 60 * 60;              // Upper bound for any configured delay

constexpr std::chrono::milliseconds PROGRESS_SAMPLE_INTERVAL{100};

constexpr std::size_t TRANSFER_BUFFER_SIZE = 256 * 1024;             // 256 KB
constexpr std::size_t COPY_BUFFER_SIZE = 1024 * 1024;                // Reassembly copy buffer

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// Where fetched bytes land before the final rename
enum class SinkMode : std::uint8_t {
    single_file, // One pre-sized temp file, chunks write at their own offsets
    part_files   // One temp file per chunk, concatenated during reassembly
};

// Exponential backoff: min(base * 2^(attempt-1), max), optionally jittered downwards
struct RetryPolicy {
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds base_delay{DEFAULT_BASE_DELAY};
    std::chrono::milliseconds max_delay{DEFAULT_MAX_DELAY};
    double jitter{0.0};

    // Delay before the attempt that follows failed attempt number `attempt` (1-based).
    // `unit` is a uniform sample in [0, 1) used only when jitter > 0.
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt, double unit = 0.0) const noexcept;

    [[nodiscard]] bool exhausted(std::uint32_t attempt) const noexcept { return attempt >= max_retries; }
};

struct DownloadConfig {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds base_delay{DEFAULT_BASE_DELAY};
    std::chrono::milliseconds max_delay{DEFAULT_MAX_DELAY};
    double jitter{0.0};
    std::chrono::seconds timeout{DEFAULT_TIMEOUT};
    std::uint64_t chunk_size{0};          // 0 = split into `concurrency` equal parts
    SinkMode sink_mode{SinkMode::single_file};
    std::string user_agent;               // Empty = volley/<version>
    bool verify_tls{true};

    [[nodiscard]] std::error_code validate() const noexcept;

    [[nodiscard]] RetryPolicy retry_policy() const noexcept {
        return RetryPolicy{max_retries, base_delay, max_delay, jitter};
    }
};

[[nodiscard]] std::string_view to_string(SinkMode mode) noexcept;

// Convert a user supplied number of seconds. NaN, infinities, negatives and
// values above MAX_DURATION_SECONDS yield nullopt.
template<typename Duration>
[[nodiscard]] std::optional<Duration> duration_from_seconds(double seconds) noexcept {
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > MAX_DURATION_SECONDS) {
        return std::nullopt;
    }
    return std::chrono::round<Duration>(std::chrono::duration<double>(seconds));
}

} // namespace volley::core
