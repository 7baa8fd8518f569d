// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace volley::cli {

// Process exit codes
namespace exit_code {
constexpr int ok = 0;
constexpr int network = 1;
constexpr int integrity = 2;
constexpr int disk = 3;
constexpr int usage = 4;
constexpr int cancelled = 130;
} // namespace exit_code

// Command line arguments. Unset options fall back to the config file, then to defaults.
struct CliArgs {
    std::string url;
    std::string output_file;
    std::string config_file;
    std::optional<std::uint32_t> concurrency;
    std::optional<std::uint32_t> retries;
    std::optional<double> base_delay;     // Seconds
    std::optional<double> max_delay;      // Seconds
    std::optional<double> timeout;        // Seconds
    std::optional<double> jitter;
    std::optional<std::uint64_t> chunk_size;
    std::string log_level;
    bool part_files{false};
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                    // First problem found while parsing
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Config file (if any) overlaid with command line options
[[nodiscard]] std::expected<core::DownloadConfig, std::error_code> build_config(const CliArgs& args);

// Download args.url; returns the process exit code
[[nodiscard]] int download(const CliArgs& args, const core::DownloadConfig& config);

// Probe args.url and print what was learned
[[nodiscard]] int info(const CliArgs& args, const core::DownloadConfig& config);

[[nodiscard]] int exit_code_for(core::ErrorClass kind) noexcept;

// SIGINT/SIGTERM set a flag that running commands turn into a cancel
void install_signal_handlers() noexcept;
[[nodiscard]] bool interrupted() noexcept;

void print_help(std::string_view program_name);
void print_version();

} // namespace volley::cli
