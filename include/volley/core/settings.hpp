// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace volley::core {

// JSON config file. Durations are in seconds, sink_mode is "single_file" or "part_files".
// Keys absent from the document keep their value from `base`; unknown keys are ignored.
[[nodiscard]] std::expected<DownloadConfig, std::error_code>
parse_config(std::string_view json, DownloadConfig base = {});

[[nodiscard]] std::expected<DownloadConfig, std::error_code>
load_config(const std::filesystem::path& path, DownloadConfig base = {});

[[nodiscard]] std::string to_json(const DownloadConfig& cfg);

[[nodiscard]] std::error_code save_config(const std::filesystem::path& path, const DownloadConfig& cfg);

[[nodiscard]] std::optional<SinkMode> parse_sink_mode(std::string_view name) noexcept;

} // namespace volley::core
