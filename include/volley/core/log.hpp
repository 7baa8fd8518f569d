// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>
#include <optional>

namespace volley::core {

// Process-wide "volley" logger on a stderr colour sink, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) noexcept;

} // namespace volley::core

#define VOLLEY_TRACE(...) ::volley::core::logger()->trace(__VA_ARGS__)
#define VOLLEY_DEBUG(...) ::volley::core::logger()->debug(__VA_ARGS__)
#define VOLLEY_INFO(...)  ::volley::core::logger()->info(__VA_ARGS__)
#define VOLLEY_WARN(...)  ::volley::core::logger()->warn(__VA_ARGS__)
#define VOLLEY_ERROR(...) ::volley::core::logger()->error(__VA_ARGS__)
