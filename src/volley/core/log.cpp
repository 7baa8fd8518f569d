// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace volley::core {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        instance = spdlog::get("volley");
        if (!instance) {
            instance = spdlog::stderr_color_mt("volley");
            instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) noexcept {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

} // namespace volley::core
