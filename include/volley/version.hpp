// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace volley {

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 3;
    std::uint32_t patch = 0;

    [[nodiscard]] std::string to_string() const {
        return std::format("{}.{}.{}", major, minor, patch);
    }

    // Default User-Agent header value
    [[nodiscard]] std::string user_agent() const {
        return std::format("volley/{}", to_string());
    }
} version;

} // namespace volley
