// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/transport.hpp>
#include <charconv>
#include <format>

namespace volley::core {

namespace {

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    if (s.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    // bytes 0-499/1234  or  bytes 0-499/*
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    if (!value.starts_with("bytes")) return std::nullopt;
    value.remove_prefix(5);
    while (!value.empty() && (value.front() == ' ' || value.front() == '=')) value.remove_prefix(1);

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto first = parse_u64(value.substr(0, dash));
    auto last = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) return std::nullopt;

    ContentRange range{*first, *last, std::nullopt};
    auto total = value.substr(slash + 1);
    if (total != "*") {
        range.total = parse_u64(total);
        if (!range.total) return std::nullopt;
    }
    return range;
}

std::string format_range(const ByteRange& range) {
    return std::format("{}-{}", range.first, range.last);
}

} // namespace volley::core
