// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/download_engine.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace volley::cli {

// Single-line progress display, redrawn in place with '\r'
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::string_view label = {});

    void update(const core::DownloadProgress& progress);

    // Draw the final state and end the line
    void finish();

    // Erase the line
    void clear();

    [[nodiscard]] std::string render(const core::DownloadProgress& progress) const;

private:
    std::ostream& out_;
    std::string label_;
    double last_percent_{-1.0};
    std::uint64_t last_bytes_{0};
    std::size_t last_width_{0};
    bool drawn_{false};
    bool finished_{false};
    core::DownloadProgress last_;
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace volley::cli
