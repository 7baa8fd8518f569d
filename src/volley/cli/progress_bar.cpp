// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <ostream>

namespace volley::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(out)
    , label_(label) {}

std::string ProgressBar::render(const core::DownloadProgress& p) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (p.total_bytes) {
        double percent = std::clamp(p.percent, 0.0, 100.0);
        const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

        line += '[';
        line.append(static_cast<std::size_t>(filled), '=');
        line += filled < BAR_WIDTH ? ">" : "";
        line.append(static_cast<std::size_t>(std::max(0, BAR_WIDTH - filled - 1)), ' ');
        line += ']';
        line += std::format(" {:3}% ({}/{})", static_cast<int>(percent),
                            format_bytes(p.downloaded_bytes), format_bytes(*p.total_bytes));
    } else {
        line += format_bytes(p.downloaded_bytes);
    }

    if (p.speed_bps > 0) {
        line += " @ ";
        line += format_speed(p.speed_bps);
    }
    if (p.eta_seconds > 0) {
        line += " ETA ";
        line += format_time(p.eta_seconds);
    }

    if (p.total_chunks > 1) {
        line += std::format(" [{}/{} chunks", p.completed_chunks, p.total_chunks);
        if (p.retrying_chunks > 0) {
            line += std::format(", {} retrying", p.retrying_chunks);
        }
        line += ']';
    }
    return line;
}

void ProgressBar::update(const core::DownloadProgress& progress) {
    if (finished_) return;
    last_ = progress;

    // Only redraw on a visible change (whole percent, or bytes when the size is unknown)
    if (progress.total_bytes) {
        auto whole = std::floor(progress.percent);
        if (drawn_ && whole == last_percent_) return;
        last_percent_ = whole;
    } else {
        if (drawn_ && progress.downloaded_bytes == last_bytes_) return;
        last_bytes_ = progress.downloaded_bytes;
    }

    auto line = render(progress);
    auto width = line.size();
    if (width < last_width_) {
        line.append(last_width_ - width, ' ');
    }
    last_width_ = width;
    drawn_ = true;

    out_ << '\r' << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    drawn_ = false;
    update(last_);
    finished_ = true;
    out_ << '\n' << std::flush;
}

void ProgressBar::clear() {
    if (!drawn_) return;
    out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    drawn_ = false;
    last_width_ = 0;
}

//=============================================================================
// Formatting
//=============================================================================

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    auto scaled = [bytes](std::uint64_t unit) { return static_cast<double>(bytes) / static_cast<double>(unit); };

    if (bytes >= TB) return std::format("{:.2f} TB", scaled(TB));
    if (bytes >= GB) return std::format("{:.2f} GB", scaled(GB));
    if (bytes >= MB) return std::format("{:.1f} MB", scaled(MB));
    if (bytes >= KB) return std::format("{:.0f} KB", scaled(KB));
    return std::format("{} B", bytes);
}

std::string format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    auto scaled = [bps](std::uint64_t unit) { return static_cast<double>(bps) / static_cast<double>(unit); };

    if (bps >= GB) return std::format("{:.1f} GB/s", scaled(GB));
    if (bps >= MB) return std::format("{:.1f} MB/s", scaled(MB));
    if (bps >= KB) return std::format("{:.1f} KB/s", scaled(KB));
    return std::format("{} B/s", bps);
}

std::string format_time(std::uint64_t seconds) {
    auto hours = seconds / 3600;
    auto minutes = (seconds % 3600) / 60;
    auto secs = seconds % 60;

    if (hours > 0) return std::format("{}h {:02}m {}s", hours, minutes, secs);
    if (minutes > 0) return std::format("{}m {}s", minutes, secs);
    return std::format("{}s", secs);
}

} // namespace volley::cli
