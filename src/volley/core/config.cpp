// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/config.hpp>
#include <volley/core/error.hpp>
#include <algorithm>

namespace volley::core {

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t attempt, double unit) const noexcept {
    if (attempt == 0) return std::chrono::milliseconds{0};

    // Double until the cap is reached; stops early so large attempt counts cannot overflow
    auto delay = base_delay;
    for (std::uint32_t i = 1; i < attempt && delay < max_delay; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, max_delay);

    if (jitter > 0.0) {
        double factor = 1.0 - std::clamp(jitter, 0.0, 1.0) * std::clamp(unit, 0.0, 1.0);
        delay = std::chrono::milliseconds{
            static_cast<std::chrono::milliseconds::rep>(static_cast<double>(delay.count()) * factor)};
    }
    return delay;
}

std::error_code DownloadConfig::validate() const noexcept {
    if (concurrency == 0 || max_retries == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (base_delay.count() < 0 || base_delay > max_delay) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (!(jitter >= 0.0 && jitter <= 1.0)) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (timeout.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::string_view to_string(SinkMode mode) noexcept {
    switch (mode) {
        case SinkMode::single_file: return "single_file";
        case SinkMode::part_files:  return "part_files";
    }
    return "single_file";
}

} // namespace volley::core
