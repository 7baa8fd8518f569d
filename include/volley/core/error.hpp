// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <system_error>
#include <string_view>

namespace volley::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    connection_lost,
    too_many_redirects,
    not_found,
    permission_denied,
    server_error,
    http_error,
    unexpected_status,
    length_mismatch,
    invalid_range,
    range_ignored,
    cancelled,
    integrity_error,
    invalid_url,
    invalid_config,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "volley::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:             return "Success";
            case DownloadErrc::network_error:       return "Network error";
            case DownloadErrc::timeout:             return "Operation timed out";
            case DownloadErrc::refused:             return "Connection refused";
            case DownloadErrc::dns_error:           return "DNS resolution failed";
            case DownloadErrc::ssl_error:           return "SSL/TLS error";
            case DownloadErrc::connection_lost:     return "Connection lost";
            case DownloadErrc::too_many_redirects:  return "Too many redirects";
            case DownloadErrc::not_found:           return "Resource not found (404)";
            case DownloadErrc::permission_denied:   return "Access denied (401/403)";
            case DownloadErrc::server_error:        return "Server error (5xx)";
            case DownloadErrc::http_error:          return "HTTP client error (4xx)";
            case DownloadErrc::unexpected_status:   return "Unexpected HTTP status";
            case DownloadErrc::length_mismatch:     return "Body length does not match requested range";
            case DownloadErrc::invalid_range:       return "Invalid byte range";
            case DownloadErrc::range_ignored:       return "Server ignored the range request";
            case DownloadErrc::cancelled:           return "Download cancelled";
            case DownloadErrc::integrity_error:     return "Integrity check failed";
            case DownloadErrc::invalid_url:         return "Invalid URL";
            case DownloadErrc::invalid_config:      return "Invalid configuration";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Coarse grouping used for reporting and exit codes
enum class ErrorClass : std::uint8_t {
    none,
    network,    // Transport or server side, possibly transient
    integrity,  // Output does not match the resource; a logic bug, never retried
    disk,       // Local filesystem
    cancelled,
    usage       // Bad URL or configuration
};

[[nodiscard]] ErrorClass classify(std::error_code ec) noexcept;

// True if a chunk attempt that failed with `ec` may be retried
[[nodiscard]] bool is_transient(std::error_code ec) noexcept;

// Map an HTTP status to the error it represents (0 for 2xx)
[[nodiscard]] std::error_code status_to_error(long http_status) noexcept;

[[nodiscard]] std::string_view to_string(ErrorClass kind) noexcept;

} // namespace volley::core

namespace std {

template<>
struct is_error_code_enum<volley::core::DownloadErrc> : true_type {};

} // namespace std
