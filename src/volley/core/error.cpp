// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/error.hpp>
#include <volley/disk/error.hpp>

namespace volley::core {

ErrorClass classify(std::error_code ec) noexcept {
    if (!ec) return ErrorClass::none;

    if (ec.category() == disk::disk_errc_category() ||
        ec.category() == std::generic_category() ||
        ec.category() == std::system_category()) {
        return ErrorClass::disk;
    }

    if (ec.category() != download_errc_category()) {
        return ErrorClass::network;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::integrity_error:
            return ErrorClass::integrity;
        case DownloadErrc::cancelled:
            return ErrorClass::cancelled;
        case DownloadErrc::invalid_url:
        case DownloadErrc::invalid_config:
            return ErrorClass::usage;
        default:
            return ErrorClass::network;
    }
}

bool is_transient(std::error_code ec) noexcept {
    if (!ec) return false;
    if (classify(ec) != ErrorClass::network) return false;
    // Retrying cannot help: the server answers every range with the whole body
    return ec != make_error_code(DownloadErrc::range_ignored);
}

std::error_code status_to_error(long http_status) noexcept {
    if (http_status >= 200 && http_status < 300) return {};
    if (http_status == 404) return make_error_code(DownloadErrc::not_found);
    if (http_status == 401 || http_status == 403) return make_error_code(DownloadErrc::permission_denied);
    if (http_status == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_status >= 400 && http_status < 500) return make_error_code(DownloadErrc::http_error);
    if (http_status >= 500 && http_status < 600) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::unexpected_status);
}

std::string_view to_string(ErrorClass kind) noexcept {
    switch (kind) {
        case ErrorClass::none:      return "no error";
        case ErrorClass::network:   return "network error";
        case ErrorClass::integrity: return "integrity error";
        case ErrorClass::disk:      return "disk error";
        case ErrorClass::cancelled: return "cancelled";
        case ErrorClass::usage:     return "usage error";
    }
    return "unknown error";
}

} // namespace volley::core
