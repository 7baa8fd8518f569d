// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace volley::core {

class Url {
public:
    // Accepts http:// and https:// URLs with an authority part
    static std::expected<Url, std::error_code> parse(std::string_view url_str);

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    // The string handed to the transport (fragment stripped)
    [[nodiscard]] std::string full() const;
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, empty for directory-style paths
    [[nodiscard]] std::string filename() const;

    // Extension of the last path segment including the dot, e.g. ".iso"
    [[nodiscard]] std::string extension() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_{"/"};
    std::string query_;
};

// Output file name when the caller gave none: server-supplied name, then the
// URL's last segment, then "download" with the URL's extension
[[nodiscard]] std::string default_output_name(const Url& url, std::string_view server_filename);

} // namespace volley::core
