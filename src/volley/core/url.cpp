// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace volley::core {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool all_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

// Strip characters that would escape the working directory or confuse a shell
std::string sanitize_filename(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') continue;
        out += c;
    }
    if (out == "." || out == "..") out.clear();
    return out;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) {
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    Url url;
    url.scheme_ = to_lower(url_str.substr(0, scheme_end));
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto rest = url_str.substr(scheme_end + 3);

    // Drop the fragment, it is never sent to the server
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto authority_end = std::min(rest.find('/'), rest.find('?'));
    if (authority_end == std::string_view::npos) {
        authority_end = rest.size();
    }
    auto authority = rest.substr(0, authority_end);
    auto tail = rest.substr(authority_end);

    // Skip userinfo (user:pass@host)
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, close + 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.port_ = std::string(after.substr(1));
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        url.host_ = std::string(authority.substr(0, colon));
        url.port_ = std::string(authority.substr(colon + 1));
    } else {
        url.host_ = std::string(authority);
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    if (!url.port_.empty() && !all_digits(url.port_)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto query_start = tail.find('?');
    auto path = tail.substr(0, query_start);
    url.path_ = path.empty() ? "/" : std::string(path);
    if (query_start != std::string_view::npos) {
        url.query_ = std::string(tail.substr(query_start + 1));
    }

    return url;
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    return sanitize_filename(name);
}

std::string Url::extension() const {
    auto name = filename();
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return {};
    }
    return name.substr(dot);
}

std::string default_output_name(const Url& url, std::string_view server_filename) {
    if (auto name = sanitize_filename(server_filename); !name.empty()) {
        return name;
    }
    if (auto name = url.filename(); !name.empty()) {
        return name;
    }
    return "download" + url.extension();
}

} // namespace volley::core
