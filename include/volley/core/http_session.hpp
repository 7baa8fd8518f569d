// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/transport.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace volley::core {

// Holds curl_global_init for as long as it lives. Nested guards are reference counted.
class CurlGlobal {
public:
    CurlGlobal() noexcept;
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }

private:
    bool ok_{false};
};

// libcurl transport. One easy handle per request; DNS, TLS sessions and
// connections are shared between requests through a CURLSH handle.
// Holds the curl global state for its own lifetime, so one session per job
// brackets curl_global_init/cleanup around that job.
class HttpSession final : public Transport {
public:
    HttpSession();
    ~HttpSession() override;

    // Non-copyable, non-movable (share handle points back at our mutexes)
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    [[nodiscard]] std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url, const TransferOptions& options) override;

    [[nodiscard]] std::expected<TransferSummary, std::error_code>
    fetch(const std::string& url,
          const std::optional<ByteRange>& range,
          const TransferOptions& options,
          const ResponseHandler& handler,
          std::stop_token stop) override;

    // Parse the filename parameter of a Content-Disposition header value
    [[nodiscard]] static std::string parse_content_disposition(std::string_view value);

private:
    struct HeadResult {
        long status{0};
        std::map<std::string, std::string> headers;
    };

    [[nodiscard]] std::expected<HeadResult, std::error_code>
    head(const std::string& url, const TransferOptions& options);

    // Apply options common to every request
    void configure(void* curl, const std::string& url, const TransferOptions& options) noexcept;

public:
    // One mutex per curl_lock_data slot
    using ShareLocks = std::array<std::mutex, 16>;

private:
    CurlGlobal global_;     // Declared first: initialised before the share handle, released after it
    void* share_{nullptr};  // CURLSH*
    ShareLocks share_locks_;
};

} // namespace volley::core
