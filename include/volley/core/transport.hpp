// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace volley::core {

// Inclusive byte span sent as "Range: bytes=first-last"
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

struct TransferOptions {
    std::chrono::seconds timeout{30};   // Connect timeout and read-stall limit
    std::string user_agent;
    bool verify_tls{true};
};

// What the probe learned about the remote resource. Immutable once built.
struct ResourceInfo {
    std::string url;
    std::optional<std::uint64_t> total_size;
    bool supports_ranges{false};
    std::string content_type;
    std::string filename;               // From Content-Disposition

    [[nodiscard]] bool known_size() const noexcept { return total_size.has_value(); }
};

// Parsed "Content-Range: bytes first-last/total"
struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;  // "*" when the server does not say
};

// Final response status line and the headers the fetch path validates
struct ResponseHead {
    long status{0};
    std::optional<std::uint64_t> content_length;
    std::optional<ContentRange> content_range;
};

// Callbacks for one streamed response. Returning an error aborts the transfer
// and that error becomes the result of fetch().
struct ResponseHandler {
    std::function<std::error_code(const ResponseHead&)> on_head;
    std::function<std::error_code(std::span<const std::byte>)> on_body;
};

struct TransferSummary {
    long status{0};
    std::uint64_t body_bytes{0};
};

// HTTP client seam. Implementations must be safe to call from several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Learn size and range support of the resource
    [[nodiscard]] virtual std::expected<ResourceInfo, std::error_code>
    probe(const std::string& url, const TransferOptions& options) = 0;

    // GET the resource, or the given range of it, streaming the body into the handler.
    // The stop token is polled while the transfer runs; a stop yields DownloadErrc::cancelled.
    [[nodiscard]] virtual std::expected<TransferSummary, std::error_code>
    fetch(const std::string& url,
          const std::optional<ByteRange>& range,
          const TransferOptions& options,
          const ResponseHandler& handler,
          std::stop_token stop) = 0;
};

[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

[[nodiscard]] std::string format_range(const ByteRange& range);

} // namespace volley::core
