// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/http_session.hpp>
#include <volley/core/config.hpp>
#include <volley/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <charconv>

namespace volley::core {

namespace {

static_assert(static_cast<std::size_t>(CURL_LOCK_DATA_LAST) <= std::tuple_size_v<HttpSession::ShareLocks>,
              "share lock table too small for this libcurl");

std::mutex global_mutex;
int global_refs = 0;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::error_code curl_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                      return {};
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_CONNECT:         return make_error_code(DownloadErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:   return make_error_code(DownloadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:      return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:            return make_error_code(DownloadErrc::connection_lost);
        case CURLE_TOO_MANY_REDIRECTS:      return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:    return make_error_code(DownloadErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:     return make_error_code(DownloadErrc::cancelled);
        default:                            return make_error_code(DownloadErrc::network_error);
    }
}

void lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* locks = static_cast<HttpSession::ShareLocks*>(userptr);
    (*locks)[static_cast<std::size_t>(data)].lock();
}

void unlock_share(CURL*, curl_lock_data data, void* userptr) {
    auto* locks = static_cast<HttpSession::ShareLocks*>(userptr);
    (*locks)[static_cast<std::size_t>(data)].unlock();
}

std::optional<std::uint64_t> header_u64(const std::map<std::string, std::string>& headers,
                                        const std::string& name) noexcept {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) return std::nullopt;

    std::uint64_t value = 0;
    const auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::string header_value(const std::map<std::string, std::string>& headers, const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
}

// Header callback: lowercased name -> value. A new status line (redirect hop) starts a fresh map.
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    std::string_view line(buffer, total);
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

// State shared with the curl callbacks of one fetch()
struct FetchContext {
    CURL* curl{nullptr};
    const ResponseHandler* handler{nullptr};
    std::map<std::string, std::string> headers;
    std::stop_token stop;
    bool head_delivered{false};
    std::error_code abort_reason;
    std::uint64_t body_bytes{0};
};

std::error_code deliver_head(FetchContext& ctx) {
    ctx.head_delivered = true;

    ResponseHead head;
    long code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
    head.status = code;
    head.content_length = header_u64(ctx.headers, "content-length");
    if (auto cr = ctx.headers.find("content-range"); cr != ctx.headers.end()) {
        head.content_range = parse_content_range(cr->second);
    }

    if (ctx.handler && ctx.handler->on_head) {
        return ctx.handler->on_head(head);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->stop.stop_requested()) {
        ctx->abort_reason = make_error_code(DownloadErrc::cancelled);
        return 0;
    }

    if (!ctx->head_delivered) {
        if (auto ec = deliver_head(*ctx)) {
            ctx->abort_reason = ec;
            return 0;  // Short count makes curl stop with CURLE_WRITE_ERROR
        }
    }

    if (ctx->handler && ctx->handler->on_body) {
        auto ec = ctx->handler->on_body(
            std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), bytes));
        if (ec) {
            ctx->abort_reason = ec;
            return 0;
        }
    }

    ctx->body_bytes += bytes;
    return bytes;
}

// Polled by curl about once a second and on every read; non-zero aborts the transfer
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    if (ctx->stop.stop_requested()) {
        ctx->abort_reason = make_error_code(DownloadErrc::cancelled);
        return 1;
    }
    return 0;
}

} // namespace

//=============================================================================
// CurlGlobal
//=============================================================================

CurlGlobal::CurlGlobal() noexcept {
    std::lock_guard<std::mutex> lock(global_mutex);
    if (global_refs == 0) {
        ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
        if (ok_) ++global_refs;
        return;
    }
    ++global_refs;
    ok_ = true;
}

CurlGlobal::~CurlGlobal() {
    if (!ok_) return;
    std::lock_guard<std::mutex> lock(global_mutex);
    if (--global_refs == 0) {
        curl_global_cleanup();
    }
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() {
    if (!global_.ok()) {
        VOLLEY_ERROR("curl_global_init failed");
        return;
    }

    CURLSH* share = curl_share_init();
    if (!share) {
        VOLLEY_WARN("curl_share_init failed, requests will not share connections");
        return;
    }

    curl_share_setopt(share, CURLSHOPT_LOCKFUNC, lock_share);
    curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, unlock_share);
    curl_share_setopt(share, CURLSHOPT_USERDATA, &share_locks_);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    share_ = share;
}

HttpSession::~HttpSession() {
    if (share_) {
        curl_share_cleanup(static_cast<CURLSH*>(share_));
        share_ = nullptr;
    }
}

void HttpSession::configure(void* handle, const std::string& url, const TransferOptions& options) noexcept {
    auto* curl = static_cast<CURL*>(handle);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required when used from worker threads

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Connect timeout, and abort if the body stalls for the same period
    long timeout = static_cast<long>(options.timeout.count());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeout);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);

    const std::string& ua = options.user_agent;
    if (!ua.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, ua.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(TRANSFER_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    if (share_) {
        curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
    }
}

std::expected<HttpSession::HeadResult, std::error_code>
HttpSession::head(const std::string& url, const TransferOptions& options) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HeadResult result;
    configure(curl.ptr, url, options);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &result.headers);

    CURLcode code = curl_easy_perform(curl.ptr);
    if (code != CURLE_OK) {
        return std::unexpected(curl_to_error_code(code));
    }

    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &result.status);
    return result;
}

std::expected<ResourceInfo, std::error_code>
HttpSession::probe(const std::string& url, const TransferOptions& options) {
    ResourceInfo info;
    info.url = url;

    auto head_result = head(url, options);
    if (!head_result) {
        return std::unexpected(head_result.error());
    }

    const long head_status = head_result->status;
    const auto& headers = head_result->headers;

    if (head_status >= 200 && head_status < 300) {
        info.total_size = header_u64(headers, "content-length");
        info.supports_ranges = header_value(headers, "accept-ranges").find("bytes") != std::string::npos;
        info.content_type = header_value(headers, "content-type");
        info.filename = parse_content_disposition(header_value(headers, "content-disposition"));

        if (info.total_size && info.supports_ranges) {
            return info;
        }
    } else if (head_status != 405 && head_status != 501) {
        // HEAD answered with a real error; a GET would not fare better
        return std::unexpected(status_to_error(head_status));
    }

    // HEAD was unhelpful: ask for the first byte and read the answer
    VOLLEY_DEBUG("HEAD {} gave status {} without size/range info, trying ranged GET", url, head_status);

    ResponseHead trial;
    bool got_head = false;

    ResponseHandler handler;
    handler.on_head = [&](const ResponseHead& h) -> std::error_code {
        trial = h;
        got_head = true;
        return {};
    };
    handler.on_body = [&](std::span<const std::byte>) -> std::error_code {
        // Never pull more than the first buffer of a server that ignores Range
        return trial.status == 206 ? std::error_code{} : make_error_code(DownloadErrc::cancelled);
    };

    auto fetched = fetch(url, ByteRange{0, 0}, options, handler, std::stop_token{});
    if (!got_head) {
        return std::unexpected(fetched ? make_error_code(DownloadErrc::network_error) : fetched.error());
    }
    if (!fetched && fetched.error() != make_error_code(DownloadErrc::cancelled)) {
        return std::unexpected(fetched.error());
    }

    if (trial.status == 206) {
        info.supports_ranges = true;
        if (trial.content_range && trial.content_range->total) {
            info.total_size = trial.content_range->total;
        } else {
            // Ranges work but the total is "*": nothing to plan against
            info.supports_ranges = false;
        }
    } else if (trial.status == 200) {
        info.supports_ranges = false;
        if (trial.content_length) {
            info.total_size = trial.content_length;
        }
    } else {
        return std::unexpected(status_to_error(trial.status));
    }

    return info;
}

std::expected<TransferSummary, std::error_code>
HttpSession::fetch(const std::string& url,
                   const std::optional<ByteRange>& range,
                   const TransferOptions& options,
                   const ResponseHandler& handler,
                   std::stop_token stop) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    FetchContext ctx;
    ctx.curl = curl.ptr;
    ctx.handler = &handler;
    ctx.stop = std::move(stop);

    configure(curl.ptr, url, options);

    std::string range_str;
    if (range) {
        range_str = format_range(*range);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_str.c_str());
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode code = curl_easy_perform(curl.ptr);

    if (code != CURLE_OK) {
        // An error from one of our callbacks explains the abort better than curl's code
        if (ctx.abort_reason) {
            return std::unexpected(ctx.abort_reason);
        }
        return std::unexpected(curl_to_error_code(code));
    }

    // Empty body: the head was never handed over by the write callback
    if (!ctx.head_delivered) {
        if (auto ec = deliver_head(ctx)) {
            return std::unexpected(ec);
        }
    }

    long status = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
    return TransferSummary{status, ctx.body_bytes};
}

std::string HttpSession::parse_content_disposition(std::string_view value) {
    // attachment; filename="file.zip"   or   filename*=UTF-8''file.zip
    auto pos = value.find("filename*=");
    std::size_t skip = 10;
    if (pos == std::string_view::npos) {
        pos = value.find("filename=");
        skip = 9;
    }
    if (pos == std::string_view::npos) {
        return {};
    }

    auto name = value.substr(pos + skip);
    if (auto semi = name.find(';'); semi != std::string_view::npos) {
        name = name.substr(0, semi);
    }
    if (skip == 10) {
        if (auto quote = name.find("''"); quote != std::string_view::npos) {
            name = name.substr(quote + 2);
        }
    }
    while (!name.empty() && (name.back() == ' ' || name.back() == '\r')) {
        name.remove_suffix(1);
    }
    if (name.size() >= 2 && (name.front() == '"' || name.front() == '\'') && name.back() == name.front()) {
        name = name.substr(1, name.size() - 2);
    }
    return std::string(name);
}

} // namespace volley::core
