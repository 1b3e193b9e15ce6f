// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/http_session.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>

namespace haul::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    if (s.empty()) {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

// Per-request state shared with the libcurl callbacks
struct RequestContext {
    HttpResponse response;
    const HeadersHandler* on_headers{nullptr};
    const BodyHandler* on_body{nullptr};
    std::stop_token stop;
    CURL* curl{nullptr};
    bool headers_delivered{false};
    bool rejected{false};
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<RequestContext*>(userdata);

    std::string_view line(buffer, total);

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return total;
    }

    std::string name;
    name.reserve(colon);
    for (char c : line.substr(0, colon)) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    ctx->response.headers[name] = std::string(trim(line.substr(colon + 1)));
    return total;
}

void finish_headers(RequestContext& ctx) {
    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);

    if (auto cl = ctx.response.header("content-length")) {
        ctx.response.content_length = parse_content_length(*cl);
    }
    auto ar = ctx.response.header("accept-ranges");
    ctx.response.accepts_ranges = ar && ar->find("bytes") != std::string_view::npos;
}

bool deliver_headers(RequestContext& ctx) {
    if (ctx.headers_delivered) {
        return !ctx.rejected;
    }
    ctx.headers_delivered = true;
    finish_headers(ctx);
    if (ctx.on_headers && *ctx.on_headers && !(*ctx.on_headers)(ctx.response)) {
        ctx.rejected = true;
    }
    return !ctx.rejected;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!deliver_headers(*ctx)) {
        return 0;
    }
    if (ctx->on_body && *ctx->on_body && !(*ctx->on_body)(ptr, bytes)) {
        ctx->rejected = true;
        return 0;
    }
    ctx->response.body_bytes += bytes;
    return bytes;
}

// Returns 1 to abort the transfer when a stop was requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<RequestContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                    return {};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return make_error_code(NetErrc::dns_error);
        case CURLE_COULDNT_CONNECT:       return make_error_code(NetErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:    return make_error_code(NetErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:            return make_error_code(NetErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:           return make_error_code(NetErrc::connection_lost);
        case CURLE_PARTIAL_FILE:          return make_error_code(NetErrc::short_body);
        case CURLE_ABORTED_BY_CALLBACK:
        case CURLE_WRITE_ERROR:           return make_error_code(NetErrc::aborted);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:  return make_error_code(NetErrc::client_error);
        case CURLE_TOO_MANY_REDIRECTS:    return make_error_code(NetErrc::client_error);
        default:                          return make_error_code(NetErrc::network_error);
    }
}

void apply_common_options(CURL* curl, const HttpRequest& request, RequestContext& ctx) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Timeouts: connect bound plus an abort when no bytes arrive for low_speed_timeout
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.low_speed_timeout.count()));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
}

} // namespace

std::optional<std::string_view> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(std::string(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

//=============================================================================
// CurlSession
//=============================================================================

CurlSession::CurlSession() {
    global_init();
}

std::expected<HttpResponse, std::error_code>
CurlSession::head(const HttpRequest& request) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(NetErrc::network_error));
        }

        RequestContext ctx;
        ctx.curl = curl.ptr;
        apply_common_options(curl.ptr, request, ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            return std::unexpected(curl_to_error_code(result));
        }

        finish_headers(ctx);
        return ctx.response;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(NetErrc::network_error));
    }
}

std::expected<HttpResponse, std::error_code>
CurlSession::get(const HttpRequest& request,
                 const HeadersHandler& on_headers,
                 const BodyHandler& on_body,
                 std::stop_token stop) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(NetErrc::network_error));
        }

        RequestContext ctx;
        ctx.curl = curl.ptr;
        ctx.on_headers = &on_headers;
        ctx.on_body = &on_body;
        ctx.stop = std::move(stop);
        apply_common_options(curl.ptr, request, ctx);

        std::string range;
        if (request.range) {
            range = range_spec(*request.range);
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, 256L * 1024L);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            return std::unexpected(curl_to_error_code(result));
        }

        // Empty bodies never reach the write callback
        if (!deliver_headers(ctx)) {
            return std::unexpected(make_error_code(NetErrc::aborted));
        }
        return ctx.response;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(NetErrc::network_error));
    }
}

void CurlSession::global_init() noexcept {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

//=============================================================================
// Header helpers
//=============================================================================

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status < 400) {
        return {};
    }
    switch (status) {
        case 401:
        case 403: return make_error_code(NetErrc::forbidden);
        case 404:
        case 410: return make_error_code(NetErrc::not_found);
        case 408:
        case 429: return make_error_code(NetErrc::rate_limited);
        case 416: return make_error_code(NetErrc::invalid_range);
        default:
            return status >= 500
                ? make_error_code(NetErrc::server_error)
                : make_error_code(NetErrc::client_error);
    }
}

std::string range_spec(const ByteRange& range) {
    return std::to_string(range.start) + "-" + std::to_string(range.end);
}

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    value = trim(value);
    if (!value.starts_with("bytes ")) {
        return std::nullopt;
    }
    value.remove_prefix(6);
    value = trim(value);

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto start = parse_u64(value.substr(0, dash));
    auto end = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }

    ContentRange out{*start, *end, std::nullopt};
    auto total = value.substr(slash + 1);
    if (total != "*") {
        auto t = parse_u64(total);
        if (!t) {
            return std::nullopt;
        }
        out.total = *t;
    }
    return out;
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept {
    return parse_u64(trim(value));
}

} // namespace haul::core
