// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace haul::core {

// Response status and headers (names lower-cased)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::uint64_t body_bytes{0};

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

// Inclusive byte span
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

struct HttpRequest {
    std::string url;
    std::optional<ByteRange> range;   // no Range header when empty
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT};
    std::chrono::seconds low_speed_timeout{LOW_SPEED_TIMEOUT};
};

// Called once the final response headers are known, before any body byte.
// Returning false aborts the request.
using HeadersHandler = std::function<bool(const HttpResponse&)>;

// Receives body bytes in order. Returning false aborts the request.
using BodyHandler = std::function<bool(const char* data, std::size_t size)>;

// HTTP seam of the engine. Implementations return the response for any
// status code; transport failures and aborts come back as NetErrc.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept = 0;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const HeadersHandler& on_headers,
        const BodyHandler& on_body,
        std::stop_token stop) noexcept = 0;
};

// libcurl transport. One easy handle per request; safe to share between
// fetcher threads.
class CurlSession final : public HttpTransport {
public:
    CurlSession();
    ~CurlSession() override = default;

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request,
        const HeadersHandler& on_headers,
        const BodyHandler& on_body,
        std::stop_token stop) noexcept override;

    // Process-wide libcurl setup; the constructor calls global_init once
    static void global_init() noexcept;
};

// Map an HTTP error status (>= 400) to NetErrc; success statuses map to {}
[[nodiscard]] std::error_code status_to_error(std::int32_t status) noexcept;

// "Range: bytes=<start>-<end>" value without the "bytes=" prefix
[[nodiscard]] std::string range_spec(const ByteRange& range);

// Parse "bytes <start>-<end>/<total|*>"; the total is nullopt for "*"
struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total;
};
[[nodiscard]] std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;

// Strict decimal parse of a Content-Length value
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value) noexcept;

} // namespace haul::core
