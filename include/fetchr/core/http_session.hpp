// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/resource.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace fetchr::core {

// Inclusive byte range; an open range has no last byte
struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last;

    // "first-last" or "first-"
    [[nodiscard]] std::string to_string() const;
};

struct HttpRequest {
    std::string url;
    Headers headers;
    std::optional<ByteRange> range;
    bool verify_tls{true};
    std::string proxy;              // Empty = direct
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds stall_timeout{STALL_TIMEOUT_SEC};
};

// Response of a completed HTTP exchange. Any status is returned here,
// errors are reserved for transport failures.
struct HttpResponse {
    std::int32_t status_code{0};
    Headers headers;                // Lowercased names, last response of a redirect chain
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename;           // From Content-Disposition
};

// Receives the body in arbitrary slices. Returning false aborts the transfer;
// get() then returns the response headers seen so far.
using BodyHandler = std::function<bool(std::int32_t status, const char* data, std::size_t size)>;

// Network seam of the engine
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept = 0;

    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request, const BodyHandler& on_body, std::stop_token stoken) noexcept = 0;
};

// libcurl transport, one easy handle per request
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) noexcept override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request, const BodyHandler& on_body, std::stop_token stoken) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

// Map an HTTP status onto the download category; empty for 2xx
[[nodiscard]] std::error_code status_to_error(std::int32_t status) noexcept;

// Filename from a Content-Disposition value: filename*= (RFC 5987) wins over filename=
[[nodiscard]] std::string parse_content_disposition(std::string_view value);

} // namespace fetchr::core
