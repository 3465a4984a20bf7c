// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/http_session.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/url.hpp>
#include <curl/curl.h>
#include <cctype>
#include <charconv>
#include <memory>

namespace fetchr::core {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using CurlSlist = std::unique_ptr<curl_slist, SlistDeleter>;

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// Header callback for HEAD/GET responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<Headers*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts another response in a redirect chain
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    try {
        (*headers)[to_lower(trim(header.substr(0, colon)))] = std::string(trim(header.substr(colon + 1)));
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

std::size_t discard_callback(char*, std::size_t size, std::size_t nitems, void*) {
    return size * nitems;
}

struct GetContext {
    CURL* curl{nullptr};
    std::string_view url;
    const BodyHandler* on_body{nullptr};
    std::stop_token stoken;
    bool aborted_by_handler{false};
};

std::size_t body_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<GetContext*>(userdata);
    std::size_t total = size * nitems;

    long http_code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);

    bool keep_going = false;
    try {
        keep_going = (*ctx->on_body)(static_cast<std::int32_t>(http_code), ptr, total);
    } catch (const std::exception& e) {
        log::get()->error("Body handler for {} threw: {}", ctx->url, e.what());
    }
    if (!keep_going) {
        ctx->aborted_by_handler = true;
        return 0;
    }
    return total;
}

// libcurl progress callback - aborts once stop was requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<GetContext*>(userdata);
    return ctx->stoken.stop_requested() ? 1 : 0;
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                    return {};
        case CURLE_OPERATION_TIMEDOUT:    return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:       return make_error_code(DownloadErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:    return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:    return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:  return make_error_code(DownloadErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:   return make_error_code(DownloadErrc::cancelled);
        default:                          return make_error_code(DownloadErrc::network_error);
    }
}

std::error_code apply_common(CURL* curl, const HttpRequest& request, curl_slist*& header_list,
                             Headers& response_headers) noexcept {
    try {
        for (const auto& [name, value] : request.headers) {
            if (to_lower(name) == "range") {
                continue;  // Range is owned by request.range
            }
            std::string line = name + ": " + value;
            auto* appended = curl_slist_append(header_list, line.c_str());
            if (!appended) {
                return make_error_code(DownloadErrc::network_error);
            }
            header_list = appended;
        }
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, DEFAULT_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, FOLLOW_REDIRECTS ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);
    if (!request.proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
    return {};
}

void fill_response(CURL* curl, HttpResponse& response) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T doesn't work for HEAD
    if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
        const auto& v = it->second;
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
        if (ec == std::errc{} && ptr == v.data() + v.size()) {
            response.content_length = value;
        }
    }

    if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
        response.content_type = it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = ar_it != response.headers.end()
                           && to_lower(ar_it->second).find("bytes") != std::string::npos;

    if (auto it = response.headers.find("content-disposition"); it != response.headers.end()) {
        response.filename = parse_content_disposition(it->second);
    }
}

} // namespace

std::string ByteRange::to_string() const {
    std::string result = std::to_string(first) + "-";
    if (last) {
        result += std::to_string(*last);
    }
    return result;
}

//=============================================================================
// HttpSession
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpSession::head(const HttpRequest& request) noexcept {
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    curl_slist* raw_list = nullptr;
    auto ec = apply_common(curl.get(), request, raw_list, response.headers);
    CurlSlist header_list{raw_list};
    if (ec) {
        return std::unexpected(ec);
    }

    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_callback);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                     static_cast<long>(request.connect_timeout.count() + request.stall_timeout.count()));

    CURLcode result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        log::get()->debug("HEAD {} failed: {}", request.url, curl_easy_strerror(result));
        return std::unexpected(curl_to_error(result));
    }

    try {
        fill_response(curl.get(), response);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
    return response;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const HttpRequest& request, const BodyHandler& on_body, std::stop_token stoken) noexcept {
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};
    curl_slist* raw_list = nullptr;
    auto ec = apply_common(curl.get(), request, raw_list, response.headers);
    CurlSlist header_list{raw_list};
    if (ec) {
        return std::unexpected(ec);
    }

    std::string range;
    if (request.range) {
        try {
            range = request.range->to_string();
        } catch (const std::bad_alloc&) {
            return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
        }
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    GetContext ctx{curl.get(), request.url, &on_body, std::move(stoken)};

    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.stall_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);  // Enable progress callback

    CURLcode result = curl_easy_perform(curl.get());

    if (result != CURLE_OK) {
        if (ctx.stoken.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }
        if (!(ctx.aborted_by_handler && result == CURLE_WRITE_ERROR)) {
            log::get()->debug("GET {} failed: {}", request.url, curl_easy_strerror(result));
            return std::unexpected(curl_to_error(result));
        }
        // Stopped by the handler: the exchange itself succeeded up to here
    }

    try {
        fill_response(curl.get(), response);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status >= 200 && status < 300) return {};
    if (status == 404 || status == 410) return make_error_code(DownloadErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(DownloadErrc::permission_denied);
    if (status == 416) return make_error_code(DownloadErrc::invalid_range);
    if (status >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::unexpected_status);
}

std::string parse_content_disposition(std::string_view value) {
    auto unquote = [](std::string_view v) {
        v = trim(v);
        if (auto semi = v.find(';'); semi != std::string_view::npos && v.front() != '"') {
            v = trim(v.substr(0, semi));
        }
        if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'')) {
            auto close = v.find(v.front(), 1);
            v = v.substr(1, (close == std::string_view::npos ? v.size() : close) - 1);
        }
        return v;
    };

    std::string lower = to_lower(value);

    // filename*=UTF-8''na%20me.zip
    if (auto pos = lower.find("filename*="); pos != std::string::npos) {
        auto ext = unquote(value.substr(pos + 10));
        if (auto quote = ext.find("''"); quote != std::string_view::npos) {
            ext.remove_prefix(quote + 2);
        }
        if (!ext.empty()) {
            return percent_decode(ext);
        }
    }

    // filename="name.zip" (skip the "filename*" hit when both are present)
    for (auto pos = lower.find("filename="); pos != std::string::npos; pos = lower.find("filename=", pos + 1)) {
        auto name = unquote(value.substr(pos + 9));
        if (!name.empty()) {
            return std::string(name);
        }
    }
    return {};
}

} // namespace fetchr::core
