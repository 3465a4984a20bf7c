// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace fetchr::core {

std::string to_lower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string percent_decode(std::string_view text) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex(text[i + 1]);
            int lo = hex(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3; // Skip "://"

        // Authority ends at the first of: /, ?, #, or end
        auto host_end = url_str.find_first_of("/?#", rest_start);
        if (host_end == std::string_view::npos) {
            host_end = url_str.length();
        }

        auto authority = url_str.substr(rest_start, host_end - rest_start);

        // Skip userinfo (user:pass@)
        if (auto at_pos = authority.rfind('@'); at_pos != std::string_view::npos) {
            authority.remove_prefix(at_pos + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
        } else if (auto colon_pos = authority.rfind(':'); colon_pos != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon_pos));
        } else {
            url.host_ = std::string(authority);
        }

        // Path runs up to the query or fragment, whichever comes first
        auto path_end = url_str.find_first_of("?#", host_end);
        if (path_end == std::string_view::npos) {
            path_end = url_str.length();
        }

        if (host_end < path_end && url_str[host_end] == '/') {
            url.path_ = std::string(url_str.substr(host_end, path_end - host_end));
        } else {
            url.path_ = "/";
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.str_ = std::string(url_str);
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string Url::filename() const {
    std::string_view path = path_;
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    auto last_slash = path.rfind('/');
    auto name = (last_slash == std::string_view::npos) ? path : path.substr(last_slash + 1);
    return percent_decode(name);
}

std::string Url::host_key() const {
    std::string key = to_lower(host_);
    if (key.starts_with("www.")) {
        key.erase(0, 4);
    }
    return key;
}

std::string host_key(std::string_view url) noexcept {
    try {
        auto parsed = Url::parse(url);
        if (!parsed) {
            return {};
        }
        return parsed->host_key();
    } catch (const std::bad_alloc&) {
        return {};
    }
}

} // namespace fetchr::core
