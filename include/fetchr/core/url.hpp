// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace fetchr::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }

    // http and https are the only schemes the transport speaks
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    // Last non-empty path component, percent-decoded; empty when the path has none
    [[nodiscard]] std::string filename() const;

    // Lowercased host with a leading "www." removed, used for admission and policy lookup
    [[nodiscard]] std::string host_key() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string path_;
};

// Host key of a raw URL string; empty when it does not parse
[[nodiscard]] std::string host_key(std::string_view url) noexcept;

// Decode %XX escapes ('+' is kept literally)
[[nodiscard]] std::string percent_decode(std::string_view text);

[[nodiscard]] std::string to_lower(std::string_view text);

} // namespace fetchr::core
