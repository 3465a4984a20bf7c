// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/error.hpp>
#include <fetchr/core/resource.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fetchr::core {

constexpr std::string_view DEFAULT_HOST_KEY = "default";

// Per-host download behaviour
struct HostPolicy {
    std::uint32_t max_connections{5};       // Segments per resource
    std::uint32_t max_concurrent{1};        // Resources in flight for this host
    bool use_alternate_engine{false};       // Fetch segments through aria2c
    bool ignore_tls_verification{false};
    bool skip_range_check{false};           // No HEAD Accept-Ranges preflight
    bool accept_full_response{false};       // Take a 200 for a whole-resource range
    bool use_proxy{true};                   // Route through the proxy list when one is configured
    Headers extra_headers;
};

// First key (in the given order, "default" excluded) where either string
// contains the other, case-insensitively. Returns "default" when none match.
[[nodiscard]] std::string match_host_key(std::string_view host,
                                         const std::vector<std::string>& keys);

// host key -> policy, insertion ordered, always with a "default" entry
class HostPolicyTable {
public:
    HostPolicyTable();

    // The built-in host table
    [[nodiscard]] static HostPolicyTable defaults();

    // {"default": {...}, "example.com": {"max_connections": 4, ...}}
    [[nodiscard]] static std::expected<HostPolicyTable, std::error_code>
    from_json(std::string_view text) noexcept;

    [[nodiscard]] static std::expected<HostPolicyTable, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::string to_json() const;

    // Insert or replace
    void set(std::string host, HostPolicy policy);

    [[nodiscard]] const HostPolicy& lookup(std::string_view host) const;
    [[nodiscard]] const HostPolicy& fallback() const noexcept { return entries_.front().second; }

    // Configured keys in insertion order, "default" first
    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] const std::vector<std::pair<std::string, HostPolicy>>& entries() const noexcept { return entries_; }

private:
    std::vector<std::pair<std::string, HostPolicy>> entries_;
};

} // namespace fetchr::core
