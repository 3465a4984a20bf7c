// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/error.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fetchr::core {

// Proxy URLs read from a list, one per line. Blank lines and lines starting
// with '#' are skipped; a line without a scheme is taken as http://.
class ProxyPool {
public:
    ProxyPool() = default;
    explicit ProxyPool(std::vector<std::string> proxies);

    [[nodiscard]] static ProxyPool parse(std::string_view text);

    // Errors: invalid_config when the file cannot be read
    [[nodiscard]] static std::expected<ProxyPool, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    // A uniformly random entry, empty when the pool is empty. Thread safe.
    [[nodiscard]] std::string pick() const;

    [[nodiscard]] bool empty() const noexcept { return proxies_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return proxies_.size(); }
    [[nodiscard]] const std::vector<std::string>& proxies() const noexcept { return proxies_; }

private:
    std::vector<std::string> proxies_;
};

} // namespace fetchr::core
