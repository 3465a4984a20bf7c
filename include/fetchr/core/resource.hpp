// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace fetchr::core {

// Request headers, name -> value
using Headers = std::map<std::string, std::string>;

// One remote resource as produced by a resolver
struct ResourceDescriptor {
    std::string url;
    std::string filename;
    std::uint64_t total_size{0};  // 0 = unknown, forces a single streamed connection
    Headers headers;

    [[nodiscard]] bool size_known() const noexcept { return total_size > 0; }
};

// A name that stays inside its target directory: not empty, not "." or "..",
// and free of path separators and NUL
[[nodiscard]] bool is_safe_filename(std::string_view name) noexcept;

// Last path component of a server-supplied name with control characters and
// surrounding blanks removed; empty when nothing usable is left
[[nodiscard]] std::string sanitize_filename(std::string_view name);

} // namespace fetchr::core
