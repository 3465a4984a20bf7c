// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/resource.hpp>

namespace fetchr::core {

bool is_safe_filename(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

std::string sanitize_filename(std::string_view name) {
    if (auto sep = name.find_last_of("/\\"); sep != std::string_view::npos) {
        name.remove_prefix(sep + 1);
    }

    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) continue;
        result += c;
    }

    auto first = result.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    result = result.substr(first, result.find_last_not_of(" \t") - first + 1);

    if (!is_safe_filename(result)) {
        return {};
    }
    return result;
}

} // namespace fetchr::core
