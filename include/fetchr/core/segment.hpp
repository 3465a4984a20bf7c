// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <vector>

namespace fetchr::core {

// A contiguous byte range of a resource, end inclusive
struct Segment {
    std::uint32_t index{0};
    std::uint64_t start_byte{0};
    std::uint64_t end_byte{0};

    [[nodiscard]] constexpr std::uint64_t expected_size() const noexcept {
        return end_byte - start_byte + 1;
    }

    constexpr bool operator==(const Segment&) const = default;
};

// Split [0, total_size) into min(max(parallelism, 1), total_size) contiguous
// ranges of floor(total_size / n) bytes; the last one absorbs the remainder.
// total_size == 0 yields no segments.
[[nodiscard]] std::vector<Segment> plan(std::uint64_t total_size, std::uint32_t parallelism);

// Sum of expected sizes
[[nodiscard]] std::uint64_t total_expected(const std::vector<Segment>& segments) noexcept;

} // namespace fetchr::core
