// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/segment.hpp>
#include <algorithm>

namespace fetchr::core {

std::vector<Segment> plan(std::uint64_t total_size, std::uint32_t parallelism) {
    std::vector<Segment> segments;
    if (total_size == 0) {
        return segments;
    }

    auto count = std::clamp<std::uint64_t>(parallelism, 1, total_size);
    std::uint64_t chunk = total_size / count;

    segments.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        Segment seg;
        seg.index = static_cast<std::uint32_t>(i);
        seg.start_byte = i * chunk;
        seg.end_byte = (i + 1 == count) ? total_size - 1 : seg.start_byte + chunk - 1;
        segments.push_back(seg);
    }
    return segments;
}

std::uint64_t total_expected(const std::vector<Segment>& segments) noexcept {
    std::uint64_t sum = 0;
    for (const auto& seg : segments) {
        sum += seg.expected_size();
    }
    return sum;
}

} // namespace fetchr::core
