// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/segment_store.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/disk/append_file.hpp>
#include <algorithm>

namespace fetchr::core {

std::filesystem::path segment_path(const std::filesystem::path& dir,
                                   const std::string& filename,
                                   std::uint32_t index) {
    return dir / (filename + ".part" + std::to_string(index));
}

SegmentStore::SegmentStore(std::filesystem::path dir, std::string filename)
    : dir_(std::move(dir))
    , filename_(std::move(filename)) {}

SegmentStatus SegmentStore::status(const Segment& segment) const noexcept {
    std::filesystem::path artifact;
    try {
        artifact = path(segment.index);
    } catch (const std::bad_alloc&) {
        return {};
    }

    auto size = disk::file_size(artifact);
    if (!size) {
        return {SegmentState::missing, 0};
    }

    auto expected = segment.expected_size();
    if (*size == expected) return {SegmentState::complete, *size};
    if (*size < expected) return {SegmentState::partial, *size};
    return {SegmentState::corrupted, *size};
}

SegmentClassification SegmentStore::classify(const std::vector<Segment>& segments) const {
    SegmentClassification result;
    for (const auto& seg : segments) {
        switch (status(seg).state) {
            case SegmentState::complete:  result.complete.push_back(seg.index); break;
            case SegmentState::partial:   result.partial.push_back(seg.index); break;
            case SegmentState::missing:   result.missing.push_back(seg.index); break;
            case SegmentState::corrupted: result.corrupted.push_back(seg.index); break;
        }
    }
    return result;
}

std::size_t SegmentStore::cleanup_corrupted(const std::vector<Segment>& segments) const {
    std::size_t removed = 0;
    for (const auto& seg : segments) {
        auto st = status(seg);
        if (st.state != SegmentState::corrupted) {
            continue;
        }

        auto artifact = path(seg.index);
        if (auto ec = disk::remove_file(artifact); ec) {
            log::get()->error("Could not remove corrupted segment {}: {}", artifact.string(), ec.message());
            continue;
        }
        log::get()->warn("Removed corrupted segment {} ({} bytes, expected {})",
                         artifact.string(), st.bytes, seg.expected_size());
        ++removed;
    }
    return removed;
}

std::uint64_t SegmentStore::downloaded_bytes(const std::vector<Segment>& segments) const noexcept {
    std::uint64_t total = 0;
    for (const auto& seg : segments) {
        total += std::min(status(seg).bytes, seg.expected_size());
    }
    return total;
}

} // namespace fetchr::core
