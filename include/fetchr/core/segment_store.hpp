// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/segment.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fetchr::core {

// Derived state of one segment artifact on disk
enum class SegmentState : std::uint8_t {
    missing,    // No artifact
    partial,    // Shorter than expected, resumable
    complete,   // Exactly the expected size
    corrupted   // Longer than expected, must be refetched
};

struct SegmentStatus {
    SegmentState state{SegmentState::missing};
    std::uint64_t bytes{0};  // Artifact size on disk
};

// Segment indices grouped by state
struct SegmentClassification {
    std::vector<std::uint32_t> complete;
    std::vector<std::uint32_t> partial;
    std::vector<std::uint32_t> missing;
    std::vector<std::uint32_t> corrupted;
};

// {dir}/{filename}.part{index}
[[nodiscard]] std::filesystem::path segment_path(const std::filesystem::path& dir,
                                                 const std::string& filename,
                                                 std::uint32_t index);

// Artifact bookkeeping for one resource. The artifact path is the only
// durable identity of a segment, nothing else is persisted.
class SegmentStore {
public:
    SegmentStore(std::filesystem::path dir, std::string filename);

    [[nodiscard]] std::filesystem::path path(std::uint32_t index) const {
        return segment_path(dir_, filename_, index);
    }

    [[nodiscard]] SegmentStatus status(const Segment& segment) const noexcept;

    // Read-only classification
    [[nodiscard]] SegmentClassification classify(const std::vector<Segment>& segments) const;

    // Delete every artifact larger than its expected size, returns how many
    // were removed. Partial artifacts are kept.
    std::size_t cleanup_corrupted(const std::vector<Segment>& segments) const;

    // Sum of min(actual, expected) over all artifacts
    [[nodiscard]] std::uint64_t downloaded_bytes(const std::vector<Segment>& segments) const noexcept;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }
    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }

private:
    std::filesystem::path dir_;
    std::string filename_;
};

} // namespace fetchr::core
