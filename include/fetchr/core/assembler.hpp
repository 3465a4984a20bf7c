// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/segment.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace fetchr::core {

// Concatenates complete segment artifacts into the final file.
//
// Artifacts are {dir}/{filename}.part{index} and the result is {dir}/{filename}.
// Nothing is written unless every artifact has exactly its expected size. The
// result is built in {dir}/{filename}.assembling and renamed into place once
// its size checks out, so a final file is always complete.
class Assembler {
public:
    explicit Assembler(AssemblyMode mode = AssemblyMode::atomic) noexcept : mode_(mode) {}

    // Final size on success; invalid_filename for a name that would leave
    // dir, assembly_failed otherwise
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    assemble(const std::filesystem::path& dir,
             const std::string& filename,
             const std::vector<Segment>& segments) const noexcept;

    [[nodiscard]] AssemblyMode mode() const noexcept { return mode_; }

private:
    AssemblyMode mode_;
};

// {final_path}.assembling
[[nodiscard]] std::filesystem::path assembling_path(const std::filesystem::path& final_path);

} // namespace fetchr::core
