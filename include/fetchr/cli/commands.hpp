// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fetchr::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir;
    std::string hosts_config;
    std::string proxies_file;
    std::uint32_t segments{0};    // 0 = per host policy
    bool info{false};
    bool stats{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;            // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Download every URL, exit code 0 only when all succeeded
[[nodiscard]] CliResult download(const CliArgs& args, const core::Settings& settings) noexcept;

// Resolve and print descriptors without downloading
[[nodiscard]] CliResult info(const CliArgs& args, const core::Settings& settings) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace fetchr::cli
