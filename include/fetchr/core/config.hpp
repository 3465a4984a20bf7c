// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/disk/append_file.hpp>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fetchr::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;                     // No bytes for this long aborts an attempt
constexpr std::uint32_t RETRY_COUNT = 3;                            // Retries after the first attempt
constexpr double BACKOFF_BASE = 2.0;

constexpr std::chrono::milliseconds SEGMENT_PROGRESS_INTERVAL{2000};
constexpr std::chrono::milliseconds JOB_PROGRESS_INTERVAL{1000};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::uint32_t GLOBAL_MAX_CONCURRENT = 20;
constexpr std::uint32_t RESOLVE_MAX_CONCURRENT = 5;

constexpr const char* DEFAULT_USER_AGENT = "fetchr/0.1";

// Retry schedule of one segment: delay before retry n is backoff_base^n units
struct RetryPolicy {
    std::uint32_t retries{RETRY_COUNT};
    double backoff_base{BACKOFF_BASE};
    std::chrono::milliseconds backoff_unit{1000};

    [[nodiscard]] std::uint32_t attempts() const noexcept { return retries + 1; }
    [[nodiscard]] std::chrono::milliseconds delay(std::uint32_t attempt) const noexcept;
};

enum class AssemblyMode : std::uint8_t {
    atomic,            // Write {final}.assembling, rename, then delete artifacts
    delete_as_copied   // Delete each artifact right after it was copied
};

// Runtime tuning for one transfer
struct TransferConfig {
    RetryPolicy retry;
    std::chrono::milliseconds segment_progress_interval{SEGMENT_PROGRESS_INTERVAL};
    std::chrono::milliseconds job_progress_interval{JOB_PROGRESS_INTERVAL};
    std::size_t chunk_size{disk::WRITE_BUFFER_SIZE};
    bool sync_each_chunk{false};
    AssemblyMode assembly{AssemblyMode::atomic};
};

// Process settings picked up from the environment
struct Settings {
    std::filesystem::path download_dir{"downloads"};
    std::optional<std::filesystem::path> hosts_config;
    std::optional<std::filesystem::path> proxies_file;
    std::string log_level{"info"};
    std::uint32_t max_concurrent{GLOBAL_MAX_CONCURRENT};

    // FETCHR_DOWNLOAD_DIR, FETCHR_HOSTS_CONFIG, FETCHR_PROXIES_PATH, FETCHR_LOG_LEVEL,
    // FETCHR_MAX_CONCURRENT
    [[nodiscard]] static Settings from_env();
};

} // namespace fetchr::core
