// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/error.hpp>
#include <fetchr/core/http_session.hpp>
#include <fetchr/core/resource.hpp>
#include <fetchr/core/segment.hpp>
#include <fetchr/core/segment_worker.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>

namespace fetchr::core {

// (bytes on disk, resource total); advisory, may repeat values and may be
// called from several segment threads at once
using ProgressCallback = std::function<void(std::uint64_t downloaded, std::uint64_t total)>;

// Drives one resource: plan, classify, fetch every segment concurrently,
// then assemble. A failed run leaves every artifact on disk and a later run
// with the same descriptor and parallelism resumes from them.
class TransferCoordinator {
public:
    explicit TransferCoordinator(HttpTransport& transport, WorkerOptions options = {});

    // Non-copyable
    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Errors: transfer_failed, range_unsupported, assembly_failed, cancelled
    [[nodiscard]] std::expected<std::filesystem::path, TransferError>
    run(const ResourceDescriptor& descriptor,
        const std::filesystem::path& target_dir,
        std::uint32_t parallelism,
        const ProgressCallback& on_progress = {},
        std::stop_token stoken = {}) noexcept;

    // Plain GET of the whole resource into {filename}.part0, renamed on success.
    // Used for unknown sizes and for servers without range support.
    [[nodiscard]] std::expected<std::filesystem::path, TransferError>
    run_streamed(const ResourceDescriptor& descriptor,
                 const std::filesystem::path& target_dir,
                 const ProgressCallback& on_progress = {},
                 std::stop_token stoken = {}) noexcept;

    [[nodiscard]] const WorkerOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::error_code
    stream_once(const ResourceDescriptor& descriptor,
                const std::filesystem::path& part,
                const ProgressCallback& on_progress,
                std::stop_token stoken) const;

    HttpTransport& transport_;
    WorkerOptions options_;
};

} // namespace fetchr::core
