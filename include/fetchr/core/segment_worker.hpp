// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/external_engine.hpp>
#include <fetchr/core/http_session.hpp>
#include <fetchr/core/proxy_pool.hpp>
#include <fetchr/core/resource.hpp>
#include <fetchr/core/segment.hpp>
#include <fetchr/core/segment_store.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>

namespace fetchr::core {

// (segment index, bytes of this segment on disk, resource total)
using SegmentProgressCallback =
    std::function<void(std::uint32_t index, std::uint64_t segment_bytes, std::uint64_t resource_total)>;

struct WorkerOptions {
    TransferConfig config;
    bool verify_tls{true};
    bool accept_full_response{false};  // Take a 200 for a range covering the whole resource
    Headers extra_headers;             // Host policy headers, applied over descriptor headers
    ExternalEngine* engine{nullptr};   // Non-owning; nullptr = built-in HTTP
    const ProxyPool* proxies{nullptr}; // Non-owning; one pick per attempt, nullptr = direct
};

// Fetches one byte range into its append-only artifact, with retry and backoff
class SegmentWorker {
public:
    explicit SegmentWorker(HttpTransport& transport, WorkerOptions options = {});

    // Artifact path once it holds exactly expected_size() bytes.
    // Errors: segment_failed, range_unsupported, cancelled.
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    fetch(const ResourceDescriptor& descriptor,
          const Segment& segment,
          const std::filesystem::path& dir,
          std::stop_token stoken,
          const SegmentProgressCallback& on_progress = {}) const noexcept;

    [[nodiscard]] const WorkerOptions& options() const noexcept { return options_; }

private:
    struct Attempt;

    [[nodiscard]] std::error_code attempt(Attempt& ctx) const;
    [[nodiscard]] std::error_code attempt_http(Attempt& ctx, std::uint64_t current_start) const;
    [[nodiscard]] std::error_code attempt_engine(Attempt& ctx, std::uint64_t current_start) const;

    [[nodiscard]] Headers request_headers(const ResourceDescriptor& descriptor) const;

    HttpTransport& transport_;
    WorkerOptions options_;
};

// Interruptible sleep; false when stop was requested
bool sleep_for(std::chrono::milliseconds delay, std::stop_token stoken);

} // namespace fetchr::core
