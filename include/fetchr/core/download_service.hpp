// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/external_engine.hpp>
#include <fetchr/core/file_claims.hpp>
#include <fetchr/core/host_admission.hpp>
#include <fetchr/core/host_policy.hpp>
#include <fetchr/core/http_session.hpp>
#include <fetchr/core/limiter.hpp>
#include <fetchr/core/proxy_pool.hpp>
#include <fetchr/core/resolver.hpp>
#include <fetchr/core/resource.hpp>
#include <fetchr/core/transfer_coordinator.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace fetchr::core {

// (resource, bytes on disk, resource total)
using ResourceProgressCallback =
    std::function<void(const ResourceDescriptor& resource, std::uint64_t downloaded, std::uint64_t total)>;

struct DownloadResult {
    std::string url;
    std::string filename;
    std::expected<std::filesystem::path, TransferError> outcome;
    bool skipped{false};  // Final file was already present with the expected size

    [[nodiscard]] bool ok() const noexcept { return outcome.has_value(); }
};

struct ServiceOptions {
    TransferConfig config;
    std::uint32_t global_limit{GLOBAL_MAX_CONCURRENT};
    std::uint32_t resolve_limit{RESOLVE_MAX_CONCURRENT};
    std::optional<std::uint32_t> parallelism;  // Overrides the host policy
    std::shared_ptr<const ProxyPool> proxies;  // For hosts with use_proxy; nullptr = direct
};

// Resolve, admit and transfer resources end to end
class DownloadService {
public:
    DownloadService(HttpTransport& transport,
                    HostPolicyTable policies,
                    ServiceOptions options = {},
                    ResolverRegistry registry = ResolverRegistry::builtin());

    DownloadService(const DownloadService&) = delete;
    DownloadService& operator=(const DownloadService&) = delete;

    // One result per resource the URL resolves to
    [[nodiscard]] std::vector<DownloadResult>
    download(const std::string& url,
             const std::filesystem::path& target_dir,
             const ResourceProgressCallback& on_progress = {},
             std::stop_token stoken = {});

    // All URLs concurrently, results in input order
    [[nodiscard]] std::vector<DownloadResult>
    download_all(const std::vector<std::string>& urls,
                 const std::filesystem::path& target_dir,
                 const ResourceProgressCallback& on_progress = {},
                 std::stop_token stoken = {});

    // Resolution under the resolver cap
    [[nodiscard]] std::expected<std::vector<ResourceDescriptor>, std::error_code>
    resolve(const std::string& url, std::stop_token stoken = {});

    // Admission and transfer of one resolved resource. Jobs sharing a final
    // path run one after another.
    [[nodiscard]] DownloadResult
    transfer(const ResourceDescriptor& descriptor,
             const std::filesystem::path& target_dir,
             const ResourceProgressCallback& on_progress = {},
             std::stop_token stoken = {});

    // Replaces the aria2c engine used by hosts with use_alternate_engine
    void engine(std::unique_ptr<ExternalEngine> engine) noexcept { engine_ = std::move(engine); }

    [[nodiscard]] HostAdmissionController& admission() noexcept { return admission_; }
    [[nodiscard]] const HostPolicyTable& policies() const noexcept { return policies_; }
    [[nodiscard]] const FileClaims& claims() const noexcept { return claims_; }

private:
    // nullptr unless the policy opts in and the pool has entries
    [[nodiscard]] const ProxyPool* proxies_for(const HostPolicy& policy) const noexcept;

    // True when the server states it serves byte ranges (or the policy skips the check)
    [[nodiscard]] bool supports_ranges(const ResourceDescriptor& descriptor, const HostPolicy& policy);

    [[nodiscard]] std::expected<std::filesystem::path, TransferError>
    run_transfer(const ResourceDescriptor& descriptor,
                 const std::filesystem::path& target_dir,
                 const HostPolicy& policy,
                 const ProgressCallback& on_progress,
                 std::stop_token stoken);

    HttpTransport& transport_;
    HostPolicyTable policies_;
    ServiceOptions options_;
    ResolverRegistry registry_;
    HostAdmissionController admission_;
    std::shared_ptr<Limiter> resolve_limiter_;
    FileClaims claims_;
    std::unique_ptr<ExternalEngine> engine_;
};

} // namespace fetchr::core
