// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/download_service.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/segment.hpp>
#include <fetchr/core/segment_store.hpp>
#include <fetchr/core/url.hpp>
#include <fetchr/disk/append_file.hpp>
#include <algorithm>
#include <iterator>
#include <thread>

namespace fetchr::core {

namespace {

DownloadResult failed_result(const std::string& url, std::string filename, std::error_code ec) {
    return DownloadResult{url, std::move(filename), std::unexpected(TransferError{ec}), false};
}

// Segment artifacts of an abandoned segmented attempt, part0 excluded
void remove_stale_segments(const ResourceDescriptor& descriptor, const std::filesystem::path& dir,
                           std::uint32_t parallelism) {
    SegmentStore store(dir, descriptor.filename);
    for (const auto& seg : plan(descriptor.total_size, parallelism)) {
        if (seg.index == 0) continue;
        if (auto ec = disk::remove_file(store.path(seg.index)); ec) {
            log::get()->warn("Could not remove {}: {}", store.path(seg.index).string(), ec.message());
        }
    }
}

} // namespace

DownloadService::DownloadService(HttpTransport& transport,
                                 HostPolicyTable policies,
                                 ServiceOptions options,
                                 ResolverRegistry registry)
    : transport_(transport)
    , policies_(std::move(policies))
    , options_(std::move(options))
    , registry_(std::move(registry))
    , admission_(policies_, options_.global_limit)
    , resolve_limiter_(std::make_shared<Limiter>(options_.resolve_limit))
    , engine_(std::make_unique<Aria2cEngine>()) {}

std::expected<std::vector<ResourceDescriptor>, std::error_code>
DownloadService::resolve(const std::string& url, std::stop_token stoken) {
    auto permit = Permit::acquire(resolve_limiter_, stoken);
    if (!permit) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    const auto& policy = policies_.lookup(host_key(url));
    auto resolver = registry_.create(url, transport_, !policy.ignore_tls_verification);
    log::get()->debug("Resolving {} with {}", url, resolver->name());
    return resolver->resolve(url);
}

std::vector<DownloadResult>
DownloadService::download(const std::string& url,
                          const std::filesystem::path& target_dir,
                          const ResourceProgressCallback& on_progress,
                          std::stop_token stoken) {
    auto descriptors = resolve(url, stoken);
    if (!descriptors) {
        return {failed_result(url, {}, descriptors.error())};
    }
    if (descriptors->empty()) {
        log::get()->warn("{} resolved to nothing", url);
        return {failed_result(url, {}, make_error_code(DownloadErrc::resolve_failed))};
    }

    std::vector<DownloadResult> results(descriptors->size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(descriptors->size());
        for (std::size_t i = 0; i < descriptors->size(); ++i) {
            workers.emplace_back([&, i] {
                results[i] = transfer((*descriptors)[i], target_dir, on_progress, stoken);
            });
        }
    }
    return results;
}

std::vector<DownloadResult>
DownloadService::download_all(const std::vector<std::string>& urls,
                              const std::filesystem::path& target_dir,
                              const ResourceProgressCallback& on_progress,
                              std::stop_token stoken) {
    std::vector<std::vector<DownloadResult>> per_url(urls.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(urls.size());
        for (std::size_t i = 0; i < urls.size(); ++i) {
            workers.emplace_back([&, i] {
                per_url[i] = download(urls[i], target_dir, on_progress, stoken);
            });
        }
    }

    std::vector<DownloadResult> results;
    for (auto& batch : per_url) {
        std::move(batch.begin(), batch.end(), std::back_inserter(results));
    }

    auto succeeded = std::count_if(results.begin(), results.end(), [](const auto& r) { return r.ok(); });
    log::get()->info("{}/{} downloads succeeded", succeeded, results.size());
    for (const auto& r : results) {
        if (!r.ok()) {
            log::get()->error("Failed: {} ({})", r.url, r.outcome.error().message());
        }
    }
    return results;
}

DownloadResult
DownloadService::transfer(const ResourceDescriptor& descriptor,
                          const std::filesystem::path& target_dir,
                          const ResourceProgressCallback& on_progress,
                          std::stop_token stoken) {
    if (!is_safe_filename(descriptor.filename)) {
        log::get()->error("Refusing unsafe filename \"{}\" for {}", descriptor.filename, descriptor.url);
        return failed_result(descriptor.url, descriptor.filename, make_error_code(DownloadErrc::invalid_filename));
    }

    const auto final_path = target_dir / descriptor.filename;
    auto already_present = [&] {
        if (!descriptor.size_known()) return false;
        auto size = disk::file_size(final_path);
        return size && *size == descriptor.total_size;
    };

    if (already_present()) {
        log::get()->info("{} already exists, skipping", final_path.string());
        return DownloadResult{descriptor.url, descriptor.filename, final_path, true};
    }

    // One writer per final path; later jobs wait for the first to finish
    if (claims_.held(final_path)) {
        log::get()->info("{} is being written by another job, waiting", final_path.string());
    }
    auto claim = claims_.acquire(final_path, stoken);
    if (!claim) {
        return failed_result(descriptor.url, descriptor.filename, make_error_code(DownloadErrc::cancelled));
    }
    if (already_present()) {
        log::get()->info("{} was completed by another job, skipping", final_path.string());
        return DownloadResult{descriptor.url, descriptor.filename, final_path, true};
    }

    const auto& policy = policies_.lookup(host_key(descriptor.url));

    ProgressCallback job_progress;
    if (on_progress) {
        job_progress = [&on_progress, &descriptor](std::uint64_t downloaded, std::uint64_t total) {
            on_progress(descriptor, downloaded, total);
        };
    }

    auto job = [&]() -> std::expected<std::filesystem::path, TransferError> {
        return run_transfer(descriptor, target_dir, policy, job_progress, stoken);
    };

    auto outcome = admission_.submit(descriptor, job, stoken);
    return DownloadResult{descriptor.url, descriptor.filename, std::move(outcome), false};
}

const ProxyPool* DownloadService::proxies_for(const HostPolicy& policy) const noexcept {
    if (!policy.use_proxy || !options_.proxies || options_.proxies->empty()) {
        return nullptr;
    }
    return options_.proxies.get();
}

bool DownloadService::supports_ranges(const ResourceDescriptor& descriptor, const HostPolicy& policy) {
    if (policy.skip_range_check) {
        return true;
    }

    HttpRequest request;
    request.url = descriptor.url;
    request.headers = descriptor.headers;
    for (const auto& [name, value] : policy.extra_headers) {
        request.headers[name] = value;
    }
    request.verify_tls = !policy.ignore_tls_verification;
    if (const auto* proxies = proxies_for(policy)) {
        request.proxy = proxies->pick();
    }

    auto response = transport_.head(request);
    if (!response || status_to_error(response->status_code)) {
        // Let the segment workers find out
        log::get()->debug("Range preflight for {} inconclusive", descriptor.url);
        return true;
    }
    return response->accepts_ranges;
}

std::expected<std::filesystem::path, TransferError>
DownloadService::run_transfer(const ResourceDescriptor& descriptor,
                              const std::filesystem::path& target_dir,
                              const HostPolicy& policy,
                              const ProgressCallback& on_progress,
                              std::stop_token stoken) {
    WorkerOptions worker;
    worker.config = options_.config;
    worker.verify_tls = !policy.ignore_tls_verification;
    worker.accept_full_response = policy.accept_full_response;
    worker.extra_headers = policy.extra_headers;
    worker.engine = policy.use_alternate_engine ? engine_.get() : nullptr;
    worker.proxies = proxies_for(policy);

    const auto parallelism = std::max<std::uint32_t>(options_.parallelism.value_or(policy.max_connections), 1);
    TransferCoordinator coordinator(transport_, std::move(worker));

    if (!descriptor.size_known()) {
        return coordinator.run_streamed(descriptor, target_dir, on_progress, stoken);
    }

    if (parallelism > 1 && !supports_ranges(descriptor, policy)) {
        log::get()->warn("{} does not accept byte ranges, using a single connection", descriptor.url);
        return coordinator.run_streamed(descriptor, target_dir, on_progress, stoken);
    }

    auto result = coordinator.run(descriptor, target_dir, parallelism, on_progress, stoken);
    if (result || result.error().code != DownloadErrc::range_unsupported) {
        return result;
    }

    log::get()->warn("{} ignored byte ranges, retrying with a single connection", descriptor.url);
    result = coordinator.run_streamed(descriptor, target_dir, on_progress, stoken);
    if (result) {
        remove_stale_segments(descriptor, target_dir, parallelism);
    }
    return result;
}

} // namespace fetchr::core
