// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/host_policy.hpp>
#include <fetchr/core/limiter.hpp>
#include <fetchr/core/resource.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace fetchr::core {

// Lifecycle of one submitted job
enum class JobState : std::uint8_t {
    queued,
    admitted_to_host,
    admitted_globally,
    running,
    succeeded,
    failed
};

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

using JobObserver = std::function<void(JobState)>;

struct AdmissionStats {
    std::uint64_t submitted{0};
    std::uint64_t succeeded{0};
    std::uint64_t failed{0};
    double success_rate{0.0};                        // Percent of submitted
    std::map<std::string, std::uint32_t> active;     // host key -> running jobs
    std::map<std::string, std::uint32_t> host_limits;
    std::uint32_t global_limit{0};
    std::uint32_t global_in_use{0};
};

// Arbitrates how many jobs run at once, per host and overall.
//
// A job first takes a slot of its host's limiter, then one of the global
// limiter, so a saturated host never holds global slots while it waits.
class HostAdmissionController {
public:
    HostAdmissionController(const std::vector<std::pair<std::string, std::uint32_t>>& host_limits,
                            std::uint32_t global_limit = GLOBAL_MAX_CONCURRENT);
    explicit HostAdmissionController(const HostPolicyTable& policies,
                                     std::uint32_t global_limit = GLOBAL_MAX_CONCURRENT);

    HostAdmissionController(const HostAdmissionController&) = delete;
    HostAdmissionController& operator=(const HostAdmissionController&) = delete;

    // Runs job() once admitted and returns its result. job() returns
    // std::expected<V, E> with E constructible from std::error_code; a
    // cancelled wait returns DownloadErrc::cancelled without running it.
    // An exception from job() counts as a failure and propagates.
    template<typename Fn>
    std::invoke_result_t<Fn&> submit(const ResourceDescriptor& descriptor,
                                     Fn&& job,
                                     std::stop_token stoken = {},
                                     const JobObserver& observer = {});

    // Lowercased authority of a URL without "www."
    [[nodiscard]] static std::string host_for(std::string_view url);

    // Limiter key for a host: first configured key matching it, else "default"
    [[nodiscard]] std::string limiter_key(std::string_view host) const;

    // Swap in a new limiter; jobs holding the old one finish undisturbed
    void update_host_limit(const std::string& host, std::uint32_t limit);

    [[nodiscard]] AdmissionStats stats() const;

private:
    [[nodiscard]] std::shared_ptr<Limiter> limiter_for(const std::string& key) const;
    void job_started(const std::string& key);
    void job_finished(const std::string& key, bool succeeded) noexcept;

    // Settles the counters exactly once, also during unwinding
    struct Completion {
        HostAdmissionController& owner;
        const std::string& key;
        bool settled{false};

        void settle(bool succeeded) noexcept {
            if (settled) return;
            settled = true;
            owner.job_finished(key, succeeded);
        }
        ~Completion() { settle(false); }
    };

    std::vector<std::string> keys_;  // Insertion order decides matching
    std::map<std::string, std::shared_ptr<Limiter>> limiters_;
    std::shared_ptr<Limiter> global_;
    std::map<std::string, std::uint32_t> active_;
    std::uint64_t submitted_{0};
    std::uint64_t succeeded_{0};
    std::uint64_t failed_{0};
    mutable std::mutex mutex_;
};

template<typename Fn>
std::invoke_result_t<Fn&> HostAdmissionController::submit(const ResourceDescriptor& descriptor,
                                                          Fn&& job,
                                                          std::stop_token stoken,
                                                          const JobObserver& observer) {
    using Result = std::invoke_result_t<Fn&>;

    auto notify = [&observer](JobState state) {
        if (observer) observer(state);
    };

    notify(JobState::queued);
    const auto key = limiter_key(host_for(descriptor.url));

    auto host_permit = Permit::acquire(limiter_for(key), stoken);
    if (!host_permit) {
        return Result(std::unexpect, make_error_code(DownloadErrc::cancelled));
    }
    notify(JobState::admitted_to_host);

    auto global_permit = Permit::acquire(global_, stoken);
    if (!global_permit) {
        return Result(std::unexpect, make_error_code(DownloadErrc::cancelled));
    }
    notify(JobState::admitted_globally);

    job_started(key);
    Completion completion{*this, key};
    notify(JobState::running);

    try {
        Result result = std::invoke(job);
        const bool ok = result.has_value();
        completion.settle(ok);
        notify(ok ? JobState::succeeded : JobState::failed);
        return result;
    } catch (...) {
        completion.settle(false);
        notify(JobState::failed);
        throw;
    }
}

} // namespace fetchr::core
