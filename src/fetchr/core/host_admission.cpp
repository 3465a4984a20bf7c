// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/host_admission.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/url.hpp>
#include <algorithm>

namespace fetchr::core {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::queued:            return "queued";
        case JobState::admitted_to_host:  return "admitted_to_host";
        case JobState::admitted_globally: return "admitted_globally";
        case JobState::running:           return "running";
        case JobState::succeeded:         return "succeeded";
        case JobState::failed:            return "failed";
        default:                          return "unknown";
    }
}

//=============================================================================
// HostAdmissionController
//=============================================================================

HostAdmissionController::HostAdmissionController(
    const std::vector<std::pair<std::string, std::uint32_t>>& host_limits,
    std::uint32_t global_limit)
    : global_(std::make_shared<Limiter>(global_limit)) {
    for (const auto& [host, limit] : host_limits) {
        auto key = to_lower(host);
        if (!limiters_.contains(key)) {
            keys_.push_back(key);
        }
        limiters_[key] = std::make_shared<Limiter>(limit);
        log::get()->debug("Host limiter {} -> {}", key, limit);
    }

    std::string default_key(DEFAULT_HOST_KEY);
    if (!limiters_.contains(default_key)) {
        keys_.push_back(default_key);
        limiters_[default_key] = std::make_shared<Limiter>(1);
    }
}

HostAdmissionController::HostAdmissionController(const HostPolicyTable& policies, std::uint32_t global_limit)
    : HostAdmissionController(
          [&policies] {
              std::vector<std::pair<std::string, std::uint32_t>> limits;
              for (const auto& [host, policy] : policies.entries()) {
                  limits.emplace_back(host, policy.max_concurrent);
              }
              return limits;
          }(),
          global_limit) {}

std::string HostAdmissionController::host_for(std::string_view url) {
    return host_key(url);
}

std::string HostAdmissionController::limiter_key(std::string_view host) const {
    std::lock_guard lock(mutex_);
    return match_host_key(host, keys_);
}

std::shared_ptr<Limiter> HostAdmissionController::limiter_for(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = limiters_.find(key);
    if (it == limiters_.end()) {
        it = limiters_.find(std::string(DEFAULT_HOST_KEY));
    }
    return it->second;
}

void HostAdmissionController::update_host_limit(const std::string& host, std::uint32_t limit) {
    auto key = to_lower(host);
    std::lock_guard lock(mutex_);
    if (!limiters_.contains(key)) {
        keys_.push_back(key);
    }
    limiters_[key] = std::make_shared<Limiter>(limit);
    log::get()->info("Host limit for {} set to {}", key, limit);
}

void HostAdmissionController::job_started(const std::string& key) {
    std::lock_guard lock(mutex_);
    ++active_[key];
    ++submitted_;
}

void HostAdmissionController::job_finished(const std::string& key, bool succeeded) noexcept {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(key); it != active_.end()) {
        if (it->second > 0) --it->second;
        if (it->second == 0) active_.erase(it);
    }
    if (succeeded) {
        ++succeeded_;
    } else {
        ++failed_;
    }
}

AdmissionStats HostAdmissionController::stats() const {
    std::lock_guard lock(mutex_);
    AdmissionStats result;
    result.submitted = submitted_;
    result.succeeded = succeeded_;
    result.failed = failed_;
    result.success_rate = static_cast<double>(succeeded_) / static_cast<double>(std::max<std::uint64_t>(submitted_, 1)) * 100.0;
    result.active = active_;
    for (const auto& [key, limiter] : limiters_) {
        result.host_limits[key] = limiter->capacity();
    }
    result.global_limit = global_->capacity();
    result.global_in_use = global_->in_use();
    return result;
}

} // namespace fetchr::core
