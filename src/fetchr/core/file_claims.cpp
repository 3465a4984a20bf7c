// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/file_claims.hpp>

namespace fetchr::core {

std::string FileClaims::key_for(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

std::optional<FileClaims::Claim> FileClaims::acquire(const std::filesystem::path& path, std::stop_token stoken) {
    auto key = key_for(path);
    std::unique_lock lock(mutex_);
    if (!cv_.wait(lock, stoken, [&] { return !held_.contains(key); })) {
        return std::nullopt;
    }
    held_.insert(key);
    return Claim(this, std::move(key));
}

std::optional<FileClaims::Claim> FileClaims::try_acquire(const std::filesystem::path& path) {
    auto key = key_for(path);
    std::lock_guard lock(mutex_);
    if (!held_.insert(key).second) {
        return std::nullopt;
    }
    return Claim(this, std::move(key));
}

bool FileClaims::held(const std::filesystem::path& path) const {
    auto key = key_for(path);
    std::lock_guard lock(mutex_);
    return held_.contains(key);
}

void FileClaims::release(const std::string& key) noexcept {
    {
        std::lock_guard lock(mutex_);
        held_.erase(key);
    }
    cv_.notify_all();
}

void FileClaims::Claim::release() noexcept {
    if (owner_) {
        owner_->release(key_);
        owner_ = nullptr;
    }
}

} // namespace fetchr::core
