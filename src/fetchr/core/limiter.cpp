// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/limiter.hpp>
#include <algorithm>

namespace fetchr::core {

//=============================================================================
// Limiter
//=============================================================================

Limiter::Limiter(std::uint32_t capacity) noexcept
    : capacity_(std::max<std::uint32_t>(capacity, 1)) {}

bool Limiter::acquire(std::stop_token stoken) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait(lock, stoken, [this] { return in_use_ < capacity_; })) {
        return false;
    }
    ++in_use_;
    return true;
}

bool Limiter::try_acquire() noexcept {
    std::lock_guard lock(mutex_);
    if (in_use_ >= capacity_) {
        return false;
    }
    ++in_use_;
    return true;
}

void Limiter::release() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

std::uint32_t Limiter::in_use() const noexcept {
    std::lock_guard lock(mutex_);
    return in_use_;
}

//=============================================================================
// Permit
//=============================================================================

std::optional<Permit> Permit::acquire(std::shared_ptr<Limiter> limiter, std::stop_token stoken) {
    if (!limiter || !limiter->acquire(std::move(stoken))) {
        return std::nullopt;
    }
    return Permit(std::move(limiter));
}

void Permit::release() noexcept {
    if (limiter_) {
        limiter_->release();
        limiter_.reset();
    }
}

} // namespace fetchr::core
