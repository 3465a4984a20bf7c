// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace fetchr::core {

// Counting semaphore whose waits can be cancelled
class Limiter {
public:
    explicit Limiter(std::uint32_t capacity) noexcept;

    Limiter(const Limiter&) = delete;
    Limiter& operator=(const Limiter&) = delete;

    // Blocks until a slot is free; false when stop was requested first
    [[nodiscard]] bool acquire(std::stop_token stoken = {});
    [[nodiscard]] bool try_acquire() noexcept;
    void release() noexcept;

    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::uint32_t in_use() const noexcept;

private:
    const std::uint32_t capacity_;
    std::uint32_t in_use_{0};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

// Holds one slot of a limiter and gives it back on destruction. Owning the
// limiter keeps the slot valid even after the limiter was replaced elsewhere.
class Permit {
public:
    Permit() = default;
    ~Permit() { release(); }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    Permit(Permit&& other) noexcept : limiter_(std::move(other.limiter_)) {}
    Permit& operator=(Permit&& other) noexcept {
        if (this != &other) {
            release();
            limiter_ = std::move(other.limiter_);
        }
        return *this;
    }

    // Empty optional when cancelled
    [[nodiscard]] static std::optional<Permit> acquire(std::shared_ptr<Limiter> limiter, std::stop_token stoken = {});

    void release() noexcept;

    [[nodiscard]] explicit operator bool() const noexcept { return limiter_ != nullptr; }
    [[nodiscard]] const std::shared_ptr<Limiter>& limiter() const noexcept { return limiter_; }

private:
    explicit Permit(std::shared_ptr<Limiter> limiter) noexcept : limiter_(std::move(limiter)) {}

    std::shared_ptr<Limiter> limiter_;
};

} // namespace fetchr::core
