// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <utility>

namespace fetchr::core {

// Final paths that have a job writing them. A job holds the claim from before
// its first segment artifact is touched until it is done, so two jobs never
// write the same {file}.partN artifacts at once.
class FileClaims {
public:
    // Released on destruction; must not outlive the FileClaims it came from
    class Claim {
    public:
        Claim() = default;
        ~Claim() { release(); }

        Claim(const Claim&) = delete;
        Claim& operator=(const Claim&) = delete;
        Claim(Claim&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), key_(std::move(other.key_)) {}
        Claim& operator=(Claim&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
                key_ = std::move(other.key_);
            }
            return *this;
        }

        void release() noexcept;

        [[nodiscard]] explicit operator bool() const noexcept { return owner_ != nullptr; }
        [[nodiscard]] const std::string& key() const noexcept { return key_; }

    private:
        friend class FileClaims;
        Claim(FileClaims* owner, std::string key) noexcept : owner_(owner), key_(std::move(key)) {}

        FileClaims* owner_{nullptr};
        std::string key_;
    };

    FileClaims() = default;
    FileClaims(const FileClaims&) = delete;
    FileClaims& operator=(const FileClaims&) = delete;

    // Blocks while another job holds the path; empty when stop was requested first
    [[nodiscard]] std::optional<Claim> acquire(const std::filesystem::path& path, std::stop_token stoken = {});

    [[nodiscard]] std::optional<Claim> try_acquire(const std::filesystem::path& path);

    [[nodiscard]] bool held(const std::filesystem::path& path) const;

    // Absolute, lexically normal form used as the claim key
    [[nodiscard]] static std::string key_for(const std::filesystem::path& path);

private:
    void release(const std::string& key) noexcept;

    std::set<std::string> held_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace fetchr::core
