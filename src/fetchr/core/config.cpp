// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/config.hpp>
#include <fetchr/core/log.hpp>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace fetchr::core {

std::chrono::milliseconds RetryPolicy::delay(std::uint32_t attempt) const noexcept {
    double factor = std::pow(backoff_base, static_cast<double>(attempt));
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(factor * static_cast<double>(backoff_unit.count()))};
}

namespace {

std::optional<std::string_view> env(const char* name) noexcept {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string_view{value};
}

} // namespace

Settings Settings::from_env() {
    Settings settings;

    if (auto dir = env("FETCHR_DOWNLOAD_DIR")) {
        settings.download_dir = std::filesystem::path{std::string{*dir}};
    }
    if (auto hosts = env("FETCHR_HOSTS_CONFIG")) {
        settings.hosts_config = std::filesystem::path{std::string{*hosts}};
    }
    if (auto proxies = env("FETCHR_PROXIES_PATH")) {
        settings.proxies_file = std::filesystem::path{std::string{*proxies}};
    }
    if (auto level = env("FETCHR_LOG_LEVEL")) {
        settings.log_level = std::string{*level};
    }
    if (auto max = env("FETCHR_MAX_CONCURRENT")) {
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(max->data(), max->data() + max->size(), value);
        if (ec == std::errc{} && ptr == max->data() + max->size() && value > 0) {
            settings.max_concurrent = value;
        } else {
            log::get()->warn("Ignoring invalid FETCHR_MAX_CONCURRENT='{}'", *max);
        }
    }

    return settings;
}

} // namespace fetchr::core
