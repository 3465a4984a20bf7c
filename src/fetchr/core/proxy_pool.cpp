// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/proxy_pool.hpp>
#include <fetchr/core/log.hpp>
#include <fstream>
#include <random>
#include <sstream>
#include <utility>

namespace fetchr::core {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

ProxyPool::ProxyPool(std::vector<std::string> proxies)
    : proxies_(std::move(proxies)) {}

ProxyPool ProxyPool::parse(std::string_view text) {
    std::vector<std::string> proxies;
    while (!text.empty()) {
        auto eol = text.find('\n');
        auto line = trim(text.substr(0, eol));
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.find("://") == std::string_view::npos) {
            proxies.push_back("http://" + std::string(line));
        } else {
            proxies.emplace_back(line);
        }
    }
    return ProxyPool(std::move(proxies));
}

std::expected<ProxyPool, std::error_code>
ProxyPool::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream in(path);
        if (!in) {
            log::get()->error("Cannot open proxy list {}", path.string());
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        auto pool = parse(buffer.str());
        log::get()->info("Loaded {} proxies from {}", pool.size(), path.string());
        return pool;
    } catch (const std::exception& e) {
        log::get()->error("Cannot read proxy list {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::string ProxyPool::pick() const {
    if (proxies_.empty()) {
        return {};
    }
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, proxies_.size() - 1);
    return proxies_[dist(rng)];
}

} // namespace fetchr::core
