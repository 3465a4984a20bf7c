// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/host_policy.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/url.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fetchr::core {

namespace {

HostPolicy make_policy(std::uint32_t max_concurrent, std::uint32_t max_connections,
                       bool alternate_engine, bool ignore_tls = false, bool skip_range_check = false,
                       bool use_proxy = true) {
    HostPolicy policy;
    policy.max_concurrent = max_concurrent;
    policy.max_connections = max_connections;
    policy.use_alternate_engine = alternate_engine;
    policy.ignore_tls_verification = ignore_tls;
    policy.skip_range_check = skip_range_check;
    policy.use_proxy = use_proxy;
    return policy;
}

// Fields missing from the JSON keep the values of `base`
HostPolicy parse_policy(const nlohmann::ordered_json& j, HostPolicy base) {
    if (!j.is_object()) {
        throw std::invalid_argument("host policy must be an object");
    }

    if (j.contains("max_connections")) {
        base.max_connections = j["max_connections"].get<std::uint32_t>();
    }
    if (j.contains("max_concurrent")) {
        base.max_concurrent = j["max_concurrent"].get<std::uint32_t>();
    }
    if (j.contains("use_alternate_engine")) {
        base.use_alternate_engine = j["use_alternate_engine"].get<bool>();
    }
    if (j.contains("ignore_tls_verification")) {
        base.ignore_tls_verification = j["ignore_tls_verification"].get<bool>();
    }
    if (j.contains("skip_range_check")) {
        base.skip_range_check = j["skip_range_check"].get<bool>();
    }
    if (j.contains("accept_full_response")) {
        base.accept_full_response = j["accept_full_response"].get<bool>();
    }
    if (j.contains("use_proxy")) {
        base.use_proxy = j["use_proxy"].get<bool>();
    }
    if (j.contains("extra_headers") && j["extra_headers"].is_object()) {
        for (auto& [key, value] : j["extra_headers"].items()) {
            base.extra_headers[key] = value.get<std::string>();
        }
    }

    if (base.max_connections == 0 || base.max_concurrent == 0) {
        throw std::invalid_argument("limits must be positive");
    }
    return base;
}

} // namespace

std::string match_host_key(std::string_view host, const std::vector<std::string>& keys) {
    auto lower_host = to_lower(host);
    if (lower_host.starts_with("www.")) {
        lower_host.erase(0, 4);
    }

    if (!lower_host.empty()) {
        for (const auto& key : keys) {
            if (key == DEFAULT_HOST_KEY || key.empty()) continue;
            auto lower_key = to_lower(key);
            if (lower_host.find(lower_key) != std::string::npos || lower_key.find(lower_host) != std::string::npos) {
                return key;
            }
        }
    }
    return std::string(DEFAULT_HOST_KEY);
}

//=============================================================================
// HostPolicyTable
//=============================================================================

HostPolicyTable::HostPolicyTable() {
    entries_.emplace_back(std::string(DEFAULT_HOST_KEY), HostPolicy{});
}

HostPolicyTable HostPolicyTable::defaults() {
    HostPolicyTable table;
    table.set("pixeldrain.com", make_policy(10, 3, true));
    table.set("gofile.io", make_policy(5, 1, false));
    table.set("anonfile.de", make_policy(20, 1, true));
    table.set("filedot.to", make_policy(5, 1, false, true));
    table.set("desiupload.co", make_policy(2, 5, true));
    table.set("axfc.net", make_policy(20, 10, true, false, true, false));
    table.set("filemirage.com", make_policy(5, 5, true));
    table.set("uploadhive.com", make_policy(5, 1, true, false, false, false));
    return table;
}

std::expected<HostPolicyTable, std::error_code>
HostPolicyTable::from_json(std::string_view text) noexcept {
    try {
        auto j = nlohmann::ordered_json::parse(text);  // File order decides matching
        if (!j.is_object()) {
            log::get()->error("Host configuration must be a JSON object");
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        HostPolicyTable table;
        const std::string default_key(DEFAULT_HOST_KEY);
        if (j.contains(default_key)) {
            table.set(default_key, parse_policy(j[default_key], HostPolicy{}));
        }
        for (auto& [key, value] : j.items()) {
            if (key == DEFAULT_HOST_KEY) continue;
            table.set(to_lower(key), parse_policy(value, table.fallback()));
        }
        return table;
    } catch (const std::exception& e) {
        log::get()->error("Invalid host configuration: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::expected<HostPolicyTable, std::error_code>
HostPolicyTable::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream in(path);
        if (!in) {
            log::get()->error("Cannot open host configuration {}", path.string());
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return from_json(buffer.str());
    } catch (const std::exception& e) {
        log::get()->error("Cannot read host configuration {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::string HostPolicyTable::to_json() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& [key, policy] : entries_) {
        nlohmann::ordered_json p;
        p["max_connections"] = policy.max_connections;
        p["max_concurrent"] = policy.max_concurrent;
        p["use_alternate_engine"] = policy.use_alternate_engine;
        p["ignore_tls_verification"] = policy.ignore_tls_verification;
        p["skip_range_check"] = policy.skip_range_check;
        p["accept_full_response"] = policy.accept_full_response;
        p["use_proxy"] = policy.use_proxy;
        p["extra_headers"] = policy.extra_headers;
        j[key] = std::move(p);
    }
    return j.dump(2);
}

void HostPolicyTable::set(std::string host, HostPolicy policy) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&host](const auto& entry) { return entry.first == host; });
    if (it != entries_.end()) {
        it->second = std::move(policy);
    } else {
        entries_.emplace_back(std::move(host), std::move(policy));
    }
}

const HostPolicy& HostPolicyTable::lookup(std::string_view host) const {
    auto key = match_host_key(host, keys());
    for (const auto& [name, policy] : entries_) {
        if (name == key) return policy;
    }
    return fallback();
}

std::vector<std::string> HostPolicyTable::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace fetchr::core
