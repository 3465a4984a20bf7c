// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/resolver.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/url.hpp>

namespace fetchr::core {

namespace {

constexpr const char* FALLBACK_FILENAME = "download";

} // namespace

//=============================================================================
// PassThroughResolver
//=============================================================================

std::expected<std::vector<ResourceDescriptor>, std::error_code>
PassThroughResolver::resolve(const std::string& url) noexcept {
    try {
        auto parsed = Url::parse(url);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }

        if (!parsed->is_http()) {
            log::get()->error("Unsupported scheme in {}", url);
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        HttpRequest request;
        request.url = url;
        request.verify_tls = verify_tls_;

        auto response = transport_.head(request);
        if (response && response->status_code == 405) {
            log::get()->warn("HEAD not allowed for {}, retrying with GET", url);
            // Headers are all we need, stop at the first body bytes
            BodyHandler stop_at_body = [](std::int32_t, const char*, std::size_t) { return false; };
            response = transport_.get(request, stop_at_body, std::stop_token{});
        }
        if (!response) {
            log::get()->error("Resolving {} failed: {}", url, response.error().message());
            return std::unexpected(response.error());
        }
        if (auto ec = status_to_error(response->status_code); ec) {
            log::get()->error("Resolving {} failed: HTTP {}", url, response->status_code);
            return std::unexpected(ec);
        }

        ResourceDescriptor descriptor;
        descriptor.url = url;
        descriptor.filename = sanitize_filename(response->filename);
        if (descriptor.filename.empty()) {
            descriptor.filename = sanitize_filename(parsed->filename());
        }
        if (descriptor.filename.empty()) {
            descriptor.filename = FALLBACK_FILENAME;
        }
        descriptor.total_size = response->content_length;

        log::get()->debug("Resolved {} -> {} ({} bytes)", url, descriptor.filename, descriptor.total_size);
        return std::vector<ResourceDescriptor>{std::move(descriptor)};
    } catch (const std::exception& e) {
        log::get()->error("Resolving {} failed: {}", url, e.what());
        return std::unexpected(make_error_code(DownloadErrc::resolve_failed));
    }
}

//=============================================================================
// ResolverRegistry
//=============================================================================

ResolverRegistry ResolverRegistry::builtin() {
    ResolverRegistry registry;
    auto passthrough = [](HttpTransport& transport, bool verify_tls) -> std::unique_ptr<Resolver> {
        return std::make_unique<PassThroughResolver>(transport, verify_tls);
    };
    for (const char* host : {"uploadbay.net", "clicknupload.net", "clicknupload.click", "pomf2.lain.la"}) {
        registry.add(host, passthrough);
    }
    return registry;
}

void ResolverRegistry::add(std::string pattern, ResolverFactory factory) {
    entries_.push_back(Entry{std::move(pattern), std::move(factory)});
}

std::unique_ptr<Resolver>
ResolverRegistry::create(std::string_view url, HttpTransport& transport, bool verify_tls) const {
    for (const auto& entry : entries_) {
        if (!entry.pattern.empty() && url.find(entry.pattern) != std::string_view::npos && entry.factory) {
            if (auto resolver = entry.factory(transport, verify_tls)) {
                return resolver;
            }
        }
    }
    return std::make_unique<PassThroughResolver>(transport, verify_tls);
}

} // namespace fetchr::core
