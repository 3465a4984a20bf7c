// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/error.hpp>
#include <fetchr/core/http_session.hpp>
#include <fetchr/core/resource.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fetchr::core {

// Turns a user-facing URL into the resources it stands for
class Resolver {
public:
    virtual ~Resolver() = default;

    [[nodiscard]] virtual std::expected<std::vector<ResourceDescriptor>, std::error_code>
    resolve(const std::string& url) noexcept = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// The URL is the resource. Filename and size come from a HEAD request
// (GET when the server answers 405).
class PassThroughResolver final : public Resolver {
public:
    explicit PassThroughResolver(HttpTransport& transport, bool verify_tls = true) noexcept
        : transport_(transport), verify_tls_(verify_tls) {}

    [[nodiscard]] std::expected<std::vector<ResourceDescriptor>, std::error_code>
    resolve(const std::string& url) noexcept override;

    [[nodiscard]] std::string_view name() const noexcept override { return "passthrough"; }

private:
    HttpTransport& transport_;
    bool verify_tls_;
};

using ResolverFactory = std::function<std::unique_ptr<Resolver>(HttpTransport&, bool verify_tls)>;

// Static pattern -> resolver table; the first pattern contained in the URL wins
class ResolverRegistry {
public:
    struct Entry {
        std::string pattern;
        ResolverFactory factory;
    };

    ResolverRegistry() = default;

    // Table with the hosts known to serve files directly
    [[nodiscard]] static ResolverRegistry builtin();

    void add(std::string pattern, ResolverFactory factory);

    // Never null; falls back to PassThroughResolver
    [[nodiscard]] std::unique_ptr<Resolver>
    create(std::string_view url, HttpTransport& transport, bool verify_tls = true) const;

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

private:
    std::vector<Entry> entries_;
};

} // namespace fetchr::core
