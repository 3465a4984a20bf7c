// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/http_session.hpp>
#include <fetchr/core/resource.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fetchr::core {

struct EngineRequest {
    std::string url;
    Headers headers;
    ByteRange range;
    bool verify_tls{true};
    std::string proxy;  // Empty = direct
};

// Downloads a byte range into a fresh output file through some other program.
// The caller owns the output file and decides what happens to its bytes.
class ExternalEngine {
public:
    virtual ~ExternalEngine() = default;

    [[nodiscard]] virtual std::error_code
    fetch(const EngineRequest& request, const std::filesystem::path& output, std::stop_token stoken) noexcept = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// Runs the aria2c executable
class Aria2cEngine final : public ExternalEngine {
public:
    explicit Aria2cEngine(std::string program = "aria2c", std::uint32_t connections = 1);

    [[nodiscard]] std::error_code
    fetch(const EngineRequest& request, const std::filesystem::path& output, std::stop_token stoken) noexcept override;

    [[nodiscard]] std::string_view name() const noexcept override { return "aria2c"; }

    // argv for one request, program first
    [[nodiscard]] std::vector<std::string>
    build_command(const EngineRequest& request, const std::filesystem::path& output) const;

private:
    std::string program_;
    std::uint32_t connections_;
    std::chrono::milliseconds poll_interval_{100};
};

} // namespace fetchr::core
