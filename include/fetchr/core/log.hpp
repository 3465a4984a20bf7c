// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace fetchr::log {

// Process-wide "fetchr" logger writing to stderr
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off")
void set_level(std::string_view level);
void set_level(spdlog::level::level_enum level);

} // namespace fetchr::log
