// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <mutex>
#include <string>

namespace fetchr::log {

namespace {

constexpr const char* LOGGER_NAME = "fetchr";

// spdlog maps unknown names to "off"
bool parse_level(std::string_view name, spdlog::level::level_enum& out) {
    auto level = spdlog::level::from_str(std::string{name});
    if (level == spdlog::level::off && name != "off") {
        return false;
    }
    out = level;
    return true;
}

std::shared_ptr<spdlog::logger> create() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }

    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    logger->set_level(spdlog::level::info);

    spdlog::level::level_enum level = spdlog::level::info;
    if (const char* name = std::getenv("FETCHR_LOG_LEVEL"); name && *name && parse_level(name, level)) {
        logger->set_level(level);
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = create(); });
    return logger;
}

void set_level(std::string_view level) {
    spdlog::level::level_enum parsed = spdlog::level::info;
    if (!parse_level(level, parsed)) {
        get()->warn("Unknown log level '{}', keeping {}", level,
                    spdlog::level::to_string_view(get()->level()));
        return;
    }
    set_level(parsed);
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace fetchr::log
