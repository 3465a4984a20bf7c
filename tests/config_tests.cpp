// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <cstdlib>

using namespace fetchr::core;

TEST_CASE("RetryPolicy", "[config]") {
    RetryPolicy retry;
    CHECK(retry.attempts() == RETRY_COUNT + 1);
    CHECK(retry.delay(0) == std::chrono::milliseconds{1000});
    CHECK(retry.delay(1) == std::chrono::milliseconds{2000});
    CHECK(retry.delay(2) == std::chrono::milliseconds{4000});

    retry.backoff_unit = std::chrono::milliseconds{1};
    retry.backoff_base = 3.0;
    CHECK(retry.delay(2) == std::chrono::milliseconds{9});

    retry.retries = 0;
    CHECK(retry.attempts() == 1);
}

TEST_CASE("Settings::from_env", "[config]") {
    ::unsetenv("FETCHR_DOWNLOAD_DIR");
    ::unsetenv("FETCHR_HOSTS_CONFIG");
    ::unsetenv("FETCHR_PROXIES_PATH");
    ::unsetenv("FETCHR_LOG_LEVEL");
    ::unsetenv("FETCHR_MAX_CONCURRENT");

    SECTION("Defaults") {
        auto settings = Settings::from_env();
        CHECK(settings.download_dir == "downloads");
        CHECK_FALSE(settings.hosts_config.has_value());
        CHECK_FALSE(settings.proxies_file.has_value());
        CHECK(settings.log_level == "info");
        CHECK(settings.max_concurrent == GLOBAL_MAX_CONCURRENT);
    }

    SECTION("Overrides") {
        ::setenv("FETCHR_DOWNLOAD_DIR", "/data/in", 1);
        ::setenv("FETCHR_HOSTS_CONFIG", "/etc/fetchr/hosts.json", 1);
        ::setenv("FETCHR_PROXIES_PATH", "/etc/fetchr/proxies.txt", 1);
        ::setenv("FETCHR_LOG_LEVEL", "debug", 1);
        ::setenv("FETCHR_MAX_CONCURRENT", "7", 1);

        auto settings = Settings::from_env();
        CHECK(settings.download_dir == "/data/in");
        REQUIRE(settings.hosts_config.has_value());
        CHECK(*settings.hosts_config == "/etc/fetchr/hosts.json");
        REQUIRE(settings.proxies_file.has_value());
        CHECK(*settings.proxies_file == "/etc/fetchr/proxies.txt");
        CHECK(settings.log_level == "debug");
        CHECK(settings.max_concurrent == 7);
    }

    SECTION("Invalid limit is ignored") {
        ::setenv("FETCHR_MAX_CONCURRENT", "lots", 1);
        CHECK(Settings::from_env().max_concurrent == GLOBAL_MAX_CONCURRENT);
        ::setenv("FETCHR_MAX_CONCURRENT", "0", 1);
        CHECK(Settings::from_env().max_concurrent == GLOBAL_MAX_CONCURRENT);
    }

    ::unsetenv("FETCHR_DOWNLOAD_DIR");
    ::unsetenv("FETCHR_HOSTS_CONFIG");
    ::unsetenv("FETCHR_PROXIES_PATH");
    ::unsetenv("FETCHR_LOG_LEVEL");
    ::unsetenv("FETCHR_MAX_CONCURRENT");
}

TEST_CASE("TransferError::message", "[error]") {
    SECTION("Plain error code") {
        TransferError error{make_error_code(DownloadErrc::invalid_config)};
        CHECK(error.message() == "Invalid configuration");
    }

    SECTION("Resumable failure reports what is on disk") {
        TransferError error;
        error.code = make_error_code(DownloadErrc::transfer_failed);
        error.failed_segments = {2};
        error.segment_count = 4;
        error.preserved_bytes = 750;
        error.total_bytes = 1000;

        auto text = error.message();
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("1/4 segments missing"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("750 of 1000 bytes preserved"));
        CHECK_THAT(text, Catch::Matchers::EndsWith("re-run to resume"));
    }

    SECTION("Range failure does not suggest a re-run") {
        TransferError error;
        error.code = make_error_code(DownloadErrc::range_unsupported);
        error.failed_segments = {0, 1};
        error.segment_count = 2;
        CHECK_THAT(error.message(), !Catch::Matchers::ContainsSubstring("re-run"));
    }

    SECTION("Assembly failure does not claim missing segments") {
        TransferError error;
        error.code = make_error_code(DownloadErrc::assembly_failed);
        error.segment_count = 2;
        error.preserved_bytes = 200;
        error.total_bytes = 200;
        CHECK(error.message() == "Segment assembly failed: 200 of 200 bytes in segment artifacts");
    }
}

TEST_CASE("DownloadErrc category", "[error]") {
    std::error_code ec = DownloadErrc::short_read;
    CHECK(std::string(ec.category().name()) == "fetchr::download");
    CHECK(ec.message() == "Response body shorter than requested range");
}
