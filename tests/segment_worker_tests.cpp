// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchr/core/segment.hpp>
#include <fetchr/core/segment_store.hpp>
#include <fetchr/core/segment_worker.hpp>
#include <thread>
#include "test_support.hpp"

using namespace fetchr::core;
using namespace fetchr::test;

namespace {

const std::string URL = "https://files.example.com/data.bin";

ResourceDescriptor describe(const std::string& body) {
    return ResourceDescriptor{URL, "data.bin", body.size(), {}};
}

} // namespace

TEST_CASE("SegmentWorker - fetches a segment", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(40);
    transport.add(URL, {body});

    auto segments = plan(body.size(), 4);
    SegmentWorker worker(transport, fast_options());

    auto artifact = worker.fetch(describe(body), segments[2], dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(*artifact == segment_path(dir.path(), "data.bin", 2));
    CHECK(read_file(*artifact) == body.substr(20, 10));

    auto gets = transport.gets();
    REQUIRE(gets.size() == 1);
    REQUIRE(gets[0].range.has_value());
    CHECK(gets[0].range->to_string() == "20-29");
}

TEST_CASE("SegmentWorker - resumes a partial artifact", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    std::string body = "abcdef";
    transport.add(URL, {body});

    auto segment = plan(body.size(), 1)[0];
    write_file(segment_path(dir.path(), "data.bin", 0), "abcd");

    SegmentWorker worker(transport, fast_options());
    auto artifact = worker.fetch(describe(body), segment, dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(read_file(*artifact) == "abcdef");

    auto gets = transport.gets();
    REQUIRE(gets.size() == 1);
    CHECK(gets[0].range->to_string() == "4-5");
}

TEST_CASE("SegmentWorker - complete artifact needs no request", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    std::string body = "abcdef";
    transport.add(URL, {body});
    write_file(segment_path(dir.path(), "data.bin", 0), body);

    SegmentWorker worker(transport, fast_options());
    REQUIRE(worker.fetch(describe(body), plan(6, 1)[0], dir.path(), {}).has_value());
    CHECK(transport.get_count() == 0);
}

TEST_CASE("SegmentWorker - retries transient failures", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(30);
    transport.add(URL, {body});
    transport.fault(URL, {Fault::Kind::transport_error}, 2);

    SegmentWorker worker(transport, fast_options(3));
    auto artifact = worker.fetch(describe(body), plan(30, 1)[0], dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(read_file(*artifact) == body);
    CHECK(transport.get_count() == 3);
}

TEST_CASE("SegmentWorker - short read keeps bytes and resumes after them", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(30);
    transport.add(URL, {body});
    transport.fault(URL, {Fault::Kind::truncate, 7});

    SegmentWorker worker(transport, fast_options());
    auto artifact = worker.fetch(describe(body), plan(30, 1)[0], dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(read_file(*artifact) == body);

    auto gets = transport.gets();
    REQUIRE(gets.size() == 2);
    CHECK(gets[0].range->to_string() == "0-29");
    CHECK(gets[1].range->to_string() == "7-29");
}

TEST_CASE("SegmentWorker - server errors are retried", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(12);
    transport.add(URL, {body});
    Fault unavailable{Fault::Kind::status};
    unavailable.status = 503;
    transport.fault(URL, unavailable);

    SegmentWorker worker(transport, fast_options());
    REQUIRE(worker.fetch(describe(body), plan(12, 1)[0], dir.path(), {}).has_value());
    CHECK(transport.get_count() == 2);
}

TEST_CASE("SegmentWorker - full response to a range request", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(20);
    transport.add(URL, {body});
    transport.fault(URL, {Fault::Kind::ignore_range}, 10);

    SECTION("Is not retried") {
        SegmentWorker worker(transport, fast_options(3));
        auto artifact = worker.fetch(describe(body), plan(20, 2)[1], dir.path(), {});
        REQUIRE_FALSE(artifact.has_value());
        CHECK(artifact.error() == DownloadErrc::range_unsupported);
        CHECK(transport.get_count() == 1);

        // Nothing of the wrong bytes reaches the artifact
        auto size = std::filesystem::exists(segment_path(dir.path(), "data.bin", 1))
                  ? std::filesystem::file_size(segment_path(dir.path(), "data.bin", 1))
                  : 0;
        CHECK(size == 0);
    }

    SECTION("Is accepted for a whole-resource range when allowed") {
        auto options = fast_options();
        options.accept_full_response = true;
        SegmentWorker worker(transport, options);
        auto artifact = worker.fetch(describe(body), plan(20, 1)[0], dir.path(), {});
        REQUIRE(artifact.has_value());
        CHECK(read_file(*artifact) == body);
    }

    SECTION("Is still refused for a partial range when allowed") {
        auto options = fast_options();
        options.accept_full_response = true;
        SegmentWorker worker(transport, options);
        auto artifact = worker.fetch(describe(body), plan(20, 2)[0], dir.path(), {});
        REQUIRE_FALSE(artifact.has_value());
        CHECK(artifact.error() == DownloadErrc::range_unsupported);
    }
}

TEST_CASE("SegmentWorker - never writes past the segment end", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(20);
    transport.add(URL, {body});
    transport.fault(URL, {Fault::Kind::oversize, 5});

    SegmentWorker worker(transport, fast_options());
    auto segment = plan(20, 2)[0];
    auto artifact = worker.fetch(describe(body), segment, dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(read_file(*artifact) == body.substr(0, 10));
    CHECK(transport.get_count() == 1);
}

TEST_CASE("SegmentWorker - oversized artifact is refetched", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(20);
    transport.add(URL, {body});
    write_file(segment_path(dir.path(), "data.bin", 1), std::string(15, 'x'));

    SegmentWorker worker(transport, fast_options());
    auto artifact = worker.fetch(describe(body), plan(20, 2)[1], dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(read_file(*artifact) == body.substr(10));
    CHECK(transport.gets()[0].range->to_string() == "10-19");
}

TEST_CASE("SegmentWorker - exhausted retries keep the partial artifact", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(50);
    transport.add(URL, {body});
    transport.fault(URL, {Fault::Kind::truncate, 3}, 4);

    SegmentWorker worker(transport, fast_options(3));
    auto artifact = worker.fetch(describe(body), plan(50, 1)[0], dir.path(), {});
    REQUIRE_FALSE(artifact.has_value());
    CHECK(artifact.error() == DownloadErrc::segment_failed);
    CHECK(transport.get_count() == 4);

    auto path = segment_path(dir.path(), "data.bin", 0);
    REQUIRE(std::filesystem::exists(path));
    CHECK(read_file(path) == body.substr(0, 12));
}

TEST_CASE("SegmentWorker - cancellation", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(20);
    transport.add(URL, {body});

    SECTION("Before the first attempt") {
        std::stop_source stop;
        stop.request_stop();
        SegmentWorker worker(transport, fast_options());
        auto artifact = worker.fetch(describe(body), plan(20, 1)[0], dir.path(), stop.get_token());
        REQUIRE_FALSE(artifact.has_value());
        CHECK(artifact.error() == DownloadErrc::cancelled);
        CHECK(transport.get_count() == 0);
    }

    SECTION("During a transfer") {
        transport.fault(URL, {Fault::Kind::block});
        SegmentWorker worker(transport, fast_options());
        std::stop_source stop;

        std::expected<std::filesystem::path, std::error_code> artifact;
        std::jthread runner([&] {
            artifact = worker.fetch(describe(body), plan(20, 1)[0], dir.path(), stop.get_token());
        });
        while (transport.get_count() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        stop.request_stop();
        runner.join();

        REQUIRE_FALSE(artifact.has_value());
        CHECK(artifact.error() == DownloadErrc::cancelled);
        CHECK(transport.get_count() == 1);
    }
}

TEST_CASE("SegmentWorker - progress and headers", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(24);
    transport.add(URL, {body});

    auto options = fast_options();
    options.extra_headers = {{"Referer", "https://example.com/"}, {"User-Agent", "policy"}};
    SegmentWorker worker(transport, options);

    auto descriptor = describe(body);
    descriptor.headers = {{"User-Agent", "resolver"}, {"Cookie", "k=v"}};

    std::vector<std::uint64_t> reports;
    auto artifact = worker.fetch(descriptor, plan(24, 1)[0], dir.path(), {},
                                 [&](std::uint32_t index, std::uint64_t bytes, std::uint64_t total) {
                                     CHECK(index == 0);
                                     CHECK(total == 24);
                                     reports.push_back(bytes);
                                 });
    REQUIRE(artifact.has_value());

    REQUIRE_FALSE(reports.empty());
    CHECK(reports.back() == 24);
    CHECK(std::is_sorted(reports.begin(), reports.end()));

    auto headers = transport.gets()[0].headers;
    CHECK(headers["User-Agent"] == "policy");
    CHECK(headers["Cookie"] == "k=v");
    CHECK(headers["Referer"] == "https://example.com/");
}

TEST_CASE("SegmentWorker - alternate engine", "[worker]") {
    TempDir dir;
    FakeTransport transport;
    auto body = make_body(30);
    FakeEngine engine(body);

    auto options = fast_options();
    options.engine = &engine;
    options.verify_tls = false;
    SegmentWorker worker(transport, options);

    auto segment = plan(30, 3)[1];
    write_file(segment_path(dir.path(), "data.bin", 1), body.substr(10, 4));

    auto artifact = worker.fetch(describe(body), segment, dir.path(), {});
    REQUIRE(artifact.has_value());
    CHECK(read_file(*artifact) == body.substr(10, 10));

    CHECK(engine.calls.load() == 1);
    CHECK(engine.last.range.to_string() == "14-19");
    CHECK_FALSE(engine.last.verify_tls);
    CHECK(transport.get_count() == 0);

    auto scratch = *artifact;
    scratch += ".engine";
    CHECK_FALSE(std::filesystem::exists(scratch));

    SECTION("Engine failures are retried") {
        std::filesystem::remove(*artifact);
        engine.fail_next = 2;
        REQUIRE(worker.fetch(describe(body), segment, dir.path(), {}).has_value());
        CHECK(engine.calls.load() == 4);
    }
}

TEST_CASE("sleep_for", "[worker]") {
    CHECK(sleep_for(std::chrono::milliseconds{1}, {}));

    std::stop_source stop;
    stop.request_stop();
    auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(sleep_for(std::chrono::seconds{10}, stop.get_token()));
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{5});
}
