// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchr/core/segment.hpp>
#include <fetchr/core/segment_store.hpp>
#include "test_support.hpp"

using namespace fetchr::core;
using fetchr::test::TempDir;
using fetchr::test::write_file;

TEST_CASE("segment_path naming", "[segment_store]") {
    CHECK(segment_path("/tmp/x", "movie.mkv", 0) == std::filesystem::path("/tmp/x/movie.mkv.part0"));
    CHECK(segment_path("/tmp/x", "movie.mkv", 12).filename() == "movie.mkv.part12");
}

TEST_CASE("SegmentStore::classify", "[segment_store]") {
    TempDir dir;
    SegmentStore store(dir.path(), "f.bin");
    auto segments = plan(10, 3);  // 3, 3, 4 bytes

    SECTION("Complete, partial and missing") {
        write_file(store.path(0), "abc");
        write_file(store.path(1), "d");

        auto classes = store.classify(segments);
        CHECK(classes.complete == std::vector<std::uint32_t>{0});
        CHECK(classes.partial == std::vector<std::uint32_t>{1});
        CHECK(classes.missing == std::vector<std::uint32_t>{2});
        CHECK(classes.corrupted.empty());
        CHECK(store.downloaded_bytes(segments) == 4);
    }

    SECTION("Oversized artifact is corrupted") {
        write_file(store.path(2), "0123456789");

        auto st = store.status(segments[2]);
        CHECK(st.state == SegmentState::corrupted);
        CHECK(st.bytes == 10);
        CHECK(store.classify(segments).corrupted == std::vector<std::uint32_t>{2});

        // Counts only up to the expected size
        CHECK(store.downloaded_bytes(segments) == 4);
    }

    SECTION("Classification never touches the disk") {
        write_file(store.path(0), "abcdef");
        (void)store.classify(segments);
        CHECK(std::filesystem::file_size(store.path(0)) == 6);
    }
}

TEST_CASE("SegmentStore::cleanup_corrupted", "[segment_store]") {
    TempDir dir;
    SegmentStore store(dir.path(), "f.bin");
    auto segments = plan(10, 3);

    write_file(store.path(0), "abcd");  // corrupted
    write_file(store.path(1), "d");     // partial
    write_file(store.path(2), "ghij");  // complete

    CHECK(store.cleanup_corrupted(segments) == 1);
    CHECK_FALSE(std::filesystem::exists(store.path(0)));
    CHECK(std::filesystem::file_size(store.path(1)) == 1);
    CHECK(std::filesystem::file_size(store.path(2)) == 4);

    auto classes = store.classify(segments);
    CHECK(classes.missing == std::vector<std::uint32_t>{0});
    CHECK(classes.partial == std::vector<std::uint32_t>{1});
    CHECK(classes.complete == std::vector<std::uint32_t>{2});

    CHECK(store.cleanup_corrupted(segments) == 0);
}
