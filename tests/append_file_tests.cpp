// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchr/disk/append_file.hpp>
#include <cstring>
#include "test_support.hpp"

using namespace fetchr::disk;
using fetchr::test::TempDir;
using fetchr::test::read_file;
using fetchr::test::write_file;

TEST_CASE("AppendFile - append mode grows the file", "[disk]") {
    TempDir dir;
    auto path = dir / "a.part0";
    write_file(path, "abc");

    auto file = AppendFile::open(path);
    REQUIRE(file.has_value());
    REQUIRE(file->is_open());
    CHECK_FALSE(file->write("def", 3));
    CHECK(file->bytes_written() == 3);
    CHECK_FALSE(file->sync());
    file->close();
    CHECK_FALSE(file->is_open());

    CHECK(read_file(path) == "abcdef");
}

TEST_CASE("AppendFile - truncate mode starts over", "[disk]") {
    TempDir dir;
    auto path = dir / "b";
    write_file(path, "old content");

    auto file = AppendFile::open(path, OpenMode::truncate);
    REQUIRE(file.has_value());
    CHECK_FALSE(file->write("new", 3));
    file->close();

    CHECK(read_file(path) == "new");
}

TEST_CASE("AppendFile - append_from copies another file", "[disk]") {
    TempDir dir;
    write_file(dir / "one", "hello ");
    write_file(dir / "two", "world");

    auto file = AppendFile::open(dir / "out", OpenMode::truncate);
    REQUIRE(file.has_value());

    auto first = file->append_from(dir / "one");
    auto second = file->append_from(dir / "two");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == 6);
    CHECK(*second == 5);
    file->close();

    CHECK(read_file(dir / "out") == "hello world");

    auto missing = AppendFile::open(dir / "out");
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing->append_from(dir / "nope").has_value());
}

TEST_CASE("AppendFile - errors", "[disk]") {
    TempDir dir;

    SECTION("Missing parent directory") {
        auto file = AppendFile::open(dir / "no" / "such" / "dir" / "x");
        REQUIRE_FALSE(file.has_value());
        CHECK(file.error() == DiskErrc::file_not_found);
    }

    SECTION("Write on a closed handle") {
        AppendFile file;
        CHECK(file.write("x", 1) == DiskErrc::handle_invalid);
    }
}

TEST_CASE("AppendFile - move transfers ownership", "[disk]") {
    TempDir dir;
    auto opened = AppendFile::open(dir / "m");
    REQUIRE(opened.has_value());

    AppendFile moved = std::move(*opened);
    CHECK(moved.is_open());
    CHECK_FALSE(opened->is_open());
    CHECK_FALSE(moved.write("z", 1));
}

TEST_CASE("ChunkBuffer", "[disk]") {
    ChunkBuffer buffer(4);
    CHECK(buffer.empty());
    CHECK(buffer.capacity() == 4);

    CHECK(buffer.append("ab", 2) == 2);
    CHECK(buffer.room() == 2);
    CHECK(buffer.append("cdef", 4) == 2);
    CHECK(buffer.full());
    CHECK(std::memcmp(buffer.data(), "abcd", 4) == 0);

    CHECK(buffer.append("x", 1) == 0);
    buffer.reset();
    CHECK(buffer.empty());
    CHECK(buffer.room() == 4);
}

TEST_CASE("file_size and remove_file", "[disk]") {
    TempDir dir;
    auto path = dir / "s";

    CHECK_FALSE(file_size(path).has_value());
    CHECK_FALSE(remove_file(path));  // Missing is fine

    write_file(path, "12345");
    auto size = file_size(path);
    REQUIRE(size.has_value());
    CHECK(*size == 5);

    CHECK_FALSE(remove_file(path));
    CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("rename_file", "[disk]") {
    TempDir dir;

    SECTION("Replaces the target") {
        write_file(dir / "from", "new");
        write_file(dir / "to", "old contents");
        REQUIRE_FALSE(rename_file(dir / "from", dir / "to"));
        CHECK(read_file(dir / "to") == "new");
        CHECK_FALSE(std::filesystem::exists(dir / "from"));
    }

    SECTION("Missing source") {
        CHECK(rename_file(dir / "nope", dir / "to") == DiskErrc::file_not_found);
    }

    SECTION("Target is a non-empty directory") {
        write_file(dir / "from", "x");
        std::filesystem::create_directories(dir / "to");
        write_file(dir / "to" / "inside", "y");
        CHECK(rename_file(dir / "from", dir / "to") == DiskErrc::rename_error);
        CHECK(std::filesystem::exists(dir / "from"));
    }
}
