// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <fetchr/core/assembler.hpp>
#include <fetchr/core/segment.hpp>
#include <fetchr/core/segment_store.hpp>
#include "test_support.hpp"

using namespace fetchr::core;
using namespace fetchr::test;

namespace {

void write_segments(const TempDir& dir, const std::string& body, const std::vector<Segment>& segments) {
    for (const auto& s : segments) {
        write_file(segment_path(dir.path(), "out.bin", s.index), body.substr(s.start_byte, s.expected_size()));
    }
}

} // namespace

TEST_CASE("Assembler - concatenates in index order", "[assembler]") {
    TempDir dir;
    auto body = make_body(101);
    auto segments = plan(body.size(), 4);
    write_segments(dir, body, segments);

    auto mode = GENERATE(AssemblyMode::atomic, AssemblyMode::delete_as_copied);
    Assembler assembler(mode);

    auto size = assembler.assemble(dir.path(), "out.bin", segments);
    REQUIRE(size.has_value());
    CHECK(*size == 101);
    CHECK(read_file(dir / "out.bin") == body);

    CHECK_FALSE(std::filesystem::exists(assembling_path(dir / "out.bin")));
    for (const auto& s : segments) {
        CHECK_FALSE(std::filesystem::exists(segment_path(dir.path(), "out.bin", s.index)));
    }
}

TEST_CASE("Assembler - refuses incomplete artifacts", "[assembler]") {
    TempDir dir;
    auto body = make_body(30);
    auto segments = plan(body.size(), 3);
    write_segments(dir, body, segments);

    SECTION("Missing") {
        std::filesystem::remove(segment_path(dir.path(), "out.bin", 1));
    }

    SECTION("Partial") {
        write_file(segment_path(dir.path(), "out.bin", 1), "short");
    }

    SECTION("Oversized") {
        write_file(segment_path(dir.path(), "out.bin", 2), std::string(11, 'z'));
    }

    Assembler assembler;
    auto size = assembler.assemble(dir.path(), "out.bin", segments);
    REQUIRE_FALSE(size.has_value());
    CHECK(size.error() == DownloadErrc::assembly_failed);

    CHECK_FALSE(std::filesystem::exists(dir / "out.bin"));
    CHECK_FALSE(std::filesystem::exists(assembling_path(dir / "out.bin")));
    CHECK(std::filesystem::exists(segment_path(dir.path(), "out.bin", 0)));
}

TEST_CASE("Assembler - replaces a stale final file", "[assembler]") {
    TempDir dir;
    auto body = make_body(16);
    auto segments = plan(body.size(), 2);
    write_segments(dir, body, segments);
    write_file(dir / "out.bin", "stale");

    REQUIRE(Assembler{}.assemble(dir.path(), "out.bin", segments).has_value());
    CHECK(read_file(dir / "out.bin") == body);
}

TEST_CASE("Assembler - filename must stay inside the directory", "[assembler]") {
    TempDir dir;
    std::filesystem::create_directories(dir / "inner");
    auto body = make_body(8);
    auto segments = plan(body.size(), 2);
    for (const auto& s : segments) {
        write_file(segment_path(dir / "inner", "../out.bin", s.index), body.substr(s.start_byte, s.expected_size()));
    }

    auto name = GENERATE(as<std::string>{}, "../out.bin", "sub/out.bin", "/out.bin", "..", "");
    auto size = Assembler{}.assemble(dir / "inner", name, segments);
    REQUIRE_FALSE(size.has_value());
    CHECK(size.error() == DownloadErrc::invalid_filename);
    CHECK_FALSE(std::filesystem::exists(dir / "out.bin"));
    CHECK(std::filesystem::exists(dir / "out.bin.part0"));
}

TEST_CASE("Assembler - a failed rename leaves no temporary file", "[assembler]") {
    TempDir dir;
    auto body = make_body(12);
    auto segments = plan(body.size(), 2);
    write_segments(dir, body, segments);
    std::filesystem::create_directories(dir / "out.bin");
    write_file(dir / "out.bin" / "occupied", "x");

    auto size = Assembler{}.assemble(dir.path(), "out.bin", segments);
    REQUIRE_FALSE(size.has_value());
    CHECK(size.error() == DownloadErrc::assembly_failed);
    CHECK_FALSE(std::filesystem::exists(assembling_path(dir / "out.bin")));
    CHECK(std::filesystem::exists(segment_path(dir.path(), "out.bin", 1)));
}

TEST_CASE("assembling_path", "[assembler]") {
    CHECK(assembling_path("/d/a.iso") == std::filesystem::path("/d/a.iso.assembling"));
}
