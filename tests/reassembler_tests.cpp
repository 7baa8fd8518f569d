// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/disk/reassembler.hpp>
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"
#include <algorithm>

using namespace volley::core;
using namespace volley::disk;
using namespace volley::test;

namespace fs = std::filesystem;

namespace {

// Write each chunk's slice of body into its part file
void write_parts(const OutputPaths& paths, const ChunkPlan& chunks, const std::vector<std::byte>& body) {
    for (const auto& entry : chunks) {
        std::vector<std::byte> part(body.begin() + static_cast<std::ptrdiff_t>(entry.start_offset),
                                    body.begin() + static_cast<std::ptrdiff_t>(entry.start_offset + entry.byte_count));
        write_file(paths.chunk_path(entry.index), part);
    }
}

} // namespace

TEST_CASE("OutputPaths", "[reassembler]") {
    auto paths = OutputPaths::for_output("/data/file.iso");
    CHECK(paths.output == "/data/file.iso");
    CHECK(paths.temp_file == "/data/file.iso.volley.part");
    CHECK(paths.parts_dir == "/data/file.iso.volley.parts");
    CHECK(paths.chunk_path(7) == "/data/file.iso.volley.parts/chunk_7");
}

TEST_CASE("Reassembler single file", "[reassembler]") {
    TempDir dir;
    auto paths = OutputPaths::for_output(dir / "out.bin");
    auto body = make_body(1000);
    Reassembler reassembler(paths, SinkMode::single_file);
    REQUIRE(reassembler.prepare() == std::error_code{});
    CHECK(!fs::exists(paths.parts_dir));

    SECTION("Matching size is renamed into place") {
        write_file(paths.temp_file, body);
        REQUIRE(reassembler.assemble(plan(1000, 4), 1000) == std::error_code{});
        CHECK(read_file(paths.output) == body);
        CHECK(!fs::exists(paths.temp_file));
    }

    SECTION("Size mismatch is an integrity error and leaves no output") {
        write_file(paths.temp_file, make_body(999));
        CHECK(reassembler.assemble(plan(1000, 4), 1000) == DownloadErrc::integrity_error);
        CHECK(!fs::exists(paths.output));

        reassembler.discard();
        CHECK(dir.entries().empty());
    }

    SECTION("Missing temp file") {
        CHECK(reassembler.assemble(plan(1000, 4), 1000) == DiskErrc::file_not_found);
        CHECK(!fs::exists(paths.output));
    }
}

TEST_CASE("Reassembler part files", "[reassembler]") {
    TempDir dir;
    auto paths = OutputPaths::for_output(dir / "out.bin");
    auto body = make_body(1001);
    auto chunks = plan(1001, 4);
    Reassembler reassembler(paths, SinkMode::part_files);
    REQUIRE(reassembler.prepare() == std::error_code{});
    REQUIRE(fs::is_directory(paths.parts_dir));

    SECTION("Parts are joined in index order whatever the plan order") {
        write_parts(paths, chunks, body);
        std::ranges::reverse(chunks);

        REQUIRE(reassembler.assemble(chunks, 1001) == std::error_code{});
        CHECK(read_file(paths.output) == body);
        CHECK(dir.entries() == std::vector<std::string>{"out.bin"});
    }

    SECTION("A short part is an integrity error") {
        write_parts(paths, chunks, body);
        write_file(paths.chunk_path(2), make_body(10));

        CHECK(reassembler.assemble(chunks, 1001) == DownloadErrc::integrity_error);
        CHECK(!fs::exists(paths.output));
    }

    SECTION("A missing part fails") {
        write_parts(paths, chunks, body);
        fs::remove(paths.chunk_path(1));

        CHECK(reassembler.assemble(chunks, 1001) == DiskErrc::file_not_found);
        reassembler.discard();
        CHECK(dir.entries().empty());
    }

    SECTION("Empty resource needs no part") {
        REQUIRE(reassembler.assemble(plan(0, 4), 0) == std::error_code{});
        REQUIRE(fs::exists(paths.output));
        CHECK(fs::file_size(paths.output) == 0);
    }

    SECTION("Unbounded chunk takes whatever arrived") {
        write_file(paths.chunk_path(0), body);
        REQUIRE(reassembler.assemble(plan_unbounded(), 1001) == std::error_code{});
        CHECK(read_file(paths.output) == body);
    }
}

TEST_CASE("Reassembler replaces an existing output only on success", "[reassembler]") {
    TempDir dir;
    auto paths = OutputPaths::for_output(dir / "out.bin");
    auto old = make_body(5);
    write_file(paths.output, old);

    Reassembler reassembler(paths, SinkMode::single_file);

    SECTION("Failure keeps the old file") {
        write_file(paths.temp_file, make_body(3));
        CHECK(reassembler.assemble(plan(4, 1), 4) == DownloadErrc::integrity_error);
        reassembler.discard();
        CHECK(read_file(paths.output) == old);
    }

    SECTION("Success overwrites it") {
        auto fresh = make_body(4);
        write_file(paths.temp_file, fresh);
        REQUIRE(reassembler.assemble(plan(4, 1), 4) == std::error_code{});
        CHECK(read_file(paths.output) == fresh);
    }
}
