// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/download_engine.hpp>
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace volley::core;
using namespace volley::test;
using namespace std::chrono_literals;

namespace {

constexpr const char* URL = "http://fake/file.bin";

DownloadConfig fast_config(std::uint32_t concurrency = 4) {
    DownloadConfig cfg;
    cfg.concurrency = concurrency;
    cfg.max_retries = 3;
    cfg.base_delay = 1ms;
    cfg.max_delay = 4ms;
    return cfg;
}

} // namespace

TEST_CASE("DownloadEngine downloads in parallel chunks", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);
    FakeTransport transport(body);
    auto cfg = fast_config(4);

    SECTION("Single file sink") {
        cfg.sink_mode = SinkMode::single_file;
    }
    SECTION("Part file sink") {
        cfg.sink_mode = SinkMode::part_files;
    }

    DownloadEngine engine(transport, cfg);
    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(result.has_value());
    CHECK(engine.state() == DownloadState::succeeded);
    CHECK(result->bytes == 1000);
    CHECK(result->chunks == 4);
    CHECK(result->total_attempts == 4);
    CHECK(result->output_path == (dir / "out.bin").string());

    CHECK(read_file(dir / "out.bin") == body);
    CHECK(dir.entries() == std::vector<std::string>{"out.bin"});

    auto log = transport.request_log();
    REQUIRE(log.size() == 4);
    std::vector<std::pair<std::uint64_t, std::uint64_t>> ranges;
    for (const auto& r : log) {
        REQUIRE(r.has_value());
        ranges.emplace_back(r->first, r->last);
    }
    std::ranges::sort(ranges);
    CHECK(ranges == std::vector<std::pair<std::uint64_t, std::uint64_t>>{{0, 249}, {250, 499}, {500, 749}, {750, 999}});

    for (const auto& chunk : engine.chunk_states()) {
        CHECK(chunk.status == ChunkStatus::complete);
        CHECK(chunk.bytes_written == 250);
    }
}

TEST_CASE("DownloadEngine recovers from transient chunk failures", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);
    FakeTransport transport(body);
    transport.inject(500, FakeTransport::Fault::error, 2, DownloadErrc::connection_lost);

    DownloadEngine engine(transport, fast_config(4));
    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(result.has_value());
    CHECK(result->total_attempts == 6);
    CHECK(transport.requests(500) == 3);
    CHECK(read_file(dir / "out.bin") == body);

    auto chunks = engine.chunk_states();
    CHECK(chunks[2].attempt_count == 3);
    CHECK(chunks[0].attempt_count == 1);
}

TEST_CASE("DownloadEngine fails the job when a chunk exhausts its retries", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);
    FakeTransport transport(body);
    transport.inject(0, FakeTransport::Fault::error, FakeTransport::ALWAYS, DownloadErrc::timeout);
    // Siblings stay in flight until the failure cancels them
    transport.inject(250, FakeTransport::Fault::hold, FakeTransport::ALWAYS);
    transport.inject(500, FakeTransport::Fault::hold, FakeTransport::ALWAYS);
    transport.inject(750, FakeTransport::Fault::hold, FakeTransport::ALWAYS);

    DownloadEngine engine(transport, fast_config(4));
    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(!result.has_value());
    const auto& error = result.error();
    CHECK(engine.state() == DownloadState::failed);
    CHECK(error.kind == ErrorClass::network);
    CHECK(error.phase == Phase::download);
    CHECK(error.code == DownloadErrc::timeout);
    REQUIRE(error.chunk.has_value());
    CHECK(error.chunk->index == 0);
    CHECK(error.attempts == 3);
    CHECK_THAT(error.message(), Catch::Matchers::StartsWith("network error in chunk 0 [0-249] after 3 attempts"));

    SECTION("No output and no temp artifacts") {
        CHECK(dir.entries().empty());
    }

    SECTION("Siblings end failed with cancellation, not retried") {
        auto chunks = engine.chunk_states();
        REQUIRE(chunks.size() == 4);
        for (std::size_t i = 1; i < chunks.size(); ++i) {
            CHECK(chunks[i].status == ChunkStatus::failed);
            CHECK(chunks[i].error == DownloadErrc::cancelled);
            CHECK(chunks[i].attempt_count <= 1);
        }
    }
}

TEST_CASE("DownloadEngine queues chunks beyond the worker count", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);
    FakeTransport transport(body);
    auto cfg = fast_config(3);
    cfg.chunk_size = 100;

    DownloadEngine engine(transport, cfg);
    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(result.has_value());
    CHECK(result->chunks == 10);
    CHECK(transport.total_requests() == 10);
    CHECK(read_file(dir / "out.bin") == body);
}

TEST_CASE("DownloadEngine without range support", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);

    FakeTransport ranged(body);
    DownloadEngine multi(ranged, fast_config(4));
    REQUIRE(multi.run(URL, dir / "multi.bin").has_value());

    FakeTransport plain(body);
    plain.ranges = false;
    DownloadEngine single(plain, fast_config(4));
    auto result = single.run(URL, dir / "single.bin");

    REQUIRE(result.has_value());
    CHECK(result->chunks == 1);
    CHECK(plain.total_requests() == 1);
    CHECK(!plain.request_log()[0].has_value());
    CHECK(read_file(dir / "single.bin") == read_file(dir / "multi.bin"));
}

TEST_CASE("DownloadEngine with unknown size", "[engine]") {
    TempDir dir;
    auto body = make_body(5000);
    FakeTransport transport(body);
    transport.report_size = false;

    DownloadEngine engine(transport, fast_config(8));
    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(result.has_value());
    CHECK(!result->resource.known_size());
    CHECK(result->chunks == 1);
    CHECK(result->bytes == 5000);
    CHECK(read_file(dir / "out.bin") == body);
}

TEST_CASE("DownloadEngine with an empty resource", "[engine]") {
    TempDir dir;
    FakeTransport transport(std::vector<std::byte>{});

    DownloadEngine engine(transport, fast_config(4));
    auto result = engine.run(URL, dir / "empty.bin");

    REQUIRE(result.has_value());
    CHECK(result->bytes == 0);
    CHECK(transport.total_requests() == 0);
    REQUIRE(std::filesystem::exists(dir / "empty.bin"));
    CHECK(std::filesystem::file_size(dir / "empty.bin") == 0);
}

TEST_CASE("DownloadEngine probe and setup failures", "[engine]") {
    TempDir dir;
    FakeTransport transport(make_body(1000));

    SECTION("Probe failure starts no chunk work") {
        transport.probe_error = DownloadErrc::not_found;
        DownloadEngine engine(transport, fast_config());
        auto result = engine.run(URL, dir / "out.bin");

        REQUIRE(!result.has_value());
        CHECK(engine.state() == DownloadState::failed);
        CHECK(result.error().phase == Phase::probe);
        CHECK(result.error().kind == ErrorClass::network);
        CHECK(!result.error().chunk.has_value());
        CHECK(transport.total_requests() == 0);
        CHECK(engine.chunk_states().empty());
        CHECK(dir.entries().empty());
    }

    SECTION("Invalid config is a usage error") {
        auto cfg = fast_config();
        cfg.concurrency = 0;
        DownloadEngine engine(transport, cfg);
        auto result = engine.run(URL, dir / "out.bin");

        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorClass::usage);
        CHECK(transport.probes() == 0);
    }

    SECTION("Invalid URL") {
        DownloadEngine engine(transport, fast_config());
        auto result = engine.run("not a url", dir / "out.bin");

        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::invalid_url);
        CHECK(transport.probes() == 0);
    }
}

TEST_CASE("DownloadEngine external cancellation", "[engine]") {
    TempDir dir;
    FakeTransport transport(make_body(1000));
    for (std::uint64_t start : {0, 250, 500, 750}) {
        transport.inject(start, FakeTransport::Fault::hold, FakeTransport::ALWAYS);
    }

    DownloadEngine engine(transport, fast_config(4));
    std::jthread canceller([&] {
        while (transport.total_requests() < 4) {
            std::this_thread::sleep_for(1ms);
        }
        engine.cancel();
        engine.cancel();  // Idempotent
    });

    auto result = engine.run(URL, dir / "out.bin");
    canceller.join();

    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ErrorClass::cancelled);
    CHECK(engine.state() == DownloadState::cancelled);
    CHECK(dir.entries().empty());
    for (const auto& chunk : engine.chunk_states()) {
        CHECK(chunk.status == ChunkStatus::failed);
        CHECK(chunk.error == DownloadErrc::cancelled);
    }
}

TEST_CASE("DownloadEngine cancel timing", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);
    FakeTransport transport(body);
    DownloadEngine engine(transport, fast_config(4));

    SECTION("Cancel before run stops it before any request") {
        engine.cancel();
        auto result = engine.run(URL, dir / "out.bin");

        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorClass::cancelled);
        CHECK(engine.state() == DownloadState::cancelled);
        CHECK(transport.probes() == 0);
        CHECK(transport.total_requests() == 0);
        CHECK(dir.entries().empty());
    }

    SECTION("Cancel after every chunk completed keeps the file") {
        std::atomic<bool> cancelled_late{false};
        engine.callback([&](const DownloadProgress& p) {
            if (p.total_chunks > 0 && p.completed_chunks == p.total_chunks && !cancelled_late) {
                cancelled_late = true;
                engine.cancel();
            }
        });

        auto result = engine.run(URL, dir / "out.bin");

        CHECK(cancelled_late);
        REQUIRE(result.has_value());
        CHECK(engine.state() == DownloadState::succeeded);
        CHECK(read_file(dir / "out.bin") == body);
        CHECK(dir.entries() == std::vector<std::string>{"out.bin"});
    }
}

TEST_CASE("DownloadEngine falls back when the server ignores ranges", "[engine]") {
    TempDir dir;
    auto body = make_body(1000);
    FakeTransport transport(body);
    transport.ignore_ranges = true;  // Range support is still advertised
    auto cfg = fast_config(4);

    SECTION("Single file sink") {
        cfg.sink_mode = SinkMode::single_file;
    }
    SECTION("Part file sink") {
        cfg.sink_mode = SinkMode::part_files;
    }

    DownloadEngine engine(transport, cfg);
    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(result.has_value());
    CHECK(result->chunks == 1);
    CHECK(!result->resource.supports_ranges);
    CHECK(result->total_attempts == 1);
    CHECK(read_file(dir / "out.bin") == body);
    CHECK(dir.entries() == std::vector<std::string>{"out.bin"});

    // Ranged attempts were not retried; the last request is the plain GET
    auto log = transport.request_log();
    REQUIRE(log.size() >= 2);
    CHECK(log.size() <= 5);
    CHECK(!log.back().has_value());
    CHECK(std::all_of(log.begin(), log.end() - 1, [](const auto& r) { return r.has_value(); }));
}

TEST_CASE("DownloadEngine survives a throwing progress callback", "[engine]") {
    TempDir dir;
    auto body = make_body(50'000);
    FakeTransport transport(body);

    int calls = 0;
    DownloadEngine engine(transport, fast_config(4));
    engine.callback([&](const DownloadProgress&) {
        ++calls;
        throw std::runtime_error("display went away");
    });

    auto result = engine.run(URL, dir / "out.bin");

    REQUIRE(result.has_value());
    CHECK(calls > 0);
    CHECK(engine.state() == DownloadState::succeeded);
    CHECK(read_file(dir / "out.bin") == body);
}

TEST_CASE("DownloadEngine reports progress", "[engine]") {
    TempDir dir;
    auto body = make_body(100'000);
    FakeTransport transport(body);

    std::mutex mutex;
    std::vector<DownloadProgress> samples;
    DownloadEngine engine(transport, fast_config(4));
    engine.callback([&](const DownloadProgress& p) {
        std::lock_guard lock(mutex);
        samples.push_back(p);
    });

    REQUIRE(engine.run(URL, dir / "out.bin").has_value());

    REQUIRE(!samples.empty());
    const auto& last = samples.back();
    CHECK(last.state == DownloadState::succeeded);
    CHECK(last.downloaded_bytes == 100'000);
    CHECK(last.total_bytes == std::optional<std::uint64_t>{100'000});
    CHECK(last.percent == Catch::Approx(100.0));
    CHECK(last.completed_chunks == 4);
    CHECK(last.total_chunks == 4);

    auto final_progress = engine.progress();
    CHECK(final_progress.downloaded_bytes == 100'000);
}

TEST_CASE("JobError::message", "[engine]") {
    SECTION("Chunk failure names the range and attempts") {
        JobError error = JobError::make(DownloadErrc::timeout, Phase::download);
        error.chunk = ChunkPlanEntry{3, 750, 999, 250};
        error.attempts = 5;

        auto expected = "network error in chunk 3 [750-999] after 5 attempts: "
                      + make_error_code(DownloadErrc::timeout).message();
        CHECK(error.message() == expected);
    }

    SECTION("Probe failure names the phase") {
        auto error = JobError::make(DownloadErrc::not_found, Phase::probe, "http://x/y");
        CHECK(error.message() == "network error during probe: "
                                 + make_error_code(DownloadErrc::not_found).message() + " (http://x/y)");
    }

    SECTION("Integrity errors are labelled distinctly") {
        auto error = JobError::make(DownloadErrc::integrity_error, Phase::reassemble);
        CHECK(error.kind == ErrorClass::integrity);
        CHECK_THAT(error.message(), Catch::Matchers::StartsWith("integrity error during reassembly"));
    }
}
