// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/cli/commands.hpp>
#include <volley/cli/progress_bar.hpp>
#include <volley/core/settings.hpp>
#include "support/temp_dir.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace volley::cli;
using namespace volley::core;
using namespace std::chrono_literals;

namespace {

// argv-style array over owned strings
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "volley");
        for (auto& s : storage_) pointers_.push_back(s.data());
    }

    [[nodiscard]] int argc() const { return static_cast<int>(pointers_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliArgs parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return parse_args(argv.argc(), argv.argv());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("URL and options") {
        auto args = parse({"-n", "16", "-o", "out.iso", "--retries", "3", "--base-delay", "0.25",
                           "--part-files", "https://example.com/file.iso"});
        CHECK(args.error.empty());
        CHECK(args.url == "https://example.com/file.iso");
        CHECK(args.output_file == "out.iso");
        CHECK(args.concurrency == std::optional<std::uint32_t>{16});
        CHECK(args.retries == std::optional<std::uint32_t>{3});
        CHECK(args.base_delay == std::optional<double>{0.25});
        CHECK(args.part_files);
        CHECK(!args.info);
    }

    SECTION("Flags") {
        auto args = parse({"-i", "-V", "--log-level", "trace", "http://x/y"});
        CHECK(args.info);
        CHECK(args.verbose);
        CHECK(args.log_level == "trace");
    }

    SECTION("Help stops parsing") {
        CHECK(parse({"--bogus", "-h"}).help);
        CHECK(parse({"--version"}).version);
    }

    SECTION("Errors") {
        CHECK(parse({"-n"}).error == "Option -n needs a value");
        CHECK(parse({"-n", "many", "http://x/y"}).error == "Invalid value for -n: many");
        CHECK(parse({"-n", "-3", "http://x/y"}).error == "Invalid value for -n: -3");
        CHECK(parse({"--fast", "http://x/y"}).error == "Unknown option: --fast");
        CHECK(parse({"http://x/y", "http://x/z"}).error == "Unexpected argument: http://x/z");
    }

    SECTION("No arguments") {
        auto args = parse({});
        CHECK(args.url.empty());
        CHECK(args.error.empty());
    }
}

TEST_CASE("build_config", "[cli]") {
    SECTION("Defaults") {
        auto cfg = build_config(parse({"http://x/y"}));
        REQUIRE(cfg.has_value());
        CHECK(cfg->concurrency == DEFAULT_CONCURRENCY);
        CHECK(cfg->sink_mode == SinkMode::single_file);
    }

    SECTION("Command line overrides") {
        auto cfg = build_config(parse({"-n", "2", "--timeout", "7", "--max-delay", "1.5", "-c", "4096", "http://x/y"}));
        REQUIRE(cfg.has_value());
        CHECK(cfg->concurrency == 2);
        CHECK(cfg->timeout == 7s);
        CHECK(cfg->max_delay == 1500ms);
        CHECK(cfg->chunk_size == 4096);
    }

    SECTION("Command line wins over the config file") {
        volley::test::TempDir dir;
        DownloadConfig file_cfg;
        file_cfg.concurrency = 5;
        file_cfg.max_retries = 9;
        REQUIRE(save_config(dir / "volley.json", file_cfg) == std::error_code{});

        auto cfg = build_config(parse({"--config", (dir / "volley.json").string(), "-n", "3", "http://x/y"}));
        REQUIRE(cfg.has_value());
        CHECK(cfg->concurrency == 3);
        CHECK(cfg->max_retries == 9);
    }

    SECTION("Invalid values are rejected") {
        auto cfg = build_config(parse({"-n", "0", "http://x/y"}));
        REQUIRE(!cfg.has_value());
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }

    SECTION("Durations must be finite and bounded") {
        for (auto* option : {"--base-delay", "--max-delay", "--timeout"}) {
            for (auto* value : {"nan", "inf", "1e300", "-1"}) {
                CAPTURE(option, value);
                auto cfg = build_config(parse({option, value, "http://x/y"}));
                REQUIRE(!cfg.has_value());
                CHECK(cfg.error() == DownloadErrc::invalid_config);
            }
        }
    }

    SECTION("Jitter outside 0..1 or NaN is rejected") {
        for (auto* value : {"nan", "1.5", "-0.1"}) {
            CAPTURE(value);
            auto cfg = build_config(parse({"--jitter", value, "http://x/y"}));
            REQUIRE(!cfg.has_value());
            CHECK(cfg.error() == DownloadErrc::invalid_config);
        }
        CHECK(build_config(parse({"--jitter", "0.5", "http://x/y"})).has_value());
    }

    SECTION("Missing config file") {
        auto cfg = build_config(parse({"--config", "/nonexistent/volley.json", "http://x/y"}));
        REQUIRE(!cfg.has_value());
    }
}

TEST_CASE("exit_code_for", "[cli]") {
    CHECK(exit_code_for(ErrorClass::none) == 0);
    CHECK(exit_code_for(ErrorClass::network) == 1);
    CHECK(exit_code_for(ErrorClass::integrity) == 2);
    CHECK(exit_code_for(ErrorClass::disk) == 3);
    CHECK(exit_code_for(ErrorClass::usage) == 4);
    CHECK(exit_code_for(ErrorClass::cancelled) == 130);
}

TEST_CASE("Formatting helpers", "[cli]") {
    SECTION("format_bytes") {
        CHECK(format_bytes(0) == "0 B");
        CHECK(format_bytes(512) == "512 B");
        CHECK(format_bytes(10 * 1024) == "10 KB");
        CHECK(format_bytes(1536 * 1024) == "1.5 MB");
        CHECK(format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
    }

    SECTION("format_speed") {
        CHECK(format_speed(100) == "100 B/s");
        CHECK(format_speed(2048) == "2.0 KB/s");
        CHECK(format_speed(5 * 1024 * 1024) == "5.0 MB/s");
    }

    SECTION("format_time") {
        CHECK(format_time(5) == "5s");
        CHECK(format_time(125) == "2m 5s");
        CHECK(format_time(3723) == "1h 02m 3s");
    }
}

TEST_CASE("ProgressBar", "[cli]") {
    std::ostringstream out;
    ProgressBar bar(out, "DL");

    DownloadProgress p;
    p.total_bytes = 1000;
    p.downloaded_bytes = 500;
    p.percent = 50.0;
    p.total_chunks = 4;
    p.completed_chunks = 2;

    SECTION("Known size") {
        auto line = bar.render(p);
        CHECK(line == "DL: [===============>              ]  50% (500 B/1000 B) [2/4 chunks]");
    }

    SECTION("Unknown size shows bytes only") {
        p.total_bytes.reset();
        p.total_chunks = 1;
        CHECK(bar.render(p) == "DL: 500 B");
    }

    SECTION("Speed, ETA and retries") {
        p.speed_bps = 2048;
        p.eta_seconds = 65;
        p.retrying_chunks = 1;
        CHECK_THAT(bar.render(p), Catch::Matchers::EndsWith("@ 2.0 KB/s ETA 1m 5s [2/4 chunks, 1 retrying]"));
    }

    SECTION("Redraws only on visible change") {
        bar.update(p);
        auto first = out.str();
        p.downloaded_bytes = 501;
        p.percent = 50.1;
        bar.update(p);
        CHECK(out.str() == first);

        bar.finish();
        CHECK(out.str().back() == '\n');
    }
}
