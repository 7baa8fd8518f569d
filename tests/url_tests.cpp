// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <volley/core/url.hpp>

using namespace volley::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/file.zip");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/file.zip");
        CHECK(url.is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/path");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "http");
        CHECK(url.port() == "8080");
        CHECK(!url.is_secure());
        CHECK(url.full() == "http://example.com:8080/path");
    }

    SECTION("Query kept, fragment dropped") {
        auto result = Url::parse("https://example.com/file.zip?v=1#section");
        REQUIRE(result.has_value());
        CHECK(result->query() == "v=1");
        CHECK(result->full() == "https://example.com/file.zip?v=1");
    }

    SECTION("URL with path segments") {
        auto result = Url::parse("https://cdn.example.com/downloads/v1.2/files/archive.zip");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/downloads/v1.2/files/archive.zip");
    }

    SECTION("Bare host gets a root path") {
        auto result = Url::parse("HTTP://example.com");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->path() == "/");
    }

    SECTION("Userinfo and IPv6 literal") {
        auto result = Url::parse("http://user:pw@[::1]:9000/x");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "9000");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        auto result = Url::parse("example.com/file.zip");
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::invalid_url);
    }

    SECTION("Empty string") {
        CHECK(!Url::parse("").has_value());
    }

    SECTION("Unsupported scheme") {
        CHECK(!Url::parse("ftp://example.com/file").has_value());
    }

    SECTION("Empty host") {
        CHECK(!Url::parse("http:///file").has_value());
    }

    SECTION("Non-numeric port") {
        CHECK(!Url::parse("http://example.com:abc/").has_value());
    }
}

TEST_CASE("Url::filename extraction", "[url]") {
    SECTION("Simple filename") {
        auto result = Url::parse("https://example.com/myfile.zip");
        REQUIRE(result.has_value());
        CHECK(result->filename() == "myfile.zip");
        CHECK(result->extension() == ".zip");
    }

    SECTION("URL with query params") {
        auto result = Url::parse("https://example.com/download.php?id=123");
        REQUIRE(result.has_value());
        CHECK(result->filename() == "download.php");
    }

    SECTION("Path without filename") {
        auto result = Url::parse("https://example.com/folder/");
        REQUIRE(result.has_value());
        CHECK(result->filename().empty());
    }
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
}

TEST_CASE("default_output_name", "[url]") {
    auto url = *Url::parse("https://example.com/dist/tool.tar.gz");

    SECTION("Server name wins") {
        CHECK(default_output_name(url, "release.tgz") == "release.tgz");
    }

    SECTION("Server name cannot escape the directory") {
        CHECK(default_output_name(url, "../../etc/passwd") == "....etcpasswd");
        CHECK(default_output_name(url, "..") == "tool.tar.gz");
    }

    SECTION("Falls back to the URL") {
        CHECK(default_output_name(url, "") == "tool.tar.gz");
    }

    SECTION("Directory URL") {
        CHECK(default_output_name(*Url::parse("https://example.com/"), "") == "download");
    }
}
