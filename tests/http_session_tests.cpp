// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/core/http_session.hpp>
#include "loopback_server.hpp"
#include "test_support.hpp"

using namespace dnl::core;

TEST_CASE("HttpSession::parse_content_disposition", "[http_session]") {
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"report.pdf\"") == "report.pdf");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=data.csv; size=10") == "data.csv");
    CHECK(HttpSession::parse_content_disposition("attachment; filename='a b.txt'") == "a b.txt");
    CHECK(HttpSession::parse_content_disposition("attachment; filename=\"../../etc/passwd\"") == "passwd");
    CHECK(HttpSession::parse_content_disposition("inline").empty());
}

TEST_CASE("HttpSession over file URLs", "[http_session]") {
    dnl::test::TempDir dir;
    const auto payload = dnl::test::make_payload(50'000);
    dnl::test::write_text(dir.file("data.bin"), payload);

    TransferConfig config;
    HttpSession session(config);

    SECTION("head reports the length") {
        auto head = session.head(dir.url("data.bin"));
        REQUIRE(head.has_value());
        REQUIRE(head->content_length.has_value());
        CHECK(*head->content_length == payload.size());
    }

    SECTION("head of a missing file fails") {
        CHECK(!session.head(dir.url("missing.bin")).has_value());
    }

    SECTION("fetch_text honors the size limit") {
        dnl::test::write_text(dir.file("small.txt"), "#EXTM3U\n");
        auto text = session.fetch_text(dir.url("small.txt"));
        REQUIRE(text.has_value());
        CHECK(*text == "#EXTM3U\n");

        auto too_big = session.fetch_text(dir.url("data.bin"), 1000);
        REQUIRE(!too_big.has_value());
        CHECK(too_big.error() == DownloadErrc::unsupported_stream);
    }

    SECTION("stream delivers the body and a byte range") {
        std::string body;
        auto sink = [&](const char* data, std::size_t size) -> std::error_code {
            body.append(data, size);
            return {};
        };

        auto whole = session.stream(dir.url("data.bin"), sink);
        REQUIRE(whole.has_value());
        CHECK(*whole == payload.size());
        CHECK(body == payload);

        body.clear();
        auto part = session.stream(dir.url("data.bin"), sink, {}, "100-199");
        REQUIRE(part.has_value());
        CHECK(*part == 100);
        CHECK(body == payload.substr(100, 100));
    }

    SECTION("stream stops when the sink fails") {
        auto result = session.stream(dir.url("data.bin"), [](const char*, std::size_t) {
            return std::make_error_code(std::errc::no_space_on_device);
        });
        CHECK(!result.has_value());
    }
}

TEST_CASE("HttpSession::stream checks ranged HTTP responses", "[http_session][loopback]") {
    const auto payload = dnl::test::make_payload(4096);
    TransferConfig config;
    config.connection_timeout = 5;
    config.read_timeout = 5;
    HttpSession session(config);

    std::string body;
    auto sink = [&](const char* data, std::size_t size) -> std::error_code {
        body.append(data, size);
        return {};
    };

    SECTION("206 delivers the range") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            return dnl::test::serve_resource(payload, request);
        });
        auto part = session.stream(server.url("/data.bin"), sink, {}, "0-9");
        REQUIRE(part.has_value());
        CHECK(*part == 10);
        CHECK(body == payload.substr(0, 10));
    }

    SECTION("200 to a range request is rejected") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            auto whole = request;
            whole.headers.erase("range");
            return dnl::test::serve_resource(payload, whole);
        });
        auto part = session.stream(server.url("/data.bin"), sink, {}, "0-9");
        REQUIRE(!part.has_value());
        CHECK(part.error() == DownloadErrc::malformed_range);
        CHECK(body.empty());
    }

    SECTION("200 without a range is accepted") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            return dnl::test::serve_resource(payload, request);
        });
        auto whole = session.stream(server.url("/data.bin"), sink);
        REQUIRE(whole.has_value());
        CHECK(body == payload);
    }
}
