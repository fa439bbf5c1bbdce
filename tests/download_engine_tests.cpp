// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/core/download_engine.hpp>
#include <dnl/disk/digest.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>
#include "loopback_server.hpp"
#include "test_support.hpp"

using namespace dnl::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

TransferConfig fast_config() {
    TransferConfig config;
    config.max_retries = 1;
    config.connection_timeout = 5;
    config.read_timeout = 5;
    return config;
}

std::string range_header(const dnl::test::HttpRequest& request) {
    auto it = request.headers.find("range");
    return it == request.headers.end() ? std::string() : it->second;
}

} // namespace

TEST_CASE("DownloadEngine::fetch_metadata", "[download_engine]") {
    dnl::test::TempDir dir;
    dnl::test::write_text(dir.file("source.bin"), dnl::test::make_payload(12'345));
    dnl::test::write_text(dir.file("empty.bin"), "");
    DownloadEngine engine(fast_config());

    SECTION("Known length") {
        auto meta = engine.fetch_metadata(dir.url("source.bin"));
        REQUIRE(meta.has_value());
        REQUIRE(meta->byte_length.has_value());
        CHECK(*meta->byte_length == 12'345);
        CHECK(meta->filename == "source.bin");
    }

    SECTION("Unreachable resource") {
        auto meta = engine.fetch_metadata(dir.url("missing.bin"));
        REQUIRE(!meta.has_value());
        CHECK(meta.error() == DownloadErrc::metadata_unavailable);
    }

    SECTION("Zero length counts as unknown") {
        auto meta = engine.fetch_metadata(dir.url("empty.bin"));
        REQUIRE(!meta.has_value());
        CHECK(meta.error() == DownloadErrc::unknown_size);
    }

    SECTION("Malformed identifier") {
        auto meta = engine.fetch_metadata("not a url");
        REQUIRE(!meta.has_value());
        CHECK(meta.error() == DownloadErrc::invalid_url);
    }
}

TEST_CASE("DownloadEngine::download reassembles chunks", "[download_engine]") {
    dnl::test::TempDir dir;
    const auto payload = dnl::test::make_payload(1'000'003);
    dnl::test::write_text(dir.file("source.bin"), payload);

    DownloadEngine engine(fast_config());
    const std::uint32_t connections = GENERATE(1u, 3u, 8u);

    std::mutex mutex;
    std::vector<TransferProgress> reports;
    std::vector<TransferStatus> started;

    DownloadOptions options;
    options.connections = connections;
    options.progress = [&](const TransferProgress& p) {
        std::lock_guard lock(mutex);
        reports.push_back(p);
    };
    options.on_start = [&](const TransferRecord& r) { started.push_back(r.status); };

    const auto dest = dir.file("out/copy.bin");
    auto result = engine.download(dir.url("source.bin"), dest, options);
    REQUIRE(result.has_value());

    CHECK(result->status == TransferStatus::completed);
    CHECK(result->progress == 100.0);
    CHECK(result->file_size == payload.size());
    CHECK(result->download_path == dest);
    CHECK(result->completed_at.has_value());
    CHECK(result->speed.has_value());
    CHECK(result->metadata.at("connections") == std::to_string(connections));
    CHECK(dnl::test::read_text(dest) == payload);

    REQUIRE(started.size() == 1);
    CHECK(started[0] == TransferStatus::starting);

    REQUIRE(!reports.empty());
    CHECK(reports.back().downloaded_bytes == payload.size());
    for (std::size_t i = 1; i < reports.size(); ++i) {
        CHECK(reports[i].downloaded_bytes >= reports[i - 1].downloaded_bytes);
        CHECK(reports[i].downloaded_bytes <= payload.size());
    }

    SECTION("Repeat run produces a byte-identical file") {
        auto again = engine.download(dir.url("source.bin"), dest, options);
        REQUIRE(again.has_value());
        CHECK(again->transfer_id != result->transfer_id);
        CHECK(dnl::test::read_text(dest) == payload);
    }
}

TEST_CASE("DownloadEngine::download with more connections than bytes", "[download_engine]") {
    dnl::test::TempDir dir;
    dnl::test::write_text(dir.file("tiny.txt"), "abc");

    DownloadEngine engine(fast_config());
    DownloadOptions options;
    options.connections = 8;

    auto result = engine.download(dir.url("tiny.txt"), dir.file("tiny.out"), options);
    REQUIRE(result.has_value());
    CHECK(dnl::test::read_text(dir.file("tiny.out")) == "abc");
}

TEST_CASE("DownloadEngine::download failures leave no file", "[download_engine]") {
    dnl::test::TempDir dir;
    DownloadEngine engine(fast_config());
    const auto dest = dir.file("never.bin");

    SECTION("Missing source") {
        auto result = engine.download(dir.url("missing.bin"), dest);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::metadata_unavailable);
        CHECK(result.error().record.status == TransferStatus::failed);
        REQUIRE(result.error().record.error.has_value());
        CHECK(!result.error().record.error->empty());
        CHECK(!fs::exists(dest));
    }

    SECTION("Cancelled before start") {
        dnl::test::write_text(dir.file("source.bin"), dnl::test::make_payload(4096));
        std::stop_source stop;
        stop.request_stop();

        DownloadOptions options;
        options.stop = stop.get_token();
        auto result = engine.download(dir.url("source.bin"), dest, options);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::cancelled);
        CHECK(result.error().record.status == TransferStatus::failed);
        CHECK(!fs::exists(dest));
    }

    SECTION("Empty source") {
        dnl::test::write_text(dir.file("empty.bin"), "");
        auto result = engine.download(dir.url("empty.bin"), dest);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::unknown_size);
        CHECK(!fs::exists(dest));
    }

    SECTION("Zero connections") {
        dnl::test::write_text(dir.file("source.bin"), "payload");
        DownloadOptions options;
        options.connections = 0;
        auto result = engine.download(dir.url("source.bin"), dest, options);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::invalid_plan);
        CHECK(!fs::exists(dest));
    }
}

TEST_CASE("DownloadEngine::download over HTTP", "[download_engine][loopback]") {
    dnl::test::TempDir dir;
    const auto payload = dnl::test::make_payload(200'003);
    const auto dest = dir.file("out.bin");

    DownloadOptions options;
    options.connections = 4;

    SECTION("Transient failures are retried into a byte-identical file") {
        std::mutex mutex;
        std::map<std::string, int> attempts;
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            if (request.method == "GET") {
                std::lock_guard lock(mutex);
                if (attempts[range_header(request)]++ == 0) {
                    dnl::test::HttpReply busy;
                    busy.status = 503;
                    return busy;
                }
            }
            return dnl::test::serve_resource(payload, request);
        });

        auto config = fast_config();
        config.max_retries = 2;
        DownloadEngine engine(config);

        auto result = engine.download(server.url("/retry.bin"), dest, options);
        REQUIRE(result.has_value());
        CHECK(result->status == TransferStatus::completed);
        CHECK(dnl::test::read_text(dest) == payload);

        std::lock_guard lock(mutex);
        CHECK(attempts.size() == 4);
        for (const auto& [range, count] : attempts) {
            CHECK(count == 2);
        }
    }

    SECTION("Server that ignores Range") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            auto whole = request;
            whole.headers.erase("range");
            return dnl::test::serve_resource(payload, whole);
        });
        DownloadEngine engine(fast_config());

        auto result = engine.download(server.url("/norange.bin"), dest, options);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::chunk_fetch_failed);
        CHECK(result.error().detail.find("Malformed range response") != std::string::npos);
        CHECK(result.error().record.status == TransferStatus::failed);
        CHECK(!fs::exists(dest));
    }

    SECTION("Short range responses are a size mismatch") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            auto reply = dnl::test::serve_resource(payload, request);
            if (reply.status == 206) {
                reply.body.resize(reply.body.size() / 2);
            }
            return reply;
        });
        DownloadEngine engine(fast_config());

        auto result = engine.download(server.url("/short.bin"), dest, options);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::size_mismatch);
        CHECK(!fs::exists(dest));
    }

    SECTION("A permanently failing chunk removes the partial file") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            if (auto range = request.range(); range && range->first > 0) {
                dnl::test::HttpReply missing;
                missing.status = 404;
                return missing;
            }
            return dnl::test::serve_resource(payload, request);
        });
        DownloadEngine engine(fast_config());

        auto result = engine.download(server.url("/gone.bin"), dest, options);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::chunk_fetch_failed);
        CHECK(result.error().detail.starts_with("chunk 1: "));
        CHECK(!fs::exists(dest));
        // 404 is not retried: one HEAD plus one GET per chunk
        CHECK(server.requests() == 5);
    }

    SECTION("Cancellation while chunks are in flight") {
        dnl::test::LoopbackServer server([&](const dnl::test::HttpRequest& request) {
            auto reply = dnl::test::serve_resource(payload, request);
            if (reply.status == 206) {
                reply.content_length = reply.body.size();
                reply.body.resize(reply.body.size() / 2);
                reply.stall = true;
            }
            return reply;
        });
        DownloadEngine engine(fast_config());

        std::stop_source stop;
        options.stop = stop.get_token();
        std::jthread canceller([&stop] {
            std::this_thread::sleep_for(500ms);
            stop.request_stop();
        });

        const auto started = std::chrono::steady_clock::now();
        auto result = engine.download(server.url("/stall.bin"), dest, options);
        CHECK(std::chrono::steady_clock::now() - started < 10s);

        REQUIRE(!result.has_value());
        CHECK(result.error().code == DownloadErrc::chunk_fetch_failed);
        CHECK(result.error().detail.find("Download cancelled") != std::string::npos);
        CHECK(result.error().record.status == TransferStatus::failed);
        CHECK(!fs::exists(dest));
    }
}

TEST_CASE("DownloadEngine::verify_checksum", "[download_engine][checksum]") {
    dnl::test::TempDir dir;
    dnl::test::write_text(dir.file("abc.txt"), "abc");
    DownloadEngine engine(fast_config());

    const std::string digest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    CHECK(engine.verify_checksum(dir.file("abc.txt"), digest));
    CHECK(engine.verify_checksum(dir.file("abc.txt"),
                                 "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));

    SECTION("Flipped byte no longer matches") {
        dnl::test::write_text(dir.file("abc.txt"), "abd");
        CHECK(!engine.verify_checksum(dir.file("abc.txt"), digest));
    }

    SECTION("Missing file is a mismatch") {
        CHECK(!engine.verify_checksum(dir.file("nope.txt"), digest));
    }
}
