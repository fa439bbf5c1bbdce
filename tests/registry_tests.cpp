// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/core/config.hpp>
#include <dnl/protocol/registry.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace dnl::core;
using namespace dnl::protocol;

namespace {

// Claims every URL with the given prefix and completes immediately
class FakeHandler : public ProtocolHandler {
public:
    FakeHandler(std::string tag, std::string prefix)
        : tag_(std::move(tag)), prefix_(std::move(prefix)) {}

    std::string_view tag() const noexcept override { return tag_; }

    bool can_handle(std::string_view url) const noexcept override {
        return url.starts_with(prefix_);
    }

    TransferRecord download(const std::string& url, const std::string& destination,
                            const TransferHooks& hooks, std::stop_token stop) override {
        auto record = TransferRecord::start(url, tag_, destination);
        if (hooks.on_start) hooks.on_start(record);

        auto now = ++running;
        auto seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}

        std::this_thread::sleep_for(delay);
        --running;

        if (stop.stop_requested()) {
            record.fail("cancelled");
        } else {
            record.complete();
        }
        return record;
    }

    std::chrono::milliseconds delay{0};
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

private:
    std::string tag_;
    std::string prefix_;
};

} // namespace

TEST_CASE("ProtocolRegistry first match wins", "[registry]") {
    ProtocolRegistry registry;
    registry.add(std::make_unique<FakeHandler>("special", "https://special."));
    registry.add(std::make_unique<FakeHandler>("generic", "https://"));
    REQUIRE(registry.size() == 2);

    auto special = registry.resolve("https://special.example.com/a");
    REQUIRE(special.has_value());
    CHECK((*special)->tag() == "special");

    auto generic = registry.resolve("https://example.com/a");
    REQUIRE(generic.has_value());
    CHECK((*generic)->tag() == "generic");
}

TEST_CASE("ProtocolRegistry unclaimed URL", "[registry]") {
    ProtocolRegistry registry;
    registry.add(std::make_unique<FakeHandler>("generic", "https://"));

    CHECK(registry.resolve("gopher://example.com/").error() == DownloadErrc::no_handler);

    auto result = registry.dispatch("gopher://example.com/", "/tmp/x");
    REQUIRE(!result.has_value());
    CHECK(result.error() == DownloadErrc::no_handler);
}

TEST_CASE("ProtocolRegistry dispatch runs the handler", "[registry]") {
    ProtocolRegistry registry;
    registry.add(std::make_unique<FakeHandler>("generic", "https://"));

    int started = 0;
    TransferHooks hooks;
    hooks.on_start = [&](const TransferRecord& r) {
        CHECK(r.status == TransferStatus::starting);
        ++started;
    };

    auto result = registry.dispatch("https://example.com/a", "/tmp/a", hooks);
    REQUIRE(result.has_value());
    CHECK(result->status == TransferStatus::completed);
    CHECK(result->file_type == "generic");
    CHECK(started == 1);
}

TEST_CASE("ProtocolRegistry dispatch honors a stopped token while waiting", "[registry]") {
    ProtocolRegistry registry(1);
    registry.add(std::make_unique<FakeHandler>("generic", "https://"));

    std::stop_source stop;
    stop.request_stop();
    auto result = registry.dispatch("https://example.com/a", "/tmp/a", {}, stop.get_token());
    // Either cancelled before a slot was taken, or the handler saw the stop
    if (result) {
        CHECK(result->status == TransferStatus::failed);
    } else {
        CHECK(result.error() == DownloadErrc::cancelled);
    }
}

TEST_CASE("ProtocolRegistry dispatch_batch", "[registry]") {
    ProtocolRegistry registry(2);
    auto fake = std::make_unique<FakeHandler>("generic", "https://");
    fake->delay = std::chrono::milliseconds(30);
    auto* handler = fake.get();
    registry.add(std::move(fake));

    std::vector<std::string> urls = {
        "https://example.com/one.bin",
        "ftp://unclaimed.example.com/two.bin",
        "https://example.com/three.bin",
        "https://example.com/four.bin",
        "https://example.com/five.bin",
    };

    std::atomic<int> hooks_made{0};
    auto results = registry.dispatch_batch(urls, "/tmp/batch", [&](const std::string&) {
        ++hooks_made;
        return TransferHooks{};
    });

    REQUIRE(results.size() == urls.size());
    CHECK(hooks_made == 4);

    SECTION("Outcomes follow input order") {
        REQUIRE(results[0].has_value());
        CHECK(results[0]->url == urls[0]);
        CHECK(results[0]->download_path == "/tmp/batch/one.bin");
        REQUIRE(!results[1].has_value());
        CHECK(results[1].error() == DownloadErrc::no_handler);
        for (std::size_t i : {2u, 3u, 4u}) {
            REQUIRE(results[i].has_value());
            CHECK(results[i]->url == urls[i]);
            CHECK(results[i]->status == TransferStatus::completed);
        }
    }

    SECTION("Concurrent transfers stay within the bound") {
        CHECK(handler->peak <= 2);
    }
}

TEST_CASE("Default registry order", "[registry]") {
    TransferConfig config;
    auto registry = make_default_registry(config);
    REQUIRE(registry->size() == 6);

    const auto& handlers = registry->handlers();
    CHECK(handlers[0]->tag() == "video");
    CHECK(handlers[1]->tag() == "m3u8");
    CHECK(handlers[2]->tag() == "torrent");
    CHECK(handlers[3]->tag() == "ftp");
    CHECK(handlers[4]->tag() == "webdav");
    CHECK(handlers[5]->tag() == "http");

    auto tag_for = [&](std::string_view url) -> std::string {
        auto handler = registry->resolve(url);
        return handler ? std::string((*handler)->tag()) : std::string("none");
    };

    CHECK(tag_for("https://www.youtube.com/watch?v=abc") == "video");
    CHECK(tag_for("https://cdn.example.com/live/index.m3u8?token=1") == "m3u8");
    CHECK(tag_for("ftp://ftp.example.com/pub/file.tar") == "ftp");
    CHECK(tag_for("sftp://host/file") == "ftp");
    CHECK(tag_for("ssh://host/file") == "ftp");
    CHECK(tag_for("webdav://dav.example.com/a.pdf") == "webdav");
    CHECK(tag_for("dav://dav.example.com/a.pdf") == "webdav");
    CHECK(tag_for("https://example.com/a.zip") == "http");
    CHECK(tag_for("http://example.com/a.zip") == "http");
    CHECK(tag_for("magnet:?xt=urn:btih:abc") == "torrent");
    CHECK(tag_for("https://releases.example.com/distro.iso.torrent") == "torrent");
    CHECK(tag_for("ftp://ftp.example.com/pub/distro.torrent") == "torrent");
    CHECK(tag_for("file:///tmp/a") == "none");
}
