// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/ledger/download_ledger.hpp>
#include <filesystem>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace dnl::core;
using namespace dnl::ledger;

TEST_CASE("DownloadLedger in memory", "[ledger]") {
    DownloadLedger ledger;
    CHECK(ledger.history_path().empty());

    auto record = TransferRecord::start("https://example.com/a.zip", "http", "/tmp/a.zip");
    REQUIRE(!ledger.record(record));

    SECTION("record makes the transfer active and appends history") {
        auto active = ledger.query_active();
        REQUIRE(active.size() == 1);
        CHECK(active.at(record.url) == record);
        REQUIRE(ledger.query_history().size() == 1);
        CHECK(ledger.find(record.url).has_value());
        CHECK(!ledger.find("https://example.com/other").has_value());
    }

    SECTION("update merges into active and history") {
        RecordChanges changes;
        changes.status = TransferStatus::downloading;
        changes.progress = 42.0;
        changes.speed = "1.00 MB/s";
        REQUIRE(!ledger.update(record.url, changes));

        auto current = ledger.find(record.url);
        REQUIRE(current.has_value());
        CHECK(current->status == TransferStatus::downloading);
        CHECK(current->progress == 42.0);
        CHECK(current->speed == "1.00 MB/s");
        CHECK(ledger.query_history().front() == *current);
    }

    SECTION("update of an unknown URL is rejected") {
        RecordChanges changes;
        changes.progress = 10.0;
        CHECK(ledger.update("https://example.com/unknown", changes) == std::errc::invalid_argument);
    }

    SECTION("backward status is rejected and nothing changes") {
        auto done = record;
        done.file_size = 100;
        done.complete();
        REQUIRE(!ledger.update(record.url, RecordChanges::from(done)));

        RecordChanges back;
        back.status = TransferStatus::downloading;
        back.progress = 5.0;
        CHECK(ledger.update(record.url, back) == std::errc::invalid_argument);

        auto current = ledger.find(record.url);
        REQUIRE(current.has_value());
        CHECK(current->status == TransferStatus::completed);
        CHECK(current->progress == 100.0);
    }

    SECTION("re-queuing a URL keeps the older history snapshot") {
        auto done = record;
        done.complete();
        REQUIRE(!ledger.update(record.url, RecordChanges::from(done)));

        auto again = TransferRecord::start(record.url, "http", "/tmp/a.zip");
        REQUIRE(!ledger.record(again));

        RecordChanges changes;
        changes.status = TransferStatus::failed;
        changes.error = "network error";
        REQUIRE(!ledger.update(record.url, changes));

        auto history = ledger.query_history();
        REQUIRE(history.size() == 2);
        CHECK(history[0].status == TransferStatus::completed);
        CHECK(history[1].status == TransferStatus::failed);
        CHECK(ledger.query_active().size() == 1);
    }

    SECTION("clear_history keeps active transfers") {
        REQUIRE(!ledger.clear_history());
        CHECK(ledger.query_history().empty());
        CHECK(ledger.query_active().size() == 1);
    }
}

TEST_CASE("DownloadLedger persistence", "[ledger]") {
    dnl::test::TempDir dir;
    const auto ledger_dir = dir.file("ledger");

    auto record = TransferRecord::start("https://example.com/b.bin", "http", "/tmp/b.bin");
    {
        DownloadLedger ledger(ledger_dir);
        REQUIRE(!ledger.record(record));
        RecordChanges changes;
        changes.file_size = 2048;
        changes.status = TransferStatus::completed;
        changes.progress = 100.0;
        REQUIRE(!ledger.update(record.url, changes));
        CHECK(std::filesystem::exists(ledger.history_path()));
    }

    DownloadLedger reloaded(ledger_dir);
    auto history = reloaded.query_history();
    REQUIRE(history.size() == 1);
    CHECK(history[0].transfer_id == record.transfer_id);
    CHECK(history[0].status == TransferStatus::completed);
    CHECK(history[0].file_size == 2048);
    // Active transfers are per process
    CHECK(reloaded.query_active().empty());
}

TEST_CASE("DownloadLedger tolerates a corrupt history file", "[ledger]") {
    dnl::test::TempDir dir;
    dnl::test::write_text(dir.file("history.json"), "{ this is not json");

    DownloadLedger ledger(dir.path().string());
    CHECK(ledger.query_history().empty());

    // The next write replaces the corrupt file
    REQUIRE(!ledger.record(TransferRecord::start("https://example.com/c", "http", "/tmp/c")));
    DownloadLedger reloaded(dir.path().string());
    CHECK(reloaded.query_history().size() == 1);
}

TEST_CASE("DownloadLedger reports persistence failures", "[ledger]") {
    dnl::test::TempDir dir;
    // A regular file where the ledger directory should be
    dnl::test::write_text(dir.file("blocked"), "x");

    DownloadLedger ledger(dir.file("blocked"));
    auto record = TransferRecord::start("https://example.com/d", "http", "/tmp/d");
    CHECK(ledger.record(record) == DownloadErrc::ledger_io);
    // In-memory state is updated regardless
    CHECK(ledger.find(record.url).has_value());
}

TEST_CASE("DownloadLedger concurrent writers", "[ledger]") {
    DownloadLedger ledger;
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < 8; ++t) {
            workers.emplace_back([&ledger, t] {
                auto url = "https://example.com/f" + std::to_string(t);
                auto record = TransferRecord::start(url, "http", "/tmp/f");
                (void)ledger.record(record);
                for (int i = 1; i <= 20; ++i) {
                    RecordChanges changes;
                    changes.progress = i * 5.0;
                    (void)ledger.update(url, changes);
                }
            });
        }
    }
    auto active = ledger.query_active();
    REQUIRE(active.size() == 8);
    for (const auto& [url, record] : active) {
        CHECK(record.progress == 100.0);
    }
    CHECK(ledger.query_history().size() == 8);
}
