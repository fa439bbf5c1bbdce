// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/cli/commands.hpp>
#include <dnl/cli/interrupt.hpp>
#include <dnl/cli/progress_bar.hpp>
#include <dnl/core/capability_probe.hpp>
#include <dnl/ledger/download_ledger.hpp>
#include <chrono>
#include <csignal>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace dnl::cli;

namespace {

CliArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    static std::string program = "dnl";
    argv.push_back(program.data());
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("URLs and options") {
        auto args = parse({"-n", "8", "-d", "/tmp/out", "--sha256", "abc", "--ledger", "/tmp/l",
                           "https://example.com/a", "ftp://h/b", "-q"});
        CHECK(args.errors.empty());
        CHECK(args.connections == 8u);
        CHECK(args.output_dir == "/tmp/out");
        CHECK(args.sha256 == "abc");
        CHECK(args.ledger_dir == "/tmp/l");
        CHECK(args.quiet);
        REQUIRE(args.urls.size() == 2);
        CHECK(args.urls[1] == "ftp://h/b");
    }

    SECTION("Help stops parsing") {
        auto args = parse({"--bogus", "-h"});
        CHECK(args.help);
    }

    SECTION("Modes") {
        auto args = parse({"--info", "--history", "-V", "-c", "cfg.json", "-o", "x.bin"});
        CHECK(args.info);
        CHECK(args.history);
        CHECK(args.verbose);
        CHECK(args.config_path == "cfg.json");
        CHECK(args.output_file == "x.bin");
    }

    SECTION("Errors are collected") {
        auto args = parse({"--frobnicate", "-n", "zero", "-o"});
        CHECK(args.errors.size() == 3);
        CHECK(!args.connections.has_value());
    }

    SECTION("Zero connections is invalid") {
        auto args = parse({"-n", "0", "https://example.com/a"});
        CHECK(args.errors.size() == 1);
    }
}

TEST_CASE("resolve_config", "[cli]") {
    dnl::test::TempDir dir;
    const auto host_chunk = dnl::core::CapabilityProbe::optimal_chunk_size();

    CliArgs args;
    auto config = resolve_config(args);
    REQUIRE(config.has_value());
    CHECK(config->chunk_size == host_chunk);
    CHECK(!config->max_connections_per_file.has_value());

    args.connections = GENERATE(1u, 4u, 40u);
    config = resolve_config(args);
    REQUIRE(config.has_value());
    REQUIRE(config->max_connections_per_file.has_value());
    CHECK(*config->max_connections_per_file == *args.connections);

    dnl::test::write_text(dir.file("cfg.json"), R"({"max_retries": 7, "max_connections_per_file": 2})");
    args.config_path = dir.file("cfg.json");
    args.connections.reset();
    config = resolve_config(args);
    REQUIRE(config.has_value());
    CHECK(config->max_retries == 7);
    REQUIRE(config->max_connections_per_file.has_value());
    CHECK(*config->max_connections_per_file == 2);
    CHECK(config->chunk_size == host_chunk);

    dnl::test::write_text(dir.file("chunk.json"), R"({"chunk_size": 65536})");
    args.config_path = dir.file("chunk.json");
    config = resolve_config(args);
    REQUIRE(config.has_value());
    CHECK(config->chunk_size == 65536);

    args.config_path = dir.file("missing.json");
    CHECK(!resolve_config(args).has_value());
}

TEST_CASE("download command records into the ledger", "[cli]") {
    dnl::test::TempDir dir;
    CliArgs args;
    args.quiet = true;
    args.ledger_dir = dir.file("ledger");
    args.output_dir = dir.file("out");

    SECTION("Unclaimed URL fails with a non-zero exit") {
        args.urls = {"gopher://example.com/a"};
        auto result = download(args, {});
        REQUIRE(result.has_value());
        CHECK(*result == 1);
    }

    SECTION("Unreachable http resource is recorded as failed") {
        args.urls = {"http://127.0.0.1:1/a.bin"};
        auto result = download(args, {});
        REQUIRE(result.has_value());
        CHECK(*result == 1);

        dnl::ledger::DownloadLedger ledger(args.ledger_dir);
        auto history = ledger.query_history();
        REQUIRE(history.size() == 1);
        CHECK(history[0].status == dnl::core::TransferStatus::failed);
        CHECK(history[0].url == args.urls[0]);
    }
}

TEST_CASE("ProgressBar rendering", "[cli]") {
    CHECK(ProgressBar::render_bar(0.0) == "[>" + std::string(29, ' ') + "]");
    CHECK(ProgressBar::render_bar(100.0) == "[" + std::string(30, '=') + "]");
    CHECK(ProgressBar::render_bar(50.0) == "[" + std::string(15, '=') + ">" + std::string(14, ' ') + "]");
    CHECK(ProgressBar::render_bar(250.0).size() == 32);

    CHECK(ProgressBar::format_time(0) == "0s");
    CHECK(ProgressBar::format_time(75) == "1m 15s");
    CHECK(ProgressBar::format_time(3725) == "1h 2m 5s");
}

TEST_CASE("InterruptGuard turns SIGINT into a stop request", "[cli]") {
    std::stop_source cancel;
    {
        InterruptGuard guard(cancel);
        CHECK(!guard.interrupted());

        REQUIRE(std::raise(SIGINT) == 0);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!cancel.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        CHECK(cancel.stop_requested());
        CHECK(guard.interrupted());
    }

    // A fresh guard starts clear
    std::stop_source other;
    InterruptGuard guard(other);
    CHECK(!guard.interrupted());
    CHECK(!other.stop_requested());
}
