// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/cli/commands.hpp>
#include <dnl/cli/progress_bar.hpp>
#include <dnl/core/capability_probe.hpp>
#include <dnl/core/download_engine.hpp>
#include <dnl/core/error.hpp>
#include <dnl/core/http_session.hpp>
#include <dnl/core/log.hpp>
#include <dnl/core/progress.hpp>
#include <dnl/ledger/download_ledger.hpp>
#include <dnl/protocol/registry.hpp>
#include <dnl/version.hpp>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>

using namespace dnl::core;

namespace chrono = std::chrono;

namespace dnl::cli {

namespace {

constexpr auto LEDGER_UPDATE_INTERVAL = chrono::seconds(1);

// Mirrors one transfer into the ledger: the starting record, throttled
// progress, then the terminal record.
class LedgerTracker {
public:
    LedgerTracker(ledger::DownloadLedger& ledger, std::string url, Logger logger)
        : ledger_(ledger)
        , url_(std::move(url))
        , logger_(std::move(logger)) {}

    void started(const TransferRecord& record) {
        std::lock_guard lock(mutex_);
        if (auto ec = ledger_.record(record)) {
            logger_->warn("Ledger: could not record {}: {}", url_, ec.message());
        }
        started_ = true;
        last_update_ = chrono::steady_clock::now();
    }

    void progressed(const TransferProgress& progress) {
        auto now = chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        if (!started_ || now - last_update_ < LEDGER_UPDATE_INTERVAL) return;
        last_update_ = now;

        ledger::RecordChanges changes;
        changes.status = TransferStatus::downloading;
        changes.progress = progress.percent;
        changes.speed = format_speed(progress.speed_bps);
        if (auto ec = ledger_.update(url_, changes)) {
            logger_->debug("Ledger: progress update for {} rejected: {}", url_, ec.message());
        }
    }

    void finished(const TransferRecord& record) {
        std::lock_guard lock(mutex_);
        if (!started_) {
            // Handler failed before announcing the transfer
            if (auto ec = ledger_.record(record)) {
                logger_->warn("Ledger: could not record {}: {}", url_, ec.message());
            }
            return;
        }
        if (auto ec = ledger_.update(url_, ledger::RecordChanges::from(record))) {
            logger_->warn("Ledger: could not finalize {}: {}", url_, ec.message());
        }
    }

private:
    ledger::DownloadLedger& ledger_;
    std::string url_;
    Logger logger_;
    std::mutex mutex_;
    bool started_{false};
    chrono::steady_clock::time_point last_update_{};
};

[[nodiscard]] bool parse_uint(const char* text, std::uint32_t& out) noexcept {
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value == 0 || value > 1024) {
        return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

// Applies --sha256 to a completed record; false on mismatch
bool apply_checksum(const DownloadEngine& engine, const std::string& expected_hex,
                    TransferRecord& record) {
    if (expected_hex.empty() || record.status != TransferStatus::completed) return true;

    if (engine.verify_checksum(record.download_path, expected_hex)) {
        record.checksum = expected_hex;
        return true;
    }
    record.checksum = expected_hex;
    record.error = make_error_code(DownloadErrc::checksum_mismatch).message();
    return false;
}

void report(const TransferRecord& record, bool quiet) {
    if (record.status == TransferStatus::completed && !record.error) {
        if (!quiet) {
            std::cout << "Saved " << record.url << " -> " << record.download_path
                      << " (" << format_bytes(record.file_size.value_or(0)) << ")" << std::endl;
        }
        return;
    }
    std::cerr << "Error: " << record.url << ": " << record.error.value_or("unknown error") << std::endl;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.errors.push_back("Missing value for " + std::string(option));
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--history") {
            args.history = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.output_dir = v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_path = v;
        } else if (arg == "--ledger") {
            if (auto v = value_of(i, arg)) args.ledger_dir = v;
        } else if (arg == "--sha256") {
            if (auto v = value_of(i, arg)) args.sha256 = v;
        } else if (arg == "-n" || arg == "--connections") {
            if (auto v = value_of(i, arg)) {
                std::uint32_t n = 0;
                if (parse_uint(v, n)) {
                    args.connections = n;
                } else {
                    args.errors.push_back("Invalid connection count: " + std::string(v));
                }
            }
        } else if (arg.size() > 1 && arg.starts_with("-")) {
            args.errors.push_back("Unknown option: " + arg);
        } else {
            // Any other argument is a resource identifier
            args.urls.push_back(arg);
        }
    }

    return args;
}

std::string default_ledger_dir() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return (std::filesystem::path(home) / ".downloads").string();
    }
    return ".downloads";
}

std::expected<TransferConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    TransferConfig config = CapabilityProbe::tuned_config();
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path, config);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (args.connections) {
        config.max_connections_per_file = *args.connections;
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, std::stop_token stop) noexcept {
    try {
        auto config = resolve_config(args);
        if (!config) {
            std::cerr << "Error: cannot load config " << args.config_path << ": "
                      << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        const std::string ledger_dir = args.ledger_dir.empty() ? default_ledger_dir() : args.ledger_dir;

        LogOptions log_options;
        log_options.level = args.verbose ? spdlog::level::debug : spdlog::level::info;
        log_options.console_level = args.verbose ? spdlog::level::debug
                                  : args.quiet   ? spdlog::level::err
                                                 : spdlog::level::warn;
        log_options.file_dir = ledger_dir;
        auto logger = make_logger(log_options);

        ledger::DownloadLedger ledger(ledger_dir, logger);
        auto registry = protocol::make_default_registry(*config, logger);
        DownloadEngine checksum_engine(*config, logger);

        // One tracker per distinct URL, created up front so worker threads
        // only read the map
        std::map<std::string, std::unique_ptr<LedgerTracker>> trackers;
        for (const auto& url : args.urls) {
            if (!trackers.contains(url)) {
                trackers.emplace(url, std::make_unique<LedgerTracker>(ledger, url, logger));
            }
        }

        const bool show_bar = !args.quiet && args.urls.size() == 1;
        ProgressBar bar("Downloading");

        auto hooks_for = [&](const std::string& url) {
            LedgerTracker* tracker = trackers.at(url).get();
            protocol::TransferHooks hooks;
            hooks.on_start = [tracker](const TransferRecord& record) { tracker->started(record); };
            hooks.on_progress = [tracker, show_bar, &bar](const TransferProgress& progress) {
                tracker->progressed(progress);
                if (show_bar) bar.update(progress);
            };
            return hooks;
        };

        std::vector<std::expected<TransferRecord, std::error_code>> outcomes;
        if (args.urls.size() == 1) {
            const auto& url = args.urls.front();
            std::string destination = args.output_file;
            if (destination.empty()) {
                if (auto handler = registry->resolve(url)) {
                    destination = (*handler)->destination_for(url, args.output_dir);
                }
            }
            outcomes.push_back(registry->dispatch(url, destination, hooks_for(url), stop));
        } else {
            if (!args.output_file.empty()) {
                logger->warn("--output ignored with several URLs; saving into {}", args.output_dir);
            }
            outcomes = registry->dispatch_batch(args.urls, args.output_dir, hooks_for, stop);
        }

        if (show_bar) {
            if (outcomes.front() && outcomes.front()->status == TransferStatus::completed) {
                bar.finish();
            } else {
                bar.clear();
            }
        }

        int exit_code = 0;
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            const auto& url = args.urls[i];
            auto& outcome = outcomes[i];
            if (!outcome) {
                std::cerr << "Error: " << url << ": " << outcome.error().message() << std::endl;
                exit_code = 1;
                continue;
            }

            TransferRecord& record = *outcome;
            if (!apply_checksum(checksum_engine, args.sha256, record)) {
                exit_code = 1;
            }
            if (record.status != TransferStatus::completed) {
                exit_code = 1;
            }
            trackers.at(url)->finished(record);
            report(record, args.quiet);
        }

        logger->flush();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult info(const std::string& url, const TransferConfig& config) noexcept {
    try {
        DownloadEngine engine(config);
        auto metadata = engine.fetch_metadata(url);
        if (!metadata) {
            std::cerr << "Error: " << url << ": " << metadata.error().message() << std::endl;
            return std::unexpected(metadata.error());
        }

        std::cout << "URL: " << url << std::endl;
        if (!metadata->effective_url.empty() && metadata->effective_url != url) {
            std::cout << "Effective URL: " << metadata->effective_url << std::endl;
        }
        std::cout << "File name: " << metadata->filename << std::endl;
        std::cout << "Content-Type: " << metadata->content_type << std::endl;
        std::cout << "Content-Length: " << *metadata->byte_length
                  << " (" << format_bytes(*metadata->byte_length) << ")" << std::endl;
        std::cout << "Accepts-Ranges: " << (metadata->resumable ? "yes" : "no") << std::endl;
        if (metadata->etag) {
            std::cout << "ETag: " << *metadata->etag << std::endl;
        }
        if (metadata->last_modified) {
            std::cout << "Last-Modified: " << *metadata->last_modified << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult history(const std::string& ledger_dir) noexcept {
    try {
        ledger::DownloadLedger ledger(ledger_dir.empty() ? default_ledger_dir() : ledger_dir);
        auto records = ledger.query_history();
        if (records.empty()) {
            std::cout << "No downloads recorded in " << ledger.history_path() << std::endl;
            return 0;
        }

        for (const auto& record : records) {
            std::cout << format_timestamp(record.started_at) << "  "
                      << to_string(record.status) << "  "
                      << record.url;
            if (!record.download_path.empty()) {
                std::cout << " -> " << record.download_path;
            }
            if (record.file_size) {
                std::cout << " (" << format_bytes(*record.file_size) << ")";
            }
            if (record.error) {
                std::cout << "  [" << *record.error << "]";
            }
            std::cout << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "dnl " << version.to_string() << " - personal download manager\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (single URL)\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -n, --connections <N>   Connections per file (default: auto)\n";
    std::cout << "  -c, --config <FILE>     Load transfer settings from a JSON file\n";
    std::cout << "      --ledger <DIR>      Ledger directory (default: ~/.downloads)\n";
    std::cout << "      --sha256 <HEX>      Verify the downloaded file's SHA-256\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "      --history           Show download history\n";
    std::cout << "\n";
    std::cout << "SUPPORTED:\n";
    std::cout << "  http(s)://, webdav://, dav://, ftp://, sftp://, ssh://,\n";
    std::cout << "  HLS playlists (.m3u8) and video sites (through yt-dlp)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -n 8 https://example.com/large.iso\n";
    std::cout << "  " << program_name << " -d videos https://example.com/live/index.m3u8\n";
}

void print_version() noexcept {
    std::cout << "dnl " << version.to_string() << " (built " << BUILD_DATE << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL, spdlog, nlohmann-json\n";
}

} // namespace dnl::cli
