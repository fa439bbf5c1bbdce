// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dnl::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir{"."};
    std::string output_file;
    std::optional<std::uint32_t> connections;
    std::string config_path;
    std::string ledger_dir;          // empty: default_ledger_dir()
    std::string sha256;
    bool info{false};
    bool history{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors; // unknown options, missing values
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// $HOME/.downloads, or ./.downloads without a home directory
[[nodiscard]] std::string default_ledger_dir();

// Host-tuned defaults, overlaid with --config and --connections
[[nodiscard]] std::expected<core::TransferConfig, std::error_code>
resolve_config(const CliArgs& args) noexcept;

// Download every URL in `args`. 0 only when all transfers completed
// (and matched --sha256 when given).
[[nodiscard]] CliResult download(const CliArgs& args, std::stop_token stop) noexcept;

// Show resource metadata without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::TransferConfig& config) noexcept;

// Print the persisted transfer history
[[nodiscard]] CliResult history(const std::string& ledger_dir) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace dnl::cli
