// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/version.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace dnl::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;           // 1 MiB
constexpr std::uint64_t MIN_CHUNK_SIZE = 1024 * 1024;               // 1 MiB
constexpr std::uint64_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;          // 16 MiB
constexpr std::uint32_t MIN_CONNECTIONS = 4;
constexpr std::uint32_t MAX_CONNECTIONS = 16;
constexpr std::uint32_t MAX_PLAN_CONNECTIONS = 64;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t READ_TIMEOUT_SEC = 30;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::uint32_t CONCURRENT_DOWNLOADS = 3;
constexpr std::uint32_t TOTAL_CONNECTIONS = 32;

constexpr std::chrono::milliseconds RETRY_BASE_DELAY{200};
constexpr std::chrono::milliseconds RETRY_MAX_DELAY{5000};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{100};

constexpr std::size_t IO_BUFFER_SIZE = 8 * 1024;                    // 8 KiB
constexpr std::size_t MAX_PLAYLIST_SIZE = 4 * 1024 * 1024;

constexpr std::uint32_t MAX_REDIRECTS = 10;

// Transfer settings consumed read-only by the engine and handlers
struct TransferConfig {
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_concurrent_downloads{CONCURRENT_DOWNLOADS};
    std::uint32_t max_retries{RETRY_COUNT};
    std::uint32_t connection_timeout{CONNECTION_TIMEOUT_SEC};   // seconds
    std::uint32_t read_timeout{READ_TIMEOUT_SEC};               // seconds without data
    std::optional<std::uint32_t> max_connections_per_file;      // unset: host default
    std::uint32_t max_total_connections{TOTAL_CONNECTIONS};
    bool verify_ssl{true};
    bool follow_redirects{true};
    std::string user_agent{USER_AGENT};
    std::optional<std::string> proxy;
    std::size_t buffer_size{IO_BUFFER_SIZE};
};

void to_json(nlohmann::json& j, const TransferConfig& cfg);

// Absent keys keep their value from `base`; a key with the wrong type is an error.
[[nodiscard]] std::expected<TransferConfig, std::error_code>
config_from_json(const nlohmann::json& j, TransferConfig base = {}) noexcept;

[[nodiscard]] std::expected<TransferConfig, std::error_code>
load_config(std::string_view path, TransferConfig base = {}) noexcept;

} // namespace dnl::core
