// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/config.hpp>
#include <dnl/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <type_traits>

namespace dnl::core {

namespace {

template<typename T>
bool read_key(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) return false;
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) return false;
    } else {
        if (!it->is_number_unsigned()) return false;
    }
    out = it->get<T>();
    return true;
}

} // namespace

void to_json(nlohmann::json& j, const TransferConfig& cfg) {
    j = nlohmann::json{
        {"chunk_size", cfg.chunk_size},
        {"max_concurrent_downloads", cfg.max_concurrent_downloads},
        {"max_retries", cfg.max_retries},
        {"connection_timeout", cfg.connection_timeout},
        {"read_timeout", cfg.read_timeout},
        {"max_total_connections", cfg.max_total_connections},
        {"verify_ssl", cfg.verify_ssl},
        {"follow_redirects", cfg.follow_redirects},
        {"user_agent", cfg.user_agent},
        {"buffer_size", cfg.buffer_size},
    };
    if (cfg.max_connections_per_file) {
        j["max_connections_per_file"] = *cfg.max_connections_per_file;
    } else {
        j["max_connections_per_file"] = nullptr;
    }
    if (cfg.proxy) {
        j["proxy"] = *cfg.proxy;
    } else {
        j["proxy"] = nullptr;
    }
}

std::expected<TransferConfig, std::error_code>
config_from_json(const nlohmann::json& j, TransferConfig base) noexcept {
    const auto invalid = std::make_error_code(std::errc::invalid_argument);
    if (!j.is_object()) {
        return std::unexpected(invalid);
    }

    try {
        TransferConfig cfg = std::move(base);
        bool ok = read_key(j, "chunk_size", cfg.chunk_size)
               && read_key(j, "max_concurrent_downloads", cfg.max_concurrent_downloads)
               && read_key(j, "max_retries", cfg.max_retries)
               && read_key(j, "connection_timeout", cfg.connection_timeout)
               && read_key(j, "read_timeout", cfg.read_timeout)
               && read_key(j, "max_total_connections", cfg.max_total_connections)
               && read_key(j, "verify_ssl", cfg.verify_ssl)
               && read_key(j, "follow_redirects", cfg.follow_redirects)
               && read_key(j, "user_agent", cfg.user_agent)
               && read_key(j, "buffer_size", cfg.buffer_size);
        if (!ok) {
            return std::unexpected(invalid);
        }

        std::string proxy;
        if (!read_key(j, "proxy", proxy)) {
            return std::unexpected(invalid);
        }
        if (!proxy.empty()) {
            cfg.proxy = std::move(proxy);
        }

        std::uint32_t per_file = 0;
        if (!read_key(j, "max_connections_per_file", per_file)) {
            return std::unexpected(invalid);
        }
        if (auto it = j.find("max_connections_per_file"); it != j.end() && !it->is_null()) {
            if (per_file == 0) {
                return std::unexpected(invalid);
            }
            cfg.max_connections_per_file = per_file;
        }

        // Zero would stall the semaphores and the planner
        if (cfg.max_concurrent_downloads == 0 || cfg.max_total_connections == 0
            || cfg.buffer_size == 0 || cfg.chunk_size == 0) {
            return std::unexpected(invalid);
        }
        return cfg;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(invalid);
    }
}

std::expected<TransferConfig, std::error_code>
load_config(std::string_view path, TransferConfig base) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        auto j = nlohmann::json::parse(file, nullptr, false);
        if (j.is_discarded()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }
        return config_from_json(j, std::move(base));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace dnl::core
