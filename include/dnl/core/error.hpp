// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <system_error>
#include <string>
#include <string_view>

namespace dnl::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    client_error,
    server_error,
    permission_denied,
    invalid_url,
    malformed_range,
    ssl_error,
    dns_error,
    too_many_redirects,
    cancelled,
    metadata_unavailable,
    unknown_size,
    invalid_plan,
    chunk_fetch_failed,
    size_mismatch,
    checksum_mismatch,
    no_handler,
    ledger_io,
    helper_unavailable,
    unsupported_stream,
    invalid_torrent,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "dnl::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::client_error:         return "Request rejected (4xx)";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::permission_denied:    return "Permission denied";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::malformed_range:      return "Malformed range response";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::metadata_unavailable: return "Resource metadata unavailable";
            case DownloadErrc::unknown_size:         return "Resource size unknown";
            case DownloadErrc::invalid_plan:         return "Invalid chunk plan";
            case DownloadErrc::chunk_fetch_failed:   return "Chunk fetch failed";
            case DownloadErrc::size_mismatch:        return "Download size mismatch";
            case DownloadErrc::checksum_mismatch:    return "Checksum mismatch";
            case DownloadErrc::no_handler:           return "No handler for resource";
            case DownloadErrc::ledger_io:            return "Ledger persistence failed";
            case DownloadErrc::helper_unavailable:   return "External helper not available";
            case DownloadErrc::unsupported_stream:   return "Unsupported stream";
            case DownloadErrc::invalid_torrent:      return "Invalid torrent metadata";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Per-chunk failure. Transient failures are retried inside RangeFetcher.
enum class FetchErrorKind : std::uint8_t {
    transient,
    permanent
};

struct FetchError {
    FetchErrorKind kind{FetchErrorKind::permanent};
    std::error_code code;
    std::string detail;

    [[nodiscard]] bool transient() const noexcept { return kind == FetchErrorKind::transient; }

    [[nodiscard]] std::string message() const {
        if (detail.empty()) return code.message();
        return code.message() + ": " + detail;
    }
};

} // namespace dnl::core

namespace std {

template<>
struct is_error_code_enum<dnl::core::DownloadErrc> : true_type {};

} // namespace std
