// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace dnl::core {

// Response to a header-only probe
struct HttpResponse {
    std::int32_t status_code{0};                 // 0 for non-HTTP schemes
    std::map<std::string, std::string> headers;  // lower-cased names
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string etag;
    std::string last_modified;
    std::string content_type;
    std::string filename;                        // From Content-Disposition
    std::string effective_url;                   // After redirects
};

// Receives body bytes; a non-zero error aborts the transfer
using BodySink = std::function<std::error_code(const char* data, std::size_t size)>;

// Single-connection requests through libcurl. Every request honors the
// TransferConfig (timeouts, TLS verification, redirects, user agent, proxy).
class HttpSession {
public:
    explicit HttpSession(TransferConfig config);

    // HEAD for http(s); libcurl's header-only mode for file/ftp
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept;

    // Small in-memory GET, fails once the body exceeds `max_bytes`
    [[nodiscard]] std::expected<std::string, std::error_code>
    fetch_text(const std::string& url, std::size_t max_bytes = MAX_PLAYLIST_SIZE) noexcept;

    // GET delivering the body to `sink`. Returns the byte count delivered.
    // `range` is an inclusive "first-last" byte range, empty for the whole body.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    stream(const std::string& url, const BodySink& sink, std::stop_token stop = {},
           const std::string& range = {}) noexcept;

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

    // Parse "attachment; filename=file.zip"
    [[nodiscard]] static std::string parse_content_disposition(std::string_view value);

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    TransferConfig config_;
};

} // namespace dnl::core
