// Copyright (c) 2026 changcheng967. All rights reserved.

// libcurl plumbing shared by HttpSession and RangeFetcher. Not installed.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/error.hpp>
#include <curl/curl.h>
#include <atomic>
#include <map>
#include <string>
#include <system_error>

namespace dnl::core::detail {

// RAII curl easy handle
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() : ptr(curl_easy_init()) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }

    explicit operator bool() const noexcept { return ptr != nullptr; }
};

// URL, timeouts, TLS, redirects, user agent and proxy from `config`.
// `url` must outlive the transfer.
void apply_common_options(CURL* curl, const std::string& url, const TransferConfig& config) noexcept;

// Abort the transfer from the xferinfo callback when the flag is set
void install_abort_flag(CURL* curl, const std::atomic<bool>* flag) noexcept;

// Collect lower-cased response headers; reset on each new status line so
// only the final response's headers survive redirects
void install_header_collector(CURL* curl, std::map<std::string, std::string>* headers) noexcept;

[[nodiscard]] std::error_code curl_error_code(CURLcode code) noexcept;
[[nodiscard]] bool curl_error_transient(CURLcode code) noexcept;

// 0 for statuses below 400
[[nodiscard]] std::error_code http_status_error(long status) noexcept;

// CURLOPT_BUFFERSIZE accepts 1 KiB up to CURL_MAX_READ_SIZE
[[nodiscard]] inline long curl_buffer_size(std::size_t requested) noexcept {
    constexpr std::size_t min_size = 1024;
    constexpr std::size_t max_size = CURL_MAX_READ_SIZE;
    return static_cast<long>(requested < min_size ? min_size : (requested > max_size ? max_size : requested));
}

[[nodiscard]] bool is_http_scheme(const std::string& url) noexcept;

} // namespace dnl::core::detail
