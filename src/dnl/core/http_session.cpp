// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/http_session.hpp>
#include <dnl/core/url.hpp>
#include "curl_support.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>

namespace dnl::core {

namespace {

using detail::CurlHandle;

// Write callback for fetch_text (stores data)
struct TextBuffer {
    std::string data;
    std::size_t limit{0};
    bool overflow{false};
};

std::size_t text_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    auto* buf = static_cast<TextBuffer*>(userdata);
    std::size_t total = size * nitems;
    if (buf->data.size() + total > buf->limit) {
        buf->overflow = true;
        return 0;
    }
    try {
        buf->data.append(ptr, total);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

struct StreamState {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    std::uint64_t delivered{0};
    bool expect_partial{false};
    std::error_code sink_error;
};

std::size_t stream_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    auto* state = static_cast<StreamState*>(userdata);
    std::size_t total = size * nitems;

    // A ranged request answered with anything but 206 carries the wrong bytes
    if (state->expect_partial && state->delivered == 0) {
        long http_code = 0;
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != 206) {
            state->sink_error = make_error_code(DownloadErrc::malformed_range);
            return 0;
        }
    }

    try {
        if (auto ec = (*state->sink)(ptr, total)) {
            state->sink_error = ec;
            return 0;
        }
    } catch (const std::exception&) {
        state->sink_error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    state->delivered += total;
    return total;
}

// Map the outcome of curl_easy_perform plus the HTTP status
std::error_code perform_error(CURL* curl, CURLcode result) noexcept {
    if (result != CURLE_OK) {
        return detail::curl_error_code(result);
    }
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    return detail::http_status_error(http_code);
}

std::optional<std::uint64_t> parse_length(const std::string& text) noexcept {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    unsigned long long val = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size() || text.front() == '-') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(val);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(TransferConfig config)
    : config_(std::move(config)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    CurlHandle curl;
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    try {
        HttpResponse response{};

        detail::apply_common_options(curl.ptr, url, config_);
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_FILETIME, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 0L);
        detail::install_header_collector(curl.ptr, &response.headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (auto ec = perform_error(curl.ptr, result)) {
            return std::unexpected(ec);
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        char* effective = nullptr;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            response.effective_url = effective;
        } else {
            response.effective_url = url;
        }

        // Header first; libcurl's own figure covers file:// and ftp://
        if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
            response.content_length = parse_length(it->second);
        }
        if (!response.content_length) {
            curl_off_t cl = -1;
            if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
                response.content_length = static_cast<std::uint64_t>(cl);
            }
        }

        if (auto it = response.headers.find("content-type"); it != response.headers.end()) {
            response.content_type = it->second;
        }
        if (auto it = response.headers.find("etag"); it != response.headers.end()) {
            response.etag = it->second;
        }
        if (auto it = response.headers.find("last-modified"); it != response.headers.end()) {
            response.last_modified = it->second;
        }

        auto ar_it = response.headers.find("accept-ranges");
        response.accepts_ranges = ar_it != response.headers.end()
            && to_lower(ar_it->second).find("bytes") != std::string::npos;

        if (auto it = response.headers.find("content-disposition"); it != response.headers.end()) {
            response.filename = parse_content_disposition(it->second);
        }

        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::string, std::error_code>
HttpSession::fetch_text(const std::string& url, std::size_t max_bytes) noexcept {
    CurlHandle curl;
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    TextBuffer buffer;
    buffer.limit = max_bytes;

    detail::apply_common_options(curl.ptr, url, config_);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, text_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &buffer);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (buffer.overflow) {
        return std::unexpected(make_error_code(DownloadErrc::unsupported_stream));
    }
    if (auto ec = perform_error(curl.ptr, result)) {
        return std::unexpected(ec);
    }
    return std::move(buffer.data);
}

std::expected<std::uint64_t, std::error_code>
HttpSession::stream(const std::string& url, const BodySink& sink, std::stop_token stop,
                    const std::string& range) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    CurlHandle curl;
    if (!curl) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    std::atomic<bool> abort{false};
    std::stop_callback on_stop(stop, [&abort] { abort.store(true, std::memory_order_release); });

    StreamState state;
    state.curl = curl.ptr;
    state.sink = &sink;
    state.expect_partial = !range.empty() && detail::is_http_scheme(url);

    detail::apply_common_options(curl.ptr, url, config_);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, stream_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &state);
    if (!range.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE,
                     detail::curl_buffer_size(config_.buffer_size));
    // Fail on HTTP errors instead of streaming an error page into the sink
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    detail::install_abort_flag(curl.ptr, &abort);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (state.sink_error) {
        return std::unexpected(state.sink_error);
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        return std::unexpected(detail::http_status_error(http_code));
    }
    if (auto ec = perform_error(curl.ptr, result)) {
        return std::unexpected(ec);
    }
    return state.delivered;
}

std::string HttpSession::parse_content_disposition(std::string_view value) {
    auto filename_pos = value.find("filename=");
    if (filename_pos == std::string_view::npos) {
        return {};
    }
    auto filename = value.substr(filename_pos + 9);
    if (auto semi = filename.find(';'); semi != std::string_view::npos) {
        filename = filename.substr(0, semi);
    }
    // Remove quotes if present
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'')
        && filename.back() == filename.front()) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }
    // Never let a server pick a directory
    if (auto slash = filename.find_last_of("/\\"); slash != std::string_view::npos) {
        filename = filename.substr(slash + 1);
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace dnl::core
