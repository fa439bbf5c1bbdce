// Copyright (c) 2026 changcheng967. All rights reserved.

#include "curl_support.hpp"
#include <dnl/core/url.hpp>
#include <atomic>
#include <string_view>

namespace dnl::core::detail {

namespace {

int abort_flag_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* flag = static_cast<const std::atomic<bool>*>(userdata);
    // Non-zero aborts with CURLE_ABORTED_BY_CALLBACK
    return flag && flag->load(std::memory_order_acquire) ? 1 : 0;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    try {
        std::string_view header(buffer, total);
        if (header.starts_with("HTTP/")) {
            headers->clear();
            return total;
        }

        auto colon = header.find(':');
        if (colon == std::string_view::npos) return total;

        auto name = header.substr(0, colon);
        auto value = header.substr(colon + 1);

        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n'
                                  || value.back() == ' ')) {
            value.remove_suffix(1);
        }

        (*headers)[to_lower(name)] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

} // namespace

void apply_common_options(CURL* curl, const std::string& url, const TransferConfig& config) noexcept {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connection_timeout));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config.read_timeout));

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_ssl ? 2L : 0L);

    if (config.follow_redirects) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
    if (config.proxy) {
        curl_easy_setopt(curl, CURLOPT_PROXY, config.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
}

void install_abort_flag(CURL* curl, const std::atomic<bool>* flag) noexcept {
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_flag_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(flag));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

void install_header_collector(CURL* curl, std::map<std::string, std::string>* headers) noexcept {
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, headers);
}

std::error_code curl_error_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_FILE_COULDNT_READ_FILE:
            return make_error_code(DownloadErrc::not_found);
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:
            return make_error_code(DownloadErrc::permission_denied);
        case CURLE_RANGE_ERROR:
        case CURLE_BAD_DOWNLOAD_RESUME:
            return make_error_code(DownloadErrc::malformed_range);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

bool curl_error_transient(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

std::error_code http_status_error(long status) noexcept {
    if (status < 400) return {};
    if (status == 404 || status == 410) return make_error_code(DownloadErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(DownloadErrc::permission_denied);
    if (status == 416) return make_error_code(DownloadErrc::malformed_range);
    if (status >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::client_error);
}

bool is_http_scheme(const std::string& url) noexcept {
    return url.starts_with("http://") || url.starts_with("https://")
        || url.starts_with("HTTP://") || url.starts_with("HTTPS://");
}

} // namespace dnl::core::detail
