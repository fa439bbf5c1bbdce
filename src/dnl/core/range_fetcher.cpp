// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/range_fetcher.hpp>
#include "curl_support.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace dnl::core {

namespace {

struct AttemptState {
    CURL* curl{nullptr};
    disk::FileWriter* writer{nullptr};
    ProgressAccumulator* progress{nullptr};
    std::int64_t start{0};
    std::uint64_t length{0};
    std::uint64_t written{0};
    std::uint64_t* high_water{nullptr};
    bool http{false};
    bool whole_resource{false};
    bool status_checked{false};
    std::optional<FetchError> failure;
};

FetchError permanent(std::error_code code, std::string detail = {}) {
    return FetchError{FetchErrorKind::permanent, code, std::move(detail)};
}

FetchError transient(std::error_code code, std::string detail = {}) {
    return FetchError{FetchErrorKind::transient, code, std::move(detail)};
}

// libcurl write callback
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* st = static_cast<AttemptState*>(userdata);
    std::size_t bytes = size * nmemb;

    try {
        if (!st->status_checked) {
            st->status_checked = true;
            if (st->http) {
                long http_code = 0;
                curl_easy_getinfo(st->curl, CURLINFO_RESPONSE_CODE, &http_code);
                // A 200 to a partial request means the server ignored Range
                if (http_code != 206 && !(http_code == 200 && st->whole_resource)) {
                    st->failure = permanent(make_error_code(DownloadErrc::malformed_range),
                                            "status " + std::to_string(http_code));
                    return 0;
                }
            }
        }

        if (st->written + bytes > st->length) {
            st->failure = permanent(make_error_code(DownloadErrc::malformed_range),
                                    "response longer than requested range");
            return 0;
        }

        auto offset = static_cast<std::uint64_t>(st->start) + st->written;
        if (auto ec = st->writer->write(offset, ptr, bytes)) {
            st->failure = permanent(ec);
            return 0;
        }
    } catch (const std::bad_alloc&) {
        return 0;
    }

    st->written += bytes;
    // Bytes below the high-water mark were already credited by an earlier attempt
    if (st->written > *st->high_water) {
        st->progress->add(st->written - *st->high_water);
        *st->high_water = st->written;
    }
    return bytes;
}

bool status_transient(long status) noexcept {
    return status >= 500 || status == 408 || status == 429;
}

} // namespace

//=============================================================================
// RangeFetcher
//=============================================================================

RangeFetcher::RangeFetcher(const TransferConfig& config,
                           std::shared_ptr<ConnectionLimiter> limiter,
                           Logger logger)
    : config_(config)
    , limiter_(std::move(limiter))
    , logger_(or_null(std::move(logger))) {}

std::chrono::milliseconds RangeFetcher::backoff_delay(std::uint32_t attempt) noexcept {
    auto delay = RETRY_BASE_DELAY;
    for (std::uint32_t i = 0; i < attempt && delay < RETRY_MAX_DELAY; ++i) {
        delay *= 2;
    }
    return std::min(delay, RETRY_MAX_DELAY);
}

std::expected<std::uint64_t, FetchError>
RangeFetcher::fetch(const std::string& url,
                    const ChunkRange& range,
                    disk::FileWriter& writer,
                    ProgressAccumulator& progress,
                    std::stop_token stop) const noexcept {
    if (range.empty()) {
        return 0;
    }

    std::uint64_t high_water = 0;
    const FetchError cancelled = permanent(make_error_code(DownloadErrc::cancelled));

    for (std::uint32_t attempt_no = 0;; ++attempt_no) {
        if (stop.stop_requested()) {
            return std::unexpected(cancelled);
        }

        std::optional<ConnectionLimiter::Permit> permit;
        if (limiter_) {
            permit = limiter_->acquire(stop);
            if (!permit) {
                return std::unexpected(cancelled);
            }
        }

        auto result = attempt(url, range, writer, progress, high_water, stop);
        permit.reset();

        if (result) {
            if (attempt_no > 0) {
                logger_->debug("chunk {} completed after {} retries", range.index, attempt_no);
            }
            return result;
        }
        if (!result.error().transient() || attempt_no >= config_.max_retries) {
            logger_->debug("chunk {} failed: {}", range.index, result.error().message());
            return result;
        }

        auto delay = backoff_delay(attempt_no);
        logger_->warn("chunk {} [{}-{}]: {}, retry {}/{} in {} ms",
                      range.index, range.start, range.end, result.error().message(),
                      attempt_no + 1, config_.max_retries, delay.count());

        // Interruptible sleep: wakes early on stop
        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock(mutex);
        cv.wait_for(lock, stop, delay, [] { return false; });
    }
}

std::expected<std::uint64_t, FetchError>
RangeFetcher::attempt(const std::string& url,
                      const ChunkRange& range,
                      disk::FileWriter& writer,
                      ProgressAccumulator& progress,
                      std::uint64_t& high_water,
                      std::stop_token stop) const noexcept {
    detail::CurlHandle curl;
    if (!curl) {
        return std::unexpected(transient(make_error_code(DownloadErrc::network_error), "curl_easy_init"));
    }

    std::atomic<bool> abort{false};
    std::stop_callback on_stop(stop, [&abort] { abort.store(true, std::memory_order_release); });

    AttemptState st;
    st.curl = curl.ptr;
    st.writer = &writer;
    st.progress = &progress;
    st.start = range.start;
    st.length = range.length();
    st.high_water = &high_water;
    st.http = detail::is_http_scheme(url);
    st.whole_resource = range.start == 0 && progress.total() == range.length();

    std::string range_header;
    try {
        range_header = std::to_string(range.start) + "-" + std::to_string(range.end);
    } catch (const std::bad_alloc&) {
        return std::unexpected(permanent(std::make_error_code(std::errc::not_enough_memory)));
    }

    detail::apply_common_options(curl.ptr, url, config_);
    curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range_header.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE,
                     detail::curl_buffer_size(config_.buffer_size));
    detail::install_abort_flag(curl.ptr, &abort);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (st.failure) {
        return std::unexpected(std::move(*st.failure));
    }
    if (result == CURLE_ABORTED_BY_CALLBACK || abort.load(std::memory_order_acquire)) {
        return std::unexpected(permanent(make_error_code(DownloadErrc::cancelled)));
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        auto ec = detail::http_status_error(http_code);
        std::string what = "HTTP " + std::to_string(http_code);
        return std::unexpected(status_transient(http_code) ? transient(ec, std::move(what))
                                                          : permanent(ec, std::move(what)));
    }
    if (result != CURLE_OK) {
        auto ec = detail::curl_error_code(result);
        std::string what = curl_easy_strerror(result);
        return std::unexpected(detail::curl_error_transient(result) ? transient(ec, std::move(what))
                                                                   : permanent(ec, std::move(what)));
    }

    // A short body is reported as is; the engine compares the byte sum
    return st.written;
}

} // namespace dnl::core
