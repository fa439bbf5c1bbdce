// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/connection_limiter.hpp>
#include <dnl/core/error.hpp>
#include <dnl/core/http_session.hpp>
#include <dnl/core/log.hpp>
#include <dnl/core/progress.hpp>
#include <dnl/core/transfer_record.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace dnl::core {

// Result of a header-only probe
struct ResourceMetadata {
    std::optional<std::uint64_t> byte_length;   // unknown when the server omits it
    bool resumable{false};                      // server serves byte ranges
    std::string content_type;
    std::string filename;                       // suggested by the server or the URL
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;
    std::string effective_url;
};

// Failed transfer: the cause plus the terminal record (status failed)
struct DownloadFailure {
    std::error_code code;
    std::string detail;
    TransferRecord record;

    [[nodiscard]] std::string message() const {
        if (detail.empty()) return code.message();
        return code.message() + ": " + detail;
    }
};

// Called once with the `starting` record, before any network activity
using RecordSink = std::function<void(const TransferRecord&)>;

struct DownloadOptions {
    std::optional<std::uint32_t> connections;   // default: CapabilityProbe
    ProgressSink progress;
    RecordSink on_start;
    std::stop_token stop;
    std::string file_type{"http"};              // protocol tag on the record
};

// Multi-connection downloader for resources of known size
class DownloadEngine {
public:
    explicit DownloadEngine(TransferConfig config,
                            Logger logger = {},
                            std::shared_ptr<ConnectionLimiter> limiter = {});

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    // Header-only probe; byte_length may be empty
    [[nodiscard]] std::expected<ResourceMetadata, std::error_code>
    probe(const std::string& url) noexcept;

    // Probe that requires a known, positive byte length
    // (metadata_unavailable / unknown_size otherwise)
    [[nodiscard]] std::expected<ResourceMetadata, std::error_code>
    fetch_metadata(const std::string& url) noexcept;

    // Fetch `url` into `destination` with one concurrent range fetch per
    // planned chunk. On failure the destination does not exist afterwards.
    [[nodiscard]] std::expected<TransferRecord, DownloadFailure>
    download(const std::string& url,
             const std::string& destination,
             DownloadOptions options = {});

    // SHA-256 of the file equals `expected_hex` (case-insensitive).
    // An unreadable file is a mismatch.
    [[nodiscard]] bool verify_checksum(const std::string& path,
                                       std::string_view expected_hex) const noexcept;

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<ConnectionLimiter>& limiter() const noexcept { return limiter_; }

private:
    TransferConfig config_;
    Logger logger_;
    std::shared_ptr<ConnectionLimiter> limiter_;
    HttpSession http_session_;
};

} // namespace dnl::core
