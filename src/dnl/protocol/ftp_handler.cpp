// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/ftp_handler.hpp>

namespace dnl::protocol {

FtpHandler::FtpHandler(core::TransferConfig config,
                       std::shared_ptr<core::ConnectionLimiter> limiter,
                       core::Logger logger)
    : StreamingHandler(std::move(config), std::move(limiter), std::move(logger)) {}

bool FtpHandler::can_handle(std::string_view url) const noexcept {
    try {
        auto scheme = scheme_of(url);
        return scheme == "ftp" || scheme == "sftp" || scheme == "ssh";
    } catch (const std::bad_alloc&) {
        return false;
    }
}

core::TransferRecord FtpHandler::download(const std::string& url,
                                          const std::string& destination,
                                          const TransferHooks& hooks,
                                          std::stop_token stop) {
    auto record = core::TransferRecord::start(url, std::string(tag()), destination);
    if (hooks.on_start) {
        hooks.on_start(record);
    }

    // libcurl knows ssh transfers as sftp
    std::string fetch_url = url;
    if (scheme_of(url) == "ssh") {
        fetch_url = "sftp" + url.substr(3);
    }

    disk::FileWriter writer;
    if (stop.stop_requested()) {
        fail(record, writer, make_error_code(core::DownloadErrc::cancelled));
        return record;
    }

    core::HttpSession session(config_);

    // Size is advisory here; servers that refuse SIZE still stream
    std::uint64_t expected_size = 0;
    if (auto head = session.head(fetch_url); head && head->content_length) {
        expected_size = *head->content_length;
        record.file_size = expected_size;
    } else if (!head) {
        logger_->debug("{}: size probe failed: {}", url, head.error().message());
    }

    if (auto ec = writer.open_stream(destination)) {
        fail(record, writer, ec, destination);
        return record;
    }

    record.advance(core::TransferStatus::downloading);
    logger_->info("downloading {} -> {}", url, destination);

    core::ProgressAccumulator progress(expected_size, hooks.on_progress);
    std::uint64_t offset = 0;
    auto result = append(session, fetch_url, writer, offset, progress, stop);
    if (!result) {
        fail(record, writer, result.error());
        return record;
    }
    if (expected_size > 0 && *result != expected_size) {
        fail(record, writer, make_error_code(core::DownloadErrc::size_mismatch),
             "expected " + std::to_string(expected_size) + " bytes, got " + std::to_string(*result));
        return record;
    }
    if (auto ec = writer.flush()) {
        fail(record, writer, ec, destination);
        return record;
    }
    writer.close();

    progress.flush();
    record.file_size = *result;
    record.speed = core::format_speed(progress.snapshot().speed_bps);
    record.complete();
    logger_->info("completed {} ({})", destination, core::format_bytes(*result));
    return record;
}

} // namespace dnl::protocol
