// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/streaming_handler.hpp>
#include <algorithm>
#include <vector>

namespace dnl::protocol {

StreamingHandler::StreamingHandler(core::TransferConfig config,
                                   std::shared_ptr<core::ConnectionLimiter> limiter,
                                   core::Logger logger)
    : config_(std::move(config))
    , limiter_(limiter ? std::move(limiter)
                       : std::make_shared<core::ConnectionLimiter>(config_.max_total_connections))
    , logger_(core::or_null(std::move(logger))) {}

std::expected<std::uint64_t, std::error_code>
StreamingHandler::append(core::HttpSession& session,
                         const std::string& url,
                         disk::FileWriter& writer,
                         std::uint64_t& offset,
                         core::ProgressAccumulator& progress,
                         std::stop_token stop,
                         const std::string& range) {
    auto permit = limiter_->acquire(stop);
    if (!permit) {
        return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
    }

    // Stream data is written in chunk_size blocks; offset only moves on disk writes
    const auto block = static_cast<std::size_t>(
        std::min<std::uint64_t>(config_.chunk_size, core::MAX_CHUNK_SIZE));
    std::vector<char> pending;
    pending.reserve(block);

    auto write_pending = [&]() -> std::error_code {
        if (pending.empty()) {
            return {};
        }
        if (auto ec = writer.write(offset, pending.data(), pending.size())) {
            return ec;
        }
        offset += pending.size();
        pending.clear();
        return {};
    };

    auto result = session.stream(url, [&](const char* data, std::size_t size) -> std::error_code {
        if (pending.size() + size > block) {
            if (auto ec = write_pending()) {
                return ec;
            }
        }
        if (size >= block) {
            if (auto ec = writer.write(offset, data, size)) {
                return ec;
            }
            offset += size;
        } else {
            pending.insert(pending.end(), data, data + size);
        }
        progress.add(size);
        return {};
    }, stop, range);

    if (!result) {
        return result;
    }
    if (auto ec = write_pending()) {
        return std::unexpected(ec);
    }
    return result;
}

void StreamingHandler::fail(core::TransferRecord& record, disk::FileWriter& writer,
                            std::error_code ec, const std::string& detail) const {
    writer.remove();
    std::string message = ec.message();
    if (!detail.empty()) {
        message += ": " + detail;
    }
    logger_->error("{}: {}", record.url, message);
    record.fail(std::move(message));
}

} // namespace dnl::protocol
