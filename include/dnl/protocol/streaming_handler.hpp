// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/connection_limiter.hpp>
#include <dnl/core/http_session.hpp>
#include <dnl/core/log.hpp>
#include <dnl/core/progress.hpp>
#include <dnl/disk/file_writer.hpp>
#include <dnl/protocol/handler.hpp>
#include <memory>

namespace dnl::protocol {

// Base for handlers that move bytes over one sequential connection
// (ftp/sftp, HLS segments)
class StreamingHandler : public ProtocolHandler {
protected:
    StreamingHandler(core::TransferConfig config,
                     std::shared_ptr<core::ConnectionLimiter> limiter,
                     core::Logger logger);

    // Append one response body to `writer` at `offset`, advancing `offset`.
    // Writes go to disk in chunk_size blocks. Holds a connection permit for
    // the duration of the request.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    append(core::HttpSession& session,
           const std::string& url,
           disk::FileWriter& writer,
           std::uint64_t& offset,
           core::ProgressAccumulator& progress,
           std::stop_token stop,
           const std::string& range = {});

    // Delete the partial output and mark the record failed
    void fail(core::TransferRecord& record, disk::FileWriter& writer,
              std::error_code ec, const std::string& detail = {}) const;

    core::TransferConfig config_;
    std::shared_ptr<core::ConnectionLimiter> limiter_;
    core::Logger logger_;
};

} // namespace dnl::protocol
