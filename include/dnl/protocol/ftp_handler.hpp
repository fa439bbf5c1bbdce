// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/protocol/streaming_handler.hpp>

namespace dnl::protocol {

// ftp://, sftp:// and ssh:// (treated as sftp) over one libcurl connection
class FtpHandler : public StreamingHandler {
public:
    FtpHandler(core::TransferConfig config,
               std::shared_ptr<core::ConnectionLimiter> limiter,
               core::Logger logger = {});

    [[nodiscard]] std::string_view tag() const noexcept override { return "ftp"; }
    [[nodiscard]] bool can_handle(std::string_view url) const noexcept override;
    [[nodiscard]] core::TransferRecord download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) override;
};

} // namespace dnl::protocol
