// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/download_engine.hpp>
#include <dnl/protocol/handler.hpp>
#include <memory>

namespace dnl::protocol {

// http:// and https:// through the multi-connection engine
class HttpHandler : public ProtocolHandler {
public:
    explicit HttpHandler(std::shared_ptr<core::DownloadEngine> engine);

    [[nodiscard]] std::string_view tag() const noexcept override { return "http"; }
    [[nodiscard]] bool can_handle(std::string_view url) const noexcept override;
    [[nodiscard]] core::TransferRecord download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) override;

    // max_connections_per_file when configured, the host default otherwise
    [[nodiscard]] std::uint32_t connections() const noexcept;

protected:
    [[nodiscard]] core::TransferRecord run_engine(const std::string& record_url,
                                                  const std::string& fetch_url,
                                                  const std::string& destination,
                                                  const TransferHooks& hooks,
                                                  std::stop_token stop);

    std::shared_ptr<core::DownloadEngine> engine_;
};

// webdav:// (served as https) and dav:// (served as http). Records keep the
// original URL.
class WebDavHandler : public HttpHandler {
public:
    using HttpHandler::HttpHandler;

    [[nodiscard]] std::string_view tag() const noexcept override { return "webdav"; }
    [[nodiscard]] bool can_handle(std::string_view url) const noexcept override;
    [[nodiscard]] core::TransferRecord download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) override;

    // webdav://h/p -> https://h/p, dav://h/p -> http://h/p
    [[nodiscard]] static std::string translate(std::string_view url);
};

} // namespace dnl::protocol
