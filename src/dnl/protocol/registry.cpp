// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/registry.hpp>
#include <dnl/protocol/ftp_handler.hpp>
#include <dnl/protocol/hls_handler.hpp>
#include <dnl/protocol/http_handler.hpp>
#include <dnl/protocol/torrent_handler.hpp>
#include <dnl/protocol/video_site_handler.hpp>
#include <thread>

namespace dnl::protocol {

//=============================================================================
// ProtocolRegistry
//=============================================================================

ProtocolRegistry::ProtocolRegistry(std::uint32_t max_concurrent_downloads, core::Logger logger)
    : transfer_slots_(max_concurrent_downloads)
    , logger_(core::or_null(std::move(logger))) {}

void ProtocolRegistry::add(std::unique_ptr<ProtocolHandler> handler) {
    if (handler) {
        handlers_.push_back(std::move(handler));
    }
}

std::expected<ProtocolHandler*, std::error_code>
ProtocolRegistry::resolve(std::string_view url) const noexcept {
    for (const auto& handler : handlers_) {
        if (handler->can_handle(url)) {
            return handler.get();
        }
    }
    return std::unexpected(make_error_code(core::DownloadErrc::no_handler));
}

std::expected<core::TransferRecord, std::error_code>
ProtocolRegistry::dispatch(const std::string& url,
                           const std::string& destination,
                           const TransferHooks& hooks,
                           std::stop_token stop) {
    auto handler = resolve(url);
    if (!handler) {
        logger_->error("{}: {}", url, handler.error().message());
        return std::unexpected(handler.error());
    }

    auto slot = transfer_slots_.acquire(stop);
    if (!slot) {
        return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
    }

    logger_->debug("{} -> {} handler", url, (*handler)->tag());
    return (*handler)->download(url, destination, hooks, stop);
}

std::vector<std::expected<core::TransferRecord, std::error_code>>
ProtocolRegistry::dispatch_batch(const std::vector<std::string>& urls,
                                 const std::string& directory,
                                 const HooksFactory& hooks,
                                 std::stop_token stop) {
    std::vector<std::expected<core::TransferRecord, std::error_code>> results(
        urls.size(), std::unexpected(make_error_code(core::DownloadErrc::cancelled)));

    {
        // dispatch() holds the transfer slot, so one thread per URL is bounded
        // by max_concurrent_downloads in terms of active transfers
        std::vector<std::jthread> workers;
        workers.reserve(urls.size());
        for (std::size_t i = 0; i < urls.size(); ++i) {
            auto handler = resolve(urls[i]);
            if (!handler) {
                logger_->error("{}: {}", urls[i], handler.error().message());
                results[i] = std::unexpected(handler.error());
                continue;
            }
            auto destination = (*handler)->destination_for(urls[i], directory);
            workers.emplace_back([&, i, destination = std::move(destination)] {
                auto transfer_hooks = hooks ? hooks(urls[i]) : TransferHooks{};
                results[i] = dispatch(urls[i], destination, transfer_hooks, stop);
            });
        }
    }
    return results;
}

//=============================================================================
// Default registry
//=============================================================================

std::unique_ptr<ProtocolRegistry>
make_default_registry(const core::TransferConfig& config, core::Logger logger) {
    logger = core::or_null(std::move(logger));
    auto limiter = std::make_shared<core::ConnectionLimiter>(config.max_total_connections);
    auto engine = std::make_shared<core::DownloadEngine>(config, logger, limiter);

    auto registry = std::make_unique<ProtocolRegistry>(config.max_concurrent_downloads, logger);
    registry->add(std::make_unique<VideoSiteHandler>(config, logger));
    registry->add(std::make_unique<HlsHandler>(config, limiter, logger));
    registry->add(std::make_unique<TorrentHandler>(config, logger));
    registry->add(std::make_unique<FtpHandler>(config, limiter, logger));
    registry->add(std::make_unique<WebDavHandler>(engine));
    registry->add(std::make_unique<HttpHandler>(engine));
    return registry;
}

} // namespace dnl::protocol
