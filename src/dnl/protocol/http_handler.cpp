// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/http_handler.hpp>
#include <dnl/core/capability_probe.hpp>
#include <algorithm>

namespace dnl::protocol {

//=============================================================================
// HttpHandler
//=============================================================================

HttpHandler::HttpHandler(std::shared_ptr<core::DownloadEngine> engine)
    : engine_(std::move(engine)) {}

bool HttpHandler::can_handle(std::string_view url) const noexcept {
    try {
        auto scheme = scheme_of(url);
        return scheme == "http" || scheme == "https";
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::uint32_t HttpHandler::connections() const noexcept {
    return engine_->config().max_connections_per_file.value_or(
        core::CapabilityProbe::optimal_connection_count());
}

core::TransferRecord HttpHandler::download(const std::string& url,
                                           const std::string& destination,
                                           const TransferHooks& hooks,
                                           std::stop_token stop) {
    return run_engine(url, url, destination, hooks, std::move(stop));
}

core::TransferRecord HttpHandler::run_engine(const std::string& record_url,
                                             const std::string& fetch_url,
                                             const std::string& destination,
                                             const TransferHooks& hooks,
                                             std::stop_token stop) {
    core::DownloadOptions options;
    options.connections = connections();
    options.progress = hooks.on_progress;
    options.stop = std::move(stop);
    options.file_type = std::string(tag());
    if (hooks.on_start) {
        options.on_start = [&](const core::TransferRecord& record) {
            auto copy = record;
            copy.url = record_url;
            hooks.on_start(copy);
        };
    }

    auto result = engine_->download(fetch_url, destination, std::move(options));
    auto record = result ? std::move(*result) : std::move(result.error().record);
    record.url = record_url;
    return record;
}

//=============================================================================
// WebDavHandler
//=============================================================================

bool WebDavHandler::can_handle(std::string_view url) const noexcept {
    try {
        auto scheme = scheme_of(url);
        return scheme == "webdav" || scheme == "dav";
    } catch (const std::bad_alloc&) {
        return false;
    }
}

core::TransferRecord WebDavHandler::download(const std::string& url,
                                             const std::string& destination,
                                             const TransferHooks& hooks,
                                             std::stop_token stop) {
    return run_engine(url, translate(url), destination, hooks, std::move(stop));
}

std::string WebDavHandler::translate(std::string_view url) {
    auto scheme = scheme_of(url);
    auto rest = url.substr(std::min(url.size(), scheme.size()));
    if (scheme == "webdav") return "https" + std::string(rest);
    if (scheme == "dav") return "http" + std::string(rest);
    return std::string(url);
}

} // namespace dnl::protocol
