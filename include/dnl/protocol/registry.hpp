// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/connection_limiter.hpp>
#include <dnl/core/download_engine.hpp>
#include <dnl/core/log.hpp>
#include <dnl/protocol/handler.hpp>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace dnl::protocol {

// Per-URL hooks for dispatch_batch
using HooksFactory = std::function<TransferHooks(const std::string& url)>;

// Ordered handler list; the first handler whose predicate matches wins.
// Registration order is the priority and is fixed once built.
class ProtocolRegistry {
public:
    explicit ProtocolRegistry(std::uint32_t max_concurrent_downloads = core::CONCURRENT_DOWNLOADS,
                              core::Logger logger = {});

    ProtocolRegistry(const ProtocolRegistry&) = delete;
    ProtocolRegistry& operator=(const ProtocolRegistry&) = delete;

    void add(std::unique_ptr<ProtocolHandler> handler);

    // First matching handler, or no_handler
    [[nodiscard]] std::expected<ProtocolHandler*, std::error_code>
    resolve(std::string_view url) const noexcept;

    // Resolve and run one transfer. At most max_concurrent_downloads calls
    // run at once; further calls wait for a slot (or for `stop`).
    // A URL no handler claims fails with no_handler and no record.
    [[nodiscard]] std::expected<core::TransferRecord, std::error_code>
    dispatch(const std::string& url,
             const std::string& destination,
             const TransferHooks& hooks = {},
             std::stop_token stop = {});

    // Run several transfers concurrently into `directory`; one outcome per
    // URL, in input order
    [[nodiscard]] std::vector<std::expected<core::TransferRecord, std::error_code>>
    dispatch_batch(const std::vector<std::string>& urls,
                   const std::string& directory,
                   const HooksFactory& hooks = {},
                   std::stop_token stop = {});

    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }
    [[nodiscard]] const std::vector<std::unique_ptr<ProtocolHandler>>& handlers() const noexcept {
        return handlers_;
    }

private:
    std::vector<std::unique_ptr<ProtocolHandler>> handlers_;
    core::ConnectionLimiter transfer_slots_;
    core::Logger logger_;
};

// video, m3u8, torrent, ftp, webdav, http: specific handlers ahead of the generic one
[[nodiscard]] std::unique_ptr<ProtocolRegistry>
make_default_registry(const core::TransferConfig& config, core::Logger logger = {});

} // namespace dnl::protocol
