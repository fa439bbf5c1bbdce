// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/log.hpp>
#include <dnl/protocol/handler.hpp>
#include <string>

namespace dnl::protocol {

// magnet: links and .torrent metainfo (local path or any fetchable URL),
// downloaded through a libtorrent session. The destination is the directory
// the torrent's content is saved under.
class TorrentHandler : public ProtocolHandler {
public:
    explicit TorrentHandler(core::TransferConfig config, core::Logger logger = {});

    [[nodiscard]] std::string_view tag() const noexcept override { return "torrent"; }
    [[nodiscard]] bool can_handle(std::string_view url) const noexcept override;
    [[nodiscard]] core::TransferRecord download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) override;

    // The directory itself; file names come from the torrent metadata
    [[nodiscard]] std::string destination_for(const std::string& url,
                                              const std::string& directory) const override;

    [[nodiscard]] static bool is_magnet(std::string_view url) noexcept;

private:
    core::TransferConfig config_;
    core::Logger logger_;
};

} // namespace dnl::protocol
