// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/media/hls_parser.hpp>
#include <dnl/protocol/streaming_handler.hpp>

namespace dnl::protocol {

// M3U8 playlists: the media segments are concatenated, in playlist order,
// into the destination. Master playlists use their highest-bandwidth variant.
class HlsHandler : public StreamingHandler {
public:
    HlsHandler(core::TransferConfig config,
               std::shared_ptr<core::ConnectionLimiter> limiter,
               core::Logger logger = {});

    [[nodiscard]] std::string_view tag() const noexcept override { return "m3u8"; }
    [[nodiscard]] bool can_handle(std::string_view url) const noexcept override;
    [[nodiscard]] core::TransferRecord download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) override;

    // Playlist name with a .ts extension
    [[nodiscard]] std::string destination_for(const std::string& url,
                                              const std::string& directory) const override;

private:
    // Fetch the media playlist, following one master-playlist hop
    [[nodiscard]] std::expected<media::HLSPlaylist, std::error_code>
    load_media_playlist(core::HttpSession& session, const std::string& url,
                        core::TransferRecord& record) const;
};

} // namespace dnl::protocol
