// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <dnl/core/log.hpp>
#include <dnl/protocol/handler.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dnl::protocol {

// What one line of yt-dlp --newline output tells us
struct HelperLine {
    std::optional<double> percent;
    std::optional<std::uint64_t> total_bytes;
    std::optional<std::uint64_t> speed_bps;
    std::optional<std::string> destination;   // Destination: / Merger output
    std::optional<std::string> error;         // ERROR: lines
};

// Video-site pages, delegated to the external yt-dlp tool
class VideoSiteHandler : public ProtocolHandler {
public:
    explicit VideoSiteHandler(core::TransferConfig config,
                              core::Logger logger = {},
                              std::string tool = "yt-dlp");

    [[nodiscard]] std::string_view tag() const noexcept override { return "video"; }
    [[nodiscard]] bool can_handle(std::string_view url) const noexcept override;
    [[nodiscard]] core::TransferRecord download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) override;

    // yt-dlp output template inside `directory`
    [[nodiscard]] std::string destination_for(const std::string& url,
                                              const std::string& directory) const override;

    // Parse a progress line such as
    // "[download]  45.3% of 50.23MiB at 2.50MiB/s ETA 00:19"
    [[nodiscard]] static HelperLine parse_line(std::string_view line);

    // Hosts served by this handler (subdomains included)
    [[nodiscard]] static const std::vector<std::string>& site_hosts();

    // Command line passed to execvp
    [[nodiscard]] std::vector<std::string> command_line(const std::string& url,
                                                        const std::string& destination) const;

private:
    core::TransferConfig config_;
    core::Logger logger_;
    std::string tool_;
};

} // namespace dnl::protocol
