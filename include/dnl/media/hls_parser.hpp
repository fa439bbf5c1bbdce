// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dnl::media {

// HLS (HTTP Live Streaming) media segment
struct HLSSegment {
    std::string url;
    double duration{0.0};                   // seconds
    std::optional<std::uint64_t> byte_offset;   // EXT-X-BYTERANGE
    std::uint64_t byte_length{0};
};

// HLS variant (for adaptive bitrate)
struct HLSVariant {
    std::uint64_t bandwidth{0};     // Bitrate in bps
    std::string resolution;
    std::string codecs;
    std::string url;
};

// Parsed HLS playlist. A master playlist has variants and no segments.
struct HLSPlaylist {
    std::vector<HLSSegment> segments;
    std::vector<HLSVariant> variants;
    double target_duration{0.0};
    double total_duration{0.0};
    bool is_endless{true};          // No EXT-X-ENDLIST: live stream
    std::string encryption_method;  // empty or NONE when clear

    [[nodiscard]] bool is_master() const noexcept { return !variants.empty(); }
    [[nodiscard]] bool is_encrypted() const noexcept {
        return !encryption_method.empty() && encryption_method != "NONE";
    }

    // Highest-bandwidth variant, if any
    [[nodiscard]] const HLSVariant* best_variant() const noexcept;
};

// M3U8 playlist parser
class HLSParser {
public:
    // Fails with unsupported_stream when the #EXTM3U header is missing or a
    // tag value cannot be parsed
    [[nodiscard]] static std::expected<HLSPlaylist, std::error_code>
    parse(std::string_view content, std::string_view base_url) noexcept;

    // Path ends in .m3u8 (query and fragment ignored)
    [[nodiscard]] static bool is_hls_url(std::string_view url) noexcept;

    [[nodiscard]] static std::string resolve_url(std::string_view base, std::string_view relative);
};

} // namespace dnl::media
