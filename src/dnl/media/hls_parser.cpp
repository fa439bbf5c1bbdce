// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/media/hls_parser.hpp>
#include <cctype>
#include <algorithm>
#include <stdexcept>

namespace dnl::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_STREAM_INF = "#EXT-X-STREAM-INF:";
constexpr std::string_view TAG_TARGET_DURATION = "#EXT-X-TARGETDURATION:";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";
constexpr std::string_view TAG_BYTERANGE = "#EXT-X-BYTERANGE:";
constexpr std::string_view TAG_KEY = "#EXT-X-KEY:";

// Value of NAME=value in an attribute list; quotes stripped
std::string attribute(std::string_view list, std::string_view name) {
    std::size_t pos = 0;
    while (pos < list.size()) {
        auto eq = list.find('=', pos);
        if (eq == std::string_view::npos) break;
        auto key = list.substr(pos, eq - pos);
        std::size_t value_start = eq + 1;
        std::size_t value_end;
        if (value_start < list.size() && list[value_start] == '"') {
            auto close = list.find('"', value_start + 1);
            value_end = close == std::string_view::npos ? list.size() : close + 1;
        } else {
            value_end = list.find(',', value_start);
            if (value_end == std::string_view::npos) value_end = list.size();
        }
        if (key == name) {
            auto value = list.substr(value_start, value_end - value_start);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
        pos = value_end + 1;  // skip the comma
    }
    return {};
}

} // namespace

const HLSVariant* HLSPlaylist::best_variant() const noexcept {
    auto it = std::max_element(variants.begin(), variants.end(),
        [](const HLSVariant& a, const HLSVariant& b) { return a.bandwidth < b.bandwidth; });
    return it == variants.end() ? nullptr : &*it;
}

bool HLSParser::is_hls_url(std::string_view url) noexcept {
    auto end = url.find_first_of("?#");
    auto path = url.substr(0, end);
    if (path.size() < 5) return false;
    auto ext = path.substr(path.size() - 5);
    return std::equal(ext.begin(), ext.end(), ".m3u8", [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

std::expected<HLSPlaylist, std::error_code>
HLSParser::parse(std::string_view content, std::string_view base_url) noexcept {
    const auto malformed = make_error_code(core::DownloadErrc::unsupported_stream);

    try {
        HLSPlaylist playlist;
        double current_duration = 0.0;
        std::optional<std::uint64_t> current_byte_offset;
        std::uint64_t current_byte_length = 0;
        std::uint64_t next_implicit_offset = 0;
        std::optional<HLSVariant> pending_variant;
        bool saw_header = false;

        std::size_t pos = 0;
        while (pos < content.size()) {
            auto end = content.find('\n', pos);
            if (end == std::string_view::npos) end = content.size();
            auto line = content.substr(pos, end - pos);
            pos = end + 1;

            // Trim \r and surrounding blanks
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
                line.remove_suffix(1);
            }
            while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
                line.remove_prefix(1);
            }
            if (line.empty()) continue;

            if (!saw_header) {
                // Tolerate a UTF-8 BOM before the header
                if (line.starts_with("\xEF\xBB\xBF")) line.remove_prefix(3);
                if (!line.starts_with(TAG_HEADER)) {
                    return std::unexpected(malformed);
                }
                saw_header = true;
                continue;
            }

            if (line.front() == '#') {
                if (line.starts_with(TAG_TARGET_DURATION)) {
                    playlist.target_duration = std::stod(std::string(line.substr(TAG_TARGET_DURATION.size())));
                } else if (line.starts_with(TAG_STREAM_INF)) {
                    auto attrs = line.substr(TAG_STREAM_INF.size());
                    HLSVariant variant;
                    auto bandwidth = attribute(attrs, "BANDWIDTH");
                    if (!bandwidth.empty()) variant.bandwidth = std::stoull(bandwidth);
                    variant.resolution = attribute(attrs, "RESOLUTION");
                    variant.codecs = attribute(attrs, "CODECS");
                    pending_variant = std::move(variant);
                } else if (line.starts_with(TAG_EXTINF)) {
                    auto val = line.substr(TAG_EXTINF.size());
                    val = val.substr(0, val.find(','));
                    current_duration = std::stod(std::string(val));
                } else if (line.starts_with(TAG_BYTERANGE)) {
                    // length[@offset]; without an offset the range follows the previous one
                    auto val = line.substr(TAG_BYTERANGE.size());
                    auto at_pos = val.find('@');
                    current_byte_length = std::stoull(std::string(val.substr(0, at_pos)));
                    current_byte_offset = at_pos != std::string_view::npos
                        ? std::stoull(std::string(val.substr(at_pos + 1)))
                        : next_implicit_offset;
                } else if (line.starts_with(TAG_KEY)) {
                    playlist.encryption_method = attribute(line.substr(TAG_KEY.size()), "METHOD");
                } else if (line.starts_with(TAG_ENDLIST)) {
                    playlist.is_endless = false;
                }
                continue;
            }

            // URI line
            auto url = resolve_url(base_url, line);
            if (pending_variant) {
                pending_variant->url = std::move(url);
                playlist.variants.push_back(std::move(*pending_variant));
                pending_variant.reset();
                continue;
            }

            HLSSegment segment;
            segment.url = std::move(url);
            segment.duration = current_duration;
            segment.byte_offset = current_byte_offset;
            segment.byte_length = current_byte_length;
            if (current_byte_offset) {
                next_implicit_offset = *current_byte_offset + current_byte_length;
            }
            playlist.total_duration += current_duration;
            playlist.segments.push_back(std::move(segment));

            // Reset for next segment
            current_duration = 0.0;
            current_byte_offset.reset();
            current_byte_length = 0;
        }

        if (!saw_header) {
            return std::unexpected(malformed);
        }
        return playlist;
    } catch (const std::invalid_argument&) {
        return std::unexpected(malformed);
    } catch (const std::out_of_range&) {
        return std::unexpected(malformed);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string HLSParser::resolve_url(std::string_view base, std::string_view relative) {
    if (relative.find("://") != std::string_view::npos) {
        return std::string(relative);
    }

    std::string base_str(base);
    // Drop query and fragment, then the last path segment
    base_str = base_str.substr(0, base_str.find_first_of("?#"));
    auto scheme_end = base_str.find("://");
    auto authority_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;

    if (relative.starts_with("/")) {
        auto path_start = base_str.find('/', authority_start);
        return base_str.substr(0, path_start) + std::string(relative);
    }

    auto last_slash = base_str.rfind('/');
    if (last_slash == std::string::npos || last_slash < authority_start) {
        return base_str + "/" + std::string(relative);
    }
    return base_str.substr(0, last_slash + 1) + std::string(relative);
}

} // namespace dnl::media
