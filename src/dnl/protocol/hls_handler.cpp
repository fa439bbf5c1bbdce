// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/hls_handler.hpp>
#include <filesystem>

namespace dnl::protocol {

HlsHandler::HlsHandler(core::TransferConfig config,
                       std::shared_ptr<core::ConnectionLimiter> limiter,
                       core::Logger logger)
    : StreamingHandler(std::move(config), std::move(limiter), std::move(logger)) {}

bool HlsHandler::can_handle(std::string_view url) const noexcept {
    return media::HLSParser::is_hls_url(url);
}

std::string HlsHandler::destination_for(const std::string& url,
                                        const std::string& directory) const {
    std::filesystem::path path = ProtocolHandler::destination_for(url, directory);
    path.replace_extension(".ts");
    return path.string();
}

std::expected<media::HLSPlaylist, std::error_code>
HlsHandler::load_media_playlist(core::HttpSession& session, const std::string& url,
                                core::TransferRecord& record) const {
    auto text = session.fetch_text(url);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto playlist = media::HLSParser::parse(*text, url);
    if (!playlist || !playlist->is_master()) {
        return playlist;
    }

    const auto* variant = playlist->best_variant();
    record.metadata["variant_url"] = variant->url;
    record.metadata["variant_bandwidth"] = std::to_string(variant->bandwidth);
    logger_->debug("{}: using variant {} ({} bps)", url, variant->url, variant->bandwidth);

    auto variant_text = session.fetch_text(variant->url);
    if (!variant_text) {
        return std::unexpected(variant_text.error());
    }
    auto media_playlist = media::HLSParser::parse(*variant_text, variant->url);
    if (media_playlist && media_playlist->is_master()) {
        // Nested masters are not followed
        return std::unexpected(make_error_code(core::DownloadErrc::unsupported_stream));
    }
    return media_playlist;
}

core::TransferRecord HlsHandler::download(const std::string& url,
                                          const std::string& destination,
                                          const TransferHooks& hooks,
                                          std::stop_token stop) {
    auto record = core::TransferRecord::start(url, std::string(tag()), destination);
    if (hooks.on_start) {
        hooks.on_start(record);
    }

    disk::FileWriter writer;
    core::HttpSession session(config_);

    auto playlist = load_media_playlist(session, url, record);
    if (!playlist) {
        fail(record, writer, playlist.error(), "playlist");
        return record;
    }
    if (playlist->is_encrypted()) {
        fail(record, writer, make_error_code(core::DownloadErrc::unsupported_stream),
             "encrypted playlist (" + playlist->encryption_method + ")");
        return record;
    }
    if (playlist->segments.empty()) {
        fail(record, writer, make_error_code(core::DownloadErrc::unsupported_stream), "no media segments");
        return record;
    }
    if (playlist->is_endless) {
        logger_->warn("{}: live playlist, downloading the {} segments currently listed",
                      url, playlist->segments.size());
    }

    const auto segment_count = playlist->segments.size();
    record.metadata["segments"] = std::to_string(segment_count);

    if (auto ec = writer.open_stream(destination)) {
        fail(record, writer, ec, destination);
        return record;
    }
    record.advance(core::TransferStatus::downloading);
    logger_->info("downloading {} ({} segments) -> {}", url, segment_count, destination);

    // Bytes are unknown up front; percent follows completed segments
    core::ProgressAccumulator bytes(0);
    std::uint64_t offset = 0;
    for (std::size_t i = 0; i < segment_count; ++i) {
        const auto& segment = playlist->segments[i];
        std::string range;
        if (segment.byte_offset && segment.byte_length > 0) {
            range = std::to_string(*segment.byte_offset) + "-"
                  + std::to_string(*segment.byte_offset + segment.byte_length - 1);
        }

        auto result = append(session, segment.url, writer, offset, bytes, stop, range);
        if (!result) {
            fail(record, writer, result.error(), "segment " + std::to_string(i));
            return record;
        }

        record.set_progress(100.0 * static_cast<double>(i + 1) / static_cast<double>(segment_count));
        if (hooks.on_progress) {
            auto p = bytes.snapshot();
            p.percent = record.progress;
            hooks.on_progress(p);
        }
    }

    if (auto ec = writer.flush()) {
        fail(record, writer, ec, destination);
        return record;
    }
    writer.close();

    record.file_size = offset;
    record.speed = core::format_speed(bytes.snapshot().speed_bps);
    record.complete();
    logger_->info("completed {} ({})", destination, core::format_bytes(offset));
    return record;
}

} // namespace dnl::protocol
