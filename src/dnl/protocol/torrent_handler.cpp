// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/torrent_handler.hpp>
#include <dnl/core/http_session.hpp>
#include <dnl/core/url.hpp>
#include <algorithm>
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

namespace dnl::protocol {

namespace {

constexpr std::size_t MAX_TORRENT_FILE_SIZE = 10 * 1024 * 1024;
constexpr auto ALERT_WAIT = std::chrono::milliseconds(250);

struct LoadError {
    std::error_code code;
    std::string detail;
};

// Magnet link or metainfo file into add_torrent_params
std::expected<lt::add_torrent_params, LoadError>
load_params(const std::string& url, const core::TransferConfig& config) {
    lt::error_code ec;
    if (TorrentHandler::is_magnet(url)) {
        auto params = lt::parse_magnet_uri(url, ec);
        if (ec) {
            return std::unexpected(LoadError{make_error_code(core::DownloadErrc::invalid_torrent), ec.message()});
        }
        return params;
    }

    // Bare paths are read through file://
    std::string source = url;
    if (url.find("://") == std::string::npos) {
        source = "file://" + std::filesystem::absolute(url).string();
    }

    core::HttpSession session(config);
    auto data = session.fetch_text(source, MAX_TORRENT_FILE_SIZE);
    if (!data) {
        return std::unexpected(LoadError{data.error(), source});
    }

    auto info = std::make_shared<lt::torrent_info>(
        lt::span<char const>(data->data(), static_cast<std::ptrdiff_t>(data->size())), ec, lt::from_span);
    if (ec) {
        return std::unexpected(LoadError{make_error_code(core::DownloadErrc::invalid_torrent), ec.message()});
    }
    lt::add_torrent_params params;
    params.ti = std::move(info);
    return params;
}

lt::settings_pack session_settings(const core::TransferConfig& config) {
    lt::settings_pack pack;
    pack.set_str(lt::settings_pack::user_agent, config.user_agent);
    pack.set_str(lt::settings_pack::listen_interfaces, "0.0.0.0:6881,[::]:6881");
    pack.set_int(lt::settings_pack::alert_mask,
                 lt::alert_category::error | lt::alert_category::status | lt::alert_category::storage);
    pack.set_int(lt::settings_pack::connections_limit,
                 static_cast<int>(config.max_total_connections));
    pack.set_int(lt::settings_pack::peer_connect_timeout, static_cast<int>(config.connection_timeout));
    pack.set_int(lt::settings_pack::stop_tracker_timeout, 1);
    return pack;
}

} // namespace

TorrentHandler::TorrentHandler(core::TransferConfig config, core::Logger logger)
    : config_(std::move(config))
    , logger_(core::or_null(std::move(logger))) {}

bool TorrentHandler::is_magnet(std::string_view url) noexcept {
    return url.size() >= 7 && (url.starts_with("magnet:") || url.starts_with("MAGNET:"));
}

bool TorrentHandler::can_handle(std::string_view url) const noexcept {
    if (is_magnet(url)) {
        return true;
    }
    try {
        auto path = url.substr(0, url.find_first_of("?#"));
        return core::to_lower(path).ends_with(".torrent");
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::string TorrentHandler::destination_for(const std::string&, const std::string& directory) const {
    return directory.empty() ? std::string(".") : directory;
}

core::TransferRecord TorrentHandler::download(const std::string& url,
                                              const std::string& destination,
                                              const TransferHooks& hooks,
                                              std::stop_token stop) {
    auto record = core::TransferRecord::start(url, std::string(tag()), destination);
    if (hooks.on_start) {
        hooks.on_start(record);
    }

    auto finish_failed = [&](std::string message) {
        logger_->error("{}: {}", url, message);
        record.fail(std::move(message));
        return record;
    };

    if (stop.stop_requested()) {
        return finish_failed(make_error_code(core::DownloadErrc::cancelled).message());
    }

    auto params = load_params(url, config_);
    if (!params) {
        return finish_failed(params.error().code.message() + ": " + params.error().detail);
    }

    std::error_code dir_ec;
    std::filesystem::create_directories(destination, dir_ec);
    if (dir_ec) {
        return finish_failed(destination + ": " + dir_ec.message());
    }

    params->save_path = destination;
    params->flags |= lt::torrent_flags::sequential_download;

    lt::session session(lt::session_params(session_settings(config_)));
    lt::error_code add_ec;
    lt::torrent_handle handle = session.add_torrent(std::move(*params), add_ec);
    if (add_ec) {
        return finish_failed(make_error_code(core::DownloadErrc::invalid_torrent).message() + ": "
                             + add_ec.message());
    }

    record.advance(core::TransferStatus::downloading);
    logger_->info("downloading {} -> {}", url, destination);

    double reported_percent = 0.0;
    std::uint64_t reported_bytes = 0;
    std::optional<std::string> error;
    bool finished = false;

    while (!finished && !error) {
        if (stop.stop_requested()) {
            session.remove_torrent(handle, lt::session::delete_files);
            return finish_failed(make_error_code(core::DownloadErrc::cancelled).message());
        }

        std::vector<lt::alert*> alerts;
        session.pop_alerts(&alerts);
        for (const lt::alert* alert : alerts) {
            if (const auto* failure = lt::alert_cast<lt::torrent_error_alert>(alert)) {
                error = failure->error.message();
            } else if (const auto* file_failure = lt::alert_cast<lt::file_error_alert>(alert)) {
                error = file_failure->error.message();
            } else if (lt::alert_cast<lt::torrent_finished_alert>(alert)) {
                finished = true;
            }
        }

        lt::torrent_status status = handle.status();
        if (status.has_metadata) {
            record.download_path = (std::filesystem::path(destination) / status.name).string();
            record.file_size = static_cast<std::uint64_t>(status.total_wanted);
        }

        // Hash failures can move libtorrent's progress backwards
        reported_percent = std::max(reported_percent, static_cast<double>(status.progress) * 100.0);
        reported_bytes = std::max(reported_bytes, static_cast<std::uint64_t>(status.total_wanted_done));
        record.set_progress(reported_percent);
        record.speed = core::format_speed(static_cast<std::uint64_t>(status.download_payload_rate));
        if (hooks.on_progress) {
            core::TransferProgress p;
            p.total_bytes = record.file_size.value_or(0);
            p.downloaded_bytes = reported_bytes;
            p.speed_bps = static_cast<std::uint64_t>(status.download_payload_rate);
            p.percent = reported_percent;
            hooks.on_progress(p);
        }

        if (status.is_finished || status.is_seeding) {
            finished = true;
        }
        if (!finished && !error) {
            session.wait_for_alert(ALERT_WAIT);
        }
    }

    if (error) {
        session.remove_torrent(handle, lt::session::delete_files);
        return finish_failed(*error);
    }

    session.remove_torrent(handle);
    record.complete();
    logger_->info("completed {} -> {}", url, record.download_path);
    return record;
}

} // namespace dnl::protocol
