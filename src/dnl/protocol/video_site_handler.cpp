// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/video_site_handler.hpp>
#include <dnl/core/url.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <regex>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dnl::protocol {

namespace {

constexpr int EXIT_EXEC_FAILED = 127;
constexpr int POLL_TIMEOUT_MS = 200;
constexpr auto TERMINATE_GRACE = std::chrono::seconds(2);

double unit_scale(const std::string& unit) {
    if (unit == "Ki") return 1024.0;
    if (unit == "Mi") return 1024.0 * 1024;
    if (unit == "Gi") return 1024.0 * 1024 * 1024;
    return 1.0;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

} // namespace

VideoSiteHandler::VideoSiteHandler(core::TransferConfig config,
                                   core::Logger logger,
                                   std::string tool)
    : config_(std::move(config))
    , logger_(core::or_null(std::move(logger)))
    , tool_(std::move(tool)) {}

const std::vector<std::string>& VideoSiteHandler::site_hosts() {
    // Subset of the sites yt-dlp supports
    static const std::vector<std::string> hosts = {
        "youtube.com", "youtu.be", "youtube-nocookie.com",
        "vimeo.com", "dailymotion.com",
        "twitter.com", "x.com",
        "facebook.com", "fb.watch", "instagram.com",
        "tiktok.com", "twitch.tv",
        "reddit.com", "v.redd.it",
        "streamable.com", "bilibili.com", "nicovideo.jp",
        "soundcloud.com", "bandcamp.com",
        "ted.com", "vk.com", "rumble.com", "odysee.com",
        "mixcloud.com",
    };
    return hosts;
}

bool VideoSiteHandler::can_handle(std::string_view url) const noexcept {
    try {
        auto parsed = core::Url::parse(url);
        if (!parsed) return false;
        auto scheme = parsed->scheme();
        if (scheme != "http" && scheme != "https") return false;

        auto host = core::to_lower(parsed->host());
        for (const auto& site : site_hosts()) {
            if (host == site) return true;
            if (host.size() > site.size() && host.ends_with(site)
                && host[host.size() - site.size() - 1] == '.') {
                return true;
            }
        }
    } catch (const std::bad_alloc&) {
        // fall through
    }
    return false;
}

std::string VideoSiteHandler::destination_for(const std::string&, const std::string& directory) const {
    std::filesystem::path dir = directory.empty() ? std::filesystem::path(".") : std::filesystem::path(directory);
    return (dir / "%(title)s.%(ext)s").string();
}

HelperLine VideoSiteHandler::parse_line(std::string_view line) {
    HelperLine out;
    std::string text(line);

    // [Merger] Merging formats into "/path/Video.mp4"
    if (text.find("[Merger]") != std::string::npos) {
        auto quote_start = text.find('"');
        auto quote_end = text.rfind('"');
        if (quote_start != std::string::npos && quote_end > quote_start) {
            out.destination = text.substr(quote_start + 1, quote_end - quote_start - 1);
        }
        return out;
    }

    if (auto pos = text.find("ERROR:"); pos != std::string::npos) {
        out.error = trim(std::string_view(text).substr(pos + 6));
        return out;
    }

    if (text.find("[download]") == std::string::npos) {
        return out;
    }

    if (auto pos = text.find("Destination:"); pos != std::string::npos) {
        out.destination = trim(std::string_view(text).substr(pos + 12));
        return out;
    }

    static const std::regex progress_regex(R"((\d+(?:\.\d+)?)%\s+of\s+~?\s*(\d+(?:\.\d+)?)(Ki|Mi|Gi)?B)");
    static const std::regex speed_regex(R"(at\s+(\d+(?:\.\d+)?)(Ki|Mi|Gi)?B/s)");

    std::smatch match;
    if (std::regex_search(text, match, progress_regex)) {
        out.percent = std::stod(match[1].str());
        out.total_bytes = static_cast<std::uint64_t>(std::stod(match[2].str()) * unit_scale(match[3].str()));
    }
    if (std::regex_search(text, match, speed_regex)) {
        out.speed_bps = static_cast<std::uint64_t>(std::stod(match[1].str()) * unit_scale(match[2].str()));
    }
    return out;
}

std::vector<std::string> VideoSiteHandler::command_line(const std::string& url,
                                                        const std::string& destination) const {
    std::vector<std::string> args = {
        tool_,
        "--newline",
        "--no-playlist",
        "--no-part",
        "--no-mtime",
        "--restrict-filenames",
        "--socket-timeout", std::to_string(config_.connection_timeout),
        "--retries", std::to_string(config_.max_retries),
        "--user-agent", config_.user_agent,
    };
    if (config_.proxy) {
        args.push_back("--proxy");
        args.push_back(*config_.proxy);
    }
    if (!config_.verify_ssl) {
        args.push_back("--no-check-certificates");
    }
    args.push_back("-o");
    args.push_back(destination);
    args.push_back("--");
    args.push_back(url);
    return args;
}

core::TransferRecord VideoSiteHandler::download(const std::string& url,
                                                const std::string& destination,
                                                const TransferHooks& hooks,
                                                std::stop_token stop) {
    auto record = core::TransferRecord::start(url, std::string(tag()), destination);
    if (hooks.on_start) {
        hooks.on_start(record);
    }

    auto finish_failed = [&](std::string message) {
        logger_->error("{}: {}", url, message);
        // --no-part writes straight to the destination
        if (!record.download_path.empty() && record.download_path.find("%(") == std::string::npos) {
            std::error_code ec;
            std::filesystem::remove(record.download_path, ec);
        }
        record.fail(std::move(message));
        return record;
    };

    if (stop.stop_requested()) {
        return finish_failed(make_error_code(core::DownloadErrc::cancelled).message());
    }

    auto args = command_line(url, destination);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    if (auto parent = std::filesystem::path(destination).parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return finish_failed(std::string("pipe: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return finish_failed(std::string("fork: ") + std::strerror(errno));
    }
    if (pid == 0) {
        // Child: own process group, stdout and stderr into the pipe
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(EXIT_EXEC_FAILED);
    }
    ::close(fds[1]);
    // Same call as the child's; EACCES means the child already exec'd with it
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
        logger_->debug("setpgid({}): {}", pid, std::strerror(errno));
    }

    logger_->info("downloading {} via {} (pid {})", url, tool_, pid);
    record.advance(core::TransferStatus::downloading);

    std::string pending;
    std::string last_error;
    bool terminated = false;
    std::chrono::steady_clock::time_point terminated_at;
    // Each fetched stream restarts at 0%; reports never go back
    double reported_percent = 0.0;
    std::uint64_t reported_bytes = 0;
    std::array<char, 4096> buffer{};

    for (;;) {
        if (stop.stop_requested()) {
            if (!terminated) {
                ::kill(-pid, SIGTERM);
                terminated = true;
                terminated_at = std::chrono::steady_clock::now();
            } else if (std::chrono::steady_clock::now() - terminated_at >= TERMINATE_GRACE) {
                logger_->warn("{} ignored SIGTERM, killing pid {}", tool_, pid);
                ::kill(-pid, SIGKILL);
                break;
            }
        }

        pollfd pfd{fds[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(fds[0], buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;  // EOF: child closed its end
        pending.append(buffer.data(), static_cast<std::size_t>(n));

        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            auto line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            logger_->debug("[{}] {}", tool_, line);

            auto parsed = parse_line(line);
            if (parsed.destination) {
                record.download_path = *parsed.destination;
            }
            if (parsed.error) {
                last_error = *parsed.error;
            }
            if (parsed.percent) {
                reported_percent = std::max(reported_percent, *parsed.percent);
                record.set_progress(reported_percent);
                if (parsed.total_bytes) {
                    record.file_size = std::max(record.file_size.value_or(0), *parsed.total_bytes);
                }
                if (parsed.speed_bps) record.speed = core::format_speed(*parsed.speed_bps);
                if (hooks.on_progress) {
                    core::TransferProgress p;
                    p.total_bytes = record.file_size.value_or(0);
                    reported_bytes = std::max(reported_bytes, static_cast<std::uint64_t>(
                        static_cast<double>(parsed.total_bytes.value_or(0)) * *parsed.percent / 100.0));
                    p.downloaded_bytes = std::min(reported_bytes, p.total_bytes);
                    p.speed_bps = parsed.speed_bps.value_or(0);
                    p.percent = record.progress;
                    hooks.on_progress(p);
                }
            }
        }
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (terminated) {
        return finish_failed(make_error_code(core::DownloadErrc::cancelled).message());
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == EXIT_EXEC_FAILED) {
        return finish_failed(make_error_code(core::DownloadErrc::helper_unavailable).message() + ": " + tool_);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::string message = last_error.empty()
            ? tool_ + " exited with status " + std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1)
            : last_error;
        return finish_failed(std::move(message));
    }

    record.complete();
    logger_->info("completed {} -> {}", url, record.download_path);
    return record;
}

} // namespace dnl::protocol
