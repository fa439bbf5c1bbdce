// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace dnl::cli {

namespace {

constexpr int BAR_WIDTH = 30;
const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(const core::TransferProgress& progress) noexcept {
    std::lock_guard lock(mutex_);
    if (finished_) return;

    try {
        // Known size: redraw on every whole percent. Unknown: spin.
        if (progress.total_bytes > 0 || progress.percent > 0.0) {
            int percent = static_cast<int>(progress.percent);
            if (percent <= last_percent_) return;
            last_percent_ = percent;
        }
        last_ = progress;
        draw(progress);
    } catch (const std::exception&) {
        // Progress output is best effort
    }
}

void ProgressBar::draw(const core::TransferProgress& progress) {
    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (progress.total_bytes == 0 && progress.percent <= 0.0) {
        line += SPINNER_FRAMES[spinner_frame_++ % 4];
        line += " ";
        line += core::format_bytes(progress.downloaded_bytes);
    } else {
        line += render_bar(progress.percent);

        // Format percentage with padding
        int pct_int = static_cast<int>(progress.percent);
        line += " ";
        if (pct_int < 10) line += " ";
        if (pct_int < 100) line += " ";
        line += std::to_string(pct_int) + "%";

        if (progress.total_bytes > 0) {
            line += " (";
            line += core::format_bytes(progress.downloaded_bytes);
            line += "/";
            line += core::format_bytes(progress.total_bytes);
            line += ")";
        }
    }

    if (progress.speed_bps > 0) {
        line += " @ ";
        line += core::format_speed(progress.speed_bps);

        if (progress.total_bytes > progress.downloaded_bytes) {
            line += " ETA: ";
            line += format_time((progress.total_bytes - progress.downloaded_bytes) / progress.speed_bps);
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    std::cout << line << std::flush;
}

void ProgressBar::finish() noexcept {
    std::lock_guard lock(mutex_);
    if (finished_) return;
    finished_ = true;
    try {
        auto done = last_;
        done.percent = 100.0;
        if (done.total_bytes > 0) done.downloaded_bytes = done.total_bytes;
        draw(done);
        std::cout << std::endl;
    } catch (const std::exception&) {
        // Progress output is best effort
    }
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace dnl::cli
