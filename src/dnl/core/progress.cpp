// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/progress.hpp>
#include <algorithm>
#include <array>
#include <cstdio>

namespace dnl::core {

ProgressAccumulator::ProgressAccumulator(std::uint64_t total_bytes,
                                         ProgressSink sink,
                                         std::chrono::milliseconds interval)
    : total_(total_bytes)
    , sink_(std::move(sink))
    , interval_(interval)
    , start_time_(std::chrono::steady_clock::now())
    , last_report_(start_time_) {}

void ProgressAccumulator::add(std::uint64_t bytes) noexcept {
    if (bytes == 0) return;
    downloaded_.fetch_add(bytes, std::memory_order_relaxed);
    report(false);
}

void ProgressAccumulator::flush() noexcept {
    report(true);
}

std::uint64_t ProgressAccumulator::downloaded() const noexcept {
    auto value = downloaded_.load(std::memory_order_relaxed);
    return total_ > 0 ? std::min(value, total_) : value;
}

TransferProgress ProgressAccumulator::snapshot() const noexcept {
    TransferProgress p;
    p.total_bytes = total_;
    p.downloaded_bytes = downloaded();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_).count();
    if (elapsed > 0) {
        p.speed_bps = p.downloaded_bytes * 1000 / static_cast<std::uint64_t>(elapsed);
    }
    if (total_ > 0) {
        p.percent = 100.0 * static_cast<double>(p.downloaded_bytes) / static_cast<double>(total_);
    }
    return p;
}

void ProgressAccumulator::report(bool force) noexcept {
    if (!sink_) return;

    std::lock_guard lock(report_mutex_);
    auto now = std::chrono::steady_clock::now();
    if (!force && now - last_report_ < interval_) {
        return;
    }

    auto p = snapshot();
    // Reports never go backwards, even if a later add() raced ahead of us
    if (p.downloaded_bytes < last_reported_) {
        return;
    }
    last_report_ = now;
    last_reported_ = p.downloaded_bytes;

    try {
        sink_(p);
    } catch (const std::exception&) {
        // A failing observer must not fail the transfer
    }
}

std::string format_speed(std::uint64_t bytes_per_sec) {
    return format_bytes(bytes_per_sec) + "/s";
}

std::string format_bytes(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    std::array<char, 32> buf{};
    std::snprintf(buf.data(), buf.size(), "%.2f %s", value, units[unit]);
    return buf.data();
}

} // namespace dnl::core
