// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace dnl::core {

struct TransferProgress {
    std::uint64_t total_bytes{0};       // 0 when unknown
    std::uint64_t downloaded_bytes{0};
    std::uint64_t speed_bps{0};
    double percent{0.0};
};

using ProgressSink = std::function<void(const TransferProgress&)>;

// Shared byte counter for one transfer. Chunk tasks call add() from their
// own threads; the sink is invoked under a lock, at most once per interval.
class ProgressAccumulator {
public:
    explicit ProgressAccumulator(std::uint64_t total_bytes,
                                 ProgressSink sink = {},
                                 std::chrono::milliseconds interval = PROGRESS_INTERVAL);

    ProgressAccumulator(const ProgressAccumulator&) = delete;
    ProgressAccumulator& operator=(const ProgressAccumulator&) = delete;

    void add(std::uint64_t bytes) noexcept;

    // Unthrottled report of the current state
    void flush() noexcept;

    [[nodiscard]] std::uint64_t downloaded() const noexcept;
    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    [[nodiscard]] TransferProgress snapshot() const noexcept;

private:
    void report(bool force) noexcept;

    const std::uint64_t total_;
    ProgressSink sink_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point start_time_;

    std::atomic<std::uint64_t> downloaded_{0};

    std::mutex report_mutex_;
    std::chrono::steady_clock::time_point last_report_;
    std::uint64_t last_reported_{0};
};

// "2.50 MB/s"
[[nodiscard]] std::string format_speed(std::uint64_t bytes_per_sec);

// "1.50 GB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

} // namespace dnl::core
