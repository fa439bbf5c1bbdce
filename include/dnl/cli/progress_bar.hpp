// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/progress.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace dnl::cli {

// Single-line progress bar on stdout. update() may be called from worker
// threads.
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    void update(const core::TransferProgress& progress) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    [[nodiscard]] static std::string render_bar(double percent);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    void draw(const core::TransferProgress& progress);

    std::mutex mutex_;
    std::string label_;
    int last_percent_{-1};
    std::size_t spinner_frame_{0};
    core::TransferProgress last_{};
    bool finished_{false};
};

} // namespace dnl::cli
