// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dnl::core {

enum class TransferStatus : std::uint8_t {
    starting,
    downloading,
    completed,
    failed
};

[[nodiscard]] std::string_view to_string(TransferStatus status) noexcept;
[[nodiscard]] std::optional<TransferStatus> parse_status(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_terminal(TransferStatus status) noexcept {
    return status == TransferStatus::completed || status == TransferStatus::failed;
}

using Clock = std::chrono::system_clock;

// One transfer's lifecycle. Created `starting` by a handler, terminal
// `completed` or `failed` is final.
struct TransferRecord {
    std::string transfer_id;
    std::string url;
    std::string file_type;                         // protocol tag
    TransferStatus status{TransferStatus::starting};
    double progress{0.0};                          // [0, 100]
    Clock::time_point started_at{};
    std::optional<Clock::time_point> completed_at;
    std::optional<std::uint64_t> file_size;
    std::string download_path;
    std::optional<std::string> checksum;
    std::optional<std::string> speed;
    std::optional<std::string> error;
    std::map<std::string, std::string> metadata;

    // New record in `starting` with a fresh transfer id and start time
    [[nodiscard]] static TransferRecord start(std::string url, std::string file_type,
                                              std::string download_path);

    // Moves status forward. Returns false (and leaves status untouched) for
    // backward moves and for any move out of a terminal state.
    bool advance(TransferStatus next) noexcept;

    void set_progress(double percent) noexcept;

    // Terminal helpers
    void complete();
    void fail(std::string message);

    bool operator==(const TransferRecord&) const = default;
};

[[nodiscard]] std::string generate_transfer_id();

// ISO-8601 UTC, second resolution: 2026-01-31T12:00:00Z
[[nodiscard]] std::string format_timestamp(Clock::time_point tp);
[[nodiscard]] std::optional<Clock::time_point> parse_timestamp(std::string_view text);

void to_json(nlohmann::json& j, const TransferRecord& record);
void from_json(const nlohmann::json& j, TransferRecord& record);

} // namespace dnl::core
