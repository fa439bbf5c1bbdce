// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/chunk_planner.hpp>
#include <dnl/core/config.hpp>
#include <dnl/core/connection_limiter.hpp>
#include <dnl/core/error.hpp>
#include <dnl/core/log.hpp>
#include <dnl/core/progress.hpp>
#include <dnl/disk/file_writer.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

namespace dnl::core {

// One range-bounded transfer into a pre-sized file at the range's offset.
// Transient failures are retried up to max_retries times with exponential
// backoff; every attempt restarts at range.start.
class RangeFetcher {
public:
    RangeFetcher(const TransferConfig& config,
                 std::shared_ptr<ConnectionLimiter> limiter,
                 Logger logger = {});

    // Returns the exact byte count written for the range
    [[nodiscard]] std::expected<std::uint64_t, FetchError>
    fetch(const std::string& url,
          const ChunkRange& range,
          disk::FileWriter& writer,
          ProgressAccumulator& progress,
          std::stop_token stop) const noexcept;

    // Delay before retry number `attempt` (0-based)
    [[nodiscard]] static std::chrono::milliseconds backoff_delay(std::uint32_t attempt) noexcept;

private:
    std::expected<std::uint64_t, FetchError>
    attempt(const std::string& url,
            const ChunkRange& range,
            disk::FileWriter& writer,
            ProgressAccumulator& progress,
            std::uint64_t& high_water,
            std::stop_token stop) const noexcept;

    const TransferConfig& config_;
    std::shared_ptr<ConnectionLimiter> limiter_;
    Logger logger_;
};

} // namespace dnl::core
