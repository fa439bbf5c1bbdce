// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/chunk_planner.hpp>
#include <limits>

namespace dnl::core {

std::expected<std::vector<ChunkRange>, std::error_code>
ChunkPlanner::plan(std::uint64_t byte_length, std::uint32_t connections) noexcept {
    if (connections < 1 || byte_length < 1
        || byte_length > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_plan));
    }

    const auto length = static_cast<std::int64_t>(byte_length);
    const auto count = static_cast<std::int64_t>(connections);
    const std::int64_t base = length / count;

    try {
        std::vector<ChunkRange> ranges;
        ranges.reserve(connections);
        for (std::int64_t i = 0; i < count; ++i) {
            ChunkRange range;
            range.index = static_cast<std::uint32_t>(i);
            range.start = i * base;
            range.end = (i == count - 1) ? length - 1 : (i + 1) * base - 1;
            ranges.push_back(range);
        }
        return ranges;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace dnl::core
