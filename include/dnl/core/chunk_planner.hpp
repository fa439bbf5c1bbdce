// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace dnl::core {

// Inclusive byte interval [start, end]. end == start - 1 marks an empty range.
struct ChunkRange {
    std::uint32_t index{0};
    std::int64_t start{0};
    std::int64_t end{-1};

    [[nodiscard]] std::uint64_t length() const noexcept {
        return end < start ? 0 : static_cast<std::uint64_t>(end - start + 1);
    }
    [[nodiscard]] bool empty() const noexcept { return end < start; }

    bool operator==(const ChunkRange&) const = default;
};

class ChunkPlanner {
public:
    // Splits [0, byte_length - 1] into `connections` contiguous ranges.
    // The last range absorbs the remainder. Fails with invalid_plan when
    // either argument is zero.
    [[nodiscard]] static std::expected<std::vector<ChunkRange>, std::error_code>
    plan(std::uint64_t byte_length, std::uint32_t connections) noexcept;
};

} // namespace dnl::core
