// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/config.hpp>
#include <cstdint>
#include <optional>

namespace dnl::core {

// Host capability queries used to pick defaults
class CapabilityProbe {
public:
    // clamp(1% of available memory, 1 MiB, 16 MiB); 1 MiB when memory is unreadable
    [[nodiscard]] static std::uint64_t optimal_chunk_size() noexcept;

    // clamp(2 x CPU count, 4, 16)
    [[nodiscard]] static std::uint32_t optimal_connection_count() noexcept;

    // Default settings with chunk_size taken from optimal_chunk_size()
    [[nodiscard]] static TransferConfig tuned_config();

    [[nodiscard]] static std::optional<std::uint64_t> available_memory() noexcept;
    [[nodiscard]] static std::uint32_t cpu_count() noexcept;

    // Pure derivations, exposed for tests
    [[nodiscard]] static std::uint64_t chunk_size_for(std::optional<std::uint64_t> available_bytes) noexcept;
    [[nodiscard]] static std::uint32_t connections_for(std::uint32_t cpus) noexcept;
};

} // namespace dnl::core
