// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/core/capability_probe.hpp>

using namespace dnl::core;

namespace {
constexpr std::uint64_t MiB = 1024 * 1024;
}

TEST_CASE("CapabilityProbe::chunk_size_for", "[capability_probe]") {
    SECTION("Unknown memory falls back to 1 MiB") {
        CHECK(CapabilityProbe::chunk_size_for(std::nullopt) == MiB);
    }

    SECTION("Small hosts clamp to the minimum") {
        CHECK(CapabilityProbe::chunk_size_for(0) == MiB);
        CHECK(CapabilityProbe::chunk_size_for(50 * MiB) == MiB);
    }

    SECTION("One percent of available memory") {
        CHECK(CapabilityProbe::chunk_size_for(800 * MiB) == 8 * MiB);
    }

    SECTION("Large hosts clamp to the maximum") {
        CHECK(CapabilityProbe::chunk_size_for(64ull * 1024 * MiB) == 16 * MiB);
    }
}

TEST_CASE("CapabilityProbe::connections_for", "[capability_probe]") {
    CHECK(CapabilityProbe::connections_for(0) == 4);
    CHECK(CapabilityProbe::connections_for(1) == 4);
    CHECK(CapabilityProbe::connections_for(3) == 6);
    CHECK(CapabilityProbe::connections_for(8) == 16);
    CHECK(CapabilityProbe::connections_for(64) == 16);
}

TEST_CASE("CapabilityProbe live values stay in range", "[capability_probe]") {
    auto chunk = CapabilityProbe::optimal_chunk_size();
    CHECK(chunk >= MiB);
    CHECK(chunk <= 16 * MiB);

    auto connections = CapabilityProbe::optimal_connection_count();
    CHECK(connections >= 4);
    CHECK(connections <= 16);

    CHECK(CapabilityProbe::cpu_count() >= 1);
}

TEST_CASE("CapabilityProbe::tuned_config", "[capability_probe]") {
    auto config = CapabilityProbe::tuned_config();
    CHECK(config.chunk_size == CapabilityProbe::optimal_chunk_size());
    CHECK(!config.max_connections_per_file.has_value());
    CHECK(config.max_retries == TransferConfig{}.max_retries);
}
