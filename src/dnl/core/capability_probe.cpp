// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/capability_probe.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#ifdef __linux__
#include <sys/sysinfo.h>
#endif

namespace dnl::core {

std::optional<std::uint64_t> CapabilityProbe::available_memory() noexcept {
#ifdef __linux__
    try {
        // MemAvailable counts reclaimable page cache, sysinfo's freeram does not
        std::ifstream meminfo("/proc/meminfo");
        std::string line;
        while (std::getline(meminfo, line)) {
            if (line.starts_with("MemAvailable:")) {
                std::istringstream iss(line.substr(13));
                std::uint64_t kib = 0;
                if (iss >> kib && kib > 0) {
                    return kib * 1024;
                }
                break;
            }
        }
    } catch (const std::exception&) {
        // fall through to sysinfo
    }

    struct sysinfo si {};
    if (sysinfo(&si) == 0 && si.freeram > 0) {
        return static_cast<std::uint64_t>(si.freeram) * si.mem_unit;
    }
#endif
    return std::nullopt;
}

std::uint32_t CapabilityProbe::cpu_count() noexcept {
    auto cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 1;
}

std::uint64_t CapabilityProbe::chunk_size_for(std::optional<std::uint64_t> available_bytes) noexcept {
    if (!available_bytes || *available_bytes == 0) {
        return DEFAULT_CHUNK_SIZE;
    }
    return std::clamp(*available_bytes / 100, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE);
}

std::uint32_t CapabilityProbe::connections_for(std::uint32_t cpus) noexcept {
    return std::clamp(cpus * 2, MIN_CONNECTIONS, MAX_CONNECTIONS);
}

std::uint64_t CapabilityProbe::optimal_chunk_size() noexcept {
    return chunk_size_for(available_memory());
}

std::uint32_t CapabilityProbe::optimal_connection_count() noexcept {
    return connections_for(cpu_count());
}

TransferConfig CapabilityProbe::tuned_config() {
    TransferConfig config;
    config.chunk_size = optimal_chunk_size();
    return config;
}

} // namespace dnl::core
