// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/connection_limiter.hpp>
#include <algorithm>
#include <chrono>

namespace dnl::core {

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{50};

} // namespace

void ConnectionLimiter::Permit::release() noexcept {
    if (owner_) {
        owner_->slots_.release();
        owner_ = nullptr;
    }
}

ConnectionLimiter::ConnectionLimiter(std::uint32_t permits)
    : capacity_(std::max<std::uint32_t>(permits, 1))
    , slots_(static_cast<std::ptrdiff_t>(capacity_)) {}

std::optional<ConnectionLimiter::Permit> ConnectionLimiter::acquire(std::stop_token stop) {
    // Semaphores cannot wait on a stop_token, so poll in short slices
    while (!stop.stop_requested()) {
        if (slots_.try_acquire_for(POLL_INTERVAL)) {
            return Permit(this);
        }
    }
    return std::nullopt;
}

std::optional<ConnectionLimiter::Permit> ConnectionLimiter::try_acquire() noexcept {
    if (slots_.try_acquire()) {
        return Permit(this);
    }
    return std::nullopt;
}

} // namespace dnl::core
