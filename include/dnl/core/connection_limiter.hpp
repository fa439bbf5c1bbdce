// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <semaphore>
#include <stop_token>

namespace dnl::core {

// Counting semaphore with RAII permits. One instance bounds the total number
// of open connections across all transfers; the registry uses another to
// bound concurrent transfers.
class ConnectionLimiter {
public:
    class Permit {
    public:
        Permit() = default;
        explicit Permit(ConnectionLimiter* owner) noexcept : owner_(owner) {}
        ~Permit() { release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        void release() noexcept;

    private:
        ConnectionLimiter* owner_{nullptr};
    };

    explicit ConnectionLimiter(std::uint32_t permits);

    ConnectionLimiter(const ConnectionLimiter&) = delete;
    ConnectionLimiter& operator=(const ConnectionLimiter&) = delete;

    // Blocks until a permit is free. Returns nullopt if `stop` is requested first.
    [[nodiscard]] std::optional<Permit> acquire(std::stop_token stop = {});

    [[nodiscard]] std::optional<Permit> try_acquire() noexcept;

    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }

private:
    std::uint32_t capacity_;
    std::counting_semaphore<> slots_;
};

} // namespace dnl::core
