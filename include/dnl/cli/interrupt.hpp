// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <stop_token>
#include <thread>

namespace dnl::cli {

// Turns SIGINT into a stop request on `cancel`. The signal handler only sets
// a lock-free flag; a watcher thread polls it and requests the stop.
// The previous SIGINT disposition is restored on destruction.
class InterruptGuard {
public:
    explicit InterruptGuard(std::stop_source cancel);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // True once SIGINT arrived while a guard was installed
    [[nodiscard]] bool interrupted() const noexcept;

private:
    using Handler = void (*)(int);

    Handler previous_;
    std::jthread watcher_;
};

} // namespace dnl::cli
