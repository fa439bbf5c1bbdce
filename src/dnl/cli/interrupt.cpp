// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/cli/interrupt.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>

namespace dnl::cli {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

// Written by the signal handler, read by the watcher thread
std::atomic<bool> interrupt_flag{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void on_sigint(int) {
    interrupt_flag.store(true, std::memory_order_relaxed);
}

} // namespace

InterruptGuard::InterruptGuard(std::stop_source cancel) {
    interrupt_flag.store(false, std::memory_order_relaxed);
    previous_ = std::signal(SIGINT, on_sigint);
    watcher_ = std::jthread([cancel = std::move(cancel)](std::stop_token done) mutable {
        while (!done.stop_requested()) {
            if (interrupt_flag.load(std::memory_order_relaxed)) {
                std::cerr << "\nCancelling..." << std::endl;
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    });
}

InterruptGuard::~InterruptGuard() {
    watcher_.request_stop();
    if (watcher_.joinable()) {
        watcher_.join();
    }
    std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
}

bool InterruptGuard::interrupted() const noexcept {
    return interrupt_flag.load(std::memory_order_relaxed);
}

} // namespace dnl::cli
