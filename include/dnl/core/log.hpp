// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace dnl::core {

using Logger = std::shared_ptr<spdlog::logger>;

struct LogOptions {
    std::string name{"dnl"};
    spdlog::level::level_enum level{spdlog::level::info};
    spdlog::level::level_enum console_level{spdlog::level::trace};   // further filters stderr
    std::string file_dir;                     // empty: console only
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};
};

// Colored stderr sink plus an optional rotating file sink
[[nodiscard]] Logger make_logger(const LogOptions& options);

// Logger that drops everything; used when a component is built without one
[[nodiscard]] Logger null_logger();

// Returns `logger`, or the null logger when it is empty
[[nodiscard]] inline Logger or_null(Logger logger) {
    return logger ? std::move(logger) : null_logger();
}

} // namespace dnl::core
