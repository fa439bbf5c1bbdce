// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/log.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace dnl::core {

Logger make_logger(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    console->set_level(options.console_level);
    sinks.push_back(console);

    std::string file_error;
    if (!options.file_dir.empty()) {
        try {
            std::filesystem::create_directories(options.file_dir);
            auto path = std::filesystem::path(options.file_dir) / "dnl.log";
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), options.max_file_size, options.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file);
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);
    if (!file_error.empty()) {
        logger->warn("log file disabled: {}", file_error);
    }
    return logger;
}

Logger null_logger() {
    static Logger logger = std::make_shared<spdlog::logger>(
        "null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

} // namespace dnl::core
