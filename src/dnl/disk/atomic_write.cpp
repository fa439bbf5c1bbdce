// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/disk/atomic_write.hpp>
#include <dnl/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <string>

#include <unistd.h>

namespace dnl::disk {

std::error_code write_file_atomic(std::string_view path, std::string_view contents) noexcept {
    std::string target;
    std::string tmp_path;
    try {
        target = std::string(path);
        tmp_path = target + ".tmp." + std::to_string(::getpid());
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    FileWriter writer;
    if (auto ec = writer.open(tmp_path, contents.size())) {
        return ec;
    }
    if (auto ec = writer.write(0, contents.data(), contents.size())) {
        writer.remove();
        return ec;
    }
    if (auto ec = writer.flush()) {
        writer.remove();
        return ec;
    }
    writer.close();

    if (std::rename(tmp_path.c_str(), target.c_str()) != 0) {
        auto ec = errno_to_error_code(errno, DiskErrc::rename_error);
        ::unlink(tmp_path.c_str());
        return ec;
    }
    return {};
}

} // namespace dnl::disk
