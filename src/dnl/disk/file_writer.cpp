// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/disk/file_writer.hpp>
#include <cerrno>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dnl::disk {

namespace fs = std::filesystem;

std::error_code ensure_parent_directory(std::string_view path) noexcept {
    try {
        fs::path parent = fs::path(path).parent_path();
        if (parent.empty()) {
            return {};
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::invalid_path);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::invalid_path);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t size) noexcept {
    return open_impl(path, size, true);
}

std::error_code FileWriter::open_stream(std::string_view path) noexcept {
    return open_impl(path, 0, false);
}

std::error_code FileWriter::open_impl(std::string_view path, std::uint64_t size, bool presize) noexcept {
    if (!closed_.load(std::memory_order_acquire)) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    if (auto ec = ensure_parent_directory(path)) {
        return ec;
    }

    try {
        path_ = std::string(path);
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }

    if (presize && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        auto ec = errno_to_error_code(errno, DiskErrc::write_error);
        ::close(fd);
        ::unlink(path_.c_str());
        return ec;
    }

    fd_ = fd;
    closed_.store(false, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd_, bytes, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        bytes += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already closed
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FileWriter::remove() noexcept {
    close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
    }
}

} // namespace dnl::disk
