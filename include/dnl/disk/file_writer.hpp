// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/disk/error.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace dnl::disk {

// Output file shared by concurrent chunk fetchers. Writes are positioned
// (pwrite) so callers writing disjoint ranges need no lock.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create parent directories, create or truncate the file and extend it
    // to `size` bytes (sparse where the file system allows)
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t size) noexcept;

    // Create or truncate for sequential appends of unknown total size
    [[nodiscard]] std::error_code open_stream(std::string_view path) noexcept;

    // Write the whole buffer at `offset` (thread-safe for disjoint ranges)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    // Close, then delete the file from disk
    void remove() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::error_code open_impl(std::string_view path, std::uint64_t size, bool presize) noexcept;

    int fd_{-1};
    std::string path_;
    std::atomic<bool> closed_{true};  // Guard against double-close
};

// Create every missing directory above `path`
[[nodiscard]] std::error_code ensure_parent_directory(std::string_view path) noexcept;

} // namespace dnl::disk
