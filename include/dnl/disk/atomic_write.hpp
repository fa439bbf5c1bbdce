// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/disk/error.hpp>
#include <string_view>

namespace dnl::disk {

// Replace `path` with `contents`: write a sibling temp file, fsync, rename.
// Readers see either the old file or the new one, never a torn write.
[[nodiscard]] std::error_code write_file_atomic(std::string_view path,
                                                std::string_view contents) noexcept;

} // namespace dnl::disk
