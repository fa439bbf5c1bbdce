// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/disk/error.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace dnl::disk {

// Streams the file through SHA-256 in `buffer_size` reads until EOF.
// Returns the lower-case hex digest.
[[nodiscard]] std::expected<std::string, std::error_code>
sha256_file(std::string_view path, std::size_t buffer_size) noexcept;

[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace dnl::disk
