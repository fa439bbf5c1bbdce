// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace dnl::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    // Same URL with another scheme (webdav:// -> https://)
    [[nodiscard]] Url with_scheme(std::string_view scheme) const;

    Url() = default;

private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Lower-case copy, used for scheme and host matching
[[nodiscard]] std::string to_lower(std::string_view s);

} // namespace dnl::core
