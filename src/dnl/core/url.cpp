// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace dnl::core {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3;

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) query_start = url_str.length();

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        // host_end is at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start});

        // user:pass@ is kept so it survives full() for ftp/sftp
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.rfind('@', host_end);
        if (at_pos != std::string_view::npos && at_pos >= rest_start && at_pos < host_end) {
            url.userinfo_ = std::string(url_str.substr(rest_start, at_pos - rest_start));
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);
        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
                url.port_ = std::string(authority.substr(bracket_end + 2));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        // file:// URLs have an empty authority
        if (url.host_.empty() && url.scheme_ != "file") {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http" || scheme_ == "dav") return 80;
    if (scheme_ == "https" || scheme_ == "webdav") return 443;
    if (scheme_ == "ftp") return 21;
    if (scheme_ == "sftp" || scheme_ == "ssh") return 22;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    // Directory URLs (path ends with /) default to index.html
    if (name.empty()) {
        return "index.html";
    }
    return name;
}

Url Url::with_scheme(std::string_view scheme) const {
    Url copy = *this;
    copy.scheme_ = to_lower(scheme);
    return copy;
}

} // namespace dnl::core
