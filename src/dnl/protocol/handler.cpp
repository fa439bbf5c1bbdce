// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/protocol/handler.hpp>
#include <dnl/core/url.hpp>
#include <filesystem>

namespace dnl::protocol {

std::string ProtocolHandler::destination_for(const std::string& url,
                                             const std::string& directory) const {
    std::string name = "download";
    if (auto parsed = core::Url::parse(url)) {
        name = parsed->filename();
    }
    if (directory.empty()) {
        return name;
    }
    return (std::filesystem::path(directory) / name).string();
}

core::TransferRecord ProtocolHandler::failed_record(const std::string& url,
                                                    const std::string& destination,
                                                    std::string error) const {
    auto record = core::TransferRecord::start(url, std::string(tag()), destination);
    record.fail(std::move(error));
    return record;
}

std::string scheme_of(std::string_view url) {
    auto end = url.find("://");
    if (end == std::string_view::npos) {
        return {};
    }
    return core::to_lower(url.substr(0, end));
}

} // namespace dnl::protocol
