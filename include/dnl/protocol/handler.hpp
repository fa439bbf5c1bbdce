// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/progress.hpp>
#include <dnl/core/transfer_record.hpp>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace dnl::protocol {

// Observers for one transfer
struct TransferHooks {
    std::function<void(const core::TransferRecord&)> on_start;   // `starting` record
    core::ProgressSink on_progress;
};

// A transport strategy bound to a set of resource identifiers
class ProtocolHandler {
public:
    virtual ~ProtocolHandler() = default;

    // Protocol tag written to TransferRecord::file_type
    [[nodiscard]] virtual std::string_view tag() const noexcept = 0;

    [[nodiscard]] virtual bool can_handle(std::string_view url) const noexcept = 0;

    // Runs the transfer to completion. The returned record is always terminal:
    // `completed`, or `failed` with a non-empty error.
    [[nodiscard]] virtual core::TransferRecord download(const std::string& url,
                                                        const std::string& destination,
                                                        const TransferHooks& hooks,
                                                        std::stop_token stop) = 0;

    // Output path for `url` inside `directory`
    [[nodiscard]] virtual std::string destination_for(const std::string& url,
                                                      const std::string& directory) const;

protected:
    // `failed` record for errors raised before the transfer could start
    [[nodiscard]] core::TransferRecord failed_record(const std::string& url,
                                                     const std::string& destination,
                                                     std::string error) const;
};

// Scheme of `url`, lower-cased; empty when there is none
[[nodiscard]] std::string scheme_of(std::string_view url);

} // namespace dnl::protocol
