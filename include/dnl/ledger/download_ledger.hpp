// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dnl/core/error.hpp>
#include <dnl/core/log.hpp>
#include <dnl/core/transfer_record.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dnl::ledger {

// Partial update; only engaged fields are applied
struct RecordChanges {
    std::optional<core::TransferStatus> status;
    std::optional<double> progress;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::uint64_t> file_size;
    std::optional<std::string> download_path;
    std::optional<std::string> checksum;
    std::optional<std::string> speed;
    std::optional<std::string> error;
    std::optional<std::map<std::string, std::string>> metadata;

    // Every field of `record` (status included)
    [[nodiscard]] static RecordChanges from(const core::TransferRecord& record);

    [[nodiscard]] bool empty() const noexcept;
};

// Active transfers keyed by URL plus a history of snapshots persisted as
// <directory>/history.json. Persistence failures are logged and reported as
// ledger_io; the in-memory state is updated regardless.
class DownloadLedger {
public:
    // An empty directory keeps everything in memory
    explicit DownloadLedger(std::string directory = {}, core::Logger logger = {});

    DownloadLedger(const DownloadLedger&) = delete;
    DownloadLedger& operator=(const DownloadLedger&) = delete;

    // Insert as active (last write wins per URL) and append to history
    std::error_code record(const core::TransferRecord& record);

    // Merge `changes` into the active entry for `url` and into its history
    // snapshot (matched by transfer id). invalid_argument when the URL is not
    // active or the status would move backwards; nothing changes then.
    std::error_code update(const std::string& url, const RecordChanges& changes);

    [[nodiscard]] std::map<std::string, core::TransferRecord> query_active() const;
    [[nodiscard]] std::vector<core::TransferRecord> query_history() const;
    [[nodiscard]] std::optional<core::TransferRecord> find(const std::string& url) const;

    std::error_code clear_history();

    [[nodiscard]] std::string history_path() const;

private:
    void load();
    std::error_code persist_locked() const;

    std::string directory_;
    core::Logger logger_;

    mutable std::mutex mutex_;
    std::map<std::string, core::TransferRecord> active_;
    std::vector<core::TransferRecord> history_;
};

} // namespace dnl::ledger
