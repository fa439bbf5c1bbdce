// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/ledger/download_ledger.hpp>
#include <dnl/disk/atomic_write.hpp>
#include <dnl/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace dnl::ledger {

namespace fs = std::filesystem;

//=============================================================================
// RecordChanges
//=============================================================================

RecordChanges RecordChanges::from(const core::TransferRecord& record) {
    RecordChanges changes;
    changes.status = record.status;
    changes.progress = record.progress;
    changes.completed_at = record.completed_at;
    changes.file_size = record.file_size;
    changes.download_path = record.download_path;
    changes.checksum = record.checksum;
    changes.speed = record.speed;
    changes.error = record.error;
    changes.metadata = record.metadata;
    return changes;
}

bool RecordChanges::empty() const noexcept {
    return !status && !progress && !completed_at && !file_size && !download_path
        && !checksum && !speed && !error && !metadata;
}

namespace {

// Apply to a copy so a rejected status leaves the original untouched
std::optional<core::TransferRecord> merged(const core::TransferRecord& current,
                                           const RecordChanges& changes) {
    auto next = current;
    if (changes.status && *changes.status != next.status && !next.advance(*changes.status)) {
        return std::nullopt;
    }
    if (changes.progress) next.set_progress(*changes.progress);
    if (changes.completed_at) next.completed_at = changes.completed_at;
    if (changes.file_size) next.file_size = changes.file_size;
    if (changes.download_path) next.download_path = *changes.download_path;
    if (changes.checksum) next.checksum = changes.checksum;
    if (changes.speed) next.speed = changes.speed;
    if (changes.error) next.error = changes.error;
    if (changes.metadata) next.metadata = *changes.metadata;
    return next;
}

} // namespace

//=============================================================================
// DownloadLedger
//=============================================================================

DownloadLedger::DownloadLedger(std::string directory, core::Logger logger)
    : directory_(std::move(directory))
    , logger_(core::or_null(std::move(logger))) {
    load();
}

std::string DownloadLedger::history_path() const {
    if (directory_.empty()) return {};
    return (fs::path(directory_) / "history.json").string();
}

void DownloadLedger::load() {
    auto path = history_path();
    if (path.empty()) return;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;  // first run
    }

    try {
        std::ifstream file(path);
        auto j = nlohmann::json::parse(file);
        if (!j.is_array()) {
            throw std::invalid_argument("history is not an array");
        }
        std::vector<core::TransferRecord> loaded;
        loaded.reserve(j.size());
        for (const auto& entry : j) {
            loaded.push_back(entry.get<core::TransferRecord>());
        }
        history_ = std::move(loaded);
        logger_->debug("loaded {} history entries from {}", history_.size(), path);
    } catch (const std::exception& e) {
        logger_->warn("{}: {} ({}), starting with empty history",
                      path, make_error_code(core::DownloadErrc::ledger_io).message(), e.what());
        history_.clear();
    }
}

std::error_code DownloadLedger::persist_locked() const {
    auto path = history_path();
    if (path.empty()) return {};

    std::error_code ec;
    try {
        nlohmann::json j = history_;
        if (auto dir_ec = disk::ensure_parent_directory(path)) {
            ec = dir_ec;
        } else {
            ec = disk::write_file_atomic(path, j.dump(2));
        }
    } catch (const std::exception& e) {
        logger_->warn("{}: {}", path, e.what());
        return make_error_code(core::DownloadErrc::ledger_io);
    }

    if (ec) {
        logger_->warn("{}: {} ({})", path, make_error_code(core::DownloadErrc::ledger_io).message(), ec.message());
        return make_error_code(core::DownloadErrc::ledger_io);
    }
    return {};
}

std::error_code DownloadLedger::record(const core::TransferRecord& record) {
    std::lock_guard lock(mutex_);
    active_[record.url] = record;
    history_.push_back(record);
    return persist_locked();
}

std::error_code DownloadLedger::update(const std::string& url, const RecordChanges& changes) {
    std::lock_guard lock(mutex_);
    auto it = active_.find(url);
    if (it == active_.end()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    auto next = merged(it->second, changes);
    if (!next) {
        logger_->warn("{}: rejected status change {} -> {}", url,
                      core::to_string(it->second.status), core::to_string(*changes.status));
        return std::make_error_code(std::errc::invalid_argument);
    }
    it->second = std::move(*next);

    for (auto& entry : history_) {
        if (entry.transfer_id == it->second.transfer_id) {
            entry = it->second;
            break;
        }
    }
    return persist_locked();
}

std::map<std::string, core::TransferRecord> DownloadLedger::query_active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

std::vector<core::TransferRecord> DownloadLedger::query_history() const {
    std::lock_guard lock(mutex_);
    return history_;
}

std::optional<core::TransferRecord> DownloadLedger::find(const std::string& url) const {
    std::lock_guard lock(mutex_);
    auto it = active_.find(url);
    if (it == active_.end()) return std::nullopt;
    return it->second;
}

std::error_code DownloadLedger::clear_history() {
    std::lock_guard lock(mutex_);
    history_.clear();
    return persist_locked();
}

} // namespace dnl::ledger
