// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/transfer_record.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <ctime>
#include <random>
#include <stdexcept>

namespace dnl::core {

std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::starting:    return "starting";
        case TransferStatus::downloading: return "downloading";
        case TransferStatus::completed:   return "completed";
        case TransferStatus::failed:      return "failed";
    }
    return "failed";
}

std::optional<TransferStatus> parse_status(std::string_view text) noexcept {
    if (text == "starting")    return TransferStatus::starting;
    if (text == "downloading") return TransferStatus::downloading;
    if (text == "completed")   return TransferStatus::completed;
    if (text == "failed")      return TransferStatus::failed;
    return std::nullopt;
}

//=============================================================================
// TransferRecord
//=============================================================================

TransferRecord TransferRecord::start(std::string url, std::string file_type,
                                     std::string download_path) {
    TransferRecord record;
    record.transfer_id = generate_transfer_id();
    record.url = std::move(url);
    record.file_type = std::move(file_type);
    record.download_path = std::move(download_path);
    record.started_at = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
    return record;
}

bool TransferRecord::advance(TransferStatus next) noexcept {
    if (is_terminal(status)) {
        return false;
    }
    if (static_cast<std::uint8_t>(next) < static_cast<std::uint8_t>(status)) {
        return false;
    }
    status = next;
    return true;
}

void TransferRecord::set_progress(double percent) noexcept {
    progress = std::clamp(percent, 0.0, 100.0);
}

void TransferRecord::complete() {
    if (advance(TransferStatus::completed)) {
        progress = 100.0;
        completed_at = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
        error.reset();
    }
}

void TransferRecord::fail(std::string message) {
    if (advance(TransferStatus::failed)) {
        if (message.empty()) {
            message = "unknown error";
        }
        error = std::move(message);
        completed_at = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
    }
}

std::string generate_transfer_id() {
    // 128 random bits as 32 hex digits
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char digits[] = "0123456789abcdef";
    std::string id;
    id.reserve(32);
    for (int half = 0; half < 2; ++half) {
        auto v = rng();
        for (int i = 0; i < 16; ++i) {
            id += digits[v & 0xF];
            v >>= 4;
        }
    }
    return id;
}

std::string format_timestamp(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::array<char, 32> buf{};
    auto n = std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf.data(), n);
}

std::optional<Clock::time_point> parse_timestamp(std::string_view text) {
    std::tm tm{};
    std::string s(text);
    const char* end = strptime(s.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (end == nullptr) {
        return std::nullopt;
    }
    // Optional trailing Z
    if (*end == 'Z') ++end;
    if (*end != '\0') {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(t);
}

//=============================================================================
// JSON
//=============================================================================

namespace {

template<typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, const TransferRecord& record) {
    j = nlohmann::json{
        {"id", record.transfer_id},
        {"url", record.url},
        {"file_type", record.file_type},
        {"status", std::string(to_string(record.status))},
        {"progress", record.progress},
        {"started_at", format_timestamp(record.started_at)},
        {"completed_at", record.completed_at
            ? nlohmann::json(format_timestamp(*record.completed_at)) : nlohmann::json(nullptr)},
        {"file_size", optional_json(record.file_size)},
        {"download_path", record.download_path},
        {"checksum", optional_json(record.checksum)},
        {"speed", optional_json(record.speed)},
        {"error", optional_json(record.error)},
        {"metadata", record.metadata},
    };
}

// Throws nlohmann::json::exception or std::invalid_argument on malformed input
void from_json(const nlohmann::json& j, TransferRecord& record) {
    record = TransferRecord{};
    record.transfer_id = j.value("id", std::string{});
    if (record.transfer_id.empty()) {
        record.transfer_id = generate_transfer_id();
    }
    j.at("url").get_to(record.url);
    record.file_type = j.value("file_type", std::string{});

    auto status = parse_status(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown transfer status");
    }
    record.status = *status;
    record.set_progress(j.value("progress", 0.0));

    if (auto started = parse_timestamp(j.value("started_at", std::string{}))) {
        record.started_at = *started;
    }
    if (auto completed = optional_string(j, "completed_at")) {
        record.completed_at = parse_timestamp(*completed);
    }

    auto size_it = j.find("file_size");
    if (size_it != j.end() && !size_it->is_null()) {
        record.file_size = size_it->get<std::uint64_t>();
    }
    record.download_path = j.value("download_path", std::string{});
    record.checksum = optional_string(j, "checksum");
    record.speed = optional_string(j, "speed");
    record.error = optional_string(j, "error");

    auto meta_it = j.find("metadata");
    if (meta_it != j.end() && meta_it->is_object()) {
        record.metadata = meta_it->get<std::map<std::string, std::string>>();
    }
}

} // namespace dnl::core
