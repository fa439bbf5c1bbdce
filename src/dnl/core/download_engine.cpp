// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/core/download_engine.hpp>
#include <dnl/core/capability_probe.hpp>
#include <dnl/core/chunk_planner.hpp>
#include <dnl/core/range_fetcher.hpp>
#include <dnl/core/url.hpp>
#include <dnl/disk/digest.hpp>
#include <dnl/disk/file_writer.hpp>
#include <thread>
#include <vector>

namespace dnl::core {

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(TransferConfig config,
                               Logger logger,
                               std::shared_ptr<ConnectionLimiter> limiter)
    : config_(std::move(config))
    , logger_(or_null(std::move(logger)))
    , limiter_(limiter ? std::move(limiter)
                       : std::make_shared<ConnectionLimiter>(config_.max_total_connections))
    , http_session_(config_) {}

std::expected<ResourceMetadata, std::error_code>
DownloadEngine::probe(const std::string& url) noexcept {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    auto head = http_session_.head(url);
    if (!head) {
        logger_->debug("probe {} failed: {}", url, head.error().message());
        return std::unexpected(head.error());
    }

    try {
        ResourceMetadata meta;
        meta.byte_length = head->content_length;
        meta.resumable = head->accepts_ranges;
        meta.content_type = head->content_type;
        meta.filename = head->filename.empty() ? parsed->filename() : head->filename;
        if (!head->etag.empty()) meta.etag = head->etag;
        if (!head->last_modified.empty()) meta.last_modified = head->last_modified;
        meta.effective_url = head->effective_url;
        return meta;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<ResourceMetadata, std::error_code>
DownloadEngine::fetch_metadata(const std::string& url) noexcept {
    auto meta = probe(url);
    if (!meta) {
        if (meta.error() == make_error_code(DownloadErrc::invalid_url)) {
            return meta;
        }
        return std::unexpected(make_error_code(DownloadErrc::metadata_unavailable));
    }
    if (!meta->byte_length || *meta->byte_length == 0) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_size));
    }
    return meta;
}

std::expected<TransferRecord, DownloadFailure>
DownloadEngine::download(const std::string& url,
                         const std::string& destination,
                         DownloadOptions options) {
    auto record = TransferRecord::start(url, options.file_type, destination);
    if (options.on_start) {
        options.on_start(record);
    }

    auto fail = [&](std::error_code ec, std::string detail) {
        DownloadFailure failure{ec, std::move(detail), {}};
        record.fail(failure.message());
        logger_->error("{}: {}", url, failure.message());
        failure.record = record;
        return std::unexpected(std::move(failure));
    };

    if (options.stop.stop_requested()) {
        return fail(make_error_code(DownloadErrc::cancelled), {});
    }

    // 1. Metadata; no partial state on failure. Same checks as
    // fetch_metadata, keeping the transport cause for the record.
    auto meta = probe(url);
    if (!meta) {
        if (meta.error() == make_error_code(DownloadErrc::invalid_url)) {
            return fail(meta.error(), url);
        }
        return fail(make_error_code(DownloadErrc::metadata_unavailable), meta.error().message());
    }
    if (!meta->byte_length || *meta->byte_length == 0) {
        return fail(make_error_code(DownloadErrc::unknown_size), {});
    }
    const std::uint64_t length = *meta->byte_length;
    record.file_size = length;
    if (!meta->content_type.empty()) record.metadata["content_type"] = meta->content_type;
    if (meta->etag) record.metadata["etag"] = *meta->etag;
    if (meta->last_modified) record.metadata["last_modified"] = *meta->last_modified;

    // 2. Connection count
    const std::uint32_t connections = options.connections.value_or(CapabilityProbe::optimal_connection_count());
    record.metadata["connections"] = std::to_string(connections);

    // 3. Plan before touching the disk so a bad plan leaves nothing behind
    auto plan = ChunkPlanner::plan(length, connections);
    if (!plan) {
        return fail(plan.error(), "connections=" + std::to_string(connections));
    }

    // 4. Pre-size the destination so every chunk writes at a fixed offset
    disk::FileWriter writer;
    if (auto ec = writer.open(destination, length)) {
        return fail(ec, destination);
    }

    record.advance(TransferStatus::downloading);
    logger_->info("downloading {} ({} bytes, {} connections) -> {}", url, length, connections, destination);

    // 5. One task per chunk, all awaited before deciding the outcome
    ProgressAccumulator progress(length, std::move(options.progress));
    RangeFetcher fetcher(config_, limiter_, logger_);
    std::vector<std::expected<std::uint64_t, FetchError>> results(
        plan->size(), std::expected<std::uint64_t, FetchError>{std::uint64_t{0}});

    std::error_code spawn_error;
    {
        std::vector<std::jthread> workers;
        workers.reserve(plan->size());
        for (std::size_t i = 0; i < plan->size(); ++i) {
            const auto& chunk = (*plan)[i];
            if (chunk.empty()) {
                continue;  // immediately complete with zero bytes
            }
            try {
                workers.emplace_back([&, i] {
                    results[i] = fetcher.fetch(url, (*plan)[i], writer, progress, options.stop);
                });
            } catch (const std::system_error& e) {
                results[i] = std::unexpected(FetchError{FetchErrorKind::permanent, e.code(), "thread spawn"});
            }
        }
    } // fan-in: jthreads join here

    // 6. Aggregate: first error wins
    std::uint64_t total_written = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (!results[i]) {
            writer.remove();
            return fail(make_error_code(DownloadErrc::chunk_fetch_failed),
                        "chunk " + std::to_string(i) + ": " + results[i].error().message());
        }
        total_written += *results[i];
    }

    // 7. Guard against silently truncated range responses
    if (total_written != length) {
        writer.remove();
        return fail(make_error_code(DownloadErrc::size_mismatch),
                    "expected " + std::to_string(length) + " bytes, got " + std::to_string(total_written));
    }

    if (auto ec = writer.flush()) {
        writer.remove();
        return fail(ec, destination);
    }
    writer.close();

    progress.flush();
    record.speed = format_speed(progress.snapshot().speed_bps);
    record.complete();
    logger_->info("completed {} ({})", destination, format_bytes(length));
    return record;
}

bool DownloadEngine::verify_checksum(const std::string& path,
                                     std::string_view expected_hex) const noexcept {
    auto digest = disk::sha256_file(path, config_.buffer_size);
    if (!digest) {
        logger_->warn("checksum of {} unavailable: {}", path, digest.error().message());
        return false;
    }
    try {
        return *digest == to_lower(expected_hex);
    } catch (const std::bad_alloc&) {
        return false;
    }
}

} // namespace dnl::core
