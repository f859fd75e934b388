#include "uplink/service/download_service.hpp"

#include "uplink/cache/file_validator.hpp"
#include "uplink/download/downloader.hpp"
#include "uplink/log/logger.hpp"

#include <stdexcept>

namespace uplink {

DownloadService::DownloadService(
    DownloadConfig config,
    DownloadLeaseRegistry& registry,
    HttpClientFactory client_factory
)
    : config_(std::move(config))
    , registry_(registry)
    , client_factory_(std::move(client_factory))
{
    if (!client_factory_) {
        throw std::invalid_argument("DownloadService: client factory cannot be empty");
    }
}

DownloadResult<std::filesystem::path> DownloadService::fetch(
    const DownloadRequest& request,
    IProgressObserver& observer,
    const CancellationToken* cancel
) {
    return fetch_leased(request, observer, cancel, true);
}

DownloadResult<std::filesystem::path> DownloadService::fetch_leased(
    const DownloadRequest& request,
    IProgressObserver& observer,
    const CancellationToken* cancel,
    bool trust_cached
) {
    auto lease = registry_.try_acquire(request.destination);
    if (!lease) {
        UPLINK_LOG_WARN("Download to {} rejected: already in progress", request.destination.string());
        return tl::unexpected(lease.error());
    }

    bool resume = request.resume;

    // ─────────────────────────────────────────────────────────────────────────
    // Cached file
    // ─────────────────────────────────────────────────────────────────────────

    std::error_code ec;
    if (std::filesystem::exists(request.destination, ec)) {
        auto cached = validate_cached_file(request.destination, request.expected_size);
        if (!cached) {
            UPLINK_LOG_WARN("Cannot inspect cached file {}: {}; downloading again",
                            request.destination.string(), cached.error().chain());
            std::filesystem::remove(request.destination, ec);
            if (ec) {
                return tl::unexpected(DownloadError::filesystem("Failed to remove cached file", ec));
            }
            resume = false;
        } else if (*cached && trust_cached) {
            UPLINK_LOG_INFO("Using cached file {}", request.destination.string());
            return request.destination;
        } else {
            UPLINK_LOG_INFO("Cached file {} is incomplete, resuming", request.destination.string());
            resume = true;
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Download
    // ─────────────────────────────────────────────────────────────────────────

    Downloader downloader(config_, client_factory_());
    auto downloaded = downloader.download(request.url, request.destination, resume, observer, cancel);
    if (!downloaded) {
        return tl::unexpected(std::move(downloaded.error()));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Post-validation
    // ─────────────────────────────────────────────────────────────────────────

    auto valid = validate_cached_file(*downloaded, request.expected_size);
    if (!valid || *valid == false) {
        UPLINK_LOG_ERROR("Downloaded file {} failed validation, removing it", downloaded->string());
        std::filesystem::remove(*downloaded, ec);
        if (ec) {
            UPLINK_LOG_WARN("Failed to remove {}: {}", downloaded->string(), ec.message());
        }
        auto error = DownloadError::validation("Downloaded file failed validation");
        if (!valid) {
            error = std::move(valid.error()).with_context("Downloaded file failed validation");
            error.code = DownloadError::Code::Validation;
        }
        return tl::unexpected(std::move(error));
    }

    UPLINK_LOG_INFO("Download complete: {}", downloaded->string());
    return downloaded;
}

DownloadResult<std::filesystem::path> DownloadService::fetch_update(
    const UpdateInfo& update,
    CacheIndex& index,
    IProgressObserver& observer,
    const CancellationToken* cancel
) {
    if (update.download_url.empty()) {
        return tl::unexpected(DownloadError::configuration(
            "Release " + update.latest_version + " has no downloadable archive"));
    }

    const std::string file_name = CacheIndex::cache_file_name(update.latest_version, update.asset_name);
    const auto existing = index.find(file_name);

    DownloadRequest request;
    request.url = update.download_url;
    request.destination = index.file_path(update.latest_version, update.asset_name);
    request.resume = true;

    // Only a completed entry for the same source may short-circuit; anything
    // else on disk is a partial download to resume.
    bool trust_cached = false;
    if (existing.has_value() && existing->completed && existing->source_url == update.download_url) {
        request.expected_size = existing->size;
        trust_cached = true;
    }

    if (!existing.has_value() || existing->source_url != update.download_url) {
        if (existing.has_value()) {
            UPLINK_LOG_INFO("Source of {} changed, discarding cached copy", file_name);
            std::error_code ec;
            std::filesystem::remove(request.destination, ec);
            if (ec) {
                return tl::unexpected(DownloadError::filesystem("Failed to remove cached file", ec));
            }
        }

        CacheEntry entry;
        entry.file_name = file_name;
        entry.version = update.latest_version;
        entry.source_url = update.download_url;
        if (auto recorded = index.record(std::move(entry)); !recorded) {
            return tl::unexpected(recorded.error());
        }
    }

    auto fetched = fetch_leased(request, observer, cancel, trust_cached);
    if (!fetched) {
        return fetched;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(*fetched, ec);
    if (ec) {
        return tl::unexpected(DownloadError::filesystem("Failed to get file metadata", ec));
    }
    if (auto marked = index.mark_completed(file_name, size); !marked) {
        return tl::unexpected(marked.error());
    }
    return fetched;
}

}  // namespace uplink
