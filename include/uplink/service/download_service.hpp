#ifndef UPLINK_SERVICE_DOWNLOAD_SERVICE_HPP
#define UPLINK_SERVICE_DOWNLOAD_SERVICE_HPP

#include "uplink/cache/cache_index.hpp"
#include "uplink/download/cancellation.hpp"
#include "uplink/download/download_config.hpp"
#include "uplink/download/download_lease.hpp"
#include "uplink/download/progress.hpp"
#include "uplink/error/download_error.hpp"
#include "uplink/error/error_classifier.hpp"
#include "uplink/transport/http_client.hpp"
#include "uplink/update/update_checker.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace uplink {

struct DownloadRequest {
    std::string url;
    std::filesystem::path destination;

    // Without it, any readable file of at least 1 KiB at destination counts
    // as finished, including a partial left behind by an interrupted run.
    // Set it whenever the size is known; fetch_update() tracks completion
    // in the CacheIndex instead.
    std::optional<std::uint64_t> expected_size;

    bool resume{true};
};

using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;

// ─────────────────────────────────────────────────────────────────────────────
// DownloadService
// ─────────────────────────────────────────────────────────────────────────────
// The caller-level flow around a Downloader:
//
//   1. lease the destination (second caller gets "Download already in progress")
//   2. cached file valid?    -> return it, no network
//      cached file invalid?  -> resume it
//   3. download with retries
//   4. validate the result; a file that fails is deleted
//
// fetch() may be called from several threads at once; each call gets its own
// HTTP client from the factory.

class DownloadService {
public:
    explicit DownloadService(
        DownloadConfig config = {},
        DownloadLeaseRegistry& registry = DownloadLeaseRegistry::global(),
        HttpClientFactory client_factory = make_http_client
    );

    [[nodiscard]] DownloadResult<std::filesystem::path> fetch(
        const DownloadRequest& request,
        IProgressObserver& observer,
        const CancellationToken* cancel = nullptr
    );

    /// Download an update's archive into the cache under its version-tagged
    /// name, recording it in index.
    [[nodiscard]] DownloadResult<std::filesystem::path> fetch_update(
        const UpdateInfo& update,
        CacheIndex& index,
        IProgressObserver& observer,
        const CancellationToken* cancel = nullptr
    );

    /// What to show the user for a failed fetch.
    [[nodiscard]] static ErrorVerdict verdict(const DownloadError& error) {
        return ErrorClassifier::classify(error);
    }

    [[nodiscard]] const DownloadConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] DownloadLeaseRegistry& registry() noexcept {
        return registry_;
    }

private:
    // trust_cached=false resumes whatever is on disk instead of returning it
    DownloadResult<std::filesystem::path> fetch_leased(
        const DownloadRequest& request,
        IProgressObserver& observer,
        const CancellationToken* cancel,
        bool trust_cached
    );

    DownloadConfig config_;
    DownloadLeaseRegistry& registry_;
    HttpClientFactory client_factory_;
};

}  // namespace uplink

#endif  // UPLINK_SERVICE_DOWNLOAD_SERVICE_HPP
