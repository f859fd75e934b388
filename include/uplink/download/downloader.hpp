#ifndef UPLINK_DOWNLOAD_DOWNLOADER_HPP
#define UPLINK_DOWNLOAD_DOWNLOADER_HPP

#include "uplink/download/cancellation.hpp"
#include "uplink/download/download_config.hpp"
#include "uplink/download/progress.hpp"
#include "uplink/download/transfer_engine.hpp"
#include "uplink/error/download_error.hpp"
#include "uplink/retry/backoff_policy.hpp"
#include "uplink/transport/http_client.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// RetryContext
// ─────────────────────────────────────────────────────────────────────────────
// Built per run() call and dropped at its end.

struct RetryContext {
    std::size_t attempt{0};         // 0-indexed
    std::size_t max_retries{0};

    [[nodiscard]] bool exhausted() const noexcept {
        return attempt >= max_retries;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Downloader
// ─────────────────────────────────────────────────────────────────────────────
// Runs TransferEngine attempts until one succeeds, the error is not
// retryable, or max_retries is used up:
//
//   attempt 0 -> fail (retryable) -> notify(retry 1) -> sleep delay(0) ->
//   attempt 1 -> fail (retryable) -> notify(retry 2) -> sleep delay(1) -> ...
//
// Every attempt after a failure resumes from whatever the previous attempt
// left on disk. One IHttpClient is reused throughout so the keep-alive
// connection survives between the probe, the attempts and the retries.
//
// Not thread-safe: one run() at a time per instance. Run several
// Downloaders for concurrent downloads, one per destination (see
// DownloadLeaseRegistry).

class Downloader {
public:
    explicit Downloader(DownloadConfig config = {});

    Downloader(DownloadConfig config, std::unique_ptr<IHttpClient> client);

    ~Downloader();

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    /// Retry loop over target. resume_hint asks for a resume even if the
    /// caller does not know whether a partial file exists; an existing
    /// destination is always resumed.
    [[nodiscard]] DownloadResult<std::filesystem::path> run(
        const TransferTarget& target,
        bool resume_hint,
        IProgressObserver& observer,
        const CancellationToken* cancel = nullptr
    );

    /// Validates the URL, then run().
    [[nodiscard]] DownloadResult<std::filesystem::path> download(
        const std::string& url,
        const std::filesystem::path& destination,
        bool resume_if_present,
        IProgressObserver& observer,
        const CancellationToken* cancel = nullptr
    );

    [[nodiscard]] const DownloadConfig& config() const noexcept {
        return config_;
    }

private:
    DownloadConfig config_;
    std::unique_ptr<IHttpClient> client_;
    std::shared_ptr<IBackoffPolicy> backoff_;
};

}  // namespace uplink

#endif  // UPLINK_DOWNLOAD_DOWNLOADER_HPP
