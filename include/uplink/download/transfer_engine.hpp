#ifndef UPLINK_DOWNLOAD_TRANSFER_ENGINE_HPP
#define UPLINK_DOWNLOAD_TRANSFER_ENGINE_HPP

#include "uplink/download/cancellation.hpp"
#include "uplink/download/download_config.hpp"
#include "uplink/download/progress.hpp"
#include "uplink/error/download_error.hpp"
#include "uplink/transport/http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// TransferTarget
// ─────────────────────────────────────────────────────────────────────────────

struct TransferTarget {
    std::string url;
    std::filesystem::path destination;
};

// ─────────────────────────────────────────────────────────────────────────────
// TransferState
// ─────────────────────────────────────────────────────────────────────────────
// Per-attempt bookkeeping. resume_offset is the on-disk length when the
// attempt began streaming (0 after a forced restart). total is 0 while
// unknown.

struct TransferState {
    std::uint64_t resume_offset{0};
    bool range_supported{true};
    std::uint64_t total{0};
    std::uint64_t downloaded{0};
    bool restarted{false};      // partial file was discarded this attempt
};

// ─────────────────────────────────────────────────────────────────────────────
// Disk space
// ─────────────────────────────────────────────────────────────────────────────

/// Fails with InsufficientSpace when directory has less than min_free bytes
/// available. If the free space cannot be determined the check passes with
/// a warning. min_free == 0 skips the check.
[[nodiscard]] DownloadResult<void> check_disk_space(
    const std::filesystem::path& directory,
    std::uint64_t min_free
);

// ─────────────────────────────────────────────────────────────────────────────
// TransferEngine
// ─────────────────────────────────────────────────────────────────────────────
// One download attempt:
//
//   1. create the destination directory and check free space
//   2. if resuming a non-empty file, probe range support; without it the
//      partial file is deleted and the attempt starts from 0
//   3. GET, ranged when resuming. 200 or 416 to a ranged request means the
//      server ignored or rejected the range: delete, reissue once from 0
//   4. total = Content-Length + offset, else the Content-Range total, else 0
//   5. append or truncate, write each chunk before counting it
//   6. throttled byte ticks, then a final 100% tick
//
// A body shorter than a known total is a PrematureEnd failure. The engine
// never retries on its own; that is the Downloader's job.
//
// The engine only ever touches target.destination, and only deletes it on a
// forced restart.

class TransferEngine {
public:
    TransferEngine(IHttpClient& client, const DownloadConfig& config)
        : client_(client)
        , config_(config)
    {}

    [[nodiscard]] DownloadResult<TransferState> attempt(
        const TransferTarget& target,
        bool resume,
        IProgressObserver& observer,
        std::size_t retry_count = 0,
        const CancellationToken* cancel = nullptr
    );

private:
    DownloadResult<TransferState> prepare_resume(const TransferTarget& target, bool resume);

    IHttpClient& client_;
    const DownloadConfig& config_;
};

}  // namespace uplink

#endif  // UPLINK_DOWNLOAD_TRANSFER_ENGINE_HPP
