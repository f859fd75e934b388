#ifndef UPLINK_DOWNLOAD_DOWNLOAD_CONFIG_HPP
#define UPLINK_DOWNLOAD_DOWNLOAD_CONFIG_HPP

#include "uplink/error/download_error.hpp"
#include "uplink/retry/retry_policy.hpp"
#include "uplink/transport/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace uplink {

// Shortest stall allowed between body chunks. Anything lower would fail
// healthy downloads on a congested link.
inline constexpr std::chrono::milliseconds kMinChunkTimeout{30'000};

// ─────────────────────────────────────────────────────────────────────────────
// DownloadConfig
// ─────────────────────────────────────────────────────────────────────────────
// Everything a Downloader needs besides the target. Defaults are tuned for
// large release archives from a CDN over a flaky home connection.

struct DownloadConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    std::string user_agent{"uplink-updater/1.0"};

    // Sent with every request in addition to User-Agent and Connection.
    HeaderMap extra_headers;

    std::chrono::milliseconds connect_timeout{30'000};

    // Longest silence tolerated between body chunks. Never below
    // kMinChunkTimeout.
    std::chrono::milliseconds chunk_timeout{kMinChunkTimeout};

    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Engine
    // ─────────────────────────────────────────────────────────────────────────

    // Minimum gap between byte ticks. The final 100% sample is always sent.
    std::chrono::milliseconds progress_interval{100};

    // Refuse to start with less free space than this in the destination
    // directory. 0 disables the check.
    std::uint64_t min_free_space{100ULL * 1024 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Retry
    // ─────────────────────────────────────────────────────────────────────────

    RetryPolicy retry{RetryPolicy::for_network_operations()};

    // Overrides the policy built from retry.backoff(). Not serialized.
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // Test hooks (see apply_environment)
    // ─────────────────────────────────────────────────────────────────────────

    // Cap on body throughput, bytes per second.
    std::optional<std::uint64_t> max_bytes_per_second;

    // Per-chunk chance, in percent, of a simulated connection reset.
    std::uint8_t fail_percent{0};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    DownloadConfig& with_user_agent(std::string agent);
    DownloadConfig& with_header(const std::string& name, const std::string& value);
    DownloadConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    // Raised to kMinChunkTimeout when lower.
    DownloadConfig& with_chunk_timeout(std::chrono::milliseconds timeout);
    DownloadConfig& with_progress_interval(std::chrono::milliseconds interval);
    DownloadConfig& with_min_free_space(std::uint64_t bytes);
    DownloadConfig& with_max_retries(std::size_t retries);
    DownloadConfig& with_backoff(const BackoffConfig& backoff);
    DownloadConfig& with_retry_policy(RetryPolicy policy);
    DownloadConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);
    DownloadConfig& with_throttle(std::uint64_t bytes_per_second);
    DownloadConfig& with_failure_injection(std::uint8_t percent);

    /// Headers for every request: User-Agent, Connection: keep-alive, extras.
    [[nodiscard]] HeaderMap default_headers() const;

    /// Pick up UPLINK_MAX_BPS and UPLINK_FAIL_PCT. Unparseable or
    /// out-of-range values are ignored.
    DownloadConfig& apply_environment();

    [[nodiscard]] nlohmann::json to_json() const;

    /// Keys that are absent keep their defaults.
    static DownloadResult<DownloadConfig> from_json(const nlohmann::json& payload);
};

}  // namespace uplink

#endif  // UPLINK_DOWNLOAD_DOWNLOAD_CONFIG_HPP
