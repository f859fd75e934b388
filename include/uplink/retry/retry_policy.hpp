#ifndef UPLINK_RETRY_RETRY_POLICY_HPP
#define UPLINK_RETRY_RETRY_POLICY_HPP

#include "uplink/error/download_error.hpp"
#include "uplink/retry/backoff_policy.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string_view>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// Retryable error kinds
// ─────────────────────────────────────────────────────────────────────────────
// Each kind is a keyword set matched against the lower-cased error chain:
//
//   NetworkTimeout    timeout, timed out
//   ConnectionReset   connection reset, connection refused, broken pipe, econnreset
//   ChunkReadFailed   chunk, incomplete read, unexpected eof
//   TemporaryFailure  temporary, service unavailable, too many requests,
//                     429, 502, 503, 504

enum class RetryKind {
    NetworkTimeout,
    ConnectionReset,
    ChunkReadFailed,
    TemporaryFailure
};

[[nodiscard]] std::string_view to_string(RetryKind kind) noexcept;

[[nodiscard]] std::optional<RetryKind> retry_kind_from_string(std::string_view name) noexcept;

[[nodiscard]] std::span<const std::string_view> retry_keywords(RetryKind kind) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Backoff configuration
// ─────────────────────────────────────────────────────────────────────────────

enum class BackoffStrategy {
    Exponential,
    Linear,
    Fixed
};

[[nodiscard]] std::string_view to_string(BackoffStrategy strategy) noexcept;

[[nodiscard]] std::optional<BackoffStrategy> backoff_strategy_from_string(std::string_view name) noexcept;

struct BackoffConfig {
    BackoffStrategy strategy{BackoffStrategy::Exponential};

    // Exponential: base * multiplier^n. Linear: base + increment * n. Fixed: base.
    std::chrono::milliseconds base{1'000};
    double multiplier{2.0};
    std::chrono::milliseconds increment{1'000};

    std::chrono::milliseconds max{30'000};

    // 0 disables jitter
    double jitter_factor{0.25};
};

/// Build the policy described by config, wrapped in JitteredBackoff when
/// jitter_factor > 0.
[[nodiscard]] std::shared_ptr<IBackoffPolicy> make_backoff_policy(const BackoffConfig& config);

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides *whether* a failed attempt is retried; IBackoffPolicy decides how
// long to wait first.
//
//   auto policy = RetryPolicy::for_network_operations()
//                     .with_max_retries(3)
//                     .without_retry_on(RetryKind::TemporaryFailure);
//
//   if (policy.should_retry(error) && attempt < policy.max_retries()) { ... }

class RetryPolicy {
public:
    /// 3 retries, all kinds enabled, exponential 1s x2 capped at 60s.
    RetryPolicy();

    /// 5 retries, all kinds enabled, exponential 1s x2 capped at 30s.
    [[nodiscard]] static RetryPolicy for_network_operations();

    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    RetryPolicy& with_retry_on(RetryKind kind) {
        retry_on_.insert(kind);
        return *this;
    }

    RetryPolicy& without_retry_on(RetryKind kind) {
        retry_on_.erase(kind);
        return *this;
    }

    RetryPolicy& with_no_retry_kinds() {
        retry_on_.clear();
        return *this;
    }

    RetryPolicy& with_backoff(BackoffConfig backoff) {
        backoff_ = backoff;
        return *this;
    }

    [[nodiscard]] std::size_t max_retries() const noexcept {
        return max_retries_;
    }

    [[nodiscard]] const std::set<RetryKind>& retry_on() const noexcept {
        return retry_on_;
    }

    [[nodiscard]] const BackoffConfig& backoff() const noexcept {
        return backoff_;
    }

    /// True iff the chain contains a keyword of at least one enabled kind.
    /// Always false when no kinds are enabled.
    [[nodiscard]] bool should_retry(const DownloadError& error) const;

    [[nodiscard]] bool should_retry(std::string_view error_chain) const;

    /// The first enabled kind whose keywords match, if any.
    [[nodiscard]] std::optional<RetryKind> matching_kind(std::string_view error_chain) const;

private:
    std::size_t max_retries_;
    std::set<RetryKind> retry_on_;
    BackoffConfig backoff_;
};

}  // namespace uplink

#endif  // UPLINK_RETRY_RETRY_POLICY_HPP
