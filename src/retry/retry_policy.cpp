#include "uplink/retry/retry_policy.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace uplink {

namespace {

constexpr std::array<std::string_view, 2> kTimeoutKeywords{
    "timeout", "timed out"
};

constexpr std::array<std::string_view, 4> kConnectionResetKeywords{
    "connection reset", "connection refused", "broken pipe", "econnreset"
};

constexpr std::array<std::string_view, 3> kChunkReadKeywords{
    "chunk", "incomplete read", "unexpected eof"
};

constexpr std::array<std::string_view, 7> kTemporaryFailureKeywords{
    "temporary", "service unavailable", "too many requests", "429", "502", "503", "504"
};

constexpr std::array<RetryKind, 4> kAllKinds{
    RetryKind::NetworkTimeout,
    RetryKind::ConnectionReset,
    RetryKind::ChunkReadFailed,
    RetryKind::TemporaryFailure
};

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

}  // namespace

std::string_view to_string(RetryKind kind) noexcept {
    switch (kind) {
        case RetryKind::NetworkTimeout:   return "network_timeout";
        case RetryKind::ConnectionReset:  return "connection_reset";
        case RetryKind::ChunkReadFailed:  return "chunk_read_failed";
        case RetryKind::TemporaryFailure: return "temporary_failure";
    }
    return "unknown";
}

std::optional<RetryKind> retry_kind_from_string(std::string_view name) noexcept {
    for (const auto kind : kAllKinds) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::span<const std::string_view> retry_keywords(RetryKind kind) noexcept {
    switch (kind) {
        case RetryKind::NetworkTimeout:   return kTimeoutKeywords;
        case RetryKind::ConnectionReset:  return kConnectionResetKeywords;
        case RetryKind::ChunkReadFailed:  return kChunkReadKeywords;
        case RetryKind::TemporaryFailure: return kTemporaryFailureKeywords;
    }
    return {};
}

std::string_view to_string(BackoffStrategy strategy) noexcept {
    switch (strategy) {
        case BackoffStrategy::Exponential: return "exponential";
        case BackoffStrategy::Linear:      return "linear";
        case BackoffStrategy::Fixed:       return "fixed";
    }
    return "exponential";
}

std::optional<BackoffStrategy> backoff_strategy_from_string(std::string_view name) noexcept {
    if (name == "exponential") return BackoffStrategy::Exponential;
    if (name == "linear")      return BackoffStrategy::Linear;
    if (name == "fixed")       return BackoffStrategy::Fixed;
    return std::nullopt;
}

std::shared_ptr<IBackoffPolicy> make_backoff_policy(const BackoffConfig& config) {
    std::shared_ptr<IBackoffPolicy> policy;
    switch (config.strategy) {
        case BackoffStrategy::Exponential:
            policy = std::make_shared<ExponentialBackoff>(config.base, config.multiplier, config.max);
            break;
        case BackoffStrategy::Linear:
            policy = std::make_shared<LinearBackoff>(config.base, config.increment, config.max);
            break;
        case BackoffStrategy::Fixed:
            policy = std::make_shared<FixedBackoff>(config.base, config.max);
            break;
    }

    if (config.jitter_factor > 0.0) {
        return std::make_shared<JitteredBackoff>(std::move(policy), config.jitter_factor);
    }
    return policy;
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────

RetryPolicy::RetryPolicy()
    : max_retries_(3)
    , retry_on_(kAllKinds.begin(), kAllKinds.end())
{
    backoff_.max = std::chrono::milliseconds{60'000};
}

RetryPolicy RetryPolicy::for_network_operations() {
    RetryPolicy policy;
    policy.max_retries_ = 5;
    policy.backoff_ = BackoffConfig{};  // 1s base, x2, 30s cap, 25% jitter
    return policy;
}

bool RetryPolicy::should_retry(const DownloadError& error) const {
    return should_retry(error.chain());
}

bool RetryPolicy::should_retry(std::string_view error_chain) const {
    return matching_kind(error_chain).has_value();
}

std::optional<RetryKind> RetryPolicy::matching_kind(std::string_view error_chain) const {
    if (retry_on_.empty()) {
        return std::nullopt;
    }

    const std::string lower = to_lower(error_chain);
    for (const auto kind : retry_on_) {
        const auto keywords = retry_keywords(kind);
        const bool matched = std::ranges::any_of(keywords, [&lower](std::string_view keyword) {
            return lower.find(keyword) != std::string::npos;
        });
        if (matched) {
            return kind;
        }
    }
    return std::nullopt;
}

}  // namespace uplink
