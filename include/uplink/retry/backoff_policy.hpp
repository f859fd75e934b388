#ifndef UPLINK_RETRY_BACKOFF_POLICY_HPP
#define UPLINK_RETRY_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long to wait before the next attempt. attempt is 0-indexed: 0 is the
// wait after the first failure.
//
//   auto policy = make_backoff_policy(config.backoff);
//   auto delay  = policy->next_delay(attempt);

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    // Upper bound next_delay() never exceeds.
    [[nodiscard]] virtual std::chrono::milliseconds max_delay() const = 0;
};

namespace detail {

inline std::chrono::milliseconds clamp_delay(double delay_ms, std::chrono::milliseconds cap) {
    const double cap_ms = static_cast<double>(cap.count());
    const double bounded = std::clamp(delay_ms, 0.0, cap_ms);
    return std::chrono::milliseconds{static_cast<std::int64_t>(bounded)};
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay(n) = min(max, base * multiplier^n)
//
// Defaults match network downloads: 1s, 2s, 4s, 8s, 16s, then 30s.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{1'000}, 2.0, std::chrono::milliseconds{30'000})
    {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double base_ms = static_cast<double>(base_.count());
        const double delay_ms = base_ms * std::pow(multiplier_, static_cast<double>(attempt));
        // pow() overflows to inf for large attempts; clamp handles it
        return detail::clamp_delay(delay_ms, max_);
    }

    [[nodiscard]] std::chrono::milliseconds max_delay() const override {
        return max_;
    }

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
};

// ─────────────────────────────────────────────────────────────────────────────
// LinearBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay(n) = min(max, base + increment * n)

class LinearBackoff : public IBackoffPolicy {
public:
    LinearBackoff(
        std::chrono::milliseconds base,
        std::chrono::milliseconds increment,
        std::chrono::milliseconds max
    )
        : base_(base)
        , increment_(increment)
        , max_(max)
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double delay_ms = static_cast<double>(base_.count()) +
                                static_cast<double>(increment_.count()) * static_cast<double>(attempt);
        return detail::clamp_delay(delay_ms, max_);
    }

    [[nodiscard]] std::chrono::milliseconds max_delay() const override {
        return max_;
    }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds increment_;
    std::chrono::milliseconds max_;
};

// ─────────────────────────────────────────────────────────────────────────────
// FixedBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Same delay every attempt, still capped.

class FixedBackoff : public IBackoffPolicy {
public:
    explicit FixedBackoff(std::chrono::milliseconds delay)
        : FixedBackoff(delay, delay)
    {}

    FixedBackoff(std::chrono::milliseconds delay, std::chrono::milliseconds max)
        : delay_(delay)
        , max_(max)
    {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::min(delay_, max_);
    }

    [[nodiscard]] std::chrono::milliseconds max_delay() const override {
        return max_;
    }

private:
    std::chrono::milliseconds delay_;
    std::chrono::milliseconds max_;
};

// ─────────────────────────────────────────────────────────────────────────────
// JitteredBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Decorates another policy with a uniform random offset of up to
// +/- jitter_factor of its delay. The offset magnitude is at least 1ms when
// the inner delay is non-zero, and the result is clamped to [0, max_delay()],
// so jitter never pushes a capped delay past the cap.
//
// Spreads out clients that all failed at the same moment (a CDN hiccup) so
// they don't come back in lockstep.

class JitteredBackoff : public IBackoffPolicy {
public:
    explicit JitteredBackoff(
        std::shared_ptr<IBackoffPolicy> inner,
        double jitter_factor = 0.25,
        std::optional<std::uint32_t> seed = std::nullopt
    )
        : inner_(std::move(inner))
        , jitter_factor_(jitter_factor)
        , rng_(seed.has_value() ? *seed : std::random_device{}())
    {
        if (!inner_) {
            throw std::invalid_argument("JitteredBackoff: inner policy cannot be null");
        }
        if (jitter_factor_ < 0.0 || jitter_factor_ > 1.0) {
            throw std::invalid_argument("JitteredBackoff: jitter_factor must be in [0, 1]");
        }
    }

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const auto base = inner_->next_delay(attempt);
        const std::int64_t base_ms = base.count();
        if (base_ms <= 0) {
            return base;
        }

        const auto scaled = static_cast<std::int64_t>(static_cast<double>(base_ms) * jitter_factor_);
        const std::int64_t range = std::max<std::int64_t>(scaled, 1);

        std::int64_t offset = 0;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            std::uniform_int_distribution<std::int64_t> dist(-range, range);
            offset = dist(rng_);
        }

        const std::int64_t cap_ms = inner_->max_delay().count();
        const std::int64_t jittered = std::clamp<std::int64_t>(base_ms + offset, 0, cap_ms);
        return std::chrono::milliseconds{jittered};
    }

    [[nodiscard]] std::chrono::milliseconds max_delay() const override {
        return inner_->max_delay();
    }

    /// The delay before jitter, for logging and tests.
    [[nodiscard]] std::chrono::milliseconds unjittered_delay(std::size_t attempt) {
        return inner_->next_delay(attempt);
    }

private:
    std::shared_ptr<IBackoffPolicy> inner_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Zero delay; keeps retry tests fast.

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    [[nodiscard]] std::chrono::milliseconds max_delay() const override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace uplink

#endif  // UPLINK_RETRY_BACKOFF_POLICY_HPP
