#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// ProgressSample
// ─────────────────────────────────────────────────────────────────────────────
// One progress report. Two flavors share the struct:
//
//   byte tick           is_retrying == false, percentage/speed/bytes filled in
//   retry notification  is_retrying == true, retry_count and retry_reason set,
//                       byte fields zero
//
// percentage is 0 while the total is unknown. speed is MB/s over the current
// attempt only; bytes resumed from disk do not count towards it.

struct ProgressSample {
    double percentage{0.0};
    double speed{0.0};
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    std::size_t retry_count{0};
    bool is_retrying{false};
    std::string retry_reason;

    /// Byte tick for an attempt that started at resumed_from and has been
    /// running for elapsed.
    [[nodiscard]] static ProgressSample transfer(
        std::uint64_t downloaded,
        std::uint64_t total,
        std::uint64_t resumed_from,
        std::chrono::steady_clock::duration elapsed,
        std::size_t retry_count
    );

    [[nodiscard]] static ProgressSample retry_notification(
        std::size_t retry_count,
        std::string reason
    );

    [[nodiscard]] nlohmann::json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// IProgressObserver
// ─────────────────────────────────────────────────────────────────────────────
// Called synchronously from the thread running the download. Implementations
// must not block; hand the sample off (see AsyncDownloadService) if the
// consumer is slow.

class IProgressObserver {
public:
    virtual ~IProgressObserver() = default;

    virtual void on_progress(const ProgressSample& sample) = 0;
};

class NullProgressObserver final : public IProgressObserver {
public:
    void on_progress(const ProgressSample& /*sample*/) override {}
};

class CallbackProgressObserver final : public IProgressObserver {
public:
    using Callback = std::function<void(const ProgressSample&)>;

    explicit CallbackProgressObserver(Callback callback)
        : callback_(std::move(callback))
    {}

    void on_progress(const ProgressSample& sample) override {
        if (callback_) {
            callback_(sample);
        }
    }

private:
    Callback callback_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ProgressThrottle
// ─────────────────────────────────────────────────────────────────────────────
// Time-slices byte ticks. ready() is true once interval has passed since the
// last tick it let through (or since construction); a zero interval lets
// every tick through.

class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::milliseconds interval)
        : interval_(interval)
        , last_(Clock::now())
    {}

    [[nodiscard]] bool ready(Clock::time_point now = Clock::now()) {
        if (now - last_ < interval_) {
            return false;
        }
        last_ = now;
        return true;
    }

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept {
        return interval_;
    }

private:
    std::chrono::milliseconds interval_;
    Clock::time_point last_;
};

}  // namespace uplink
