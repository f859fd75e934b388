#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// CancellationToken
// ─────────────────────────────────────────────────────────────────────────────
// Shared flag a caller flips to stop a running download. The transfer loop
// polls it between chunks and the retry loop sleeps on it, so a cancel is
// seen within one chunk or immediately during a backoff wait.
//
// Copies share state:
//
//   CancellationToken token;
//   std::thread worker([&downloader, token] { downloader.run(target, false, &token); });
//   token.cancel();

class CancellationToken {
public:
    CancellationToken()
        : state_(std::make_shared<State>())
    {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /// Sleep for up to duration. Returns false if cancelled before or during
    /// the wait.
    template <typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        const bool cancelled = state_->cv.wait_for(lock, duration, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
        return !cancelled;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

}  // namespace uplink
