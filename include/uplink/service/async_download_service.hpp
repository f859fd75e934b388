#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Download Service
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine front-end for DownloadService. Downloads are blocking (libcurl
// easy handles), so each one runs on an internal thread pool while the
// caller's coroutine is suspended.
//
// Usage:
//   asio::io_context io;
//   AsyncDownloadService downloads(io.get_executor(), config);
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       while (auto sample = co_await downloads.next_progress()) {
//           render(*sample);
//       }
//   }, asio::detached);
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto path = co_await downloads.async_fetch(request);
//       downloads.close_progress();
//   }, asio::detached);
//
//   io.run();
//
// Progress samples go through a bounded channel. When the consumer falls
// behind, samples are dropped rather than stalling the transfer; retry
// notifications are dropped the same way, so consumers should treat the
// stream as lossy.

#include "uplink/download/cancellation.hpp"
#include "uplink/download/progress.hpp"
#include "uplink/error/download_error.hpp"
#include "uplink/service/download_service.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/thread_pool.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

namespace uplink {

struct AsyncDownloadConfig {
    /// Downloads that may run at the same time
    std::size_t worker_threads{2};

    /// Progress samples buffered before new ones are dropped
    std::size_t progress_capacity{64};
};

class AsyncDownloadService {
public:
    AsyncDownloadService(
        asio::any_io_executor executor,
        std::shared_ptr<DownloadService> service,
        AsyncDownloadConfig config = {}
    );

    ~AsyncDownloadService();

    // Non-copyable, non-movable
    AsyncDownloadService(const AsyncDownloadService&) = delete;
    AsyncDownloadService& operator=(const AsyncDownloadService&) = delete;
    AsyncDownloadService(AsyncDownloadService&&) = delete;
    AsyncDownloadService& operator=(AsyncDownloadService&&) = delete;

    /// Run DownloadService::fetch on the pool. Resumes on the caller's
    /// executor once the download finishes.
    [[nodiscard]] asio::awaitable<DownloadResult<std::filesystem::path>> async_fetch(
        DownloadRequest request,
        CancellationToken cancel = {}
    );

    /// Next progress sample, or nullopt once the channel is closed.
    [[nodiscard]] asio::awaitable<std::optional<ProgressSample>> next_progress();

    /// Ends the progress stream; pending next_progress() calls return nullopt.
    void close_progress();

    /// Samples discarded because the channel was full.
    [[nodiscard]] std::size_t dropped_samples() const noexcept;

    [[nodiscard]] asio::any_io_executor get_executor() const {
        return executor_;
    }

private:
    using ProgressChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, ProgressSample)
    >;

    class ChannelObserver;

    asio::any_io_executor executor_;
    std::shared_ptr<DownloadService> service_;
    asio::thread_pool pool_;
    std::unique_ptr<ProgressChannel> progress_;
    std::unique_ptr<ChannelObserver> observer_;
};

}  // namespace uplink
