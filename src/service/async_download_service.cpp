#include "uplink/service/async_download_service.hpp"

#include "uplink/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/experimental/channel_error.hpp>
#include <asio/use_awaitable.hpp>

#include <atomic>
#include <stdexcept>
#include <system_error>

namespace uplink {

// ═══════════════════════════════════════════════════════════════════════════
// Channel Observer
// ═══════════════════════════════════════════════════════════════════════════
// Called on pool threads. try_send never blocks; a full or closed channel
// just counts the sample as dropped.

class AsyncDownloadService::ChannelObserver final : public IProgressObserver {
public:
    explicit ChannelObserver(ProgressChannel& channel)
        : channel_(channel)
    {}

    void on_progress(const ProgressSample& sample) override {
        if (channel_.try_send(asio::error_code{}, sample) == false) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] std::size_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    ProgressChannel& channel_;
    std::atomic<std::size_t> dropped_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

AsyncDownloadService::AsyncDownloadService(
    asio::any_io_executor executor,
    std::shared_ptr<DownloadService> service,
    AsyncDownloadConfig config
)
    : executor_(std::move(executor))
    , service_(std::move(service))
    , pool_(config.worker_threads == 0 ? 1 : config.worker_threads)
    , progress_(std::make_unique<ProgressChannel>(executor_, config.progress_capacity))
    , observer_(std::make_unique<ChannelObserver>(*progress_))
{
    if (!service_) {
        throw std::invalid_argument("AsyncDownloadService: service cannot be null");
    }
}

AsyncDownloadService::~AsyncDownloadService() {
    progress_->close();
    pool_.join();
}

// ═══════════════════════════════════════════════════════════════════════════
// Downloads
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<DownloadResult<std::filesystem::path>> AsyncDownloadService::async_fetch(
    DownloadRequest request,
    CancellationToken cancel
) {
    UPLINK_LOG_DEBUG("Queueing download of {}", request.url);

    auto service = service_;
    auto* observer = observer_.get();

    // The blocking fetch runs on the pool; completion resumes us on the
    // caller's executor.
    auto result = co_await asio::co_spawn(
        pool_,
        [service, observer, request = std::move(request), cancel]()
            -> asio::awaitable<DownloadResult<std::filesystem::path>> {
            co_return service->fetch(request, *observer, &cancel);
        },
        asio::use_awaitable
    );

    co_return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Progress Stream
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<std::optional<ProgressSample>> AsyncDownloadService::next_progress() {
    try {
        auto sample = co_await progress_->async_receive(asio::use_awaitable);
        co_return sample;
    } catch (const std::system_error& e) {
        if (e.code() != asio::experimental::error::channel_closed &&
            e.code() != asio::experimental::error::channel_cancelled) {
            UPLINK_LOG_WARN("Progress receive failed: {}", e.what());
        }
        co_return std::nullopt;
    }
}

void AsyncDownloadService::close_progress() {
    progress_->close();
}

std::size_t AsyncDownloadService::dropped_samples() const noexcept {
    return observer_->dropped();
}

}  // namespace uplink
