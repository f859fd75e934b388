#include "uplink/download/downloader.hpp"

#include "uplink/log/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace uplink {

Downloader::Downloader(DownloadConfig config)
    : Downloader(std::move(config), make_http_client())
{}

Downloader::Downloader(DownloadConfig config, std::unique_ptr<IHttpClient> client)
    : config_(std::move(config))
    , client_(std::move(client))
{
    if (!client_) {
        throw std::invalid_argument("Downloader: HTTP client cannot be null");
    }

    // Use configured backoff policy or build one from the retry settings
    if (config_.backoff_policy != nullptr) {
        backoff_ = config_.backoff_policy;
    } else {
        backoff_ = make_backoff_policy(config_.retry.backoff());
    }

    client_->set_default_headers(config_.default_headers());
    client_->set_connect_timeout(config_.connect_timeout);
    client_->set_read_timeout(std::max(config_.chunk_timeout, kMinChunkTimeout));
    client_->set_verify_ssl(config_.verify_ssl);
}

Downloader::~Downloader() = default;

DownloadResult<std::filesystem::path> Downloader::run(
    const TransferTarget& target,
    bool resume_hint,
    IProgressObserver& observer,
    const CancellationToken* cancel
) {
    TransferEngine engine(*client_, config_);
    RetryContext context{0, config_.retry.max_retries()};

    UPLINK_LOG_INFO("Downloading {} -> {}", target.url, target.destination.string());

    while (true) {
        std::error_code ec;
        const bool resume = resume_hint || std::filesystem::exists(target.destination, ec);

        auto outcome = engine.attempt(target, resume, observer, context.attempt, cancel);
        if (outcome) {
            return target.destination;
        }

        DownloadError error = std::move(outcome.error());
        const bool cancelled = (error.code == DownloadError::Code::Cancelled);

        if (!cancelled && !context.exhausted() && config_.retry.should_retry(error)) {
            std::string reason = error.chain();
            UPLINK_LOG_WARN("Download attempt {} failed: {}", context.attempt + 1, reason);
            observer.on_progress(ProgressSample::retry_notification(context.attempt + 1, std::move(reason)));

            const auto delay = backoff_->next_delay(context.attempt);
            UPLINK_LOG_INFO("Retrying in {} ms ({}/{})", delay.count(), context.attempt + 1,
                            context.max_retries);

            if (cancel != nullptr) {
                if (cancel->sleep_for(delay) == false) {
                    UPLINK_LOG_INFO("Download of {} cancelled during backoff", target.url);
                    return tl::unexpected(DownloadError::cancelled());
                }
            } else {
                std::this_thread::sleep_for(delay);
            }

            ++context.attempt;
            continue;
        }

        if (!cancelled && context.exhausted()) {
            error = DownloadError::retries_exhausted(std::move(error), context.attempt + 1);
        }

        if (cancelled) {
            UPLINK_LOG_INFO("Download of {} cancelled", target.url);
        } else {
            UPLINK_LOG_ERROR("Download of {} failed: {}", target.url, error.chain());
        }
        return tl::unexpected(std::move(error));
    }
}

DownloadResult<std::filesystem::path> Downloader::download(
    const std::string& url,
    const std::filesystem::path& destination,
    bool resume_if_present,
    IProgressObserver& observer,
    const CancellationToken* cancel
) {
    if (!parse_url(url).has_value()) {
        return tl::unexpected(DownloadError::invalid_url(url));
    }
    if (destination.empty()) {
        return tl::unexpected(DownloadError::filesystem("Download destination is empty"));
    }
    return run(TransferTarget{url, destination}, resume_if_present, observer, cancel);
}

}  // namespace uplink
