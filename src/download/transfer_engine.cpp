#include "uplink/download/transfer_engine.hpp"

#include "uplink/download/range_prober.hpp"
#include "uplink/log/logger.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <optional>
#include <random>
#include <system_error>
#include <thread>

namespace uplink {

namespace {

constexpr std::uint64_t kBytesPerMegabyte = 1024 * 1024;

std::error_code last_os_error() {
    return {errno, std::generic_category()};
}

// ─────────────────────────────────────────────────────────────────────────────
// FileSink
// ─────────────────────────────────────────────────────────────────────────────
// Streams one response body into the destination file. One instance per
// request; the file is opened only once a usable response head arrives, so
// a request that fails before that never truncates the partial file.

class FileSink final : public IStreamSink {
public:
    FileSink(
        const TransferTarget& target,
        TransferState& state,
        const DownloadConfig& config,
        IProgressObserver& observer,
        std::size_t retry_count,
        const CancellationToken* cancel
    )
        : target_(target)
        , state_(state)
        , config_(config)
        , observer_(observer)
        , retry_count_(retry_count)
        , cancel_(cancel)
        , throttle_(config.progress_interval)
        , started_(std::chrono::steady_clock::now())
        , rng_(std::random_device{}())
    {}

    bool on_response(const HttpResponseHead& head) override {
        response_seen_ = true;
        status_code_ = head.status_code;

        const bool ranged = (state_.resume_offset > 0) && state_.range_supported;
        if (ranged) {
            const bool range_ignored =
                (head.status_code == http_status::Ok) ||
                (head.status_code == http_status::RangeNotSatisfiable);
            if (range_ignored) {
                restart_requested_ = true;
                return false;
            }
        }

        if (head.is_success() == false) {
            error_ = DownloadError::http_error(head);
            return false;
        }

        state_.total = 0;
        if (const auto length = head.header("Content-Length"); length.has_value()) {
            if (const auto bytes = parse_content_length(*length); bytes.has_value()) {
                state_.total = *bytes + state_.resume_offset;
            }
        }
        if (state_.total == 0) {
            if (const auto range = head.header("Content-Range"); range.has_value()) {
                state_.total = parse_content_range_total(*range).value_or(0);
            }
        }

        const bool append = state_.resume_offset > 0;
        const auto mode = std::ios::out | std::ios::binary | (append ? std::ios::app : std::ios::trunc);
        file_.open(target_.destination, mode);
        if (file_.is_open() == false) {
            error_ = DownloadError::filesystem(
                append ? "Failed to open file for resume" : "Failed to create download file",
                last_os_error());
            return false;
        }

        state_.downloaded = state_.resume_offset;
        started_ = std::chrono::steady_clock::now();
        UPLINK_LOG_DEBUG("{} {} for {} (total {} bytes, offset {})",
                         head.status_code, head.reason, target_.url, state_.total,
                         state_.resume_offset);
        return true;
    }

    bool on_chunk(std::string_view data) override {
        if (cancelled()) {
            error_ = DownloadError::cancelled();
            return false;
        }

        file_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file_) {
            error_ = DownloadError::filesystem("Failed to write download chunk", last_os_error());
            return false;
        }
        state_.downloaded += data.size();
        throttle_bytes_ += data.size();

        apply_bandwidth_cap();

        if (inject_failure()) {
            error_ = DownloadError::network("Connection reset by peer (simulated)")
                         .with_context("Failed to read download chunk");
            return false;
        }

        if (throttle_.ready()) {
            observer_.on_progress(ProgressSample::transfer(
                state_.downloaded, state_.total, state_.resume_offset,
                std::chrono::steady_clock::now() - started_, retry_count_));
        }
        return true;
    }

    bool should_continue() override {
        if (cancelled()) {
            if (!error_.has_value()) {
                error_ = DownloadError::cancelled();
            }
            return false;
        }
        return true;
    }

    /// Flush and close; a failure here means bytes may not have hit the disk.
    DownloadResult<void> finish() {
        if (file_.is_open() == false) {
            return {};
        }
        file_.close();
        if (file_.fail()) {
            return tl::unexpected(
                DownloadError::filesystem("Failed to finalize download file", last_os_error()));
        }
        return {};
    }

    [[nodiscard]] bool response_seen() const noexcept { return response_seen_; }
    [[nodiscard]] bool restart_requested() const noexcept { return restart_requested_; }
    [[nodiscard]] int status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::optional<DownloadError>& error() const noexcept { return error_; }

    [[nodiscard]] std::chrono::steady_clock::duration elapsed() const {
        return std::chrono::steady_clock::now() - started_;
    }

private:
    [[nodiscard]] bool cancelled() const noexcept {
        return (cancel_ != nullptr) && cancel_->is_cancelled();
    }

    // UPLINK_MAX_BPS: sleep until the average rate drops back under the cap.
    void apply_bandwidth_cap() {
        if (!config_.max_bytes_per_second.has_value()) {
            return;
        }
        const double expected_seconds =
            static_cast<double>(throttle_bytes_) / static_cast<double>(*config_.max_bytes_per_second);
        const double actual_seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        if (expected_seconds <= actual_seconds) {
            return;
        }

        const auto pause = std::chrono::milliseconds{
            static_cast<std::int64_t>((expected_seconds - actual_seconds) * 1000.0)};
        if (pause.count() <= 0) {
            return;
        }
        if (cancel_ != nullptr) {
            (void)cancel_->sleep_for(pause);
        } else {
            std::this_thread::sleep_for(pause);
        }
    }

    // UPLINK_FAIL_PCT
    bool inject_failure() {
        if (config_.fail_percent == 0) {
            return false;
        }
        std::uniform_int_distribution<int> roll(0, 99);
        return roll(rng_) < config_.fail_percent;
    }

    const TransferTarget& target_;
    TransferState& state_;
    const DownloadConfig& config_;
    IProgressObserver& observer_;
    std::size_t retry_count_;
    const CancellationToken* cancel_;

    std::ofstream file_;
    ProgressThrottle throttle_;
    std::chrono::steady_clock::time_point started_;
    std::uint64_t throttle_bytes_{0};
    std::mt19937 rng_;

    bool response_seen_{false};
    bool restart_requested_{false};
    int status_code_{0};
    std::optional<DownloadError> error_;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Disk space
// ─────────────────────────────────────────────────────────────────────────────

DownloadResult<void> check_disk_space(const std::filesystem::path& directory, std::uint64_t min_free) {
    if (min_free == 0) {
        return {};
    }

    std::error_code ec;
    const auto info = std::filesystem::space(directory, ec);
    if (ec) {
        UPLINK_LOG_WARN("Could not check disk space in {} ({}), proceeding anyway",
                        directory.string(), ec.message());
        return {};
    }

    if (info.available < min_free) {
        return tl::unexpected(DownloadError::insufficient_space(info.available, min_free));
    }

    UPLINK_LOG_DEBUG("Disk space check passed. Available: {} MB", info.available / kBytesPerMegabyte);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// TransferEngine
// ─────────────────────────────────────────────────────────────────────────────

DownloadResult<TransferState> TransferEngine::prepare_resume(const TransferTarget& target, bool resume) {
    TransferState state;

    std::error_code ec;
    if (resume == false || std::filesystem::exists(target.destination, ec) == false) {
        return state;
    }

    const auto size = std::filesystem::file_size(target.destination, ec);
    if (ec) {
        return tl::unexpected(DownloadError::filesystem("Failed to get file metadata for resume", ec));
    }
    if (size == 0) {
        return state;
    }
    state.resume_offset = size;

    RangeProber prober(client_);
    auto supported = prober.probe(target.url);
    if (!supported) {
        UPLINK_LOG_WARN("Could not test Range support ({}), attempting resume anyway",
                        supported.error().chain());
    } else if (*supported) {
        UPLINK_LOG_INFO("Server supports Range requests, resuming download from byte {}", size);
    } else {
        UPLINK_LOG_WARN("Server doesn't support Range requests, restarting download");
        state.resume_offset = 0;
        state.range_supported = false;
        state.restarted = true;
        std::filesystem::remove(target.destination, ec);
        if (ec) {
            UPLINK_LOG_WARN("Failed to remove partial file for restart: {}", ec.message());
        }
    }
    return state;
}

DownloadResult<TransferState> TransferEngine::attempt(
    const TransferTarget& target,
    bool resume,
    IProgressObserver& observer,
    std::size_t retry_count,
    const CancellationToken* cancel
) {
    if ((cancel != nullptr) && cancel->is_cancelled()) {
        return tl::unexpected(DownloadError::cancelled());
    }

    auto directory = target.destination.parent_path();
    if (directory.empty()) {
        directory = ".";
    } else {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            return tl::unexpected(DownloadError::filesystem("Failed to create cache directory", ec));
        }
    }

    if (auto space = check_disk_space(directory, config_.min_free_space); !space) {
        return tl::unexpected(space.error());
    }

    auto prepared = prepare_resume(target, resume);
    if (!prepared) {
        return tl::unexpected(prepared.error());
    }
    TransferState state = *prepared;

    // At most two requests: the ranged one and, if the server ignored the
    // range, one from scratch.
    for (int request = 0; request < 2; ++request) {
        HeaderMap headers;
        if ((state.resume_offset > 0) && state.range_supported) {
            headers["Range"] = make_range_header(state.resume_offset);
        }
        state.downloaded = state.resume_offset;

        FileSink sink(target, state, config_, observer, retry_count, cancel);
        auto status = client_.get_stream(target.url, headers, sink);

        if (sink.restart_requested()) {
            UPLINK_LOG_WARN("Server answered {} to a range request, restarting {} from byte 0",
                            sink.status_code(), target.destination.string());
            std::error_code ec;
            std::filesystem::remove(target.destination, ec);
            if (ec) {
                UPLINK_LOG_WARN("Failed to remove partial file for restart: {}", ec.message());
            }
            state.resume_offset = 0;
            state.range_supported = false;
            state.restarted = true;
            continue;
        }

        if (sink.error().has_value()) {
            return tl::unexpected(*sink.error());
        }

        if (!status) {
            auto error = DownloadError::from_client_error(status.error());
            return tl::unexpected(std::move(error).with_context(
                sink.response_seen() ? "Failed to read download chunk" : "Failed to start download"));
        }

        if (auto closed = sink.finish(); !closed) {
            return tl::unexpected(closed.error());
        }

        if ((state.total > 0) && (state.downloaded < state.total)) {
            return tl::unexpected(DownloadError::premature_end(state.downloaded, state.total));
        }

        auto done = ProgressSample::transfer(
            state.downloaded, state.total, state.resume_offset, sink.elapsed(), retry_count);
        done.percentage = 100.0;
        observer.on_progress(done);

        UPLINK_LOG_INFO("Downloaded {} ({} bytes)", target.destination.string(), state.downloaded);
        return state;
    }

    // Second request was unranged, so it can't ask for another restart
    return tl::unexpected(DownloadError::network("Server rejected the download request"));
}

}  // namespace uplink
