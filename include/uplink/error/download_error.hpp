#ifndef UPLINK_ERROR_DOWNLOAD_ERROR_HPP
#define UPLINK_ERROR_DOWNLOAD_ERROR_HPP

#include "uplink/transport/http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tl/expected.hpp>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// DownloadError
// ─────────────────────────────────────────────────────────────────────────────
// Error type for everything above the transport. Each error carries a typed
// code set where it was raised plus a causal chain of messages, outermost
// first:
//
//   "Failed to read download chunk" | "Recv failure: Connection reset by peer"
//
// The code is what the library branches on. The chain is what the retry
// policy and the error classifier match keywords against, since transport
// and filesystem failures arrive as opaque text from libcurl and the OS.

struct DownloadError {
    enum class Code {
        Network,             // transport failure (connect, reset, DNS, SSL)
        Timeout,             // connect timeout or stalled body
        HttpStatus,          // server answered with a non-success status
        PrematureEnd,        // body ended before the advertised length
        Filesystem,          // directory, open, write, remove
        InsufficientSpace,   // free-space headroom check failed
        InvalidUrl,
        Cancelled,
        RetriesExhausted,
        Validation,          // downloaded/cached file failed validation
        AlreadyInProgress,   // destination is leased by another download
        Parse,               // release feed or cache index could not be parsed
        Configuration
    };

    Code code;
    std::optional<int> http_status;

    DownloadError(Code c, std::string message, std::optional<int> status = std::nullopt)
        : code(c)
        , http_status(status)
        , chain_{std::move(message)}
    {}

    /// Outermost message.
    [[nodiscard]] const std::string& message() const noexcept {
        return chain_.front();
    }

    /// All messages, outermost first.
    [[nodiscard]] const std::vector<std::string>& causes() const noexcept {
        return chain_;
    }

    /// "outer | inner | root"
    [[nodiscard]] std::string chain() const;

    /// Wrap with an outer message. The code is kept.
    DownloadError& with_context(std::string outer) &;
    DownloadError&& with_context(std::string outer) &&;

    // ─────────────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────────────

    static DownloadError network(std::string msg) {
        return {Code::Network, std::move(msg)};
    }

    static DownloadError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }

    /// "Download failed with status: 503 Service Unavailable"
    static DownloadError http_error(const HttpResponseHead& head);

    static DownloadError premature_end(std::uint64_t received, std::uint64_t expected);

    /// Message plus the OS description, e.g. "Failed to create download file | Permission denied"
    static DownloadError filesystem(std::string msg, const std::error_code& ec);

    static DownloadError filesystem(std::string msg) {
        return {Code::Filesystem, std::move(msg)};
    }

    static DownloadError insufficient_space(std::uint64_t available, std::uint64_t required);

    static DownloadError invalid_url(const std::string& url) {
        return {Code::InvalidUrl, "Invalid download URL: " + url};
    }

    static DownloadError cancelled() {
        return {Code::Cancelled, "Download cancelled"};
    }

    /// Wraps the last attempt's error; its chain is preserved underneath.
    static DownloadError retries_exhausted(DownloadError last, std::size_t attempts);

    static DownloadError validation(std::string msg) {
        return {Code::Validation, std::move(msg)};
    }

    static DownloadError already_in_progress() {
        return {Code::AlreadyInProgress, "Download already in progress"};
    }

    static DownloadError parse(std::string msg) {
        return {Code::Parse, std::move(msg)};
    }

    static DownloadError configuration(std::string msg) {
        return {Code::Configuration, std::move(msg)};
    }

    /// Transport error -> download error, preserving libcurl's message.
    static DownloadError from_client_error(const HttpClientError& err);

private:
    std::vector<std::string> chain_;
};

[[nodiscard]] std::string_view to_string(DownloadError::Code code) noexcept;

template <typename T>
using DownloadResult = tl::expected<T, DownloadError>;

}  // namespace uplink

#endif  // UPLINK_ERROR_DOWNLOAD_ERROR_HPP
