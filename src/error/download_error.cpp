#include "uplink/error/download_error.hpp"

namespace uplink {

std::string DownloadError::chain() const {
    std::string joined;
    for (std::size_t i = 0; i < chain_.size(); ++i) {
        if (i > 0) {
            joined += " | ";
        }
        joined += chain_[i];
    }
    return joined;
}

DownloadError& DownloadError::with_context(std::string outer) & {
    chain_.insert(chain_.begin(), std::move(outer));
    return *this;
}

DownloadError&& DownloadError::with_context(std::string outer) && {
    chain_.insert(chain_.begin(), std::move(outer));
    return std::move(*this);
}

DownloadError DownloadError::http_error(const HttpResponseHead& head) {
    return {Code::HttpStatus, "Download failed with status: " + head.status_text(), head.status_code};
}

DownloadError DownloadError::premature_end(std::uint64_t received, std::uint64_t expected) {
    // "incomplete read" keeps this in the retryable chunk-failure family
    return {
        Code::PrematureEnd,
        "Download ended prematurely (incomplete read): received " + std::to_string(received) +
            " of " + std::to_string(expected) + " bytes"
    };
}

DownloadError DownloadError::filesystem(std::string msg, const std::error_code& ec) {
    DownloadError err{Code::Filesystem, ec.message()};
    return std::move(err).with_context(std::move(msg));
}

DownloadError DownloadError::insufficient_space(std::uint64_t available, std::uint64_t required) {
    constexpr std::uint64_t mib = 1024 * 1024;
    DownloadError err{
        Code::InsufficientSpace,
        "Not enough disk space. Available: " + std::to_string(available / mib) +
            " MB, Required: " + std::to_string(required / mib) + " MB"
    };
    return std::move(err).with_context("Insufficient disk space");
}

DownloadError DownloadError::retries_exhausted(DownloadError last, std::size_t attempts) {
    last.code = Code::RetriesExhausted;
    return std::move(last).with_context(
        "Download failed after retries exhausted (" + std::to_string(attempts) + " attempts)"
    );
}

DownloadError DownloadError::from_client_error(const HttpClientError& err) {
    switch (err.code) {
        case HttpClientError::Code::Timeout:
            return timeout(err.message);
        case HttpClientError::Code::ConnectionFailed:
        case HttpClientError::Code::SslError:
        case HttpClientError::Code::Aborted:
        case HttpClientError::Code::Unknown:
            return network(err.message);
    }
    return network(err.message);
}

std::string_view to_string(DownloadError::Code code) noexcept {
    switch (code) {
        case DownloadError::Code::Network:           return "network";
        case DownloadError::Code::Timeout:           return "timeout";
        case DownloadError::Code::HttpStatus:        return "http_status";
        case DownloadError::Code::PrematureEnd:      return "premature_end";
        case DownloadError::Code::Filesystem:        return "filesystem";
        case DownloadError::Code::InsufficientSpace: return "insufficient_space";
        case DownloadError::Code::InvalidUrl:        return "invalid_url";
        case DownloadError::Code::Cancelled:         return "cancelled";
        case DownloadError::Code::RetriesExhausted:  return "retries_exhausted";
        case DownloadError::Code::Validation:        return "validation";
        case DownloadError::Code::AlreadyInProgress: return "already_in_progress";
        case DownloadError::Code::Parse:             return "parse";
        case DownloadError::Code::Configuration:     return "configuration";
    }
    return "unknown";
}

}  // namespace uplink
