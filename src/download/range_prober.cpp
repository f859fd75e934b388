#include "uplink/download/range_prober.hpp"

#include "uplink/log/logger.hpp"

#include <optional>

namespace uplink {

namespace {

// Captures the response head of the test range request and then aborts.
class HeadOnlySink final : public IStreamSink {
public:
    bool on_response(const HttpResponseHead& head) override {
        head_ = head;
        return false;
    }

    bool on_chunk(std::string_view /*data*/) override {
        return false;
    }

    [[nodiscard]] const std::optional<HttpResponseHead>& head() const noexcept {
        return head_;
    }

private:
    std::optional<HttpResponseHead> head_;
};

}  // namespace

DownloadResult<bool> RangeProber::probe(const std::string& url) {
    auto head_response = client_.head(url);
    if (!head_response) {
        return tl::unexpected(DownloadError::from_client_error(head_response.error())
                                  .with_context("Failed to send HEAD request for Range support test"));
    }

    if (const auto accept_ranges = head_response->head.header("Accept-Ranges"); accept_ranges.has_value()) {
        const bool supported = accepts_byte_ranges(*accept_ranges);
        UPLINK_LOG_DEBUG("Range probe: Accept-Ranges: {} -> {}", *accept_ranges,
                         supported ? "supported" : "unsupported");
        return supported;
    }

    HeadOnlySink sink;
    HeaderMap range_header{{"Range", make_range_header(0, 0)}};
    auto status = client_.get_stream(url, range_header, sink);

    // Aborting from on_response is expected; only a missing head is a failure
    if (!sink.head().has_value()) {
        if (!status) {
            return tl::unexpected(DownloadError::from_client_error(status.error())
                                      .with_context("Failed to send test Range request"));
        }
        return tl::unexpected(DownloadError::network("Failed to send test Range request"));
    }

    const int code = sink.head()->status_code;
    UPLINK_LOG_DEBUG("Range probe: bytes=0-0 answered {}", code);
    return code == http_status::PartialContent;
}

}  // namespace uplink
