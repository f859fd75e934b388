#pragma once

#include "uplink/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// Transport failures only. HTTP error statuses are not errors at this level;
// they come back as ordinary responses.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,        // connect timeout or stalled body (no bytes within read timeout)
        SslError,
        Aborted,        // a stream sink returned false
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError aborted() {
        return {Code::Aborted, "Transfer aborted by receiver"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Buffered Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    HttpResponseHead head;
    std::string body;

    [[nodiscard]] int status_code() const {
        return head.status_code;
    }

    [[nodiscard]] bool is_success() const {
        return head.is_success();
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IStreamSink
// ─────────────────────────────────────────────────────────────────────────────
// Receiver for a streamed GET. on_response() is called exactly once with the
// final response head (after redirects) before any body bytes; on_chunk() is
// called for each piece of body as it arrives. Returning false from either
// aborts the transfer and the request yields HttpClientError::Code::Aborted.
//
// should_continue() is polled while the transfer is idle (connecting, waiting
// for the next chunk) so a sink can abort without waiting for more data.

class IStreamSink {
public:
    virtual ~IStreamSink() = default;

    virtual bool on_response(const HttpResponseHead& head) = 0;

    virtual bool on_chunk(std::string_view data) = 0;

    virtual bool should_continue() {
        return true;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Minimal surface the download engine needs: HEAD, buffered GET and streamed
// GET against absolute URLs. One instance is reused across the attempts of a
// download so the underlying connection can be kept alive between them.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Headers sent with every request (User-Agent, Connection, ...)
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Upper bound on the wait for the next body bytes. A stream that stays
    // silent this long fails with Code::Timeout. Non-positive values are
    // ignored; the wait is always bounded.
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> head(
        const std::string& url,
        const HeaderMap& headers = {}
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> get(
        const std::string& url,
        const HeaderMap& headers = {}
    ) = 0;

    /// Stream a GET into sink. Returns the final status code on completion.
    [[nodiscard]] virtual HttpClientResult<int> get_stream(
        const std::string& url,
        const HeaderMap& headers,
        IStreamSink& sink
    ) = 0;
};

// Default implementation (cpr / libcurl).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace uplink
