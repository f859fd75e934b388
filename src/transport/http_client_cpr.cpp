#include "uplink/transport/http_client.hpp"

#include "uplink/log/logger.hpp"

#include <cpr/cpr.h>

#include <charconv>
#include <mutex>

namespace uplink {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Per-request state shared with the libcurl callbacks
// ─────────────────────────────────────────────────────────────────────────────

struct TransferState {
    IStreamSink* sink{nullptr};
    HttpResponseHead head;
    bool head_dispatched{false};
    bool sink_aborted{false};
    bool stalled{false};
    std::chrono::milliseconds read_timeout{30'000};
    std::chrono::steady_clock::time_point last_progress{std::chrono::steady_clock::now()};
    long long last_download_now{0};
};

// "HTTP/1.1 206 Partial Content" -> 206, "Partial Content"
void parse_status_line(std::string_view line, HttpResponseHead& head) {
    head = HttpResponseHead{};

    const auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) {
        return;
    }
    auto rest = line.substr(first_space + 1);
    const auto second_space = rest.find(' ');
    const auto code_text = rest.substr(0, second_space);

    int code = 0;
    std::from_chars(code_text.data(), code_text.data() + code_text.size(), code);
    head.status_code = code;

    if (second_space != std::string_view::npos) {
        auto reason = rest.substr(second_space + 1);
        while (!reason.empty() && (reason.back() == '\r' || reason.back() == '\n')) {
            reason.remove_suffix(1);
        }
        head.reason = std::string(reason);
    }
}

void parse_header_line(std::string_view line, HttpResponseHead& head) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return;
    }
    // Every response in a redirect chain starts a fresh header block
    if (line.starts_with("HTTP/")) {
        parse_status_line(line, head);
        return;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }
    auto value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    head.headers[std::string(line.substr(0, colon))] = std::string(value);
}

bool dispatch_head(TransferState& state) {
    if (state.head_dispatched) {
        return true;
    }
    state.head_dispatched = true;
    if (state.head.reason.empty()) {
        state.head.reason = std::string(reason_phrase(state.head.status_code));
    }
    const bool keep_going = state.sink->on_response(state.head);
    if (keep_going == false) {
        state.sink_aborted = true;
    }
    return keep_going;
}

// Collects a whole response in memory for head() and get().
class BufferingSink final : public IStreamSink {
public:
    bool on_response(const HttpResponseHead& head) override {
        response_.head = head;
        return true;
    }

    bool on_chunk(std::string_view data) override {
        response_.body.append(data);
        return true;
    }

    [[nodiscard]] HttpClientResponse take() {
        return std::move(response_);
    }

private:
    HttpClientResponse response_;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. A single cpr::Session is kept for the
// lifetime of the client so libcurl's connection cache lets consecutive
// requests (probe, ranged GET, retry) reuse the same keep-alive connection.
// Requests on one client are serialized by session_mutex_.

class CprHttpClient final : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(session_mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(session_mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        if (timeout <= std::chrono::milliseconds::zero()) {
            UPLINK_LOG_WARN("Ignoring non-positive read timeout ({} ms)", timeout.count());
            return;
        }
        std::lock_guard<std::mutex> lock(session_mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(session_mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> head(
        const std::string& url,
        const HeaderMap& headers
    ) override {
        BufferingSink sink;
        auto status = perform(HttpMethod::Head, url, headers, sink);
        if (!status) {
            return tl::unexpected(status.error());
        }
        return sink.take();
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& url,
        const HeaderMap& headers
    ) override {
        BufferingSink sink;
        auto status = perform(HttpMethod::Get, url, headers, sink);
        if (!status) {
            return tl::unexpected(status.error());
        }
        return sink.take();
    }

    HttpClientResult<int> get_stream(
        const std::string& url,
        const HeaderMap& headers,
        IStreamSink& sink
    ) override {
        return perform(HttpMethod::Get, url, headers, sink);
    }

private:
    HttpClientResult<int> perform(
        HttpMethod method,
        const std::string& url,
        const HeaderMap& headers,
        IStreamSink& sink
    ) {
        std::lock_guard<std::mutex> lock(session_mutex_);

        TransferState state;
        state.sink = &sink;
        state.read_timeout = read_timeout_;
        state.last_progress = std::chrono::steady_clock::now();

        session_.SetUrl(cpr::Url{url});
        session_.SetHeader(build_headers(headers));
        session_.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout_});
        // No overall deadline: large archives take as long as they take.
        // Stalls are caught by the progress callback below instead.
        session_.SetTimeout(cpr::Timeout{std::chrono::milliseconds{0}});
        session_.SetVerifySsl(cpr::VerifySsl{verify_ssl_});

        session_.SetHeaderCallback(cpr::HeaderCallback{
            [&state](std::string_view line, intptr_t /*userdata*/) -> bool {
                parse_header_line(line, state.head);
                return true;
            }
        });

        session_.SetWriteCallback(cpr::WriteCallback{
            [&state](std::string_view data, intptr_t /*userdata*/) -> bool {
                if (dispatch_head(state) == false) {
                    return false;
                }
                const bool keep_going = state.sink->on_chunk(data);
                if (keep_going == false) {
                    state.sink_aborted = true;
                }
                return keep_going;
            }
        });

        session_.SetProgressCallback(cpr::ProgressCallback{
            [&state](auto /*download_total*/, auto download_now,
                           auto /*upload_total*/, auto /*upload_now*/,
                           intptr_t /*userdata*/) -> bool {
                const auto now = std::chrono::steady_clock::now();
                const auto received = static_cast<long long>(download_now);
                if (received != state.last_download_now) {
                    state.last_download_now = received;
                    state.last_progress = now;
                }
                if (state.sink->should_continue() == false) {
                    state.sink_aborted = true;
                    return false;
                }
                if (now - state.last_progress > state.read_timeout) {
                    state.stalled = true;
                    return false;
                }
                return true;
            }
        });

        const cpr::Response response =
            (method == HttpMethod::Head) ? session_.Head() : session_.Get();

        if (state.sink_aborted) {
            return tl::unexpected(HttpClientError::aborted());
        }
        if (state.stalled) {
            const auto seconds =
                std::chrono::duration_cast<std::chrono::seconds>(state.read_timeout).count();
            return tl::unexpected(HttpClientError::timeout(
                "Chunk read timed out: no data received for " + std::to_string(seconds) + "s"
            ));
        }

        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            UPLINK_LOG_DEBUG("{} {} failed: {}", to_string(method), url, response.error.message);
            return tl::unexpected(map_error(response.error));
        }

        // Empty bodies (HEAD, 204, 416 without payload) never hit the write callback
        if (state.head.status_code == 0) {
            state.head.status_code = static_cast<int>(response.status_code);
        }
        if (dispatch_head(state) == false) {
            return tl::unexpected(HttpClientError::aborted());
        }
        return state.head.status_code;
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                // Resolve failures, resets, refused connects, short reads
                return HttpClientError::connection_failed(msg);
        }
    }

    std::mutex session_mutex_;
    cpr::Session session_;

    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{30'000};
    std::chrono::milliseconds read_timeout_{30'000};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace uplink
