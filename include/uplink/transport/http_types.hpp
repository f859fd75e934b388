#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// Header names are case-insensitive (RFC 7230). Servers and CDNs disagree on
// "Content-Range" vs "content-range", so every lookup goes through here.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Status Codes used by the download engine
// ─────────────────────────────────────────────────────────────────────────────

namespace http_status {
inline constexpr int Ok = 200;
inline constexpr int PartialContent = 206;
inline constexpr int RangeNotSatisfiable = 416;
}  // namespace http_status

enum class HttpMethod {
    Get,
    Head
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Head: return "HEAD";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponseHead
// ─────────────────────────────────────────────────────────────────────────────
// Status line and headers of a response, available before the first body byte
// of a streamed transfer.

struct HttpResponseHead {
    int status_code{0};
    std::string reason;
    HeaderMap headers;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_partial_content() const {
        return status_code == http_status::PartialContent;
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }

    /// "206 Partial Content", or just "206" when the reason phrase is missing.
    [[nodiscard]] std::string status_text() const {
        if (reason.empty()) {
            return std::to_string(status_code);
        }
        return std::to_string(status_code) + " " + reason;
    }
};

/// Standard reason phrase for the statuses a download server sends back.
[[nodiscard]] std::string_view reason_phrase(int status_code) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Range Header Helpers
// ─────────────────────────────────────────────────────────────────────────────

/// "bytes=<from>-"
[[nodiscard]] std::string make_range_header(std::uint64_t from);

/// "bytes=<from>-<to>" (inclusive)
[[nodiscard]] std::string make_range_header(std::uint64_t from, std::uint64_t to);

/// Parse a decimal Content-Length. nullopt if absent, empty or not a number.
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(std::string_view value);

/// Extract the complete-length from "bytes 100-199/1000". nullopt when the
/// value is malformed or the length is "*".
[[nodiscard]] std::optional<std::uint64_t> parse_content_range_total(std::string_view value);

/// True if an Accept-Ranges value advertises byte ranges ("bytes", any case).
[[nodiscard]] bool accepts_byte_ranges(std::string_view accept_ranges);

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // includes leading slash
    std::string query;    // includes "?" when present

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// Last path segment, percent-decoding left to the caller.
    [[nodiscard]] std::string file_name() const;
};

/// Parse an absolute http(s) URL with ada-url. nullopt for anything else.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace uplink
