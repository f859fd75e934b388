#include "uplink/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace uplink {

namespace {

std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::optional<std::uint64_t> parse_u64(std::string_view digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* begin = digits.data();
    const auto* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    const bool fully_parsed = (ec == std::errc{}) && (ptr == end);
    if (fully_parsed == false) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string_view reason_phrase(int status_code) noexcept {
    switch (status_code) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 416: return "Range Not Satisfiable";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

std::string make_range_header(std::uint64_t from) {
    return "bytes=" + std::to_string(from) + "-";
}

std::string make_range_header(std::uint64_t from, std::uint64_t to) {
    return "bytes=" + std::to_string(from) + "-" + std::to_string(to);
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) {
    return parse_u64(trim(value));
}

std::optional<std::uint64_t> parse_content_range_total(std::string_view value) {
    // bytes <first>-<last>/<complete-length>  or  bytes */<complete-length>
    const auto slash = value.rfind('/');
    const bool has_slash = (slash != std::string_view::npos);
    if (has_slash == false) {
        return std::nullopt;
    }
    return parse_u64(trim(value.substr(slash + 1)));
}

bool accepts_byte_ranges(std::string_view accept_ranges) {
    std::string lower(accept_ranges);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("bytes") != std::string::npos;
}

std::string UrlComponents::file_name() const {
    const auto last_slash = path.find_last_of('/');
    if (last_slash == std::string::npos) {
        return path;
    }
    return path.substr(last_slash + 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Parser (ada-url, WHATWG compliant)
// ─────────────────────────────────────────────────────────────────────────────

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);

    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada returns "https:"; drop the colon
    std::string scheme = std::string(ada_url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    const bool has_explicit_port = (port_str.empty() == false);
    if (has_explicit_port) {
        const auto explicit_port = parse_u64(port_str);
        if (explicit_port.has_value() == false || *explicit_port > 65535) {
            return std::nullopt;
        }
        port = static_cast<std::uint16_t>(*explicit_port);
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace uplink
