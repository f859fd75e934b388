#include "uplink/update/version.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace uplink {

namespace {

bool is_numeric(std::string_view text) {
    return !text.empty() && std::ranges::all_of(text, [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_identifier(std::string_view text) {
    return !text.empty() && std::ranges::all_of(text, [](unsigned char c) {
        return (std::isalnum(c) != 0) || c == '-';
    });
}

std::optional<std::uint64_t> parse_number(std::string_view text) {
    if (is_numeric(text) == false) {
        return std::nullopt;
    }
    // No leading zeros except "0" itself
    if (text.size() > 1 && text.front() == '0') {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto end = text.find(separator, start);
        if (end == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::strong_ordering compare_identifier(const std::string& lhs, const std::string& rhs) {
    const bool lhs_numeric = is_numeric(lhs);
    const bool rhs_numeric = is_numeric(rhs);
    if (lhs_numeric && rhs_numeric) {
        if (lhs.size() != rhs.size()) {
            return lhs.size() <=> rhs.size();
        }
        return lhs.compare(rhs) <=> 0;
    }
    if (lhs_numeric != rhs_numeric) {
        return lhs_numeric ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    return lhs.compare(rhs) <=> 0;
}

DownloadError invalid_version(std::string_view text) {
    return DownloadError::parse("Invalid version: '" + std::string(text) + "'");
}

}  // namespace

DownloadResult<Version> Version::parse(std::string_view text) {
    const std::string_view original = text;

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
        text.remove_prefix(1);
    }

    Version version;

    if (const auto plus = text.find('+'); plus != std::string_view::npos) {
        version.build = std::string(text.substr(plus + 1));
        text = text.substr(0, plus);
        if (version.build.empty()) {
            return tl::unexpected(invalid_version(original));
        }
    }

    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        for (const auto identifier : split(text.substr(dash + 1), '.')) {
            if (is_identifier(identifier) == false) {
                return tl::unexpected(invalid_version(original));
            }
            if (is_numeric(identifier) && identifier.size() > 1 && identifier.front() == '0') {
                return tl::unexpected(invalid_version(original));
            }
            version.pre_release.emplace_back(identifier);
        }
        text = text.substr(0, dash);
    }

    const auto core = split(text, '.');
    if (core.size() != 3) {
        return tl::unexpected(invalid_version(original));
    }

    const auto major = parse_number(core[0]);
    const auto minor = parse_number(core[1]);
    const auto patch = parse_number(core[2]);
    if (!major || !minor || !patch) {
        return tl::unexpected(invalid_version(original));
    }

    version.major = *major;
    version.minor = *minor;
    version.patch = *patch;
    return version;
}

std::string Version::to_string() const {
    std::string text = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!pre_release.empty()) {
        text += '-';
        for (std::size_t i = 0; i < pre_release.size(); ++i) {
            if (i > 0) {
                text += '.';
            }
            text += pre_release[i];
        }
    }
    if (!build.empty()) {
        text += '+';
        text += build;
    }
    return text;
}

std::strong_ordering Version::operator<=>(const Version& other) const {
    if (auto cmp = major <=> other.major; cmp != 0) {
        return cmp;
    }
    if (auto cmp = minor <=> other.minor; cmp != 0) {
        return cmp;
    }
    if (auto cmp = patch <=> other.patch; cmp != 0) {
        return cmp;
    }

    // A release outranks any of its pre-releases
    if (pre_release.empty() || other.pre_release.empty()) {
        if (pre_release.empty() && other.pre_release.empty()) {
            return std::strong_ordering::equal;
        }
        return pre_release.empty() ? std::strong_ordering::greater : std::strong_ordering::less;
    }

    const std::size_t common = std::min(pre_release.size(), other.pre_release.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (auto cmp = compare_identifier(pre_release[i], other.pre_release[i]); cmp != 0) {
            return cmp;
        }
    }
    return pre_release.size() <=> other.pre_release.size();
}

DownloadResult<bool> is_update_available(std::string_view current, std::string_view latest) {
    auto current_version = Version::parse(current);
    if (!current_version) {
        return tl::unexpected(std::move(current_version.error()).with_context("Invalid current version"));
    }
    auto latest_version = Version::parse(latest);
    if (!latest_version) {
        return tl::unexpected(std::move(latest_version.error()).with_context("Invalid latest version"));
    }
    return *latest_version > *current_version;
}

}  // namespace uplink
