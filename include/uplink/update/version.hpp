#pragma once

#include "uplink/error/download_error.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// Version
// ─────────────────────────────────────────────────────────────────────────────
// Semantic version MAJOR.MINOR.PATCH[-PRE][+BUILD]. Release tags usually
// carry a leading 'v' ("v1.3.0"); parse() drops it.
//
// Ordering follows SemVer 2.0: a pre-release sorts below its release,
// pre-release identifiers compare numerically when both are numeric,
// numeric identifiers sort below alphanumeric ones, and build metadata is
// ignored.

struct Version {
    std::uint64_t major{0};
    std::uint64_t minor{0};
    std::uint64_t patch{0};
    std::vector<std::string> pre_release;
    std::string build;

    [[nodiscard]] static DownloadResult<Version> parse(std::string_view text);

    [[nodiscard]] bool is_pre_release() const noexcept {
        return !pre_release.empty();
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::strong_ordering operator<=>(const Version& other) const;

    [[nodiscard]] bool operator==(const Version& other) const {
        return (*this <=> other) == std::strong_ordering::equal;
    }
};

/// True when latest is strictly newer than current. Either string may carry
/// a leading 'v'. Unparseable versions are a Parse error.
[[nodiscard]] DownloadResult<bool> is_update_available(std::string_view current, std::string_view latest);

}  // namespace uplink
