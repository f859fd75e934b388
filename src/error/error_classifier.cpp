#include "uplink/error/error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace uplink {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

template <std::size_t N>
bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& needles) {
    return std::ranges::any_of(needles, [&haystack](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

// ─────────────────────────────────────────────────────────────────────────────
// Category keyword sets
// ─────────────────────────────────────────────────────────────────────────────

constexpr std::array<std::string_view, 16> kNetworkKeywords{
    "network", "connection", "timeout", "timed out", "dns", "host",
    "unreachable", "refused", "reset", "broken pipe",
    "502", "503", "504", "gateway timeout", "service unavailable", "bad gateway"
};

constexpr std::array<std::string_view, 10> kFilesystemKeywords{
    "no such file", "file not found", "directory not found", "disk", "space",
    "full", "read-only", "invalid path", "path too long", "io error"
};

constexpr std::array<std::string_view, 7> kPermissionKeywords{
    "permission denied", "access denied", "unauthorized", "forbidden",
    "cannot write", "cannot read", "cannot create"
};

constexpr std::array<std::string_view, 6> kValidationKeywords{
    "validation", "invalid", "corrupt", "checksum", "integrity", "malformed"
};

constexpr std::array<std::string_view, 5> kConfigurationKeywords{
    "config", "configuration", "setting", "missing", "not configured"
};

constexpr std::array<std::string_view, 9> kArchiveKeywords{
    "extract", "archive", "zip", "7z", "tar", "compression", "decompression", "zstd", "zst"
};

// ─────────────────────────────────────────────────────────────────────────────
// Verdict builders
// ─────────────────────────────────────────────────────────────────────────────

ErrorVerdict network_verdict(const std::string& lower, std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::Network;
    v.technical_details = std::move(details);
    v.is_retryable = true;

    if (contains(lower, "timeout") || contains(lower, "timed out")) {
        v.user_message = "The connection timed out while downloading the update.";
        v.recovery_suggestion =
            "Check your internet connection and try again. If the problem persists, try clearing the cache.";
    } else if (contains(lower, "refused") || contains(lower, "unreachable")) {
        v.user_message = "Could not connect to the download server.";
        v.recovery_suggestion =
            "Check your internet connection and firewall settings. The server may be temporarily unavailable.";
    } else if (contains(lower, "dns") || contains(lower, "resolve")) {
        v.user_message = "Could not resolve the download server address.";
        v.recovery_suggestion =
            "Check your internet connection and DNS settings. Try again in a few minutes.";
    } else if (contains(lower, "502") || contains(lower, "503") || contains(lower, "504")) {
        v.user_message = "The download server is temporarily unavailable.";
        v.recovery_suggestion = "This is usually temporary. Try again in a few minutes.";
    } else {
        v.user_message = "A network error occurred while downloading the update.";
        v.recovery_suggestion =
            "Check your internet connection and try again. If the problem persists, try clearing the cache.";
    }
    return v;
}

ErrorVerdict filesystem_verdict(const std::string& lower, std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::FileSystem;
    v.technical_details = std::move(details);
    v.is_retryable = false;

    if (contains(lower, "space") || contains(lower, "full")) {
        v.user_message = "Not enough disk space to complete the operation.";
        v.recovery_suggestion = "Free up some disk space and try again.";
    } else if (contains(lower, "file not found") || contains(lower, "directory not found")) {
        v.user_message = "A required file or directory could not be found.";
        v.recovery_suggestion = "Check your installation path settings and try again.";
    } else if (contains(lower, "read-only")) {
        v.user_message = "Cannot write to the selected location because it's read-only.";
        v.recovery_suggestion =
            "Choose a different installation directory or change the folder permissions.";
    } else {
        v.user_message = "A file system error occurred.";
        v.recovery_suggestion = "Check your installation path and disk space, then try again.";
    }
    return v;
}

ErrorVerdict permission_verdict(const std::string& lower, std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::Permission;
    v.technical_details = std::move(details);
    v.is_retryable = false;

    if (contains(lower, "permission denied") || contains(lower, "access denied")) {
        v.user_message = "Permission denied when accessing the installation directory.";
        v.recovery_suggestion =
            "Run the launcher as administrator or choose a different installation directory.";
    } else if (contains(lower, "unauthorized") || contains(lower, "forbidden")) {
        v.user_message = "Access to the installation directory is forbidden.";
        v.recovery_suggestion = "Check folder permissions or run the launcher as administrator.";
    } else {
        v.user_message = "Insufficient permissions to complete the operation.";
        v.recovery_suggestion = "Run the launcher as administrator or check folder permissions.";
    }
    return v;
}

ErrorVerdict validation_verdict(const std::string& lower, std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::Validation;
    v.technical_details = std::move(details);
    v.is_retryable = true;

    if (contains(lower, "corrupt") || contains(lower, "integrity")) {
        v.user_message = "The downloaded file appears to be corrupted.";
        v.recovery_suggestion =
            "Clear the cache and try downloading again. If the problem persists, the server file may be corrupted.";
    } else if (contains(lower, "checksum")) {
        v.user_message = "The downloaded file failed integrity verification.";
        v.recovery_suggestion = "Clear the cache and try downloading again.";
    } else {
        v.user_message = "The file or data failed validation.";
        v.recovery_suggestion =
            "Clear the cache and try again. If the problem persists, contact support.";
    }
    return v;
}

ErrorVerdict configuration_verdict(const std::string& lower, std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::Configuration;
    v.technical_details = std::move(details);
    v.is_retryable = false;
    v.recovery_suggestion = "Check your settings and reconfigure if necessary.";

    if (contains(lower, "missing") || contains(lower, "not configured")) {
        v.user_message = "Required configuration is missing or incomplete.";
    } else {
        v.user_message = "There's an issue with the application configuration.";
    }
    return v;
}

ErrorVerdict archive_verdict(const std::string& lower, std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::Archive;
    v.technical_details = std::move(details);
    v.is_retryable = true;

    if (contains(lower, "zstd") || contains(lower, "zst")) {
        v.user_message = "Failed to extract the archive. The compression format may not be supported.";
        v.recovery_suggestion =
            "Clear the cache and try downloading again. If the problem persists, the archive format may be unsupported.";
    } else if (contains(lower, "extract")) {
        v.user_message = "Failed to extract the downloaded archive.";
        v.recovery_suggestion =
            "The file may be corrupted. Clear the cache and try downloading again.";
    } else {
        v.user_message = "An error occurred while processing the archive.";
        v.recovery_suggestion = "Clear the cache and try downloading again.";
    }
    return v;
}

ErrorVerdict unknown_verdict(std::string details) {
    ErrorVerdict v;
    v.category = ErrorCategory::Unknown;
    v.user_message = "An unexpected error occurred.";
    v.technical_details = std::move(details);
    v.recovery_suggestion = "Try again. If the problem persists, contact support.";
    v.is_retryable = false;
    return v;
}

}  // namespace

std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Network:       return "network";
        case ErrorCategory::FileSystem:    return "filesystem";
        case ErrorCategory::Permission:    return "permission";
        case ErrorCategory::Validation:    return "validation";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Archive:       return "archive";
        case ErrorCategory::Unknown:       return "unknown";
    }
    return "unknown";
}

nlohmann::json ErrorVerdict::to_json() const {
    return nlohmann::json{
        {"category", std::string(to_string(category))},
        {"user_message", user_message},
        {"technical_details", technical_details},
        {"recovery_suggestion", recovery_suggestion},
        {"is_retryable", is_retryable}
    };
}

ErrorVerdict ErrorClassifier::classify(const DownloadError& error) {
    return classify(error.chain());
}

ErrorVerdict ErrorClassifier::classify(std::string_view error_chain) {
    const std::string lower = to_lower(error_chain);
    std::string details(error_chain);

    if (contains_any(lower, kNetworkKeywords)) {
        return network_verdict(lower, std::move(details));
    }
    if (contains_any(lower, kFilesystemKeywords)) {
        return filesystem_verdict(lower, std::move(details));
    }
    if (contains_any(lower, kPermissionKeywords)) {
        return permission_verdict(lower, std::move(details));
    }
    if (contains_any(lower, kValidationKeywords)) {
        return validation_verdict(lower, std::move(details));
    }
    if (contains_any(lower, kConfigurationKeywords)) {
        return configuration_verdict(lower, std::move(details));
    }
    if (contains_any(lower, kArchiveKeywords)) {
        return archive_verdict(lower, std::move(details));
    }
    return unknown_verdict(std::move(details));
}

}  // namespace uplink
