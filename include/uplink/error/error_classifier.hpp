#ifndef UPLINK_ERROR_ERROR_CLASSIFIER_HPP
#define UPLINK_ERROR_ERROR_CLASSIFIER_HPP

#include "uplink/error/download_error.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// Error Categories
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorCategory {
    Network,
    FileSystem,
    Permission,
    Validation,
    Configuration,
    Archive,
    Unknown
};

[[nodiscard]] std::string_view to_string(ErrorCategory category) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// ErrorVerdict
// ─────────────────────────────────────────────────────────────────────────────
// What the UI shows for a failed operation. Always derived from an error,
// never stored.

struct ErrorVerdict {
    ErrorCategory category{ErrorCategory::Unknown};
    std::string user_message;
    std::string technical_details;   // full causal chain
    std::string recovery_suggestion;
    bool is_retryable{false};

    [[nodiscard]] nlohmann::json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// ErrorClassifier
// ─────────────────────────────────────────────────────────────────────────────
// Maps an error to one of seven categories by lower-cased substring match over
// the whole causal chain. Categories are tried in a fixed order and the first
// match wins:
//
//   network -> filesystem -> permission -> validation -> configuration
//           -> archive -> unknown
//
// Network matches are always retryable, filesystem/permission/configuration
// never, validation/archive always (the caller re-downloads), unknown never.
//
// This is the user-facing view. The retry loop uses the narrower keyword sets
// in RetryPolicy instead.

class ErrorClassifier {
public:
    [[nodiscard]] static ErrorVerdict classify(const DownloadError& error);

    /// For errors that only exist as text (exceptions from other layers).
    [[nodiscard]] static ErrorVerdict classify(std::string_view error_chain);

    [[nodiscard]] static bool is_retryable(const DownloadError& error) {
        return classify(error).is_retryable;
    }

    [[nodiscard]] static bool is_retryable(std::string_view error_chain) {
        return classify(error_chain).is_retryable;
    }
};

}  // namespace uplink

#endif  // UPLINK_ERROR_ERROR_CLASSIFIER_HPP
