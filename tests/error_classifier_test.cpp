#include <catch2/catch_test_macros.hpp>

#include "uplink/error/error_classifier.hpp"

using namespace uplink;

// ═══════════════════════════════════════════════════════════════════════════
// Category Matching
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ErrorClassifier network errors", "[classifier][network]") {
    SECTION("Timeout") {
        const auto v = ErrorClassifier::classify("Operation timed out after 30000 milliseconds");
        REQUIRE(v.category == ErrorCategory::Network);
        REQUIRE(v.is_retryable);
        REQUIRE(v.user_message == "The connection timed out while downloading the update.");
    }

    SECTION("Refused") {
        const auto v = ErrorClassifier::classify("Failed to connect: Connection refused");
        REQUIRE(v.category == ErrorCategory::Network);
        REQUIRE(v.user_message == "Could not connect to the download server.");
    }

    SECTION("Gateway statuses") {
        const auto v = ErrorClassifier::classify("Download failed with status: 502 Bad Gateway");
        REQUIRE(v.category == ErrorCategory::Network);
        REQUIRE(v.user_message == "The download server is temporarily unavailable.");
    }

    SECTION("Generic reset") {
        const auto v = ErrorClassifier::classify("Failed to read download chunk | Connection reset by peer");
        REQUIRE(v.category == ErrorCategory::Network);
        REQUIRE(v.is_retryable);
    }
}

TEST_CASE("ErrorClassifier filesystem and permission errors", "[classifier][filesystem]") {
    SECTION("Disk space") {
        const auto error = DownloadError::insufficient_space(10, 100ULL * 1024 * 1024);
        const auto v = ErrorClassifier::classify(error);
        REQUIRE(v.category == ErrorCategory::FileSystem);
        REQUIRE_FALSE(v.is_retryable);
        REQUIRE(v.user_message == "Not enough disk space to complete the operation.");
    }

    SECTION("Read-only") {
        const auto v = ErrorClassifier::classify("Failed to create download file | Read-only file system");
        REQUIRE(v.category == ErrorCategory::FileSystem);
        REQUIRE_FALSE(v.is_retryable);
    }

    SECTION("Permission denied") {
        const auto v = ErrorClassifier::classify("Failed to create download file | Permission denied");
        REQUIRE(v.category == ErrorCategory::Permission);
        REQUIRE_FALSE(v.is_retryable);
        REQUIRE(v.user_message == "Permission denied when accessing the installation directory.");
    }
}

TEST_CASE("ErrorClassifier validation, configuration and archive errors", "[classifier]") {
    SECTION("Corrupt file is retryable") {
        const auto v = ErrorClassifier::classify("Archive integrity check failed: corrupt header");
        REQUIRE(v.category == ErrorCategory::Validation);
        REQUIRE(v.is_retryable);
    }

    SECTION("Configuration") {
        const auto v = ErrorClassifier::classify("Update URL not configured");
        REQUIRE(v.category == ErrorCategory::Configuration);
        REQUIRE_FALSE(v.is_retryable);
        REQUIRE(v.user_message == "Required configuration is missing or incomplete.");
    }

    SECTION("Archive") {
        const auto v = ErrorClassifier::classify("Failed to extract update");
        REQUIRE(v.category == ErrorCategory::Archive);
        REQUIRE(v.is_retryable);
    }

    SECTION("Unknown") {
        const auto v = ErrorClassifier::classify("Something odd happened");
        REQUIRE(v.category == ErrorCategory::Unknown);
        REQUIRE_FALSE(v.is_retryable);
        REQUIRE(v.recovery_suggestion == "Try again. If the problem persists, contact support.");
    }
}

TEST_CASE("ErrorClassifier checks categories in order", "[classifier]") {
    // Matches both network ("timeout") and filesystem ("disk"); network wins
    const auto v = ErrorClassifier::classify("disk write timeout");
    REQUIRE(v.category == ErrorCategory::Network);
}

TEST_CASE("ErrorClassifier keeps the full chain as technical details", "[classifier]") {
    auto error = DownloadError::network("Connection reset by peer (simulated)")
                     .with_context("Failed to read download chunk");
    auto exhausted = DownloadError::retries_exhausted(std::move(error), 6);

    const auto v = ErrorClassifier::classify(exhausted);
    REQUIRE(v.technical_details == exhausted.chain());
    REQUIRE(ErrorClassifier::is_retryable(exhausted));
}

TEST_CASE("ErrorVerdict serializes to JSON", "[classifier][json]") {
    const auto v = ErrorClassifier::classify("Connection refused");
    const auto j = v.to_json();

    REQUIRE(j["category"] == "network");
    REQUIRE(j["is_retryable"] == true);
    REQUIRE(j["technical_details"] == "Connection refused");
    REQUIRE(j.contains("user_message"));
    REQUIRE(j.contains("recovery_suggestion"));
}
