#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uplink/error/download_error.hpp"

#include <system_error>

using namespace uplink;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

TEST_CASE("DownloadError context chain", "[error]") {
    auto error = DownloadError::network("Connection reset by peer")
                     .with_context("Failed to read download chunk");

    REQUIRE(error.code == DownloadError::Code::Network);
    REQUIRE(error.message() == "Failed to read download chunk");
    REQUIRE(error.causes().size() == 2);
    REQUIRE(error.causes().back() == "Connection reset by peer");
    REQUIRE(error.chain() == "Failed to read download chunk | Connection reset by peer");

    SECTION("Lvalue overload") {
        error.with_context("Update failed");
        REQUIRE(error.causes().size() == 3);
        REQUIRE_THAT(error.chain(), StartsWith("Update failed | "));
    }
}

TEST_CASE("DownloadError factories", "[error]") {
    SECTION("HTTP status") {
        HttpResponseHead head;
        head.status_code = 503;
        head.reason = "Service Unavailable";

        const auto error = DownloadError::http_error(head);
        REQUIRE(error.code == DownloadError::Code::HttpStatus);
        REQUIRE(error.http_status == 503);
        REQUIRE(error.message() == "Download failed with status: 503 Service Unavailable");
    }

    SECTION("Premature end mentions both sizes") {
        const auto error = DownloadError::premature_end(400, 1000);
        REQUIRE(error.code == DownloadError::Code::PrematureEnd);
        REQUIRE_THAT(error.message(), ContainsSubstring("400"));
        REQUIRE_THAT(error.message(), ContainsSubstring("1000"));
    }

    SECTION("Filesystem error appends the OS message") {
        const auto ec = std::make_error_code(std::errc::permission_denied);
        const auto error = DownloadError::filesystem("Failed to create download file", ec);
        REQUIRE(error.code == DownloadError::Code::Filesystem);
        REQUIRE(error.chain() == "Failed to create download file | " + ec.message());
    }

    SECTION("Insufficient space") {
        const auto error = DownloadError::insufficient_space(50ULL * 1024 * 1024, 100ULL * 1024 * 1024);
        REQUIRE(error.code == DownloadError::Code::InsufficientSpace);
        REQUIRE(error.message() == "Insufficient disk space");
        REQUIRE_THAT(error.chain(), ContainsSubstring("Available: 50 MB, Required: 100 MB"));
    }

    SECTION("Retries exhausted keeps the last chain") {
        auto last = DownloadError::network("Connection reset by peer")
                        .with_context("Failed to read download chunk");
        const auto error = DownloadError::retries_exhausted(std::move(last), 6);

        REQUIRE(error.code == DownloadError::Code::RetriesExhausted);
        REQUIRE(error.message() == "Download failed after retries exhausted (6 attempts)");
        REQUIRE_THAT(error.chain(), ContainsSubstring("Connection reset by peer"));
    }

    SECTION("Already in progress") {
        REQUIRE(DownloadError::already_in_progress().message() == "Download already in progress");
    }
}

TEST_CASE("DownloadError from transport errors", "[error][transport]") {
    SECTION("Timeout") {
        const auto error = DownloadError::from_client_error(HttpClientError::timeout("Operation timed out"));
        REQUIRE(error.code == DownloadError::Code::Timeout);
        REQUIRE(error.message() == "Operation timed out");
    }

    SECTION("Connection failure keeps libcurl's text") {
        const auto error = DownloadError::from_client_error(
            HttpClientError::connection_failed("Could not resolve host: example.invalid"));
        REQUIRE(error.code == DownloadError::Code::Network);
        REQUIRE(error.message() == "Could not resolve host: example.invalid");
    }
}

TEST_CASE("DownloadError code names", "[error]") {
    REQUIRE(to_string(DownloadError::Code::RetriesExhausted) == "retries_exhausted");
    REQUIRE(to_string(DownloadError::Code::AlreadyInProgress) == "already_in_progress");
    REQUIRE(to_string(DownloadError::Code::InsufficientSpace) == "insufficient_space");
}
