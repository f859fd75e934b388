#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uplink/update/update_checker.hpp"
#include "mocks/mock_http_client.hpp"

#include <stdexcept>

using namespace uplink;
using namespace uplink::testing;
using Catch::Matchers::StartsWith;

namespace {

const std::string kFeed = "https://api.github.com/repos/owner/app/releases/latest";

const std::string kReleaseJson = R"({
    "tag_name": "v1.3.0",
    "name": "Release 1.3.0",
    "assets": [
        { "name": "checksums.txt", "browser_download_url": "https://github.com/owner/app/releases/download/v1.3.0/checksums.txt" },
        { "name": "app-1.3.0.zip", "browser_download_url": "https://github.com/owner/app/releases/download/v1.3.0/app-1.3.0.zip" },
        { "name": "app-1.3.0.7z",  "browser_download_url": "https://github.com/owner/app/releases/download/v1.3.0/app-1.3.0.7z" }
    ]
})";

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Release Feed Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ReleaseInfo parsing", "[update]") {
    SECTION("Well-formed release") {
        auto release = ReleaseInfo::from_json(nlohmann::json::parse(kReleaseJson));
        REQUIRE(release.has_value());
        REQUIRE(release->tag_name == "v1.3.0");
        REQUIRE(release->version() == "1.3.0");
        REQUIRE(release->assets.size() == 3);
    }

    SECTION("Malformed assets are skipped") {
        auto release = ReleaseInfo::from_json(nlohmann::json{
            {"tag_name", "v2.0.0"},
            {"assets", nlohmann::json::array({
                nlohmann::json{{"name", "app.7z"}},
                nlohmann::json{{"name", 7}, {"browser_download_url", "https://x/app.zip"}},
                "not an object",
                nlohmann::json{{"name", "app.zip"}, {"browser_download_url", "https://x/app.zip"}}
            })}
        });
        REQUIRE(release.has_value());
        REQUIRE(release->assets.size() == 1);
        REQUIRE(release->assets.front().name == "app.zip");
    }

    SECTION("No assets") {
        auto release = ReleaseInfo::from_json(nlohmann::json{{"tag_name", "v2.0.0"}});
        REQUIRE(release.has_value());
        REQUIRE(release->assets.empty());
    }

    SECTION("Missing tag_name") {
        auto release = ReleaseInfo::from_json(nlohmann::json{{"assets", nlohmann::json::array()}});
        REQUIRE_FALSE(release.has_value());
        REQUIRE(release.error().code == DownloadError::Code::Parse);
    }

    SECTION("Not an object") {
        REQUIRE_FALSE(ReleaseInfo::from_json(nlohmann::json::array()).has_value());
    }
}

TEST_CASE("Archive asset preference", "[update]") {
    const std::vector<ReleaseAsset> assets{
        {"app-1.3.0.tar.zst", "https://x/app-1.3.0.tar.zst"},
        {"app-1.3.0.tgz", "https://x/app-1.3.0.tgz"},
        {"app-1.3.0.zip", "https://x/app-1.3.0.zip"},
        {"app-1.3.0.7z", "https://x/app-1.3.0.7z"},
    };

    REQUIRE(select_archive_asset(assets)->name == "app-1.3.0.7z");
    REQUIRE(select_archive_asset(std::vector<ReleaseAsset>(assets.begin(), assets.begin() + 3))->name == "app-1.3.0.zip");
    REQUIRE(select_archive_asset(std::vector<ReleaseAsset>(assets.begin(), assets.begin() + 2))->name == "app-1.3.0.tgz");
    REQUIRE(select_archive_asset(std::vector<ReleaseAsset>(assets.begin(), assets.begin() + 1))->name == "app-1.3.0.tar.zst");
    REQUIRE_FALSE(select_archive_asset(std::vector<ReleaseAsset>{ReleaseAsset{"notes.md", "https://x/notes.md"}}).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// UpdateChecker
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("UpdateChecker requires an HTTP client", "[update]") {
    REQUIRE_THROWS_AS(UpdateChecker("uplink-test", nullptr), std::invalid_argument);
}

TEST_CASE("UpdateChecker finds a newer release", "[update]") {
    MockHttpClient mock;
    mock.queue_response(200, kReleaseJson);

    UpdateChecker checker("uplink-test/1.0", mock.clone());

    auto info = checker.check_for_updates("1.2.0", kFeed);
    REQUIRE(info.has_value());
    REQUIRE(info->update_available);
    REQUIRE(info->current_version == "1.2.0");
    REQUIRE(info->latest_version == "1.3.0");
    REQUIRE(info->asset_name == "app-1.3.0.7z");
    REQUIRE(info->download_url == "https://github.com/owner/app/releases/download/v1.3.0/app-1.3.0.7z");

    const auto j = info->to_json();
    REQUIRE(j["update_available"] == true);
    REQUIRE(j["latest_version"] == "1.3.0");

    SECTION("Request went to the feed with the configured headers") {
        const auto requests = mock.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests.front().url == kFeed);
        REQUIRE(get_header(mock.default_headers(), "User-Agent") == "uplink-test/1.0");
        REQUIRE(get_header(mock.default_headers(), "Accept") == "application/vnd.github+json");
    }
}

TEST_CASE("UpdateChecker when already up to date", "[update]") {
    MockHttpClient mock;
    mock.queue_response(200, kReleaseJson);
    UpdateChecker checker("uplink-test/1.0", mock.clone());

    UpdaterConfig config;
    config.current_version = "1.3.0";
    config.update_check_url = kFeed;

    auto info = checker.check_for_updates(config);
    REQUIRE(info.has_value());
    REQUIRE_FALSE(info->update_available);
}

TEST_CASE("UpdateChecker release without an archive", "[update]") {
    MockHttpClient mock;
    mock.queue_response(200, R"({"tag_name": "v1.4.0", "assets": [{"name": "notes.md", "browser_download_url": "https://x/notes.md"}]})");
    UpdateChecker checker("uplink-test/1.0", mock.clone());

    auto info = checker.check_for_updates("1.3.0", kFeed);
    REQUIRE(info.has_value());
    REQUIRE(info->update_available);
    REQUIRE(info->download_url.empty());
    REQUIRE(info->asset_name.empty());
}

TEST_CASE("UpdateChecker failures", "[update][error]") {
    MockHttpClient mock;
    UpdateChecker checker("uplink-test/1.0", mock.clone());

    SECTION("Invalid feed URL") {
        auto info = checker.check_for_updates("1.2.0", "not a url");
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().code == DownloadError::Code::Configuration);
        REQUIRE(mock.request_count() == 0);
    }

    SECTION("Transport error") {
        mock.queue_error(HttpClientError::connection_failed("Could not resolve host: api.github.com"));
        auto info = checker.check_for_updates("1.2.0", kFeed);
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().code == DownloadError::Code::Network);
        REQUIRE(info.error().chain() == "Failed to fetch latest release | Could not resolve host: api.github.com");
    }

    SECTION("Rate limited") {
        mock.queue_response(403, R"({"message": "API rate limit exceeded"})");
        auto info = checker.check_for_updates("1.2.0", kFeed);
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().code == DownloadError::Code::HttpStatus);
        REQUIRE(info.error().http_status == 403);
        REQUIRE(info.error().message() == "Release feed returned status: 403 Forbidden");
    }

    SECTION("Body is not JSON") {
        mock.queue_response(200, "<html>maintenance</html>");
        auto info = checker.check_for_updates("1.2.0", kFeed);
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().code == DownloadError::Code::Parse);
        REQUIRE(info.error().message() == "Failed to parse release feed response");
    }

    SECTION("Tag is not a version") {
        mock.queue_response(200, R"({"tag_name": "nightly"})");
        auto info = checker.check_for_updates("1.2.0", kFeed);
        REQUIRE_FALSE(info.has_value());
        REQUIRE_THAT(info.error().chain(), StartsWith("Invalid latest version"));
    }
}
