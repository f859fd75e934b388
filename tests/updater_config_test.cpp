#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uplink/config/updater_config.hpp"
#include "mocks/temp_directory.hpp"

#include <regex>

using namespace uplink;
using namespace uplink::testing;
using Catch::Matchers::StartsWith;

TEST_CASE("UpdaterConfig first run writes defaults", "[config]") {
    TempDirectory dir;
    const auto path = dir / "settings" / "config.json";

    auto config = UpdaterConfig::load(path);
    REQUIRE(config.has_value());
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(config->current_version == "0.0.0");
    REQUIRE(config->cache_directory == std::filesystem::path("update_cache"));
    REQUIRE(config->auto_check);
    REQUIRE(std::regex_match(config->last_check, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));

    auto reloaded = UpdaterConfig::load(path);
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->last_check == config->last_check);
}

TEST_CASE("UpdaterConfig save and load", "[config]") {
    TempDirectory dir;
    const auto path = dir / "config.json";

    UpdaterConfig config;
    config.current_version = "1.2.0";
    config.update_check_url = "https://api.github.com/repos/acme/tool/releases/latest";
    config.cache_directory = "cache";
    config.auto_check = false;
    config.log_level = "debug";
    config.download.with_max_retries(9);
    REQUIRE(config.save(path).has_value());

    auto loaded = UpdaterConfig::load(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->current_version == "1.2.0");
    REQUIRE(loaded->update_check_url == "https://api.github.com/repos/acme/tool/releases/latest");
    REQUIRE(loaded->cache_directory == std::filesystem::path("cache"));
    REQUIRE_FALSE(loaded->auto_check);
    REQUIRE(loaded->log_level == "debug");
    REQUIRE(loaded->download.retry.max_retries() == 9);
}

TEST_CASE("UpdaterConfig tolerates older and newer files", "[config]") {
    TempDirectory dir;
    const auto path = dir / "config.json";
    write_file(path, R"({ "current_version": "1.1.0", "theme": "dark" })");

    auto loaded = UpdaterConfig::load(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->current_version == "1.1.0");
    REQUIRE(loaded->log_level == "info");
    REQUIRE(loaded->download.retry.max_retries() == 5);
}

TEST_CASE("UpdaterConfig rejects broken files", "[config][error]") {
    TempDirectory dir;
    const auto path = dir / "config.json";

    SECTION("Not JSON") {
        write_file(path, "current_version = 1.2.0");
        auto loaded = UpdaterConfig::load(path);
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().code == DownloadError::Code::Configuration);
    }

    SECTION("Wrong type") {
        write_file(path, R"({ "auto_check": "sometimes" })");
        auto loaded = UpdaterConfig::load(path);
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE_THAT(loaded.error().message(), StartsWith("Failed to load"));
        REQUIRE(loaded.error().causes().back() == "Invalid config setting 'auto_check': must be a boolean");
    }

    SECTION("Bad nested download settings") {
        write_file(path, R"({ "download": { "max_retries": "many" } })");
        auto loaded = UpdaterConfig::load(path);
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().code == DownloadError::Code::Configuration);
    }
}
