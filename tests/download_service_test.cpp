#include <catch2/catch_test_macros.hpp>

#include "uplink/service/download_service.hpp"
#include "mocks/mock_http_client.hpp"
#include "mocks/temp_directory.hpp"

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace uplink;
using namespace uplink::testing;
using namespace std::chrono_literals;

namespace {

const std::string kUrl = "https://github.com/owner/app/releases/download/v1.3.0/app-1.3.0.7z";

DownloadConfig service_config() {
    DownloadConfig config;
    config.with_min_free_space(0)
          .with_progress_interval(0ms)
          .with_max_retries(3)
          .with_backoff_policy(std::make_shared<NoBackoff>());
    return config;
}

HttpClientFactory factory_for(MockHttpClient& mock) {
    return [&mock]() -> std::unique_ptr<IHttpClient> { return mock.clone(); };
}

UpdateInfo make_update(const std::string& url = kUrl) {
    UpdateInfo update;
    update.current_version = "1.2.0";
    update.latest_version = "1.3.0";
    update.download_url = url;
    update.asset_name = "app-1.3.0.7z";
    update.update_available = true;
    return update;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// fetch
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DownloadService requires a client factory", "[service]") {
    DownloadLeaseRegistry registry;
    REQUIRE_THROWS_AS(DownloadService(service_config(), registry, HttpClientFactory{}), std::invalid_argument);
}

TEST_CASE("DownloadService downloads and validates", "[service]") {
    TempDirectory dir;
    const auto payload = make_payload(64 * 1024);

    MockHttpClient mock;
    mock.serve_file(kUrl, payload);

    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    NullProgressObserver observer;

    DownloadRequest request;
    request.url = kUrl;
    request.destination = dir / "app.7z";
    request.expected_size = payload.size();

    auto path = service.fetch(request, observer);
    REQUIRE(path.has_value());
    REQUIRE(*path == request.destination);
    REQUIRE(read_file(*path) == payload);
    REQUIRE(registry.active_count() == 0);
}

TEST_CASE("DownloadService reuses valid cached files", "[service][cache]") {
    TempDirectory dir;
    const auto payload = make_payload(8192);
    const auto destination = dir / "app.7z";

    MockHttpClient mock;
    mock.serve_file(kUrl, payload);

    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    NullProgressObserver observer;

    SECTION("Valid file short-circuits the network") {
        write_file(destination, payload);
        auto path = service.fetch({kUrl, destination, payload.size(), true}, observer);
        REQUIRE(path.has_value());
        REQUIRE(mock.request_count() == 0);
    }

    SECTION("Incomplete file is resumed") {
        write_file(destination, payload.substr(0, 2000));
        auto path = service.fetch({kUrl, destination, payload.size(), true}, observer);
        REQUIRE(path.has_value());
        REQUIRE(read_file(destination) == payload);

        const auto gets = mock.requests_of(HttpMethod::Get);
        REQUIRE(gets.size() == 1);
        REQUIRE(gets.front().range() == "bytes=2000-");
    }

    SECTION("Incomplete file is resumed even when resume was not asked for") {
        write_file(destination, payload.substr(0, 2000));
        auto path = service.fetch({kUrl, destination, payload.size(), false}, observer);
        REQUIRE(path.has_value());
        REQUIRE(mock.requests_of(HttpMethod::Get).front().range() == "bytes=2000-");
    }
}

TEST_CASE("DownloadService rejects downloads that fail validation", "[service][validation]") {
    TempDirectory dir;
    const auto destination = dir / "app.7z";

    MockHttpClient mock;
    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    NullProgressObserver observer;

    SECTION("Too small to be an archive") {
        mock.serve_file(kUrl, std::string(500, 'x'));
        auto path = service.fetch({kUrl, destination, std::nullopt, true}, observer);

        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == DownloadError::Code::Validation);
        REQUIRE(path.error().message() == "Downloaded file failed validation");
        REQUIRE_FALSE(std::filesystem::exists(destination));
    }

    SECTION("Size differs from the expected size") {
        mock.serve_file(kUrl, make_payload(4096));
        auto path = service.fetch({kUrl, destination, 5000, true}, observer);

        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == DownloadError::Code::Validation);
        REQUIRE_FALSE(std::filesystem::exists(destination));

        const auto verdict = DownloadService::verdict(path.error());
        REQUIRE(verdict.category == ErrorCategory::Validation);
        REQUIRE(verdict.is_retryable);
    }
}

TEST_CASE("DownloadService propagates download failures", "[service][error]") {
    TempDirectory dir;
    MockHttpClient mock;
    mock.serve_file(kUrl, make_payload(4096));
    mock.queue_stream_status(404);

    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    NullProgressObserver observer;

    auto path = service.fetch({kUrl, dir / "app.7z", std::nullopt, true}, observer);

    REQUIRE_FALSE(path.has_value());
    REQUIRE(path.error().code == DownloadError::Code::HttpStatus);
    REQUIRE(registry.active_count() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Single Writer per Destination
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DownloadService refuses a second download into the same file", "[service][lease]") {
    TempDirectory dir;
    const auto destination = dir / "app.7z";

    MockHttpClient mock;
    mock.serve_file(kUrl, make_payload(256 * 1024));
    mock.serve_file(kUrl + ".sig", make_payload(2048));
    mock.set_chunk_size(16 * 1024);

    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));

    SECTION("Held lease") {
        auto lease = registry.try_acquire(destination);
        REQUIRE(lease.has_value());

        NullProgressObserver observer;
        auto path = service.fetch({kUrl, destination, std::nullopt, true}, observer);
        REQUIRE_FALSE(path.has_value());
        REQUIRE(path.error().code == DownloadError::Code::AlreadyInProgress);
        REQUIRE(mock.request_count() == 0);
    }

    SECTION("Concurrent fetches") {
        std::promise<void> started;
        std::promise<void> release;
        auto release_future = release.get_future().share();
        bool signalled = false;

        CallbackProgressObserver blocking([&](const ProgressSample& /*sample*/) {
            if (!signalled) {
                signalled = true;
                started.set_value();
                release_future.wait();
            }
        });

        auto first = std::async(std::launch::async, [&]() {
            return service.fetch({kUrl, destination, std::nullopt, true}, blocking);
        });
        started.get_future().wait();

        NullProgressObserver observer;
        auto second = service.fetch({kUrl, destination, std::nullopt, true}, observer);
        // CHECK rather than REQUIRE: the first download must be released
        CHECK_FALSE(second.has_value());
        if (!second.has_value()) {
            CHECK(second.error().message() == "Download already in progress");
        }

        // A different destination is not blocked
        auto other = service.fetch({kUrl + ".sig", dir / "app.7z.sig", std::nullopt, true}, observer);
        CHECK(other.has_value());

        release.set_value();
        auto result = first.get();
        REQUIRE(result.has_value());
        REQUIRE(registry.active_count() == 0);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// fetch_update
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DownloadService fetch_update stores the archive in the cache", "[service][update]") {
    TempDirectory dir;
    const auto payload = make_payload(32 * 1024);

    MockHttpClient mock;
    mock.serve_file(kUrl, payload);

    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    CacheIndex index(dir / "update_cache");
    NullProgressObserver observer;

    auto path = service.fetch_update(make_update(), index, observer);
    REQUIRE(path.has_value());
    REQUIRE(*path == dir / "update_cache" / "v1.3.0_app-1.3.0.7z");
    REQUIRE(read_file(*path) == payload);

    auto entry = index.find("v1.3.0_app-1.3.0.7z");
    REQUIRE(entry.has_value());
    REQUIRE(entry->completed);
    REQUIRE(entry->size == payload.size());
    REQUIRE(entry->version == "1.3.0");
    REQUIRE(entry->source_url == kUrl);

    SECTION("A second call is served from the cache") {
        const auto before = mock.request_count();
        auto again = service.fetch_update(make_update(), index, observer);
        REQUIRE(again.has_value());
        REQUIRE(mock.request_count() == before);
    }

    SECTION("A new source discards the cached copy") {
        const std::string mirror = "https://mirror.example.com/app-1.3.0.7z";
        const auto mirrored = make_payload(40 * 1024);
        mock.serve_file(mirror, mirrored);

        auto again = service.fetch_update(make_update(mirror), index, observer);
        REQUIRE(again.has_value());
        REQUIRE(read_file(*again) == mirrored);
        REQUIRE(index.find("v1.3.0_app-1.3.0.7z")->source_url == mirror);

        // Fresh download, not a resume onto the old bytes
        const auto gets = mock.requests_of(HttpMethod::Get);
        REQUIRE_FALSE(gets.back().range().has_value());
    }
}

TEST_CASE("DownloadService fetch_update resumes a partial archive", "[service][update]") {
    TempDirectory dir;
    const auto payload = make_payload(32 * 1024);

    MockHttpClient mock;
    mock.serve_file(kUrl, payload);

    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    CacheIndex index(dir / "update_cache");
    NullProgressObserver observer;

    // An earlier run got 3000 bytes in before it died
    CacheEntry partial;
    partial.file_name = "v1.3.0_app-1.3.0.7z";
    partial.version = "1.3.0";
    partial.source_url = kUrl;
    REQUIRE(index.record(partial).has_value());
    write_file(dir / "update_cache" / "v1.3.0_app-1.3.0.7z", payload.substr(0, 3000));

    auto path = service.fetch_update(make_update(), index, observer);
    REQUIRE(path.has_value());
    REQUIRE(read_file(*path) == payload);
    REQUIRE(mock.requests_of(HttpMethod::Get).front().range() == "bytes=3000-");
    REQUIRE(index.find("v1.3.0_app-1.3.0.7z")->completed);
}

TEST_CASE("DownloadService fetch_update without an archive", "[service][update]") {
    TempDirectory dir;
    MockHttpClient mock;
    DownloadLeaseRegistry registry;
    DownloadService service(service_config(), registry, factory_for(mock));
    CacheIndex index(dir.path());
    NullProgressObserver observer;

    auto update = make_update();
    update.download_url.clear();

    auto path = service.fetch_update(update, index, observer);
    REQUIRE_FALSE(path.has_value());
    REQUIRE(path.error().code == DownloadError::Code::Configuration);
    REQUIRE(path.error().message() == "Release 1.3.0 has no downloadable archive");
    REQUIRE(index.entries().empty());
}
