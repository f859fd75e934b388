#include <catch2/catch_test_macros.hpp>

#include "uplink/download/download_lease.hpp"
#include "mocks/temp_directory.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace uplink;
using namespace uplink::testing;

TEST_CASE("DownloadLeaseRegistry grants one lease per destination", "[lease]") {
    TempDirectory dir;
    DownloadLeaseRegistry registry;
    const auto destination = dir / "v1.3.0_app.7z";

    auto first = registry.try_acquire(destination);
    REQUIRE(first.has_value());
    REQUIRE(first->held());
    REQUIRE(first->path() == destination);
    REQUIRE(registry.is_active(destination));

    SECTION("Second acquire for the same path fails") {
        auto second = registry.try_acquire(destination);
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().code == DownloadError::Code::AlreadyInProgress);
        REQUIRE(second.error().message() == "Download already in progress");
    }

    SECTION("Equivalent spellings of the path collide") {
        auto second = registry.try_acquire(dir.path() / "." / "v1.3.0_app.7z");
        REQUIRE_FALSE(second.has_value());
    }

    SECTION("Different paths do not block each other") {
        auto other = registry.try_acquire(dir / "v1.3.0_app.zip");
        REQUIRE(other.has_value());
        REQUIRE(registry.active_count() == 2);
    }

    SECTION("Release frees the path") {
        first->release();
        REQUIRE_FALSE(first->held());
        REQUIRE_FALSE(registry.is_active(destination));
        REQUIRE(registry.try_acquire(destination).has_value());
    }
}

TEST_CASE("DownloadLease is released on every exit path", "[lease]") {
    TempDirectory dir;
    DownloadLeaseRegistry registry;
    const auto destination = dir / "app.7z";

    {
        auto lease = registry.try_acquire(destination);
        REQUIRE(lease.has_value());
    }
    REQUIRE(registry.active_count() == 0);

    SECTION("Moved-from leases release nothing") {
        auto lease = registry.try_acquire(destination);
        REQUIRE(lease.has_value());

        DownloadLease moved = std::move(*lease);
        REQUIRE(moved.held());
        REQUIRE_FALSE(lease->held());

        lease->release();
        REQUIRE(registry.is_active(destination));

        moved.release();
        REQUIRE_FALSE(registry.is_active(destination));
    }

    SECTION("A lease may outlive its registry") {
        auto registry_ptr = std::make_unique<DownloadLeaseRegistry>();
        auto lease = registry_ptr->try_acquire(destination);
        REQUIRE(lease.has_value());
        registry_ptr.reset();
        lease->release();
        REQUIRE_FALSE(lease->held());
    }
}

TEST_CASE("DownloadLeaseRegistry under contention", "[lease][concurrency]") {
    TempDirectory dir;
    DownloadLeaseRegistry registry;
    const auto destination = dir / "app.7z";

    constexpr int kThreads = 8;
    std::atomic<int> granted{0};
    std::vector<DownloadResult<DownloadLease>> results;
    results.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        results.emplace_back(tl::unexpected(DownloadError::already_in_progress()));
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            results[i] = registry.try_acquire(destination);
            if (results[i].has_value()) {
                granted.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(granted.load() == 1);
    REQUIRE(registry.active_count() == 1);
}

TEST_CASE("Global registry is a single instance", "[lease]") {
    REQUIRE(&DownloadLeaseRegistry::global() == &DownloadLeaseRegistry::global());
}
