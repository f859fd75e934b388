#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uplink/download/range_prober.hpp"
#include "mocks/mock_http_client.hpp"

using namespace uplink;
using namespace uplink::testing;
using Catch::Matchers::StartsWith;

namespace {
const std::string kUrl = "https://cdn.example.com/app-1.3.0.7z";
}

TEST_CASE("RangeProber trusts Accept-Ranges on HEAD", "[prober]") {
    MockHttpClient client;

    SECTION("bytes") {
        client.serve_file(kUrl, make_payload(4096));

        RangeProber prober(client);
        auto supported = prober.probe(kUrl);

        REQUIRE(supported.has_value());
        REQUIRE(*supported);
        REQUIRE(client.request_count() == 1);
        REQUIRE(client.requests().front().method == HttpMethod::Head);
    }

    SECTION("none") {
        ServedFile file;
        file.content = make_payload(4096);
        file.accept_ranges = "none";
        file.honor_ranges = false;
        client.serve_file(kUrl, file);

        RangeProber prober(client);
        auto supported = prober.probe(kUrl);

        REQUIRE(supported.has_value());
        REQUIRE_FALSE(*supported);
        REQUIRE(client.request_count() == 1);
    }
}

TEST_CASE("RangeProber falls back to a one-byte range request", "[prober]") {
    MockHttpClient client;
    ServedFile file;
    file.content = make_payload(4096);
    file.accept_ranges = std::nullopt;

    SECTION("206 means supported") {
        file.honor_ranges = true;
        client.serve_file(kUrl, file);

        RangeProber prober(client);
        auto supported = prober.probe(kUrl);

        REQUIRE(supported.has_value());
        REQUIRE(*supported);

        const auto requests = client.requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[1].range() == "bytes=0-0");
    }

    SECTION("200 means unsupported") {
        file.honor_ranges = false;
        client.serve_file(kUrl, file);

        RangeProber prober(client);
        auto supported = prober.probe(kUrl);

        REQUIRE(supported.has_value());
        REQUIRE_FALSE(*supported);
    }
}

TEST_CASE("RangeProber reports transport failures", "[prober][error]") {
    MockHttpClient client;
    ServedFile file;
    file.content = make_payload(4096);
    file.accept_ranges = std::nullopt;
    client.serve_file(kUrl, file);
    client.queue_request_error(HttpClientError::connection_failed("Connection refused"));

    RangeProber prober(client);
    auto supported = prober.probe(kUrl);

    REQUIRE_FALSE(supported.has_value());
    REQUIRE_THAT(supported.error().chain(), StartsWith("Failed to send test Range request"));
}

TEST_CASE("RangeProber HEAD failure", "[prober][error]") {
    MockHttpClient client;
    client.serve_file(kUrl, make_payload(4096));
    client.queue_head_error(HttpClientError::timeout("Connection timed out after 30000 milliseconds"));

    RangeProber prober(client);
    auto supported = prober.probe(kUrl);

    REQUIRE_FALSE(supported.has_value());
    REQUIRE_THAT(supported.error().chain(), StartsWith("Failed to send HEAD request for Range support test"));
}
