#include <catch2/catch_test_macros.hpp>
#include "PageFetcher.h"

#include <chrono>

using namespace std::chrono_literals;

// Offline cases only: nothing here needs a reachable host.

TEST_CASE("PageFetcher refuses non-HTTP schemes", "[PageFetcher]") {
    PageFetcher fetcher("FrontierCrawler-Test/1.0", 2000ms);

    auto result = fetcher.fetch("ftp://example.com/file.txt");

    REQUIRE_FALSE(result.success);
    REQUIRE(result.statusCode == 0);
    REQUIRE(result.curlCode == CURLE_UNSUPPORTED_PROTOCOL);
    REQUIRE_FALSE(result.errorMessage.empty());
    REQUIRE(result.content.empty());
}

TEST_CASE("PageFetcher reports connection failures", "[PageFetcher]") {
    PageFetcher fetcher("FrontierCrawler-Test/1.0", 2000ms, false);

    // Port 1 on loopback has no listener
    auto result = fetcher.fetch("http://127.0.0.1:1/");

    REQUIRE_FALSE(result.success);
    REQUIRE(result.statusCode == 0);
    REQUIRE(result.curlCode != CURLE_OK);
    REQUIRE_FALSE(result.errorMessage.empty());
}

TEST_CASE("PageFetcher options keep the scheme restriction", "[PageFetcher]") {
    PageFetcher fetcher("FrontierCrawler-Test/1.0", 2000ms);
    fetcher.setVerifySSL(false);
    fetcher.setMaxContentBytes(16);

    auto result = fetcher.fetch("file:///etc/hostname");

    REQUIRE_FALSE(result.success);
    REQUIRE(result.curlCode == CURLE_UNSUPPORTED_PROTOCOL);
    REQUIRE(result.content.empty());
}
