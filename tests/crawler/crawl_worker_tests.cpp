#include <catch2/catch_test_macros.hpp>
#include "CrawlWorker.h"
#include "../support/GzipData.h"
#include "../support/InMemoryFrontierStore.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace frontier_crawler::crawler;
using frontier_crawler::storage::ContentSink;
using frontier_crawler::testing::InMemoryFrontierStore;
using frontier_crawler::testing::gzip;
using frontier_crawler::frontier::TransitionOutcome;
using frontier_crawler::frontier::UrlStatus;
using namespace std::chrono_literals;

namespace {

PageFetchResult htmlPage(const std::string& body) {
    PageFetchResult result;
    result.success = true;
    result.statusCode = 200;
    result.contentType = "text/html; charset=utf-8";
    result.content = body;
    return result;
}

PageFetchResult httpError(int status) {
    PageFetchResult result;
    result.statusCode = status;
    result.errorMessage = "HTTP status " + std::to_string(status);
    return result;
}

size_t countLines(const std::string& path) {
    std::ifstream in(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) ++lines;
    return lines;
}

// Single worker wired to an in-memory store, a temp sink and a scripted fetcher.
struct WorkerFixture {
    WorkerFixture() {
        config.politenessDelay = 0ms;
        config.dequeueTimeout = 10ms;
        config.baseRetryDelay = 0ms;
        config.storeRetryDelay = 60000ms;
        config.maxRetries = 3;

        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        sinkPath = (std::filesystem::temp_directory_path() /
                    ("frontier_worker_" + std::to_string(stamp) + ".jsonl")).string();

        store = std::make_shared<InMemoryFrontierStore>(config.maxRetries);
        sink = std::make_shared<ContentSink>(sinkPath);
    }

    ~WorkerFixture() {
        std::filesystem::remove(sinkPath);
    }

    CrawlWorker makeWorker(FetchFunction fetch, int id = 1) {
        return CrawlWorker(id, config, store, queue, shutdown, sink, std::move(fetch));
    }

    CrawlConfig config;
    std::string sinkPath;
    std::shared_ptr<InMemoryFrontierStore> store;
    std::shared_ptr<ContentSink> sink;
    WorkQueue queue;
    ShutdownSignal shutdown;
};

} // namespace

TEST_CASE("Worker records a page and registers its links", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/";
    f.store->upsertNew(url, false);

    auto worker = f.makeWorker([](const std::string&) {
        return htmlPage("<html><head><title>Home</title></head><body>"
                        "<a href=\"/a\">a</a><a href=\"/b\">b</a><a href=\"/\">self</a>"
                        "<a href=\"/sitemap.xml\">map</a></body></html>");
    });
    worker.process(url);

    REQUIRE(f.store->statusOf(url) == UrlStatus::VISITED);
    REQUIRE(f.store->size() == 4);
    REQUIRE(f.store->statusOf("https://example.com/a") == UrlStatus::PENDING);
    REQUIRE(f.store->record("https://example.com/sitemap.xml").isSitemap);
    REQUIRE_FALSE(f.store->record("https://example.com/a").isSitemap);
    REQUIRE(f.queue.size() == 3);
    REQUIRE(f.sink->recordsWritten() == 1);
}

TEST_CASE("Worker drops URLs that are no longer pending", "[CrawlWorker]") {
    WorkerFixture f;
    std::atomic<int> fetches{0};
    auto worker = f.makeWorker([&fetches](const std::string&) {
        ++fetches;
        return htmlPage("<html></html>");
    });

    SECTION("Paused") {
        f.store->upsertNew("https://example.com/p", false);
        f.store->setStatus("https://example.com/p", UrlStatus::PAUSED, "user-pause");
        worker.process("https://example.com/p");
        REQUIRE(f.store->statusOf("https://example.com/p") == UrlStatus::PAUSED);
    }

    SECTION("Already visited") {
        f.store->upsertNew("https://example.com/v", false);
        f.store->markVisited("https://example.com/v", false);
        worker.process("https://example.com/v");
    }

    SECTION("Unknown to the store") {
        worker.process("https://example.com/never-seeded");
    }

    REQUIRE(fetches == 0);
    REQUIRE(f.sink->recordsWritten() == 0);
}

TEST_CASE("A URL queued twice produces one content record", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/dup";
    f.store->upsertNew(url, false);
    f.queue.push(url);
    f.queue.push(url);

    std::atomic<int> fetches{0};
    auto worker = f.makeWorker([&fetches](const std::string&) {
        ++fetches;
        return htmlPage("<html><body>once</body></html>");
    });
    REQUIRE(worker.processNext());
    REQUIRE(worker.processNext());
    REQUIRE_FALSE(worker.processNext());

    REQUIRE(fetches == 1);
    REQUIRE(f.sink->recordsWritten() == 1);
    REQUIRE(countLines(f.sinkPath) == 1);
}

TEST_CASE("Failed fetches retry until the limit, then error", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/flaky";
    f.store->upsertNew(url, false);

    auto worker = f.makeWorker([](const std::string&) { return httpError(503); });

    for (int attempt = 1; attempt <= 3; ++attempt) {
        worker.process(url);
        auto record = f.store->record(url);
        REQUIRE(record.status == UrlStatus::PENDING);
        REQUIRE(record.retryCount == attempt);
        REQUIRE(record.lastError.value() == "HTTP 503: HTTP status 503");
        // Re-queued for another attempt
        REQUIRE(f.queue.waitAndPop(10ms) == std::optional<std::string>(url));
    }

    worker.process(url);
    REQUIRE(f.store->statusOf(url) == UrlStatus::ERROR);
    REQUIRE(f.store->record(url).retryCount == 4);
    REQUIRE(f.queue.empty());
    REQUIRE(f.sink->recordsWritten() == 0);
}

TEST_CASE("Retries wait out the backoff delay", "[CrawlWorker]") {
    WorkerFixture f;
    f.config.baseRetryDelay = 60000ms;
    const std::string url = "https://example.com/slow";
    f.store->upsertNew(url, false);

    auto worker = f.makeWorker([](const std::string&) { return httpError(500); });
    worker.process(url);

    REQUIRE(f.queue.delayedSize() == 1);
    REQUIRE_FALSE(f.queue.waitAndPop(20ms).has_value());
}

TEST_CASE("A throwing fetcher counts as a failed fetch", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/boom";
    f.store->upsertNew(url, false);

    auto worker = f.makeWorker([](const std::string&) -> PageFetchResult {
        throw std::runtime_error("connection reset");
    });
    worker.process(url);

    auto record = f.store->record(url);
    REQUIRE(record.retryCount == 1);
    REQUIRE(record.lastError.value() == "connection reset");
}

TEST_CASE("Store read failures re-queue with a delay", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/later";
    f.store->upsertNew(url, false);
    f.store->failReads = true;

    std::atomic<int> fetches{0};
    auto worker = f.makeWorker([&fetches](const std::string&) {
        ++fetches;
        return htmlPage("<html></html>");
    });
    worker.process(url);

    REQUIRE(fetches == 0);
    REQUIRE(f.queue.delayedSize() == 1);
    f.store->failReads = false;
    REQUIRE(f.store->statusOf(url) == UrlStatus::PENDING);
}

TEST_CASE("Sitemaps are expanded instead of stored", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/sitemap.xml";
    f.store->upsertNew(url, true);

    auto worker = f.makeWorker([](const std::string& requested) {
        PageFetchResult result;
        result.success = true;
        result.statusCode = 200;
        result.contentType = "application/xml";
        if (requested == "https://example.com/sitemap.xml") {
            result.content =
                "<sitemapindex xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">"
                "<sitemap><loc>https://example.com/sitemap-a.xml</loc></sitemap>"
                "</sitemapindex>";
        } else {
            result.content =
                "<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">"
                "<url><loc>https://example.com/one</loc></url>"
                "<url><loc>https://example.com/two#frag</loc></url>"
                "<url><loc>ftp://example.com/skip</loc></url>"
                "</urlset>";
        }
        return result;
    });

    worker.process(url);
    REQUIRE(f.store->statusOf(url) == UrlStatus::VISITED);
    REQUIRE(f.store->record("https://example.com/sitemap-a.xml").isSitemap);
    REQUIRE(f.queue.waitAndPop(10ms) == std::optional<std::string>("https://example.com/sitemap-a.xml"));

    worker.process("https://example.com/sitemap-a.xml");
    REQUIRE(f.store->statusOf("https://example.com/one") == UrlStatus::PENDING);
    REQUIRE(f.store->statusOf("https://example.com/two") == UrlStatus::PENDING);
    REQUIRE(f.store->size() == 4);
    REQUIRE(f.queue.size() == 2);
    REQUIRE(f.sink->recordsWritten() == 0);
}

TEST_CASE("Unparseable sitemaps follow the retry path", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/sitemap.xml";
    f.store->upsertNew(url, true);

    auto worker = f.makeWorker([](const std::string&) {
        PageFetchResult result;
        result.success = true;
        result.statusCode = 200;
        result.contentType = "application/xml";
        result.content = "<urlset><url><loc>https://example.com/x";
        return result;
    });
    worker.process(url);

    auto record = f.store->record(url);
    REQUIRE(record.status == UrlStatus::PENDING);
    REQUIRE(record.retryCount == 1);
    REQUIRE(record.lastError.value().find("Sitemap parse failed") == 0);
}

TEST_CASE("A pause issued during the fetch wins", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/racing";
    f.store->upsertNew(url, false);

    auto store = f.store;
    std::atomic<int> fetches{0};
    auto worker = f.makeWorker([store, url, &fetches](const std::string&) {
        if (++fetches == 1) {
            store->setStatus(url, UrlStatus::PAUSED, "user-pause");
        }
        return htmlPage("<html><body>late <a href=\"/found-late\">x</a></body></html>");
    });
    worker.process(url);

    REQUIRE(f.store->statusOf(url) == UrlStatus::PAUSED);
    REQUIRE(f.sink->recordsWritten() == 0);
    REQUIRE(f.store->size() == 1);
    REQUIRE(f.queue.empty());

    SECTION("Resuming crawls it exactly once") {
        REQUIRE(f.store->setStatus(url, UrlStatus::PENDING).value == TransitionOutcome::APPLIED);
        worker.process(url);
        worker.process(url);

        REQUIRE(fetches == 2);
        REQUIRE(f.store->statusOf(url) == UrlStatus::VISITED);
        REQUIRE(f.sink->recordsWritten() == 1);
        REQUIRE(countLines(f.sinkPath) == 1);
        REQUIRE(f.store->statusOf("https://example.com/found-late") == UrlStatus::PENDING);
    }
}

TEST_CASE("Workers racing on one URL write one content record", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/contended";
    f.store->upsertNew(url, false);

    // Both workers pass the pending check before either finishes its fetch
    std::atomic<int> arrived{0};
    FetchFunction fetch = [&arrived](const std::string&) {
        ++arrived;
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (arrived.load() < 2 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        return htmlPage("<html><body><a href=\"/next\">next</a></body></html>");
    };
    auto first = f.makeWorker(fetch, 1);
    auto second = f.makeWorker(fetch, 2);

    std::thread a([&] { first.process(url); });
    std::thread b([&] { second.process(url); });
    a.join();
    b.join();

    REQUIRE(arrived == 2);
    REQUIRE(f.store->statusOf(url) == UrlStatus::VISITED);
    REQUIRE(f.store->visitedWrites == 1);
    REQUIRE(f.sink->recordsWritten() == 1);
    REQUIRE(countLines(f.sinkPath) == 1);
    REQUIRE(f.queue.size() == 1);
}

TEST_CASE("A failed visited write re-queues without a content record", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/unsaved";
    f.store->upsertNew(url, false);

    auto store = f.store;
    auto worker = f.makeWorker([store](const std::string&) {
        store->failWrites = true;
        return htmlPage("<html><body>fetched</body></html>");
    });
    worker.process(url);
    f.store->failWrites = false;

    REQUIRE(f.sink->recordsWritten() == 0);
    REQUIRE(f.queue.delayedSize() == 1);
    REQUIRE(f.store->statusOf(url) == UrlStatus::PENDING);
}

TEST_CASE("Politeness wait ends on shutdown without fetching", "[CrawlWorker]") {
    WorkerFixture f;
    f.config.politenessDelay = 60000ms;
    const std::string url = "https://example.com/polite";
    f.store->upsertNew(url, false);
    f.shutdown.requestStop();

    std::atomic<int> fetches{0};
    auto worker = f.makeWorker([&fetches](const std::string&) {
        ++fetches;
        return htmlPage("<html></html>");
    });

    auto started = std::chrono::steady_clock::now();
    worker.process(url);
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
    REQUIRE(fetches == 0);
    REQUIRE(f.store->statusOf(url) == UrlStatus::PENDING);
}

TEST_CASE("No fetch starts once shutdown is requested", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/late-start";
    f.store->upsertNew(url, false);
    f.queue.push(url);
    f.shutdown.requestStop();

    std::atomic<int> fetches{0};
    auto worker = f.makeWorker([&fetches](const std::string&) {
        ++fetches;
        return htmlPage("<html></html>");
    });
    REQUIRE(worker.processNext());

    REQUIRE(fetches == 0);
    REQUIRE(f.store->statusOf(url) == UrlStatus::PENDING);
    REQUIRE(f.sink->recordsWritten() == 0);
}

TEST_CASE("Non-HTML responses are recorded without parsing", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/data.json";
    f.store->upsertNew(url, false);

    auto worker = f.makeWorker([](const std::string&) {
        PageFetchResult result;
        result.success = true;
        result.statusCode = 200;
        result.contentType = "application/json";
        result.content = "{\"href\": \"<a href='/hidden'>x</a>\"}";
        return result;
    });
    worker.process(url);

    REQUIRE(f.store->statusOf(url) == UrlStatus::VISITED);
    REQUIRE(f.store->size() == 1);
    REQUIRE(f.sink->recordsWritten() == 1);
}

TEST_CASE("Gzipped sitemaps are inflated before expansion", "[CrawlWorker]") {
    WorkerFixture f;
    const std::string url = "https://example.com/sitemap.xml.gz";
    f.store->upsertNew(url, true);

    std::string body;
    SECTION("Valid archive") {
        body = gzip("<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">"
                    "<url><loc>https://example.com/from-gz</loc></url></urlset>");
        auto worker = f.makeWorker([&body](const std::string&) {
            PageFetchResult result;
            result.success = true;
            result.statusCode = 200;
            result.contentType = "application/x-gzip";
            result.content = body;
            return result;
        });
        worker.process(url);

        REQUIRE(f.store->statusOf(url) == UrlStatus::VISITED);
        REQUIRE(f.store->statusOf("https://example.com/from-gz") == UrlStatus::PENDING);
        REQUIRE(f.sink->recordsWritten() == 0);
    }

    SECTION("Truncated archive is retried") {
        std::string full = gzip("<urlset><url><loc>https://example.com/x</loc></url></urlset>");
        body = full.substr(0, full.size() / 2);
        auto worker = f.makeWorker([&body](const std::string&) {
            PageFetchResult result;
            result.success = true;
            result.statusCode = 200;
            result.contentType = "application/x-gzip";
            result.content = body;
            return result;
        });
        worker.process(url);

        auto record = f.store->record(url);
        REQUIRE(record.status == UrlStatus::PENDING);
        REQUIRE(record.retryCount == 1);
        REQUIRE(f.store->size() == 1);
    }
}
