#pragma once

#include <functional>
#include <memory>
#include <string>
#include "ContentParser.h"
#include "PageFetcher.h"
#include "ShutdownSignal.h"
#include "WorkQueue.h"
#include "../../include/frontier_crawler/crawler/models/CrawlConfig.h"
#include "../../include/frontier_crawler/frontier/FrontierStore.h"
#include "../../include/frontier_crawler/storage/ContentSink.h"

namespace frontier_crawler::crawler {

// Fetch collaborator: blocking GET bounded by the configured timeout.
using FetchFunction = std::function<PageFetchResult(const std::string&)>;

/**
 * One crawl worker. Pops URLs from the shared WorkQueue, re-checks each one
 * against the frontier store, fetches it and records the outcome:
 *
 *  - not pending any more (paused, visited, error): dropped silently
 *  - fetch failure: retry counted in the store, re-queued with backoff while
 *    still pending
 *  - sitemap: marked visited, then children registered and queued
 *  - page: marked visited, then one content record written and new links
 *    registered and queued. A response whose visited write loses (the URL
 *    was paused meanwhile, or a duplicate queue entry won) is discarded.
 *
 * Nothing but the shutdown signal ends run(); per-URL exceptions are logged.
 */
class CrawlWorker {
public:
    CrawlWorker(int id,
                const CrawlConfig& config,
                std::shared_ptr<frontier::FrontierStore> store,
                WorkQueue& queue,
                ShutdownSignal& shutdown,
                std::shared_ptr<storage::ContentSink> sink,
                FetchFunction fetch);

    // Loops until shutdown is requested.
    void run();

    // One dequeue-and-process step. Returns false if nothing was dequeued.
    bool processNext();

    // Handles one URL taken from the queue.
    void process(const std::string& url);

    int id() const { return id_; }

private:
    void handleFailure(const frontier::UrlRecord& record, const std::string& error);
    void handleSitemap(const frontier::UrlRecord& record, const PageFetchResult& response);
    void handlePage(const frontier::UrlRecord& record, const PageFetchResult& response);

    // pending -> visited. False when another worker or an operator command
    // got there first, or when the write failed (the URL is then re-queued).
    bool claimVisit(const frontier::UrlRecord& record, bool isSitemap);

    // upsertNew + enqueue when newly inserted. Returns true if inserted.
    bool registerDiscovered(const std::string& url, bool isSitemap);

    int id_;
    const CrawlConfig& config_;
    std::shared_ptr<frontier::FrontierStore> store_;
    WorkQueue& queue_;
    ShutdownSignal& shutdown_;
    std::shared_ptr<storage::ContentSink> sink_;
    FetchFunction fetch_;
    ContentParser parser_;
};

} // namespace frontier_crawler::crawler
