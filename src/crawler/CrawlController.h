#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "CrawlWorker.h"
#include "ShutdownSignal.h"
#include "WorkQueue.h"
#include "../../include/frontier_crawler/common/Result.h"
#include "../../include/frontier_crawler/crawler/CrawlStats.h"
#include "../../include/frontier_crawler/crawler/models/CrawlConfig.h"
#include "../../include/frontier_crawler/frontier/FrontierStore.h"
#include "../../include/frontier_crawler/storage/ContentSink.h"

namespace frontier_crawler::crawler {

/**
 * Owns the worker pool, the work queue and the shutdown signal, and turns
 * operator commands into frontier store transitions plus queue updates.
 *
 * Construction reloads every pending row into the queue, so a restart picks
 * up exactly where the previous run stopped. stop() is idempotent: it joins
 * all workers and closes the store once.
 */
class CrawlController {
public:
    // Throws std::runtime_error if pending work cannot be reloaded from the store.
    CrawlController(const CrawlConfig& config,
                    std::shared_ptr<frontier::FrontierStore> store,
                    std::shared_ptr<storage::ContentSink> sink,
                    FetchFunction fetch);

    // Fetches with a PageFetcher built from config.
    CrawlController(const CrawlConfig& config,
                    std::shared_ptr<frontier::FrontierStore> store,
                    std::shared_ptr<storage::ContentSink> sink);

    ~CrawlController();

    CrawlController(const CrawlController&) = delete;
    CrawlController& operator=(const CrawlController&) = delete;

    // Launches workerCount workers (0 = recommendedWorkerCount()). value is the
    // number started. Fails if already running or already stopped.
    Result<size_t> start(size_t workerCount = 0);

    void stop();
    bool isRunning() const;

    // value is true when the url was new and has been queued
    Result<bool> seed(const std::string& url);

    Result<frontier::TransitionOutcome> pause(const std::string& url);
    // paused or error -> pending, then queued
    Result<frontier::TransitionOutcome> resume(const std::string& url);

    // value is the number of rows changed
    Result<size_t> pauseByPrefix(const std::string& prefix);
    Result<size_t> resumeByPrefix(const std::string& prefix);
    Result<size_t> resumeAllPaused();
    // Resumes paused urls whose domain equals domain or is a subdomain of it
    Result<size_t> resumeDomain(const std::string& domain);

    Result<std::vector<std::string>> listPending(const std::string& prefix = "");
    Result<std::vector<std::string>> listPaused();

    Result<CrawlStats> stats(size_t topN = 10);
    Result<frontier::StatusCounts> statusCounts();

    size_t queueSize() const;
    size_t workerCount() const;

    // max(2, min(32, cpus * 4)); cpus defaults to 4 when unknown
    static size_t recommendedWorkerCount();

private:
    size_t reloadPending();
    Result<size_t> resumeUrls(const std::vector<std::string>& urls);

    CrawlConfig config_;
    std::shared_ptr<frontier::FrontierStore> store_;
    std::shared_ptr<storage::ContentSink> sink_;
    FetchFunction fetch_;

    WorkQueue queue_;
    ShutdownSignal shutdown_;

    std::vector<std::unique_ptr<CrawlWorker>> workers_;
    std::vector<std::thread> threads_;

    mutable std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    bool stopped_ = false;
};

} // namespace frontier_crawler::crawler
