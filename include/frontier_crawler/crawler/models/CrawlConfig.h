#pragma once

#include <chrono>
#include <cstddef>
#include <string>

struct CrawlConfig {
    // Frontier store
    std::string mongoUri = "mongodb://localhost:27017";
    std::string databaseName = "frontier-crawler";
    std::string collectionName = "urls";

    // 0 picks CrawlController::recommendedWorkerCount()
    size_t workerCount = 0;
    std::chrono::milliseconds politenessDelay{1000};
    std::chrono::milliseconds dequeueTimeout{1000};

    std::string userAgent = "TerminalCrawler/1.0 (+https://example.com/bot)";
    std::chrono::milliseconds requestTimeout{15000};
    bool followRedirects = true;
    size_t maxRedirects = 5;
    bool verifySsl = true;
    // Larger bodies fail the fetch; 0 disables the cap
    size_t maxContentBytes = 20 * 1024 * 1024;

    int maxRetries = 3;
    std::chrono::milliseconds baseRetryDelay{1000};
    float backoffMultiplier = 2.0f;
    std::chrono::milliseconds maxRetryDelay{30000};
    // Re-push delay when the store cannot be read for a dequeued URL
    std::chrono::milliseconds storeRetryDelay{2000};

    std::string outputPath = "scraped_data.jsonl";
    size_t contentExcerptLength = 500;

    std::string logFile = "crawler.log";
    std::string logLevel = "info";
    size_t logMaxBytes = 5 * 1024 * 1024;
    int logBackups = 5;

    /**
     * Defaults overridden by environment variables:
     *   MONGODB_URI, CRAWLER_DB_NAME, CRAWLER_WORKERS, CRAWLER_DELAY_MS,
     *   CRAWLER_USER_AGENT, CRAWLER_TIMEOUT_MS, CRAWLER_MAX_RETRIES,
     *   CRAWLER_OUTPUT, CRAWLER_LOG_FILE, CRAWLER_LOG_LEVEL
     * Malformed numbers are ignored with a warning.
     */
    static CrawlConfig fromEnvironment();
};
