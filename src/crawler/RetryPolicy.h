#pragma once

#include <chrono>
#include <string>
#include "../../include/frontier_crawler/crawler/models/CrawlConfig.h"

namespace frontier_crawler::crawler {

class RetryPolicy {
public:
    /**
     * Delay before re-queueing a URL that has failed retryCount times.
     * @param retryCount Failures recorded so far (1-based)
     * @param config Crawl configuration with backoff settings
     * @return baseRetryDelay * backoffMultiplier^(retryCount-1), capped at maxRetryDelay
     */
    static std::chrono::milliseconds calculateRetryDelay(int retryCount, const CrawlConfig& config);

    /**
     * Short human-readable reason for a failed fetch, stored as last_error.
     * @param statusCode HTTP status, 0 when no response was received
     * @param errorMessage Transport error text, may be empty
     */
    static std::string describeFailure(int statusCode, const std::string& errorMessage);
};

} // namespace frontier_crawler::crawler
