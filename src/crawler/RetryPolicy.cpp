#include "RetryPolicy.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cmath>

namespace frontier_crawler::crawler {

std::chrono::milliseconds RetryPolicy::calculateRetryDelay(int retryCount, const CrawlConfig& config) {
    if (retryCount < 1) {
        retryCount = 1;
    }

    // Exponential backoff: base * (multiplier ^ (retryCount - 1))
    double multiplier = std::pow(config.backoffMultiplier, retryCount - 1);
    double calculated = static_cast<double>(config.baseRetryDelay.count()) * multiplier;

    auto finalDelay = config.maxRetryDelay;
    if (calculated < static_cast<double>(config.maxRetryDelay.count())) {
        finalDelay = std::chrono::milliseconds(static_cast<long long>(calculated));
    }

    LOG_DEBUG("Calculated retry delay for attempt " + std::to_string(retryCount) +
              ": " + std::to_string(finalDelay.count()) + "ms");

    return finalDelay;
}

std::string RetryPolicy::describeFailure(int statusCode, const std::string& errorMessage) {
    if (statusCode > 0 && (statusCode < 200 || statusCode >= 300)) {
        std::string description = "HTTP " + std::to_string(statusCode);
        if (!errorMessage.empty()) {
            description += ": " + errorMessage;
        }
        return description;
    }
    if (!errorMessage.empty()) {
        return errorMessage;
    }
    return "Unknown fetch failure";
}

} // namespace frontier_crawler::crawler
