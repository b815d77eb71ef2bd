#pragma once

#include "../frontier/FrontierStore.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace frontier_crawler::crawler {

struct CrawlStats {
    frontier::StatusCounts statusCounts;
    size_t total = 0;
    std::optional<std::string> earliestSeed;

    frontier::DomainCounts topPausedDomains;
    // Grouped by "host[/first_path_segment]"
    std::vector<std::pair<std::string, size_t>> topPausedPrefixes;
    frontier::DomainCounts domainDistribution;

    size_t queueSize = 0;

    size_t count(frontier::UrlStatus status) const {
        auto it = statusCounts.find(status);
        return it == statusCounts.end() ? 0 : it->second;
    }
};

} // namespace frontier_crawler::crawler
