#pragma once

#include "UrlRecord.h"
#include "../common/Result.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace frontier_crawler::frontier {

using StatusCounts = std::map<UrlStatus, size_t>;
using DomainCounts = std::vector<std::pair<std::string, size_t>>;

/**
 * Durable URL -> state table. The single source of truth for what has been
 * seen, what is done and what is waiting.
 *
 * Implementations serialize every mutating call behind one write lock and serve
 * reads from separate connections, so reporting never waits for the crawl.
 * Storage failures come back as failed Results; nothing here throws.
 */
class FrontierStore {
public:
    virtual ~FrontierStore() = default;

    // Insert-if-absent. value is true when this call created the row.
    virtual Result<bool> upsertNew(const std::string& url, bool isSitemap) = 0;

    // pending (or in_progress) -> visited. A sniffed sitemap kind, when given,
    // replaces the stored is_sitemap flag.
    virtual Result<bool> markVisited(const std::string& url,
                                     std::optional<bool> isSitemap = std::nullopt) = 0;

    // Counts one failed fetch of a pending URL. The row becomes error once its
    // retry count exceeds maxRetries and stays pending otherwise; value is the
    // resulting status.
    virtual Result<UrlStatus> markRetryOrError(const std::string& url,
                                               const std::string& error) = 0;

    virtual Result<TransitionOutcome> setStatus(const std::string& url, UrlStatus status,
                                                const std::string& reason = "") = 0;

    virtual Result<std::optional<UrlRecord>> get(const std::string& url) = 0;

    // Rows in insertion order.
    virtual Result<std::vector<UrlRecord>> listByStatus(UrlStatus status) = 0;
    virtual Result<std::vector<UrlRecord>> listByPrefix(const std::string& prefix,
                                                        UrlStatus status) = 0;

    // Moves every row whose url starts with prefix (literally) from `from` to `to`
    // in one write. Returns the urls that changed.
    virtual Result<std::vector<std::string>> setStatusByPrefix(const std::string& prefix,
                                                               UrlStatus from,
                                                               UrlStatus to,
                                                               const std::string& reason = "") = 0;

    virtual Result<StatusCounts> countsByStatus() = 0;

    // Most common domains, largest first. Restricted to one status when given.
    virtual Result<DomainCounts> countsByDomain(std::optional<UrlStatus> status, size_t limit) = 0;

    // First url ever inserted, if any.
    virtual Result<std::optional<std::string>> earliestUrl() = 0;

    // Releases connections. Safe to call more than once.
    virtual void close() = 0;
};

} // namespace frontier_crawler::frontier
