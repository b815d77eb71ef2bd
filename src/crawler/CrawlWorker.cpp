#include "CrawlWorker.h"
#include "RetryPolicy.h"
#include "SitemapExpander.h"
#include "../../include/Logger.h"
#include "../../include/frontier_crawler/common/UrlNormalizer.h"
#include <algorithm>
#include <cctype>

using frontier_crawler::frontier::UrlRecord;
using frontier_crawler::frontier::UrlStatus;
using frontier_crawler::frontier::urlStatusToString;

namespace frontier_crawler::crawler {

namespace {

bool isHtmlLike(const std::string& contentType) {
    if (contentType.empty()) {
        return true;
    }
    std::string lower = contentType;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("html") != std::string::npos || lower.find("text/") != std::string::npos;
}

} // namespace

CrawlWorker::CrawlWorker(int id,
                         const CrawlConfig& config,
                         std::shared_ptr<frontier::FrontierStore> store,
                         WorkQueue& queue,
                         ShutdownSignal& shutdown,
                         std::shared_ptr<storage::ContentSink> sink,
                         FetchFunction fetch)
    : id_(id)
    , config_(config)
    , store_(std::move(store))
    , queue_(queue)
    , shutdown_(shutdown)
    , sink_(std::move(sink))
    , fetch_(std::move(fetch)) {
}

void CrawlWorker::run() {
    Logger::setThreadName("worker-" + std::to_string(id_));
    LOG_INFO("Worker started");

    while (!shutdown_.isStopRequested()) {
        try {
            processNext();
        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected error in worker loop: " + std::string(e.what()));
        }
    }

    LOG_INFO("Worker stopped");
}

bool CrawlWorker::processNext() {
    auto url = queue_.waitAndPop(config_.dequeueTimeout);
    if (!url) {
        return false;
    }
    process(*url);
    return true;
}

void CrawlWorker::process(const std::string& url) {
    // The queue may hold stale or duplicate entries; the store decides
    auto current = store_->get(url);
    if (!current.success) {
        LOG_WARNING("Could not read frontier state for " + url + ": " + current.message +
                    ", re-queueing in " + std::to_string(config_.storeRetryDelay.count()) + "ms");
        queue_.pushDelayed(url, config_.storeRetryDelay);
        return;
    }
    if (!current.value) {
        LOG_DEBUG("Dropping unknown URL from queue: " + url);
        return;
    }
    const UrlRecord& record = *current.value;
    if (record.status != UrlStatus::PENDING) {
        LOG_DEBUG("Skipping " + url + " (status " + urlStatusToString(record.status) + ")");
        return;
    }

    if (config_.politenessDelay.count() > 0 && shutdown_.waitFor(config_.politenessDelay)) {
        // Still pending in the store; the next start reloads it
        return;
    }
    if (shutdown_.isStopRequested()) {
        return;
    }

    LOG_INFO("Fetching: " + url);
    PageFetchResult response;
    try {
        response = fetch_(url);
    } catch (const std::exception& e) {
        response.success = false;
        response.errorMessage = e.what();
    }

    if (!response.success) {
        handleFailure(record, RetryPolicy::describeFailure(response.statusCode, response.errorMessage));
        return;
    }

    // Inflated once here; the expander sees plain XML from then on
    if (SitemapExpander::isGzipped(response.content)) {
        auto inflated = SitemapExpander::decompressGzip(response.content);
        if (!inflated.success) {
            handleFailure(record, inflated.message);
            return;
        }
        response.content = std::move(inflated.value);
    }

    if (SitemapExpander::looksLikeSitemap(url, response.contentType, response.content, record.isSitemap)) {
        handleSitemap(record, response);
    } else {
        handlePage(record, response);
    }
}

void CrawlWorker::handleFailure(const UrlRecord& record, const std::string& error) {
    LOG_WARNING("Error fetching " + record.url + ": " + error);

    auto outcome = store_->markRetryOrError(record.url, error);
    if (!outcome.success) {
        LOG_ERROR("Failed to record fetch failure for " + record.url + ": " + outcome.message);
        queue_.pushDelayed(record.url, config_.storeRetryDelay);
        return;
    }

    switch (outcome.value) {
        case UrlStatus::PENDING: {
            auto delay = RetryPolicy::calculateRetryDelay(record.retryCount + 1, config_);
            LOG_INFO("Will retry " + record.url + " in " + std::to_string(delay.count()) + "ms (" +
                     outcome.message + ")");
            queue_.pushDelayed(record.url, delay);
            break;
        }
        case UrlStatus::ERROR:
            LOG_WARNING("Giving up on " + record.url + ": " + outcome.message);
            break;
        default:
            LOG_DEBUG(record.url + " left the pending state while fetching, not retrying");
            break;
    }
}

void CrawlWorker::handleSitemap(const UrlRecord& record, const PageFetchResult& response) {
    auto expanded = SitemapExpander::expand(response.content, record.url);
    if (!expanded.success) {
        handleFailure(record, "Sitemap parse failed: " + expanded.message);
        return;
    }

    if (!claimVisit(record, true)) {
        return;
    }

    size_t added = 0;
    for (const auto& entry : expanded.value) {
        std::string normalized = common::normalizeUrl(entry.url);
        if (normalized.empty()) {
            LOG_DEBUG("Skipping non-http sitemap entry: " + entry.url);
            continue;
        }
        if (registerDiscovered(normalized, entry.isSitemap)) {
            ++added;
        }
    }

    LOG_INFO("Sitemap " + record.url + ": " + std::to_string(expanded.value.size()) +
             " entries, " + std::to_string(added) + " new");
}

void CrawlWorker::handlePage(const UrlRecord& record, const PageFetchResult& response) {
    ParsedContent parsed;
    if (isHtmlLike(response.contentType)) {
        std::string base = response.finalUrl.empty() ? record.url : response.finalUrl;
        parsed = parser_.parse(response.content, base);
    } else {
        LOG_DEBUG("Not parsing " + record.url + " with content type " + response.contentType);
    }

    // Only the worker whose pending -> visited write lands may emit the record
    if (!claimVisit(record, false)) {
        return;
    }

    if (sink_) {
        storage::ContentRecord content;
        content.url = record.url;
        content.title = parsed.title;
        content.statusCode = response.statusCode;
        content.content = parsed.textContent;
        auto written = sink_->append(content);
        if (!written.success) {
            LOG_ERROR(written.message);
        }
    }

    size_t added = 0;
    for (const auto& link : parsed.links) {
        if (registerDiscovered(link, common::looksLikeSitemapUrl(link))) {
            ++added;
        }
    }

    LOG_INFO("Visited " + record.url + " (" + std::to_string(parsed.links.size()) + " links, " +
             std::to_string(added) + " new)");
}

bool CrawlWorker::claimVisit(const UrlRecord& record, bool isSitemap) {
    auto visited = store_->markVisited(record.url, isSitemap);
    if (!visited.success) {
        LOG_ERROR("Failed to mark visited " + record.url + ": " + visited.message +
                  ", re-queueing in " + std::to_string(config_.storeRetryDelay.count()) + "ms");
        queue_.pushDelayed(record.url, config_.storeRetryDelay);
        return false;
    }
    if (!visited.value) {
        LOG_DEBUG(record.url + " left the pending state while fetching, response discarded");
        return false;
    }
    return true;
}

bool CrawlWorker::registerDiscovered(const std::string& url, bool isSitemap) {
    auto inserted = store_->upsertNew(url, isSitemap);
    if (!inserted.success) {
        LOG_WARNING("Failed to register " + url + ": " + inserted.message);
        return false;
    }
    if (inserted.value) {
        queue_.push(url);
    }
    return inserted.value;
}

} // namespace frontier_crawler::crawler
