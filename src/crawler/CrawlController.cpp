#include "CrawlController.h"
#include "PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/frontier_crawler/common/UrlNormalizer.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

using frontier_crawler::frontier::StatusCounts;
using frontier_crawler::frontier::TransitionOutcome;
using frontier_crawler::frontier::UrlStatus;
using frontier_crawler::frontier::transitionOutcomeToString;

namespace frontier_crawler::crawler {

namespace {

FetchFunction makePageFetcher(const CrawlConfig& config) {
    auto fetcher = std::make_shared<PageFetcher>(config.userAgent, config.requestTimeout,
                                                 config.followRedirects, config.maxRedirects);
    fetcher->setVerifySSL(config.verifySsl);
    fetcher->setMaxContentBytes(config.maxContentBytes);
    if (!config.verifySsl) {
        LOG_WARNING("TLS certificate verification is disabled");
    }
    return [fetcher](const std::string& url) { return fetcher->fetch(url); };
}

std::string canonicalDomain(std::string domain) {
    std::transform(domain.begin(), domain.end(), domain.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (domain.rfind("www.", 0) == 0) {
        domain = domain.substr(4);
    }
    return domain;
}

} // namespace

CrawlController::CrawlController(const CrawlConfig& config,
                                 std::shared_ptr<frontier::FrontierStore> store,
                                 std::shared_ptr<storage::ContentSink> sink,
                                 FetchFunction fetch)
    : config_(config)
    , store_(std::move(store))
    , sink_(std::move(sink))
    , fetch_(std::move(fetch)) {
    if (!store_) {
        throw std::runtime_error("CrawlController requires a frontier store");
    }
    if (!fetch_) {
        throw std::runtime_error("CrawlController requires a fetch function");
    }
    size_t reloaded = reloadPending();
    LOG_INFO("Loaded " + std::to_string(reloaded) + " pending URLs into the work queue");
}

CrawlController::CrawlController(const CrawlConfig& config,
                                 std::shared_ptr<frontier::FrontierStore> store,
                                 std::shared_ptr<storage::ContentSink> sink)
    : CrawlController(config, std::move(store), std::move(sink), makePageFetcher(config)) {
}

CrawlController::~CrawlController() {
    stop();
}

size_t CrawlController::reloadPending() {
    auto pending = store_->listByStatus(UrlStatus::PENDING);
    if (!pending.success) {
        throw std::runtime_error("Failed to load pending URLs: " + pending.message);
    }
    for (const auto& record : pending.value) {
        queue_.push(record.url);
    }
    return pending.value.size();
}

Result<size_t> CrawlController::start(size_t workerCount) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_) {
        return Result<size_t>::Failure("Crawler has been stopped");
    }
    if (running_) {
        LOG_WARNING("Workers already running");
        return Result<size_t>::Failure("Crawler already running");
    }

    size_t count = workerCount == 0 ? recommendedWorkerCount() : workerCount;
    workers_.reserve(count);
    threads_.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        workers_.push_back(std::make_unique<CrawlWorker>(
            static_cast<int>(i + 1), config_, store_, queue_, shutdown_, sink_, fetch_));
        threads_.emplace_back(&CrawlWorker::run, workers_.back().get());
    }
    running_ = true;

    LOG_INFO("Started " + std::to_string(count) + " worker threads (delay " +
             std::to_string(config_.politenessDelay.count()) + "ms)");
    return Result<size_t>::Success(count);
}

void CrawlController::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    LOG_INFO("Stopping crawler");
    shutdown_.requestStop();
    queue_.wakeAll();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    workers_.clear();
    running_ = false;

    store_->close();
    LOG_INFO("Stopped all worker threads");
}

bool CrawlController::isRunning() const {
    return running_;
}

Result<bool> CrawlController::seed(const std::string& url) {
    std::string normalized = common::normalizeUrl(url);
    if (normalized.empty()) {
        return Result<bool>::Failure("Invalid URL: " + url);
    }

    auto inserted = store_->upsertNew(normalized, common::looksLikeSitemapUrl(normalized));
    if (!inserted.success) {
        return Result<bool>::Failure(inserted.message);
    }
    if (inserted.value) {
        queue_.push(normalized);
        LOG_INFO("Seeded URL: " + normalized);
        return Result<bool>::Success(true, "Seeded URL: " + normalized);
    }
    LOG_DEBUG("Seed skipped (exists): " + normalized);
    return Result<bool>::Success(false, "URL already known (skipped): " + normalized);
}

Result<TransitionOutcome> CrawlController::pause(const std::string& url) {
    std::string normalized = common::normalizeUrl(url);
    if (normalized.empty()) {
        return Result<TransitionOutcome>::Failure("Invalid URL: " + url);
    }
    auto outcome = store_->setStatus(normalized, UrlStatus::PAUSED, "user-pause");
    if (outcome.success && outcome.value == TransitionOutcome::APPLIED) {
        LOG_INFO("Paused URL: " + normalized);
    }
    return outcome;
}

Result<TransitionOutcome> CrawlController::resume(const std::string& url) {
    std::string normalized = common::normalizeUrl(url);
    if (normalized.empty()) {
        return Result<TransitionOutcome>::Failure("Invalid URL: " + url);
    }
    auto outcome = store_->setStatus(normalized, UrlStatus::PENDING);
    if (outcome.success && outcome.value == TransitionOutcome::APPLIED) {
        queue_.push(normalized);
        LOG_INFO("Resumed URL: " + normalized);
    } else if (outcome.success) {
        LOG_DEBUG("Resume of " + normalized + ": " + transitionOutcomeToString(outcome.value));
    }
    return outcome;
}

Result<size_t> CrawlController::pauseByPrefix(const std::string& prefix) {
    auto changed = store_->setStatusByPrefix(prefix, UrlStatus::PENDING, UrlStatus::PAUSED,
                                             "user-pause-prefix");
    if (!changed.success) {
        return Result<size_t>::Failure(changed.message);
    }
    // Workers re-check status anyway; this only saves them the lookups
    size_t removed = queue_.removeByPrefix(prefix);
    LOG_INFO("Paused " + std::to_string(changed.value.size()) + " URL(s) with prefix " + prefix +
             ", removed " + std::to_string(removed) + " queued entries");
    return Result<size_t>::Success(changed.value.size());
}

Result<size_t> CrawlController::resumeByPrefix(const std::string& prefix) {
    auto changed = store_->setStatusByPrefix(prefix, UrlStatus::PAUSED, UrlStatus::PENDING);
    if (!changed.success) {
        return Result<size_t>::Failure(changed.message);
    }
    for (const auto& url : changed.value) {
        queue_.push(url);
    }
    LOG_INFO("Resumed " + std::to_string(changed.value.size()) + " URL(s) with prefix " + prefix);
    return Result<size_t>::Success(changed.value.size());
}

Result<size_t> CrawlController::resumeAllPaused() {
    return resumeByPrefix("");
}

Result<size_t> CrawlController::resumeDomain(const std::string& domain) {
    std::string wanted = canonicalDomain(domain);
    if (wanted.empty()) {
        return Result<size_t>::Failure("Empty domain");
    }

    auto paused = store_->listByStatus(UrlStatus::PAUSED);
    if (!paused.success) {
        return Result<size_t>::Failure(paused.message);
    }

    std::vector<std::string> matching;
    const std::string suffix = "." + wanted;
    for (const auto& record : paused.value) {
        const std::string& host = record.domain;
        bool subdomain = host.size() > suffix.size() &&
                         host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0;
        if (host == wanted || subdomain) {
            matching.push_back(record.url);
        }
    }

    auto resumed = resumeUrls(matching);
    if (resumed.success && resumed.value > 0) {
        LOG_INFO("Resumed " + std::to_string(resumed.value) + " paused URL(s) for domain " + wanted);
    }
    return resumed;
}

Result<size_t> CrawlController::resumeUrls(const std::vector<std::string>& urls) {
    size_t resumed = 0;
    for (const auto& url : urls) {
        auto outcome = store_->setStatus(url, UrlStatus::PENDING);
        if (!outcome.success) {
            return Result<size_t>::Failure(outcome.message);
        }
        if (outcome.value == TransitionOutcome::APPLIED) {
            queue_.push(url);
            ++resumed;
        }
    }
    return Result<size_t>::Success(resumed);
}

Result<std::vector<std::string>> CrawlController::listPending(const std::string& prefix) {
    auto records = store_->listByPrefix(prefix, UrlStatus::PENDING);
    if (!records.success) {
        return Result<std::vector<std::string>>::Failure(records.message);
    }
    std::vector<std::string> urls;
    urls.reserve(records.value.size());
    for (const auto& record : records.value) {
        urls.push_back(record.url);
    }
    return Result<std::vector<std::string>>::Success(std::move(urls));
}

Result<std::vector<std::string>> CrawlController::listPaused() {
    auto records = store_->listByStatus(UrlStatus::PAUSED);
    if (!records.success) {
        return Result<std::vector<std::string>>::Failure(records.message);
    }
    std::vector<std::string> urls;
    urls.reserve(records.value.size());
    for (const auto& record : records.value) {
        urls.push_back(record.url);
    }
    return Result<std::vector<std::string>>::Success(std::move(urls));
}

Result<StatusCounts> CrawlController::statusCounts() {
    return store_->countsByStatus();
}

Result<CrawlStats> CrawlController::stats(size_t topN) {
    CrawlStats stats;

    auto counts = store_->countsByStatus();
    if (!counts.success) {
        return Result<CrawlStats>::Failure(counts.message);
    }
    stats.statusCounts = counts.value;
    for (const auto& entry : stats.statusCounts) {
        stats.total += entry.second;
    }

    auto earliest = store_->earliestUrl();
    if (earliest.success) {
        stats.earliestSeed = earliest.value;
    } else {
        LOG_WARNING("Could not read earliest seed: " + earliest.message);
    }

    auto pausedDomains = store_->countsByDomain(UrlStatus::PAUSED, topN);
    if (!pausedDomains.success) {
        return Result<CrawlStats>::Failure(pausedDomains.message);
    }
    stats.topPausedDomains = pausedDomains.value;

    auto paused = store_->listByStatus(UrlStatus::PAUSED);
    if (!paused.success) {
        return Result<CrawlStats>::Failure(paused.message);
    }
    // Ties keep first-seen order
    std::unordered_map<std::string, size_t> prefixIndex;
    for (const auto& record : paused.value) {
        std::string prefix = common::extractPrefixKey(record.url);
        auto it = prefixIndex.find(prefix);
        if (it == prefixIndex.end()) {
            prefixIndex.emplace(prefix, stats.topPausedPrefixes.size());
            stats.topPausedPrefixes.emplace_back(prefix, 1);
        } else {
            stats.topPausedPrefixes[it->second].second++;
        }
    }
    std::stable_sort(stats.topPausedPrefixes.begin(), stats.topPausedPrefixes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (topN > 0 && stats.topPausedPrefixes.size() > topN) {
        stats.topPausedPrefixes.resize(topN);
    }

    auto distribution = store_->countsByDomain(std::nullopt, topN);
    if (!distribution.success) {
        return Result<CrawlStats>::Failure(distribution.message);
    }
    stats.domainDistribution = distribution.value;

    stats.queueSize = queue_.size();
    return Result<CrawlStats>::Success(std::move(stats));
}

size_t CrawlController::queueSize() const {
    return queue_.size();
}

size_t CrawlController::workerCount() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return threads_.size();
}

size_t CrawlController::recommendedWorkerCount() {
    size_t cpus = std::thread::hardware_concurrency();
    if (cpus == 0) {
        cpus = 4;
    }
    return std::max<size_t>(2, std::min<size_t>(32, cpus * 4));
}

} // namespace frontier_crawler::crawler
