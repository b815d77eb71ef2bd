#pragma once

#include "../frontier/FrontierStore.h"
#include <mongocxx/pool.hpp>
#include <mongocxx/collection.hpp>
#include <bsoncxx/document/view.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace frontier_crawler::storage {

/**
 * FrontierStore backed by one MongoDB collection (default "urls").
 *
 * Document shape:
 *   { url, status, retryCount, isSitemap, domain, lastError?, pauseReason?,
 *     createdAt, lastUpdated }
 *
 * url carries a unique index; status and domain are indexed for the worker
 * reload and the stats report. Writes go through one dedicated client under
 * writeMutex_; reads check a client out of the pool per call.
 */
class MongoFrontierStore : public frontier::FrontierStore {
public:
    explicit MongoFrontierStore(const std::string& connectionString = "mongodb://localhost:27017",
                                const std::string& databaseName = "frontier-crawler",
                                int maxRetries = 3,
                                const std::string& collectionName = "urls");
    ~MongoFrontierStore() override;

    MongoFrontierStore(const MongoFrontierStore&) = delete;
    MongoFrontierStore& operator=(const MongoFrontierStore&) = delete;

    Result<bool> upsertNew(const std::string& url, bool isSitemap) override;
    Result<bool> markVisited(const std::string& url,
                             std::optional<bool> isSitemap = std::nullopt) override;
    Result<frontier::UrlStatus> markRetryOrError(const std::string& url,
                                                 const std::string& error) override;
    Result<frontier::TransitionOutcome> setStatus(const std::string& url,
                                                  frontier::UrlStatus status,
                                                  const std::string& reason = "") override;
    Result<std::optional<frontier::UrlRecord>> get(const std::string& url) override;
    Result<std::vector<frontier::UrlRecord>> listByStatus(frontier::UrlStatus status) override;
    Result<std::vector<frontier::UrlRecord>> listByPrefix(const std::string& prefix,
                                                          frontier::UrlStatus status) override;
    Result<std::vector<std::string>> setStatusByPrefix(const std::string& prefix,
                                                       frontier::UrlStatus from,
                                                       frontier::UrlStatus to,
                                                       const std::string& reason = "") override;
    Result<frontier::StatusCounts> countsByStatus() override;
    Result<frontier::DomainCounts> countsByDomain(std::optional<frontier::UrlStatus> status,
                                                  size_t limit) override;
    Result<std::optional<std::string>> earliestUrl() override;
    void close() override;

    // Round-trips a ping through a pooled client. Fails once closed.
    Result<bool> testConnection();

private:
    Result<bool> ensureIndexes();

    // Caller holds lifecycleMutex_ (shared or exclusive).
    mongocxx::collection writeCollection();

    frontier::UrlRecord bsonToUrlRecord(const bsoncxx::document::view& doc) const;

    std::string databaseName_;
    std::string collectionName_;
    int maxRetries_;

    std::unique_ptr<mongocxx::pool> pool_;
    mongocxx::pool::entry writeClient_;

    // Exclusive only in close(); keeps the pool alive under in-flight reads.
    std::shared_mutex lifecycleMutex_;
    std::mutex writeMutex_;
    bool closed_ = false;
};

} // namespace frontier_crawler::storage
