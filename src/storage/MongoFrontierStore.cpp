#include "../../include/frontier_crawler/storage/MongoFrontierStore.h"
#include "../../include/frontier_crawler/storage/MongoDBInstance.h"
#include "../../include/frontier_crawler/common/UrlNormalizer.h"
#include "../../include/Logger.h"
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/builder/stream/array.hpp>
#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/stream/helpers.hpp>
#include <bsoncxx/types.hpp>
#include <cstdint>
#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/find_one_and_update.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/pipeline.hpp>
#include <mongocxx/uri.hpp>

using namespace bsoncxx::builder::stream;
using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using frontier_crawler::frontier::DomainCounts;
using frontier_crawler::frontier::StatusCounts;
using frontier_crawler::frontier::TransitionOutcome;
using frontier_crawler::frontier::UrlRecord;
using frontier_crawler::frontier::UrlStatus;
using frontier_crawler::frontier::isTransitionAllowed;
using frontier_crawler::frontier::urlStatusFromString;
using frontier_crawler::frontier::urlStatusToString;

namespace frontier_crawler::storage {

namespace {

    constexpr int kDuplicateKeyError = 11000;

    bsoncxx::types::b_date timePointToBsonDate(const std::chrono::system_clock::time_point& tp) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
        return bsoncxx::types::b_date{millis};
    }

    std::chrono::system_clock::time_point bsonDateToTimePoint(const bsoncxx::types::b_date& date) {
        return std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(date.value)};
    }

    // "^" + prefix with every regex metacharacter escaped, so the match is literal.
    std::string literalPrefixPattern(const std::string& prefix) {
        static const std::string meta = R"(\^$.|?*+()[]{}/)";
        std::string pattern = "^";
        for (char c : prefix) {
            if (meta.find(c) != std::string::npos) {
                pattern.push_back('\\');
            }
            pattern.push_back(c);
        }
        return pattern;
    }

    size_t readCount(const bsoncxx::document::element& element) {
        switch (element.type()) {
            case bsoncxx::type::k_int32: return static_cast<size_t>(element.get_int32().value);
            case bsoncxx::type::k_int64: return static_cast<size_t>(element.get_int64().value);
            case bsoncxx::type::k_double: return static_cast<size_t>(element.get_double().value);
            default: return 0;
        }
    }

    mongocxx::options::find insertionOrder() {
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("createdAt", 1), kvp("_id", 1)));
        return opts;
    }
}

MongoFrontierStore::MongoFrontierStore(const std::string& connectionString,
                                       const std::string& databaseName,
                                       int maxRetries,
                                       const std::string& collectionName)
    : databaseName_(databaseName)
    , collectionName_(collectionName)
    , maxRetries_(maxRetries) {
    LOG_DEBUG("MongoFrontierStore constructor called with database: " + databaseName);
    try {
        LOG_INFO("Initializing MongoDB frontier store at: " + connectionString);

        MongoDBInstance::getInstance();

        pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri{connectionString});
        writeClient_ = pool_->acquire();

        auto connection = testConnection();
        if (!connection.success) {
            throw std::runtime_error(connection.message);
        }
        LOG_INFO("Connected to MongoDB database: " + databaseName_);

        auto indexes = ensureIndexes();
        if (!indexes.success) {
            throw std::runtime_error(indexes.message);
        }
        LOG_DEBUG("Frontier indexes ensured on collection: " + collectionName_);

    } catch (const mongocxx::exception& e) {
        LOG_ERROR("Failed to initialize MongoDB frontier store: " + std::string(e.what()));
        throw std::runtime_error("Failed to initialize MongoDB frontier store: " + std::string(e.what()));
    }
}

MongoFrontierStore::~MongoFrontierStore() {
    close();
}

void MongoFrontierStore::close() {
    std::unique_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    writeClient_.reset();
    pool_.reset();
    LOG_INFO("MongoDB frontier store closed");
}

mongocxx::collection MongoFrontierStore::writeCollection() {
    return (*writeClient_)[databaseName_][collectionName_];
}

Result<bool> MongoFrontierStore::testConnection() {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<bool>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto result = (*client)[databaseName_].run_command(document{} << "ping" << 1 << finalize);
        (void)result;
        return Result<bool>::Success(true, "MongoDB connection is healthy");
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB connection test failed: " + std::string(e.what()));
        return Result<bool>::Failure("MongoDB connection test failed: " + std::string(e.what()));
    }
}

Result<bool> MongoFrontierStore::ensureIndexes() {
    try {
        auto urls = writeCollection();
        {
            auto keys = document{} << "url" << 1 << finalize;
            mongocxx::options::index idx_opts{};
            idx_opts.unique(true);
            urls.create_index(keys.view(), idx_opts);
        }
        {
            auto keys = document{} << "status" << 1 << "createdAt" << 1 << finalize;
            urls.create_index(keys.view());
        }
        {
            auto keys = document{} << "domain" << 1 << finalize;
            urls.create_index(keys.view());
        }
        return Result<bool>::Success(true, "Indexes created successfully");
    } catch (const mongocxx::exception& e) {
        return Result<bool>::Failure("Failed to create frontier indexes: " + std::string(e.what()));
    }
}

UrlRecord MongoFrontierStore::bsonToUrlRecord(const bsoncxx::document::view& doc) const {
    UrlRecord record;
    record.url = std::string(doc["url"].get_string().value);

    if (auto status = urlStatusFromString(std::string(doc["status"].get_string().value))) {
        record.status = *status;
    } else {
        LOG_WARNING("Unknown status stored for " + record.url + ", treating as error");
        record.status = UrlStatus::ERROR;
    }

    if (auto el = doc["retryCount"]) {
        record.retryCount = static_cast<int>(readCount(el));
    }
    if (auto el = doc["isSitemap"]) {
        record.isSitemap = el.get_bool().value;
    }
    if (auto el = doc["domain"]) {
        record.domain = std::string(el.get_string().value);
    }
    if (auto el = doc["lastError"]) {
        if (el.type() == bsoncxx::type::k_string) {
            record.lastError = std::string(el.get_string().value);
        }
    }
    if (auto el = doc["pauseReason"]) {
        if (el.type() == bsoncxx::type::k_string) {
            record.pauseReason = std::string(el.get_string().value);
        }
    }
    if (auto el = doc["createdAt"]) {
        record.createdAt = bsonDateToTimePoint(el.get_date());
    }
    if (auto el = doc["lastUpdated"]) {
        record.lastUpdated = bsonDateToTimePoint(el.get_date());
    }
    return record;
}

Result<bool> MongoFrontierStore::upsertNew(const std::string& url, bool isSitemap) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<bool>::Failure("Frontier store is closed");
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        auto now = timePointToBsonDate(std::chrono::system_clock::now());
        auto filter = document{} << "url" << url << finalize;
        auto update = document{}
            << "$setOnInsert" << open_document
                << "status" << urlStatusToString(UrlStatus::PENDING)
                << "retryCount" << 0
                << "isSitemap" << isSitemap
                << "domain" << common::extractDomain(url)
                << "createdAt" << now
                << "lastUpdated" << now
            << close_document
        << finalize;
        mongocxx::options::update opts;
        opts.upsert(true);
        auto result = writeCollection().update_one(filter.view(), update.view(), opts);
        bool inserted = result && result->upserted_id().has_value();
        return Result<bool>::Success(inserted, inserted ? "URL registered" : "URL already known");
    } catch (const mongocxx::operation_exception& e) {
        // Two writers racing on the unique index: the loser simply did not insert
        if (e.code().value() == kDuplicateKeyError) {
            return Result<bool>::Success(false, "URL already known");
        }
        return Result<bool>::Failure("MongoDB upsertNew error: " + std::string(e.what()));
    } catch (const mongocxx::exception& e) {
        return Result<bool>::Failure("MongoDB upsertNew error: " + std::string(e.what()));
    }
}

Result<bool> MongoFrontierStore::markVisited(const std::string& url, std::optional<bool> isSitemap) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<bool>::Failure("Frontier store is closed");
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        auto filter = document{}
            << "url" << url
            << "status" << open_document
                << "$in" << open_array
                    << urlStatusToString(UrlStatus::PENDING)
                    << urlStatusToString(UrlStatus::IN_PROGRESS)
                << close_array
            << close_document
        << finalize;

        document setDoc{};
        setDoc << "status" << urlStatusToString(UrlStatus::VISITED)
               << "lastUpdated" << timePointToBsonDate(std::chrono::system_clock::now());
        if (isSitemap) {
            setDoc << "isSitemap" << *isSitemap;
        }
        auto update = document{}
            << "$set" << bsoncxx::types::b_document{setDoc.view()}
            << "$unset" << open_document << "lastError" << "" << close_document
        << finalize;

        auto result = writeCollection().update_one(filter.view(), update.view());
        bool changed = result && result->modified_count() > 0;
        if (!changed) {
            LOG_DEBUG("markVisited left " + url + " unchanged (not pending)");
        }
        return Result<bool>::Success(changed, changed ? "URL visited" : "URL not pending");
    } catch (const mongocxx::exception& e) {
        return Result<bool>::Failure("MongoDB markVisited error: " + std::string(e.what()));
    }
}

Result<UrlStatus> MongoFrontierStore::markRetryOrError(const std::string& url, const std::string& error) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<UrlStatus>::Failure("Frontier store is closed");
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        auto urls = writeCollection();
        auto now = timePointToBsonDate(std::chrono::system_clock::now());

        auto filter = document{} << "url" << url
                                 << "status" << urlStatusToString(UrlStatus::PENDING) << finalize;
        auto update = document{}
            << "$inc" << open_document << "retryCount" << 1 << close_document
            << "$set" << open_document
                << "lastError" << error
                << "lastUpdated" << now
            << close_document
        << finalize;
        mongocxx::options::find_one_and_update opts;
        opts.return_document(mongocxx::options::return_document::k_after);

        auto updated = urls.find_one_and_update(filter.view(), update.view(), opts);
        if (!updated) {
            // Paused or finished in the meantime: nothing to count
            auto existing = urls.find_one(document{} << "url" << url << finalize);
            if (!existing) {
                return Result<UrlStatus>::Failure("Unknown URL: " + url);
            }
            auto current = bsonToUrlRecord(existing->view());
            return Result<UrlStatus>::Success(current.status, "URL not pending, retry not counted");
        }

        auto record = bsonToUrlRecord(updated->view());
        if (record.retryCount <= maxRetries_) {
            return Result<UrlStatus>::Success(UrlStatus::PENDING,
                "Retry " + std::to_string(record.retryCount) + "/" + std::to_string(maxRetries_));
        }

        auto errorUpdate = document{}
            << "$set" << open_document
                << "status" << urlStatusToString(UrlStatus::ERROR)
                << "lastUpdated" << now
            << close_document
        << finalize;
        urls.update_one(filter.view(), errorUpdate.view());
        return Result<UrlStatus>::Success(UrlStatus::ERROR,
            "Retries exhausted after " + std::to_string(record.retryCount) + " failures");
    } catch (const mongocxx::exception& e) {
        return Result<UrlStatus>::Failure("MongoDB markRetryOrError error: " + std::string(e.what()));
    }
}

Result<TransitionOutcome> MongoFrontierStore::setStatus(const std::string& url, UrlStatus status,
                                                        const std::string& reason) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<TransitionOutcome>::Failure("Frontier store is closed");
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        auto urls = writeCollection();
        auto existing = urls.find_one(document{} << "url" << url << finalize);
        if (!existing) {
            return Result<TransitionOutcome>::Success(TransitionOutcome::NOT_FOUND, "Unknown URL: " + url);
        }

        UrlStatus from = bsonToUrlRecord(existing->view()).status;
        if (!isTransitionAllowed(from, status)) {
            return Result<TransitionOutcome>::Success(TransitionOutcome::REJECTED,
                "Cannot move " + url + " from " + urlStatusToString(from) + " to " + urlStatusToString(status));
        }

        auto filter = document{} << "url" << url << "status" << urlStatusToString(from) << finalize;
        auto builder = document{};
        if (status == UrlStatus::PAUSED) {
            builder << "$set" << open_document
                << "status" << urlStatusToString(status)
                << "pauseReason" << reason
                << "lastUpdated" << timePointToBsonDate(std::chrono::system_clock::now())
            << close_document;
        } else {
            builder << "$set" << open_document
                << "status" << urlStatusToString(status)
                << "lastUpdated" << timePointToBsonDate(std::chrono::system_clock::now())
            << close_document
            << "$unset" << open_document << "pauseReason" << "" << close_document;
        }
        auto update = builder << finalize;

        auto result = urls.update_one(filter.view(), update.view());
        if (!result || result->modified_count() == 0) {
            return Result<TransitionOutcome>::Success(TransitionOutcome::REJECTED,
                "Status of " + url + " changed concurrently");
        }
        return Result<TransitionOutcome>::Success(TransitionOutcome::APPLIED,
            url + " -> " + urlStatusToString(status));
    } catch (const mongocxx::exception& e) {
        return Result<TransitionOutcome>::Failure("MongoDB setStatus error: " + std::string(e.what()));
    }
}

Result<std::optional<UrlRecord>> MongoFrontierStore::get(const std::string& url) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<std::optional<UrlRecord>>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto urls = (*client)[databaseName_][collectionName_];
        auto doc = urls.find_one(document{} << "url" << url << finalize);
        if (!doc) {
            return Result<std::optional<UrlRecord>>::Success(std::nullopt, "URL not found");
        }
        return Result<std::optional<UrlRecord>>::Success(bsonToUrlRecord(doc->view()));
    } catch (const mongocxx::exception& e) {
        return Result<std::optional<UrlRecord>>::Failure("MongoDB get error: " + std::string(e.what()));
    }
}

Result<std::vector<UrlRecord>> MongoFrontierStore::listByStatus(UrlStatus status) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<std::vector<UrlRecord>>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto urls = (*client)[databaseName_][collectionName_];
        auto filter = document{} << "status" << urlStatusToString(status) << finalize;
        auto cursor = urls.find(filter.view(), insertionOrder());

        std::vector<UrlRecord> records;
        for (const auto& doc : cursor) {
            records.push_back(bsonToUrlRecord(doc));
        }
        return Result<std::vector<UrlRecord>>::Success(std::move(records));
    } catch (const mongocxx::exception& e) {
        return Result<std::vector<UrlRecord>>::Failure("MongoDB listByStatus error: " + std::string(e.what()));
    }
}

Result<std::vector<UrlRecord>> MongoFrontierStore::listByPrefix(const std::string& prefix, UrlStatus status) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<std::vector<UrlRecord>>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto urls = (*client)[databaseName_][collectionName_];
        auto filter = document{}
            << "url" << bsoncxx::types::b_regex{literalPrefixPattern(prefix)}
            << "status" << urlStatusToString(status)
        << finalize;
        auto cursor = urls.find(filter.view(), insertionOrder());

        std::vector<UrlRecord> records;
        for (const auto& doc : cursor) {
            records.push_back(bsonToUrlRecord(doc));
        }
        return Result<std::vector<UrlRecord>>::Success(std::move(records));
    } catch (const mongocxx::exception& e) {
        return Result<std::vector<UrlRecord>>::Failure("MongoDB listByPrefix error: " + std::string(e.what()));
    }
}

Result<std::vector<std::string>> MongoFrontierStore::setStatusByPrefix(const std::string& prefix,
                                                                       UrlStatus from,
                                                                       UrlStatus to,
                                                                       const std::string& reason) {
    if (!isTransitionAllowed(from, to)) {
        return Result<std::vector<std::string>>::Failure(
            "Transition " + urlStatusToString(from) + " -> " + urlStatusToString(to) + " is not allowed");
    }

    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<std::vector<std::string>>::Failure("Frontier store is closed");
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    try {
        auto urls = writeCollection();
        auto filter = document{}
            << "url" << bsoncxx::types::b_regex{literalPrefixPattern(prefix)}
            << "status" << urlStatusToString(from)
        << finalize;

        std::vector<std::string> changed;
        mongocxx::options::find opts = insertionOrder();
        opts.projection(document{} << "url" << 1 << finalize);
        for (const auto& doc : urls.find(filter.view(), opts)) {
            changed.emplace_back(doc["url"].get_string().value);
        }
        if (changed.empty()) {
            return Result<std::vector<std::string>>::Success(std::move(changed), "No matching URLs");
        }

        auto builder = document{};
        if (to == UrlStatus::PAUSED) {
            builder << "$set" << open_document
                << "status" << urlStatusToString(to)
                << "pauseReason" << reason
                << "lastUpdated" << timePointToBsonDate(std::chrono::system_clock::now())
            << close_document;
        } else {
            builder << "$set" << open_document
                << "status" << urlStatusToString(to)
                << "lastUpdated" << timePointToBsonDate(std::chrono::system_clock::now())
            << close_document
            << "$unset" << open_document << "pauseReason" << "" << close_document;
        }
        auto update = builder << finalize;
        urls.update_many(filter.view(), update.view());

        LOG_INFO_STREAM("Moved " << changed.size() << " URLs under " << prefix << " from "
                        << urlStatusToString(from) << " to " << urlStatusToString(to));
        return Result<std::vector<std::string>>::Success(std::move(changed));
    } catch (const mongocxx::exception& e) {
        return Result<std::vector<std::string>>::Failure("MongoDB setStatusByPrefix error: " + std::string(e.what()));
    }
}

Result<StatusCounts> MongoFrontierStore::countsByStatus() {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<StatusCounts>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto urls = (*client)[databaseName_][collectionName_];

        mongocxx::pipeline pipeline;
        pipeline.group(make_document(
            kvp("_id", "$status"),
            kvp("count", make_document(kvp("$sum", 1)))));

        StatusCounts counts;
        for (const auto& doc : urls.aggregate(pipeline)) {
            auto status = urlStatusFromString(std::string(doc["_id"].get_string().value));
            if (status) {
                counts[*status] += readCount(doc["count"]);
            }
        }
        return Result<StatusCounts>::Success(std::move(counts));
    } catch (const mongocxx::exception& e) {
        return Result<StatusCounts>::Failure("MongoDB countsByStatus error: " + std::string(e.what()));
    }
}

Result<DomainCounts> MongoFrontierStore::countsByDomain(std::optional<UrlStatus> status, size_t limit) {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<DomainCounts>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto urls = (*client)[databaseName_][collectionName_];

        mongocxx::pipeline pipeline;
        if (status) {
            pipeline.match(make_document(kvp("status", urlStatusToString(*status))));
        }
        pipeline.group(make_document(
            kvp("_id", "$domain"),
            kvp("count", make_document(kvp("$sum", 1)))));
        pipeline.sort(make_document(kvp("count", -1), kvp("_id", 1)));
        if (limit > 0) {
            pipeline.limit(static_cast<std::int32_t>(limit));
        }

        DomainCounts counts;
        for (const auto& doc : urls.aggregate(pipeline)) {
            std::string domain;
            if (doc["_id"].type() == bsoncxx::type::k_string) {
                domain = std::string(doc["_id"].get_string().value);
            }
            counts.emplace_back(domain, readCount(doc["count"]));
        }
        return Result<DomainCounts>::Success(std::move(counts));
    } catch (const mongocxx::exception& e) {
        return Result<DomainCounts>::Failure("MongoDB countsByDomain error: " + std::string(e.what()));
    }
}

Result<std::optional<std::string>> MongoFrontierStore::earliestUrl() {
    std::shared_lock<std::shared_mutex> lifecycle(lifecycleMutex_);
    if (closed_) {
        return Result<std::optional<std::string>>::Failure("Frontier store is closed");
    }
    try {
        auto client = pool_->acquire();
        auto urls = (*client)[databaseName_][collectionName_];

        mongocxx::options::find opts = insertionOrder();
        opts.projection(document{} << "url" << 1 << finalize);
        auto doc = urls.find_one(make_document(), opts);
        if (!doc) {
            return Result<std::optional<std::string>>::Success(std::nullopt, "Frontier is empty");
        }
        return Result<std::optional<std::string>>::Success(
            std::string((*doc)["url"].get_string().value));
    } catch (const mongocxx::exception& e) {
        return Result<std::optional<std::string>>::Failure("MongoDB earliestUrl error: " + std::string(e.what()));
    }
}

} // namespace frontier_crawler::storage
