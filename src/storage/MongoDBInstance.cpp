#include "../../include/frontier_crawler/storage/MongoDBInstance.h"
#include <mongocxx/instance.hpp>

namespace frontier_crawler::storage {

std::unique_ptr<mongocxx::instance> MongoDBInstance::instance;
std::mutex MongoDBInstance::mutex;

mongocxx::instance& MongoDBInstance::getInstance() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!instance) {
        instance = std::make_unique<mongocxx::instance>();
    }
    return *instance;
}

} // namespace frontier_crawler::storage
