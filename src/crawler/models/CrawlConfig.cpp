#include "../../../include/frontier_crawler/crawler/models/CrawlConfig.h"
#include "../../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

template <typename T>
T envNumberOr(const char* name, T fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    try {
        long long parsed = std::stoll(value);
        if (parsed < 0) {
            LOG_WARNING(std::string("Ignoring negative value for ") + name + ": " + value);
            return fallback;
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        LOG_WARNING(std::string("Ignoring malformed value for ") + name + ": " + value);
        return fallback;
    }
}

bool envFlagOr(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    std::string flag = value;
    std::transform(flag.begin(), flag.end(), flag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (flag == "1" || flag == "true" || flag == "yes" || flag == "on") {
        return true;
    }
    if (flag == "0" || flag == "false" || flag == "no" || flag == "off") {
        return false;
    }
    LOG_WARNING(std::string("Ignoring malformed value for ") + name + ": " + value);
    return fallback;
}

} // namespace

CrawlConfig CrawlConfig::fromEnvironment() {
    CrawlConfig config;
    config.mongoUri = envOr("MONGODB_URI", config.mongoUri);
    config.databaseName = envOr("CRAWLER_DB_NAME", config.databaseName);
    config.workerCount = envNumberOr<size_t>("CRAWLER_WORKERS", config.workerCount);
    config.politenessDelay = std::chrono::milliseconds(
        envNumberOr<long long>("CRAWLER_DELAY_MS", config.politenessDelay.count()));
    config.userAgent = envOr("CRAWLER_USER_AGENT", config.userAgent);
    config.requestTimeout = std::chrono::milliseconds(
        envNumberOr<long long>("CRAWLER_TIMEOUT_MS", config.requestTimeout.count()));
    config.maxRetries = envNumberOr<int>("CRAWLER_MAX_RETRIES", config.maxRetries);
    config.verifySsl = envFlagOr("CRAWLER_VERIFY_SSL", config.verifySsl);
    config.maxContentBytes = envNumberOr<size_t>("CRAWLER_MAX_BODY_BYTES", config.maxContentBytes);
    config.outputPath = envOr("CRAWLER_OUTPUT", config.outputPath);
    config.logFile = envOr("CRAWLER_LOG_FILE", config.logFile);
    config.logLevel = envOr("CRAWLER_LOG_LEVEL", config.logLevel);
    return config;
}
