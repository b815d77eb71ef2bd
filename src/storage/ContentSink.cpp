#include "../../include/frontier_crawler/storage/ContentSink.h"
#include "../../include/Logger.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace frontier_crawler::storage {

ContentSink::ContentSink(const std::string& path, size_t excerptLength)
    : path_(path)
    , excerptLength_(excerptLength) {
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open content output file: " + path_);
    }
    LOG_INFO("Writing crawled content to " + path_);
}

ContentSink::~ContentSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.close();
    }
}

Result<bool> ContentSink::append(const ContentRecord& record) {
    json line = {
        {"url", record.url},
        {"title", record.title},
        {"status_code", record.statusCode},
        {"content", truncateUtf8(record.content, excerptLength_)}
    };
    // Pages are not always valid UTF-8; replace bad bytes instead of throwing
    std::string serialized = line.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << serialized << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        return Result<bool>::Failure("Failed to write record for " + record.url + " to " + path_);
    }
    ++recordsWritten_;
    return Result<bool>::Success(true);
}

size_t ContentSink::recordsWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recordsWritten_;
}

std::string ContentSink::truncateUtf8(const std::string& text, size_t maxChars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size() && chars < maxChars) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) {
            break;
        }
        i += len;
        ++chars;
    }
    return text.substr(0, i);
}

} // namespace frontier_crawler::storage
