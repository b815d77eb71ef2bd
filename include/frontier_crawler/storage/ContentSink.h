#pragma once

#include "../common/Result.h"
#include <fstream>
#include <mutex>
#include <string>

namespace frontier_crawler::storage {

struct ContentRecord {
    std::string url;
    std::string title;
    int statusCode = 0;
    std::string content;
};

// Append-only JSON Lines file, one object per successfully crawled page:
// {"url": ..., "title": ..., "status_code": ..., "content": ...}
// Existing lines are never rewritten; the file is opened in append mode.
class ContentSink {
public:
    // Throws std::runtime_error if the file cannot be opened.
    explicit ContentSink(const std::string& path, size_t excerptLength = 500);
    ~ContentSink();

    ContentSink(const ContentSink&) = delete;
    ContentSink& operator=(const ContentSink&) = delete;

    // content is cut to excerptLength characters before writing.
    Result<bool> append(const ContentRecord& record);

    size_t recordsWritten() const;
    const std::string& path() const { return path_; }

    // First maxChars UTF-8 characters of text, never splitting a sequence.
    static std::string truncateUtf8(const std::string& text, size_t maxChars);

private:
    std::string path_;
    size_t excerptLength_;
    std::ofstream out_;
    size_t recordsWritten_ = 0;
    mutable std::mutex mutex_;
};

} // namespace frontier_crawler::storage
