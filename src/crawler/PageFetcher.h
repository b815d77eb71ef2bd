#pragma once

#include <string>
#include <chrono>
#include <curl/curl.h>

struct PageFetchResult {
    bool success = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string errorMessage;
    std::string finalUrl;  // After redirects
    CURLcode curlCode = CURLE_OK;
};

// Blocking HTTP(S) GET with a fixed User-Agent and timeout. Each call uses its
// own easy handle, so one fetcher can be shared by every worker thread.
// curl_global_init must have run before the first fetch.
class PageFetcher {
public:
    PageFetcher(const std::string& userAgent,
                std::chrono::milliseconds timeout,
                bool followRedirects = true,
                size_t maxRedirects = 5);

    // success is true only for a completed transfer with a 2xx status
    PageFetchResult fetch(const std::string& url) const;

    void setVerifySSL(bool verify);

    // Transfers larger than this are aborted and reported as failures. 0 disables the cap.
    void setMaxContentBytes(size_t bytes);

private:
    struct ResponseBuffer {
        std::string data;
        size_t limit = 0;
    };

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::string userAgent;
    std::chrono::milliseconds timeout;
    bool followRedirects;
    size_t maxRedirects;
    bool verifySSL;
    size_t maxContentBytes;
};
