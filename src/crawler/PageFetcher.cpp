#include "PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/frontier_crawler/common/UrlNormalizer.h"
#include <algorithm>

PageFetcher::PageFetcher(const std::string& userAgent,
                         std::chrono::milliseconds timeout,
                         bool followRedirects,
                         size_t maxRedirects)
    : userAgent(userAgent)
    , timeout(timeout)
    , followRedirects(followRedirects)
    , maxRedirects(maxRedirects)
    , verifySSL(true)
    , maxContentBytes(20 * 1024 * 1024) {
    LOG_DEBUG("PageFetcher constructor called with userAgent: " + userAgent);
}

PageFetchResult PageFetcher::fetch(const std::string& url) const {
    using namespace frontier_crawler::common;
    const std::string cleanedUrl = sanitizeUrl(url);
    LOG_DEBUG("PageFetcher::fetch called for URL: " + cleanedUrl);
    PageFetchResult result;

    CURL* localCurl = curl_easy_init();
    if (!localCurl) {
        result.errorMessage = "Failed to create CURL handle";
        LOG_ERROR("Error: " + result.errorMessage);
        return result;
    }

    curl_easy_setopt(localCurl, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(localCurl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(localCurl, CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(localCurl, CURLOPT_ERRORBUFFER, errbuf);

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(localCurl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(localCurl, CURLOPT_USERAGENT, userAgent.c_str());

    long timeoutMs = static_cast<long>(timeout.count());
    curl_easy_setopt(localCurl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(localCurl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeoutMs, 10000L));

    curl_easy_setopt(localCurl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(localCurl, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));

    curl_easy_setopt(localCurl, CURLOPT_SSL_VERIFYPEER, verifySSL ? 1L : 0L);
    curl_easy_setopt(localCurl, CURLOPT_SSL_VERIFYHOST, verifySSL ? 2L : 0L);

    // Let curl advertise and undo gzip/deflate transfer encodings
    curl_easy_setopt(localCurl, CURLOPT_ACCEPT_ENCODING, "");

    ResponseBuffer response;
    response.limit = maxContentBytes;
    curl_easy_setopt(localCurl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(localCurl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(localCurl);

    if (res != CURLE_OK) {
        result.errorMessage = std::string(curl_easy_strerror(res));
        if (errbuf[0] != '\0') {
            result.errorMessage += " | " + std::string(errbuf);
        }
        result.curlCode = res;
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + result.errorMessage +
                    " | url_hex=" + hexDump(cleanedUrl));
        curl_easy_cleanup(localCurl);
        return result;
    }

    long statusCode = 0;
    curl_easy_getinfo(localCurl, CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    if (result.statusCode >= 400 && result.statusCode < 500) {
        LOG_WARNING("HTTP CLIENT ERROR (" + std::to_string(result.statusCode) + "): " + cleanedUrl);
    } else if (result.statusCode >= 500) {
        LOG_WARNING("HTTP SERVER ERROR (" + std::to_string(result.statusCode) + "): " + cleanedUrl);
    } else {
        LOG_DEBUG("HTTP " + std::to_string(result.statusCode) + ": " + cleanedUrl);
    }

    char* contentType = nullptr;
    curl_easy_getinfo(localCurl, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        result.contentType = contentType;
    }

    char* finalUrl = nullptr;
    curl_easy_getinfo(localCurl, CURLINFO_EFFECTIVE_URL, &finalUrl);
    result.finalUrl = finalUrl ? std::string(finalUrl) : cleanedUrl;

    result.content = std::move(response.data);

    // 2xx status codes are considered successful
    result.success = (result.statusCode >= 200 && result.statusCode < 300);
    if (!result.success) {
        result.errorMessage = "HTTP status " + std::to_string(result.statusCode);
    }

    curl_easy_cleanup(localCurl);
    return result;
}

void PageFetcher::setVerifySSL(bool verify) {
    LOG_DEBUG("PageFetcher::setVerifySSL called with: " + std::string(verify ? "true" : "false"));
    verifySSL = verify;
}

void PageFetcher::setMaxContentBytes(size_t bytes) {
    maxContentBytes = bytes;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* response = static_cast<ResponseBuffer*>(userp);
    size_t totalSize = size * nmemb;
    if (response->limit > 0 && response->data.size() + totalSize > response->limit) {
        // Returning a short count makes curl fail the transfer with CURLE_WRITE_ERROR
        return 0;
    }
    response->data.append(static_cast<char*>(contents), totalSize);
    return totalSize;
}
