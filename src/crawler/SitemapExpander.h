#pragma once

#include <string>
#include <vector>
#include "../../include/frontier_crawler/common/Result.h"

namespace frontier_crawler::crawler {

struct SitemapEntry {
    std::string url;
    bool isSitemap = false;   // true for <sitemap> children of a sitemap index
};

// Turns sitemap bytes (plain or gzip-compressed XML) into frontier entries.
// No network access: the caller already fetched the bytes.
class SitemapExpander {
public:
    // <sitemapindex> yields its sitemap/loc values flagged as sitemaps,
    // <urlset> yields its url/loc values as pages. Namespaced and
    // non-namespaced documents are both accepted; empty loc values are skipped.
    static Result<std::vector<SitemapEntry>> expand(const std::string& body,
                                                    const std::string& sourceUrl = "");

    // Decides from the response whether url should be expanded as a sitemap.
    // A gzipped body is inflated for the check; callers that already inflated
    // it pass the plain document.
    // Body (root element, gzip magic) and content type win; the url suffix and
    // the stored flag only decide when the response is ambiguous.
    static bool looksLikeSitemap(const std::string& url,
                                 const std::string& contentType,
                                 const std::string& body,
                                 bool storedIsSitemap = false);

    static bool isGzipped(const std::string& data);
    static Result<std::string> decompressGzip(const std::string& compressed);
};

} // namespace frontier_crawler::crawler
