#include "SitemapExpander.h"
#include "../../include/frontier_crawler/common/UrlNormalizer.h"
#include "../../include/Logger.h"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <mutex>

namespace frontier_crawler::crawler {

namespace {

// Sitemaps are capped at 50 MB uncompressed; leave some headroom
constexpr size_t kMaxDecompressedBytes = 64 * 1024 * 1024;
constexpr size_t kSniffWindow = 4096;

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

void ensureXmlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

bool nodeNameIs(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

std::string nodeText(xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return trim(text);
}

// <entryName><loc>...</loc></entryName> children of root
void collectLocs(xmlNode* root, const char* entryName, bool isSitemap,
                 std::vector<SitemapEntry>& entries) {
    for (xmlNode* entry = root->children; entry; entry = entry->next) {
        if (!nodeNameIs(entry, entryName)) {
            continue;
        }
        for (xmlNode* child = entry->children; child; child = child->next) {
            if (!nodeNameIs(child, "loc")) {
                continue;
            }
            std::string loc = nodeText(child);
            if (!loc.empty()) {
                entries.push_back(SitemapEntry{loc, isSitemap});
            }
        }
    }
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Looks for a sitemap root tag, with or without a namespace prefix.
bool hasSitemapRoot(const std::string& xml) {
    std::string head = toLower(xml.substr(0, kSniffWindow));
    for (const char* root : {"urlset", "sitemapindex"}) {
        size_t pos = head.find(root);
        while (pos != std::string::npos) {
            if (pos > 0 && (head[pos - 1] == '<' || head[pos - 1] == ':')) {
                return true;
            }
            pos = head.find(root, pos + 1);
        }
    }
    return false;
}

bool hasHtmlRoot(const std::string& body) {
    std::string head = toLower(body.substr(0, kSniffWindow));
    return head.find("<!doctype html") != std::string::npos ||
           head.find("<html") != std::string::npos;
}

} // namespace

bool SitemapExpander::isGzipped(const std::string& data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

Result<std::string> SitemapExpander::decompressGzip(const std::string& compressed) {
    if (compressed.empty()) {
        return Result<std::string>::Failure("Empty gzip payload");
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // 16 + MAX_WBITS: expect a gzip header rather than raw zlib
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
        return Result<std::string>::Failure("inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::string decompressed;
    char buffer[32768];

    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string reason = zs.msg ? zs.msg : "inflate error " + std::to_string(ret);
            inflateEnd(&zs);
            return Result<std::string>::Failure("Gzip decompression failed: " + reason);
        }

        decompressed.append(buffer, sizeof(buffer) - zs.avail_out);
        if (decompressed.size() > kMaxDecompressedBytes) {
            inflateEnd(&zs);
            return Result<std::string>::Failure("Decompressed sitemap exceeds size limit");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return Result<std::string>::Success(std::move(decompressed));
}

Result<std::vector<SitemapEntry>> SitemapExpander::expand(const std::string& body,
                                                          const std::string& sourceUrl) {
    std::string xml = body;
    if (isGzipped(body)) {
        auto inflated = decompressGzip(body);
        if (!inflated.success) {
            return Result<std::vector<SitemapEntry>>::Failure(inflated.message);
        }
        xml = std::move(inflated.value);
    }

    if (xml.empty()) {
        return Result<std::vector<SitemapEntry>>::Failure("Empty sitemap document");
    }

    ensureXmlInitialized();
    // NONET: never fetch external DTDs. No NOENT: entities are left unexpanded.
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                sourceUrl.empty() ? nullptr : sourceUrl.c_str(), nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        return Result<std::vector<SitemapEntry>>::Failure("Malformed sitemap XML");
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        return Result<std::vector<SitemapEntry>>::Failure("Sitemap has no root element");
    }

    std::vector<SitemapEntry> entries;
    if (nodeNameIs(root, "sitemapindex")) {
        collectLocs(root, "sitemap", true, entries);
    } else if (nodeNameIs(root, "urlset")) {
        collectLocs(root, "url", false, entries);
    } else {
        return Result<std::vector<SitemapEntry>>::Failure(
            "Unrecognized sitemap root element: " + std::string(reinterpret_cast<const char*>(root->name)));
    }

    LOG_DEBUG("Expanded sitemap " + sourceUrl + " into " + std::to_string(entries.size()) + " entries");
    return Result<std::vector<SitemapEntry>>::Success(std::move(entries));
}

bool SitemapExpander::looksLikeSitemap(const std::string& url,
                                       const std::string& contentType,
                                       const std::string& body,
                                       bool storedIsSitemap) {
    bool urlSaysSitemap = storedIsSitemap || common::looksLikeSitemapUrl(url);

    std::string document = body;
    if (isGzipped(body)) {
        auto inflated = decompressGzip(body);
        if (!inflated.success) {
            // Compressed but unreadable: only worth treating as a sitemap if named like one
            return urlSaysSitemap;
        }
        document = std::move(inflated.value);
    }

    if (hasSitemapRoot(document)) {
        return true;
    }

    std::string type = toLower(contentType);
    if (type.find("html") != std::string::npos || hasHtmlRoot(document)) {
        return false;
    }
    if (type.find("xml") != std::string::npos) {
        return true;
    }
    return urlSaysSitemap;
}

} // namespace frontier_crawler::crawler
