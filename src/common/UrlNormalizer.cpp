#include "../../include/frontier_crawler/common/UrlNormalizer.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace frontier_crawler::common {

namespace {

inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct UrlParts {
    std::string scheme;     // lowercased
    std::string authority;  // userinfo@host:port as written
    std::string path;       // starts with '/' or is empty
    std::string query;      // includes leading '?', or empty
};

// Splits an absolute URL (fragment already removed). Returns false if there is no scheme.
bool splitUrl(const std::string& url, UrlParts& parts) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return false;
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    std::string rest = url.substr(schemeEnd + 3);

    size_t authorityEnd = rest.find_first_of("/?");
    if (authorityEnd == std::string::npos) {
        authorityEnd = rest.size();
    }
    parts.authority = rest.substr(0, authorityEnd);
    std::string tail = rest.substr(authorityEnd);

    size_t queryPos = tail.find('?');
    if (queryPos == std::string::npos) {
        parts.path = tail;
        parts.query.clear();
    } else {
        parts.path = tail.substr(0, queryPos);
        parts.query = tail.substr(queryPos);
    }
    return true;
}

std::string stripFragment(const std::string& url) {
    size_t hashPos = url.find('#');
    return hashPos == std::string::npos ? url : url.substr(0, hashPos);
}

// RFC 3986 section 5.2.4, applied to an absolute path.
std::string removeDotSegments(const std::string& path) {
    std::vector<std::string> output;
    bool trailingSlash = !path.empty() && path.back() == '/';

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string segment = path.substr(start, end - start);
        bool last = end == path.size();

        if (segment == ".") {
            if (last) trailingSlash = true;
        } else if (segment == "..") {
            if (!output.empty()) output.pop_back();
            if (last) trailingSlash = true;
        } else if (!segment.empty()) {
            output.push_back(segment);
        }
        start = end + 1;
    }

    std::string result;
    for (const auto& segment : output) {
        result += "/" + segment;
    }
    if (result.empty() || trailingSlash) {
        result += "/";
    }
    return result;
}

} // namespace

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string s = input.substr(start, end - start);

    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0x80) == 0) {
            if (c < 0x20 || c == 0x7F) { i++; continue; }
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        // Decode just enough UTF-8 to see the codepoint
        uint32_t cp = 0;
        size_t adv = 1;
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
            adv = 2;
        } else if ((c & 0xF0) == 0xE0 && i + 2 < s.size()) {
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 2]) & 0x3F);
            adv = 3;
        } else if ((c & 0xF8) == 0xF0 && i + 3 < s.size()) {
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 3]) & 0x3F);
            adv = 4;
        } else {
            i++;
            continue;
        }

        if (cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF ||
            cp == 0x200E || cp == 0x200F ||
            cp == 0x202A || cp == 0x202B || cp == 0x202C || cp == 0x202D || cp == 0x202E ||
            cp == 0x2066 || cp == 0x2067 || cp == 0x2068 || cp == 0x2069) {
            i += adv;
            continue;
        }

        out.append(s, i, adv);
        i += adv;
    }

    return out;
}

std::string normalizeUrl(const std::string& input) {
    std::string cleaned = stripFragment(sanitizeUrl(input));
    if (cleaned.empty()) {
        return "";
    }

    UrlParts parts;
    if (!splitUrl(cleaned, parts)) {
        return "";
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        return "";
    }

    std::string userinfo;
    std::string hostPort = parts.authority;
    size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        userinfo = hostPort.substr(0, at + 1);
        hostPort = hostPort.substr(at + 1);
    }

    std::string host = hostPort;
    std::string port;
    size_t bracket = hostPort.rfind(']');
    size_t colon = hostPort.rfind(':');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        host = hostPort.substr(0, colon);
        port = hostPort.substr(colon + 1);
    }
    host = toLower(host);
    if (host.empty()) {
        return "";
    }
    if ((parts.scheme == "http" && port == "80") || (parts.scheme == "https" && port == "443")) {
        port.clear();
    }

    std::string path = parts.path.empty() ? "/" : parts.path;

    std::string normalized = parts.scheme + "://" + userinfo + host;
    if (!port.empty()) {
        normalized += ":" + port;
    }
    normalized += path + parts.query;
    return normalized;
}

std::string resolveUrl(const std::string& baseUrl, const std::string& href) {
    std::string ref = stripFragment(sanitizeUrl(href));
    if (ref.empty()) {
        return "";
    }

    // Absolute reference, or a non-web scheme we never follow
    size_t schemeEnd = ref.find(':');
    size_t firstDelimiter = ref.find_first_of("/?");
    if (schemeEnd != std::string::npos &&
        (firstDelimiter == std::string::npos || schemeEnd < firstDelimiter)) {
        std::string scheme = toLower(ref.substr(0, schemeEnd));
        if (scheme == "http" || scheme == "https") {
            return ref;
        }
        return "";
    }

    UrlParts base;
    if (!splitUrl(stripFragment(sanitizeUrl(baseUrl)), base)) {
        return "";
    }

    if (ref.rfind("//", 0) == 0) {
        return base.scheme + ":" + ref;
    }

    std::string refPath = ref;
    std::string refQuery;
    size_t queryPos = ref.find('?');
    if (queryPos != std::string::npos) {
        refPath = ref.substr(0, queryPos);
        refQuery = ref.substr(queryPos);
    }

    std::string origin = base.scheme + "://" + base.authority;

    if (refPath.empty()) {
        // "?q=1" keeps the base path
        std::string basePath = base.path.empty() ? "/" : base.path;
        return origin + basePath + refQuery;
    }

    if (refPath[0] == '/') {
        return origin + removeDotSegments(refPath) + refQuery;
    }

    std::string directory = "/";
    if (!base.path.empty()) {
        size_t lastSlash = base.path.rfind('/');
        directory = base.path.substr(0, lastSlash + 1);
    }
    return origin + removeDotSegments(directory + refPath) + refQuery;
}

std::string extractHost(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return "";
    }
    std::string rest = url.substr(schemeEnd + 3);
    size_t end = rest.find_first_of("/?#");
    std::string hostPort = rest.substr(0, end);

    size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }
    size_t bracket = hostPort.rfind(']');
    size_t colon = hostPort.rfind(':');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        hostPort = hostPort.substr(0, colon);
    }
    return toLower(hostPort);
}

std::string extractDomain(const std::string& url) {
    std::string host = extractHost(url);
    if (host.rfind("www.", 0) == 0) {
        host = host.substr(4);
    }
    return host;
}

std::string extractPrefixKey(const std::string& url) {
    std::string domain = extractDomain(url);
    if (domain.empty()) {
        return "";
    }

    UrlParts parts;
    if (!splitUrl(stripFragment(url), parts)) {
        return domain;
    }
    size_t segmentStart = parts.path.find_first_not_of('/');
    if (segmentStart == std::string::npos) {
        return domain;
    }
    size_t segmentEnd = parts.path.find('/', segmentStart);
    return domain + "/" + parts.path.substr(segmentStart, segmentEnd - segmentStart);
}

bool looksLikeSitemapUrl(const std::string& url) {
    std::string lower = toLower(stripFragment(url));
    std::string withoutQuery = lower.substr(0, lower.find('?'));
    return endsWith(withoutQuery, ".xml") || endsWith(withoutQuery, ".xml.gz") ||
           lower.find("sitemap") != std::string::npos;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

} // namespace frontier_crawler::common
