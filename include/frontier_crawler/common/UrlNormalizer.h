#pragma once

#include <string>

namespace frontier_crawler::common {

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// and strip ASCII control characters and surrounding ASCII whitespace.
// Specifically removes: U+200B, U+200C, U+200D, U+2060, U+FEFF, bidi marks and
// bytes < 0x20 or 0x7F. Also trims leading/trailing spaces, tabs, CR, LF.
std::string sanitizeUrl(const std::string& input);

// Canonical frontier key for a URL: sanitized, fragment removed, scheme and host
// lowercased, default port dropped, empty path replaced by "/". Path and query keep
// their case. Returns an empty string for anything that is not an absolute
// http(s) URL.
std::string normalizeUrl(const std::string& input);

// Resolve an href found on baseUrl into an absolute URL (RFC 3986 reference
// resolution without dot-segment edge cases beyond "." and ".."). Returns an
// empty string for javascript:, mailto:, tel:, data: and similar schemes.
std::string resolveUrl(const std::string& baseUrl, const std::string& href);

// Lowercased host of an http(s) URL without port, or "" if there is none.
std::string extractHost(const std::string& url);

// Host with a leading "www." removed; used for per-domain statistics.
std::string extractDomain(const std::string& url);

// "host[/first_path_segment]" grouping key used by the stats report.
std::string extractPrefixKey(const std::string& url);

// True if the URL path ends with .xml or .xml.gz, or the URL mentions "sitemap".
bool looksLikeSitemapUrl(const std::string& url);

// Produce a compact hex dump of the given string for logging/debugging.
// Example: "68 74 74 70 73 3a 2f ..."
std::string hexDump(const std::string& input);

} // namespace frontier_crawler::common
