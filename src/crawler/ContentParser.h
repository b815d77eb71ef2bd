#pragma once

#include <string>
#include <vector>
#include <optional>
#include <gumbo.h>

struct ParsedContent {
    std::string title;
    std::string textContent;          // visible text, whitespace collapsed
    std::vector<std::string> links;   // absolute, normalized http(s) urls, first occurrence order
};

class ContentParser {
public:
    ContentParser();
    ~ContentParser();

    // Parse HTML once and extract title, text and outbound links.
    // Relative links are resolved against <base href> when present, else baseUrl.
    ParsedContent parse(const std::string& html, const std::string& baseUrl) const;

    // Extract visible text from HTML (script, style and similar are skipped)
    std::string extractText(const std::string& html) const;

    // Extract links from HTML
    std::vector<std::string> extractLinks(const std::string& html, const std::string& baseUrl) const;

    // Extract title from HTML
    std::optional<std::string> extractTitle(const std::string& html) const;

private:
    static void extractTextFromNode(const GumboNode* node, std::string& text);
    static void extractLinksFromNode(const GumboNode* node, const std::string& baseUrl,
                                     std::vector<std::string>& links);
    static std::optional<std::string> findTitle(const GumboNode* node);
    static std::optional<std::string> findBaseHref(const GumboNode* node);

    // Collapses runs of whitespace to one space and trims both ends
    static std::string collapseWhitespace(const std::string& text);
};
