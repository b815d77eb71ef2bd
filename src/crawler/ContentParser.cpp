#include "ContentParser.h"
#include "../../include/Logger.h"
#include "../../include/frontier_crawler/common/UrlNormalizer.h"
#include <cctype>
#include <unordered_set>

namespace {

bool isInvisibleTag(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE ||
           tag == GUMBO_TAG_NOSCRIPT || tag == GUMBO_TAG_TEMPLATE;
}

void dedupe(std::vector<std::string>& links) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(links.size());
    for (auto& link : links) {
        if (seen.insert(link).second) {
            unique.push_back(std::move(link));
        }
    }
    links.swap(unique);
}

} // namespace

ContentParser::ContentParser() {
    LOG_DEBUG("ContentParser constructor called");
}

ContentParser::~ContentParser() {
    LOG_DEBUG("ContentParser destructor called");
}

ParsedContent ContentParser::parse(const std::string& html, const std::string& baseUrl) const {
    LOG_DEBUG("ContentParser::parse called for URL: " + baseUrl + " with HTML length: " + std::to_string(html.length()) + " bytes");
    ParsedContent result;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) {
        LOG_ERROR("Failed to parse HTML with Gumbo for " + baseUrl);
        return result;
    }

    result.title = collapseWhitespace(findTitle(output->root).value_or(""));

    std::string text;
    extractTextFromNode(output->root, text);
    result.textContent = collapseWhitespace(text);

    std::string linkBase = baseUrl;
    if (auto baseHref = findBaseHref(output->root)) {
        std::string resolved = frontier_crawler::common::resolveUrl(baseUrl, *baseHref);
        if (!resolved.empty()) {
            linkBase = resolved;
        }
    }
    extractLinksFromNode(output->root, linkBase, result.links);
    dedupe(result.links);

    gumbo_destroy_output(&kGumboDefaultOptions, output);

    LOG_DEBUG("Extracted " + std::to_string(result.links.size()) + " links from " + baseUrl);
    return result;
}

std::string ContentParser::extractText(const std::string& html) const {
    std::string text;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (output) {
        extractTextFromNode(output->root, text);
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    } else {
        LOG_ERROR("Failed to parse HTML for text extraction");
    }
    return collapseWhitespace(text);
}

std::vector<std::string> ContentParser::extractLinks(const std::string& html, const std::string& baseUrl) const {
    return parse(html, baseUrl).links;
}

std::optional<std::string> ContentParser::extractTitle(const std::string& html) const {
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    std::optional<std::string> title;
    if (output) {
        title = findTitle(output->root);
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    } else {
        LOG_ERROR("Failed to parse HTML for title extraction");
    }
    if (title) {
        title = collapseWhitespace(*title);
    }
    return title;
}

void ContentParser::extractTextFromNode(const GumboNode* node, std::string& text) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA) {
        text += node->v.text.text;
        text += " ";
    }
    else if (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE) {
        if (!isInvisibleTag(node->v.element.tag)) {
            for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
                extractTextFromNode(static_cast<GumboNode*>(node->v.element.children.data[i]), text);
            }
        }
    }
    else if (node->type == GUMBO_NODE_DOCUMENT) {
        for (unsigned int i = 0; i < node->v.document.children.length; ++i) {
            extractTextFromNode(static_cast<GumboNode*>(node->v.document.children.data[i]), text);
        }
    }
}

void ContentParser::extractLinksFromNode(const GumboNode* node, const std::string& baseUrl, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return;
    }
    if (node->v.element.tag == GUMBO_TAG_A || node->v.element.tag == GUMBO_TAG_AREA) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            std::string url = frontier_crawler::common::normalizeUrl(
                frontier_crawler::common::resolveUrl(baseUrl, href->value));
            if (!url.empty()) {
                links.push_back(url);
            }
        }
    }

    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        extractLinksFromNode(static_cast<GumboNode*>(node->v.element.children.data[i]), baseUrl, links);
    }
}

std::optional<std::string> ContentParser::findTitle(const GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return std::nullopt;
    }
    if (node->v.element.tag == GUMBO_TAG_TITLE) {
        std::string title;
        for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
            auto* child = static_cast<GumboNode*>(node->v.element.children.data[i]);
            if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) {
                title += child->v.text.text;
            }
        }
        return title;
    }
    // <svg><title> is a tooltip, not the document title
    if (node->v.element.tag == GUMBO_TAG_SVG) {
        return std::nullopt;
    }
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        auto result = findTitle(static_cast<GumboNode*>(node->v.element.children.data[i]));
        if (result) {
            return result;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ContentParser::findBaseHref(const GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return std::nullopt;
    }
    if (node->v.element.tag == GUMBO_TAG_BASE) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href && href->value[0] != '\0') {
            return std::string(href->value);
        }
        return std::nullopt;
    }
    // <base> only counts inside <head>; don't walk the body
    if (node->v.element.tag == GUMBO_TAG_BODY) {
        return std::nullopt;
    }
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        auto result = findBaseHref(static_cast<GumboNode*>(node->v.element.children.data[i]));
        if (result) {
            return result;
        }
    }
    return std::nullopt;
}

std::string ContentParser::collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) {
            out.push_back(' ');
        }
        pendingSpace = false;
        out.push_back(c);
    }
    return out;
}
