#include "utils/HtmlParser.hpp"
#include "utils/Errors.hpp"
#include "utils/TextUtils.hpp"
#include <libxml/parser.h>
#include <libxml/xpathInternals.h>
#include <cstring>
#include <memory>

namespace Pequod {

namespace {

const char* kContentNs = "http://purl.org/rss/1.0/modules/content/";
const char* kDublinCoreNs = "http://purl.org/dc/elements/1.1/";
const char* kAtomNs = "http://www.w3.org/2005/Atom";

using XmlDoc = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

std::string nodeName(xmlNodePtr node) {
    return node && node->name ? reinterpret_cast<const char*>(node->name) : "";
}

bool inNamespace(xmlNodePtr node, const char* href) {
    return node->ns && node->ns->href && std::strcmp(reinterpret_cast<const char*>(node->ns->href), href) == 0;
}

std::string attribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

std::string rawContent(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    return result;
}

xmlNodePtr firstChild(xmlNodePtr node, const std::string& name) {
    for (xmlNodePtr child = node ? node->children : nullptr; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && nodeName(child) == name) return child;
    }
    return nullptr;
}

bool isSkippedElement(const std::string& name) {
    static const char* skipped[] = {"script", "style", "nav", "header", "footer", "aside", "form",
                                    "noscript", "iframe", "svg", "button", "template", "head"};
    for (const char* s : skipped) {
        if (name == s) return true;
    }
    return false;
}

bool isBlockElement(const std::string& name) {
    static const char* blocks[] = {"p", "div", "section", "article", "main", "h1", "h2", "h3", "h4",
                                   "h5", "h6", "li", "ul", "ol", "pre", "blockquote", "tr", "table",
                                   "br", "hr", "dd", "dt", "figcaption", "body"};
    for (const char* b : blocks) {
        if (name == b) return true;
    }
    return false;
}

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
            space = true;
            continue;
        }
        if (space && !out.empty()) out += ' ';
        space = false;
        out += c;
    }
    return out;
}

// Splits a DOM subtree into paragraphs at block element boundaries.
struct TextCollector {
    std::vector<std::string> paragraphs;
    std::string current;

    void flush() {
        std::string text = collapseWhitespace(current);
        if (!text.empty() && text != "-") paragraphs.push_back(text);
        current.clear();
    }

    void walk(xmlNodePtr node) {
        for (xmlNodePtr child = node->children; child; child = child->next) {
            if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
                if (child->content) current += reinterpret_cast<const char*>(child->content);
                continue;
            }
            if (child->type != XML_ELEMENT_NODE) continue;
            std::string name = toLower(nodeName(child));
            if (isSkippedElement(name)) continue;
            if (isBlockElement(name)) {
                flush();
                if (name == "li") current += "- ";
                walk(child);
                flush();
            } else {
                walk(child);
            }
        }
    }

    std::string joined() const {
        std::string out;
        for (const auto& p : paragraphs) {
            if (!out.empty()) out += "\n\n";
            out += p;
        }
        return out;
    }
};

std::string cleanTitle(const std::string& raw) {
    std::string title = trim(raw);
    if (title.find('<') != std::string::npos && title.find('>') != std::string::npos) {
        title = HtmlParser::htmlToText(title);
    }
    return sanitizeUtf8(collapseWhitespace(title));
}

std::string cleanSummary(const std::string& html) {
    return sanitizeUtf8(HtmlParser::htmlToText(html));
}

ParsedEntry parseRssItem(xmlNodePtr itemNode) {
    ParsedEntry entry;
    std::string description;
    std::string encoded;
    std::string date;

    for (xmlNodePtr child = itemNode->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        std::string name = nodeName(child);

        if (name == "title" && !inNamespace(child, kDublinCoreNs)) {
            entry.title = cleanTitle(rawContent(child));
        } else if (name == "link" && !inNamespace(child, kAtomNs)) {
            entry.link = trim(rawContent(child));
        } else if (name == "guid") {
            std::string guid = trim(rawContent(child));
            if (!guid.empty()) entry.guid = guid;
        } else if (name == "description") {
            description = rawContent(child);
        } else if (name == "encoded" && inNamespace(child, kContentNs)) {
            encoded = rawContent(child);
        } else if (name == "pubDate") {
            date = rawContent(child);
        } else if (name == "date" && inNamespace(child, kDublinCoreNs) && date.empty()) {
            date = rawContent(child);
        }
    }

    // RSS 1.0 items carry their identity in rdf:about.
    if (!entry.guid) {
        std::string about = attribute(itemNode, "about");
        if (!about.empty()) entry.guid = about;
    }
    entry.summary = cleanSummary(!encoded.empty() ? encoded : description);
    if (!date.empty()) entry.publishedAt = parseFeedDate(date);
    return entry;
}

ParsedEntry parseAtomEntry(xmlNodePtr entryNode) {
    ParsedEntry entry;
    std::string summary;
    std::string content;
    std::string published;
    std::string updated;

    for (xmlNodePtr child = entryNode->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        std::string name = nodeName(child);

        if (name == "title") {
            entry.title = cleanTitle(rawContent(child));
        } else if (name == "link") {
            std::string rel = attribute(child, "rel");
            std::string href = trim(attribute(child, "href"));
            if ((rel.empty() || rel == "alternate") && !href.empty() && entry.link.empty()) {
                entry.link = href;
            }
        } else if (name == "id") {
            std::string id = trim(rawContent(child));
            if (!id.empty()) entry.guid = id;
        } else if (name == "summary") {
            summary = rawContent(child);
        } else if (name == "content") {
            content = rawContent(child);
        } else if (name == "published") {
            published = rawContent(child);
        } else if (name == "updated") {
            updated = rawContent(child);
        }
    }

    entry.summary = cleanSummary(!content.empty() ? content : summary);
    if (!published.empty()) entry.publishedAt = parseFeedDate(published);
    if (!entry.publishedAt && !updated.empty()) entry.publishedAt = parseFeedDate(updated);
    return entry;
}

}

HtmlParser::HtmlParser() : doc_(nullptr), xpathCtx_(nullptr) { xmlInitParser(); }
HtmlParser::~HtmlParser() { cleanup(); }

void HtmlParser::cleanup() {
    if (xpathCtx_) { xmlXPathFreeContext(xpathCtx_); xpathCtx_ = nullptr; }
    if (doc_) { xmlFreeDoc(doc_); doc_ = nullptr; }
}

bool HtmlParser::parse(const std::string& html) {
    cleanup();
    if (html.empty()) return false;
    doc_ = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
                          HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!doc_) return false;
    xpathCtx_ = xmlXPathNewContext(doc_);
    return xpathCtx_ != nullptr;
}

std::string HtmlParser::nodeToText(xmlNodePtr node) {
    if (!node) return "";
    return trim(rawContent(node));
}

std::vector<std::string> HtmlParser::getAttributes(const std::string& xpath, const std::string& attr) {
    std::vector<std::string> values;
    if (!xpathCtx_) return values;
    xmlXPathObjectPtr result = xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), xpathCtx_);
    if (!result) return values;
    if (result->nodesetval) {
        for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
            std::string value = trim(attribute(result->nodesetval->nodeTab[i], attr.c_str()));
            if (!value.empty()) values.push_back(value);
        }
    }
    xmlXPathFreeObject(result);
    return values;
}

std::string HtmlParser::extractReadableText() {
    if (!doc_ || !xpathCtx_) return "";
    xmlNodePtr root = nullptr;
    static const char* candidates[] = {"//article", "//main", "//*[@role='main']", "//body"};
    for (const char* xpath : candidates) {
        xmlXPathObjectPtr result = xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath), xpathCtx_);
        if (!result) continue;
        if (result->nodesetval && result->nodesetval->nodeNr > 0) root = result->nodesetval->nodeTab[0];
        xmlXPathFreeObject(result);
        if (root && !nodeToText(root).empty()) break;
        root = nullptr;
    }
    if (!root) root = xmlDocGetRootElement(doc_);
    if (!root) return "";

    TextCollector collector;
    collector.walk(root);
    collector.flush();
    return sanitizeUtf8(collector.joined());
}

std::string HtmlParser::htmlToText(const std::string& html) {
    if (trim(html).empty()) return "";
    HtmlParser parser;
    if (!parser.parse(html)) return trim(html);
    xmlNodePtr root = xmlDocGetRootElement(parser.doc_);
    if (!root) return "";
    TextCollector collector;
    collector.walk(root);
    collector.flush();
    return collector.joined();
}

ParsedFeed HtmlParser::parseFeed(const std::string& xml) {
    if (trim(xml).empty()) throw ParseError("unable to parse feed: document is empty");

    xmlInitParser();
    XmlDoc doc(xmlReadMemory(xml.c_str(), static_cast<int>(xml.size()), nullptr, nullptr,
                             XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET | XML_PARSE_NOCDATA),
               &xmlFreeDoc);
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        std::string reason = (err && err->message) ? trim(err->message) : "malformed document";
        throw ParseError("unable to parse feed: " + reason);
    }
    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) throw ParseError("unable to parse feed: no root element");

    ParsedFeed feed;
    std::string rootName = nodeName(root);
    if (rootName == "rss" || rootName == "RDF") {
        xmlNodePtr channel = firstChild(root, "channel");
        if (!channel) throw ParseError("unable to parse feed: missing channel element");
        if (xmlNodePtr title = firstChild(channel, "title")) feed.title = cleanTitle(rawContent(title));
        // RSS 2.0 nests items in the channel, RSS 1.0 places them beside it.
        xmlNodePtr itemParent = (rootName == "rss") ? channel : root;
        for (xmlNodePtr child = itemParent->children; child; child = child->next) {
            if (child->type == XML_ELEMENT_NODE && nodeName(child) == "item") {
                feed.entries.push_back(parseRssItem(child));
            }
        }
    } else if (rootName == "feed") {
        if (xmlNodePtr title = firstChild(root, "title")) feed.title = cleanTitle(rawContent(title));
        for (xmlNodePtr child = root->children; child; child = child->next) {
            if (child->type == XML_ELEMENT_NODE && nodeName(child) == "entry") {
                feed.entries.push_back(parseAtomEntry(child));
            }
        }
    } else {
        throw ParseError("unable to parse feed: unrecognized root element <" + rootName + ">");
    }
    return feed;
}

}
