#pragma once
#include <string>
#include <vector>
#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>
#include "storage/Models.hpp"

namespace Pequod {

class HtmlParser {
public:
    HtmlParser();
    ~HtmlParser();
    HtmlParser(const HtmlParser&) = delete;
    HtmlParser& operator=(const HtmlParser&) = delete;

    bool parse(const std::string& html);
    std::vector<std::string> getAttributes(const std::string& xpath, const std::string& attr);

    // Readable text of the parsed page: article, then main, then body.
    std::string extractReadableText();

    // RSS 0.9x/2.0, RSS 1.0 and Atom. Throws ParseError.
    static ParsedFeed parseFeed(const std::string& xml);
    // Plain text of an HTML fragment such as a feed summary.
    static std::string htmlToText(const std::string& html);

private:
    htmlDocPtr doc_;
    xmlXPathContextPtr xpathCtx_;
    static std::string nodeToText(xmlNodePtr node);
    void cleanup();
};

}
