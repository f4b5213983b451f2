#pragma once
#include <atomic>
#include <string>
#include <vector>
#include "storage/Models.hpp"
#include "utils/HttpClient.hpp"

namespace Pequod {

struct FetchedDocument {
    std::string url;
    std::string body;
    std::string contentType;
};

// Network access. Throws FetchError, or TimeoutError when the limit expires.
class Transport {
public:
    virtual ~Transport() = default;
    virtual FetchedDocument fetch(const std::string& url, long timeoutSeconds) = 0;
    // Aborts transfers in flight and refuses new ones, for shutdown.
    virtual void cancelAll() {}
};

// Feed document parsing. parse throws ParseError.
class FeedParser {
public:
    virtual ~FeedParser() = default;
    virtual ParsedFeed parse(const std::string& bytes) = 0;
    // Candidate feed URLs advertised by an HTML page, absolute, best first.
    virtual std::vector<std::string> discoverFeedLinks(const std::string& html, const std::string& pageUrl) = 0;
};

// Readable text from an article page. Throws ResolutionError.
class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    virtual std::string extractReadableText(const std::string& html) = 0;
};

class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;
    // False when no browser could be started.
    virtual bool open(const std::string& url) = 0;
};

class CurlTransport : public Transport {
public:
    explicit CurlTransport(const std::string& userAgent);
    FetchedDocument fetch(const std::string& url, long timeoutSeconds) override;
    void cancelAll() override;

private:
    std::string userAgent_;
    std::atomic<bool> cancelled_;
};

class XmlFeedParser : public FeedParser {
public:
    ParsedFeed parse(const std::string& bytes) override;
    std::vector<std::string> discoverFeedLinks(const std::string& html, const std::string& pageUrl) override;
};

class HtmlTextExtractor : public TextExtractor {
public:
    std::string extractReadableText(const std::string& html) override;
};

class SystemBrowserLauncher : public BrowserLauncher {
public:
    bool open(const std::string& url) override;
};

}
