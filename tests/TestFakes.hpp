#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include "app/BackgroundRunner.hpp"
#include "services/Capabilities.hpp"
#include "utils/Errors.hpp"

namespace Pequod {
namespace Testing {

// Fresh directory under the system temp dir, removed with the object.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "pequod_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) throw std::runtime_error("mkdtemp failed");
        path_ = buffer.data();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

class FakeTransport : public Transport {
public:
    // Crash throws an error type the transport contract does not name.
    enum class Failure { None, Fetch, Timeout, Crash };

    void respond(const std::string& url, const std::string& body, const std::string& contentType = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url] = Response{body, contentType, Failure::None};
    }
    void fail(const std::string& url, Failure failure) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url] = Response{"", "", failure};
    }

    FetchedDocument fetch(const std::string& url, long) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.push_back(url);
        if (cancelled_) throw FetchError("cancelled");
        auto it = responses_.find(url);
        if (it == responses_.end()) throw FetchError("HTTP status 404");
        if (it->second.failure == Failure::Timeout) throw TimeoutError("timed out fetching " + url);
        if (it->second.failure == Failure::Fetch) throw FetchError("connection refused");
        if (it->second.failure == Failure::Crash) throw std::runtime_error("transport crashed");
        return FetchedDocument{url, it->second.body, it->second.contentType};
    }

    void cancelAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }

    std::vector<std::string> requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

private:
    struct Response {
        std::string body;
        std::string contentType;
        Failure failure;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Response> responses_;
    std::vector<std::string> requested_;
    bool cancelled_ = false;
};

// Bodies registered with feed() parse to that feed; anything else is a
// ParseError, which is how an HTML page looks to the engine.
class FakeFeedParser : public FeedParser {
public:
    void feed(const std::string& body, ParsedFeed parsed) {
        std::lock_guard<std::mutex> lock(mutex_);
        feeds_[body] = std::move(parsed);
    }
    void links(const std::string& html, std::vector<std::string> candidates) {
        std::lock_guard<std::mutex> lock(mutex_);
        links_[html] = std::move(candidates);
    }

    ParsedFeed parse(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = feeds_.find(bytes);
        if (it == feeds_.end()) throw ParseError("unable to parse feed: unrecognized root element <html>");
        return it->second;
    }

    std::vector<std::string> discoverFeedLinks(const std::string& html, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(html);
        return it == links_.end() ? std::vector<std::string>() : it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, ParsedFeed> feeds_;
    std::map<std::string, std::vector<std::string>> links_;
};

class FakeTextExtractor : public TextExtractor {
public:
    std::string extractReadableText(const std::string& html) override {
        if (html.empty()) throw ResolutionError("no readable text found on the page");
        return html;
    }
};

class FakeBrowser : public BrowserLauncher {
public:
    bool open(const std::string& url) override {
        opened.push_back(url);
        return succeed;
    }

    std::vector<std::string> opened;
    bool succeed = true;
};

class InlineRunner : public BackgroundRunner {
public:
    void post(std::function<void()> task) override {
        posted++;
        task();
    }
    int posted = 0;
};

// Fails every post, like a runner that cannot start a thread.
class RefusingRunner : public BackgroundRunner {
public:
    void post(std::function<void()>) override { throw std::runtime_error("no threads available"); }
};

// Holds tasks until runAll(), so tests can observe work in flight.
class DeferredRunner : public BackgroundRunner {
public:
    void post(std::function<void()> task) override { tasks.push_back(std::move(task)); }
    void runAll() {
        auto pending = std::move(tasks);
        tasks.clear();
        for (auto& task : pending) task();
    }
    std::vector<std::function<void()>> tasks;
};

inline ParsedEntry makeEntry(const std::string& link, const std::string& title,
                             std::optional<Timestamp> published = std::nullopt,
                             const std::string& summary = "") {
    ParsedEntry entry;
    entry.link = link;
    entry.title = title;
    entry.publishedAt = published;
    entry.summary = summary;
    return entry;
}

}
}
