#pragma once
#include <atomic>
#include <string>
#include <vector>
#include "services/Capabilities.hpp"
#include "storage/FeedStore.hpp"

namespace Pequod {

enum class SyncErrorKind {
    None,
    Fetch,
    Timeout,
    Parse,
    Storage,
    Referential,
    Cancelled,
    Internal
};

struct SyncResult {
    FeedId feedId = 0;
    std::string feedUrl;
    SyncStatus status = SyncStatus::Never;
    SyncErrorKind errorKind = SyncErrorKind::None;
    std::string message;
    int insertedCount = 0;
    int updatedCount = 0;

    bool ok() const { return status == SyncStatus::Ok; }
};

struct AddFeedResult {
    bool ok = false;
    FeedId feedId = 0;
    // The subscribed URL, which differs from the request after autodiscovery.
    std::string feedUrl;
    std::string title;
    std::string message;
    int insertedCount = 0;
};

struct SyncOptions {
    int concurrency = 4;
    long feedTimeoutSeconds = 15;
    // Items published longer ago than this are not imported. 0 keeps all.
    Timestamp maxEntryAgeSeconds = 0;
};

class SyncEngine {
public:
    SyncEngine(FeedStore& store, Transport& transport, FeedParser& parser, SyncOptions options = SyncOptions());

    SyncResult syncFeed(const Feed& feed);
    // Results come back in the order of feeds.
    std::vector<SyncResult> syncAll(const std::vector<Feed>& feeds);
    AddFeedResult addFeed(const std::string& url);

    // Permanent: feeds not yet started report Cancelled and transfers abort.
    void cancel();

private:
    std::vector<ParsedEntry> withinAgeLimit(const std::vector<ParsedEntry>& entries) const;
    bool discoverFeed(const std::string& html, const std::string& pageUrl, std::string& feedUrl, ParsedFeed& parsed);
    void recordOutcome(const SyncResult& result);

    FeedStore& store_;
    Transport& transport_;
    FeedParser& parser_;
    SyncOptions options_;
    std::atomic<bool> cancelled_;
};

}
