#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "storage/Database.hpp"
#include "storage/Models.hpp"

namespace Pequod {

// Durable feeds and entries. Every public method is one transaction and is
// safe to call from any thread; writes from concurrent syncs of different
// feeds are serialized here.
class FeedStore {
public:
    explicit FeedStore(const std::string& dbPath);

    FeedId upsertFeed(const std::string& url);
    void deleteFeed(FeedId id);
    std::vector<Feed> listFeeds() const;
    Feed getFeed(FeedId id) const;
    std::optional<Feed> findFeedByUrl(const std::string& url) const;
    void setFeedTitle(FeedId id, const std::string& title);
    void setCollapsed(FeedId id, bool collapsed);
    void recordSync(FeedId id, SyncStatus status, const std::string& message, Timestamp when);

    // All-or-nothing batch keyed on the entry identity. Existing rows only
    // get title, summary and a newly available publish time; the read flag
    // and cached full content are left alone.
    UpsertCounts upsertEntries(FeedId feedId, const std::vector<ParsedEntry>& entries);
    // A new feed with its title, entries and a successful sync record, all in
    // one transaction. Throws StorageError when the URL is already stored.
    AddedFeed addFeedWithEntries(const std::string& url, const std::string& title,
                                 const std::vector<ParsedEntry>& entries, Timestamp when);
    std::vector<Entry> listEntries(FeedId feedId) const;
    Entry getEntry(EntryId id) const;
    void setFullContent(EntryId id, const std::string& text);
    void markRead(EntryId id);
    void markUnread(EntryId id);

    // Deletes entries published before the cutoff; returns how many.
    int expireEntries(Timestamp cutoff);

private:
    void createSchema();
    void requireFeed(FeedId id) const;
    void setRead(EntryId id, bool read);
    // Callers hold mutex_ and an open transaction.
    UpsertCounts writeEntries(FeedId feedId, const std::vector<ParsedEntry>& entries);
    void writeSync(FeedId id, SyncStatus status, const std::string& message, Timestamp when);
    static Feed feedFromRow(const Statement& stmt);

    std::unique_ptr<Database> db_;
    mutable std::mutex mutex_;
};

}
