#include "storage/FeedStore.hpp"
#include "utils/Errors.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>

namespace Pequod {

namespace {

const char* kFeedColumns =
    "id, url, title, last_sync_at, last_sync_status, last_sync_message, collapsed";

const char* kEntryColumns =
    "id, feed_id, identity_key, title, link, published_at, summary, full_content IS NOT NULL, read";

std::string statusToText(SyncStatus status) {
    switch (status) {
        case SyncStatus::Ok: return "ok";
        case SyncStatus::Error: return "error";
        case SyncStatus::Never: break;
    }
    return "";
}

SyncStatus statusFromText(const std::optional<std::string>& text) {
    if (!text) return SyncStatus::Never;
    if (*text == "ok") return SyncStatus::Ok;
    if (*text == "error") return SyncStatus::Error;
    return SyncStatus::Never;
}

Entry entryFromRow(const Statement& stmt) {
    Entry entry;
    entry.id = stmt.getInt64(0);
    entry.feedId = stmt.getInt64(1);
    entry.identityKey = stmt.getString(2);
    entry.title = stmt.getString(3);
    entry.link = stmt.getString(4);
    entry.publishedAt = stmt.getOptionalInt64(5);
    entry.summary = stmt.getString(6);
    entry.hasFullContent = stmt.getInt64(7) != 0;
    entry.read = stmt.getInt64(8) != 0;
    return entry;
}

}

FeedStore::FeedStore(const std::string& dbPath) : db_(std::make_unique<Database>(dbPath)) {
    createSchema();
    spdlog::debug("Opened feed store at {}", dbPath);
}

void FeedStore::createSchema() {
    db_->execute("PRAGMA foreign_keys = ON");
    db_->execute("PRAGMA journal_mode = WAL");
    db_->execute(R"(
        CREATE TABLE IF NOT EXISTS feeds (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            url TEXT NOT NULL UNIQUE,
            title TEXT NOT NULL DEFAULT '',
            last_sync_at INTEGER,
            last_sync_status TEXT,
            last_sync_message TEXT NOT NULL DEFAULT '',
            collapsed INTEGER NOT NULL DEFAULT 1
        );

        CREATE TABLE IF NOT EXISTS entries (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            feed_id INTEGER NOT NULL REFERENCES feeds(id) ON DELETE CASCADE,
            identity_key TEXT NOT NULL,
            title TEXT NOT NULL DEFAULT '',
            link TEXT NOT NULL DEFAULT '',
            published_at INTEGER,
            summary TEXT NOT NULL DEFAULT '',
            full_content TEXT,
            read INTEGER NOT NULL DEFAULT 0,
            UNIQUE (feed_id, identity_key)
        );

        CREATE INDEX IF NOT EXISTS entries_by_feed ON entries(feed_id, published_at);
    )");
}

Feed FeedStore::feedFromRow(const Statement& stmt) {
    Feed feed;
    feed.id = stmt.getInt64(0);
    feed.url = stmt.getString(1);
    feed.title = stmt.getString(2);
    feed.lastSyncAt = stmt.getOptionalInt64(3);
    feed.lastSyncStatus = statusFromText(stmt.getOptionalString(4));
    feed.lastSyncMessage = stmt.getString(5);
    feed.collapsed = stmt.getInt64(6) != 0;
    return feed;
}

void FeedStore::requireFeed(FeedId id) const {
    auto stmt = db_->prepare("SELECT 1 FROM feeds WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) {
        throw ReferentialError("feed " + std::to_string(id) + " does not exist");
    }
}

FeedId FeedStore::upsertFeed(const std::string& url) {
    std::string cleanUrl = trim(url);
    if (cleanUrl.empty()) throw StorageError("feed URL is empty");

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    auto insert = db_->prepare("INSERT OR IGNORE INTO feeds (url) VALUES (?)");
    insert.bind(1, cleanUrl);
    insert.execute();

    auto select = db_->prepare("SELECT id FROM feeds WHERE url = ?");
    select.bind(1, cleanUrl);
    if (!select.step()) throw StorageError("feed " + cleanUrl + " vanished after insert");
    FeedId id = select.getInt64(0);
    tx.commit();
    return id;
}

void FeedStore::deleteFeed(FeedId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    auto stmt = db_->prepare("DELETE FROM feeds WHERE id = ?");
    stmt.bind(1, id);
    stmt.execute();
    int removed = db_->changes();
    tx.commit();
    if (removed == 0) spdlog::warn("deleteFeed: feed {} was already gone", id);
    else spdlog::info("Deleted feed {}", id);
}

std::vector<Feed> FeedStore::listFeeds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Feed> feeds;
    auto stmt = db_->prepare(std::string("SELECT ") + kFeedColumns +
                             " FROM feeds ORDER BY lower(CASE WHEN title = '' THEN url ELSE title END), url");
    while (stmt.step()) feeds.push_back(feedFromRow(stmt));
    return feeds;
}

Feed FeedStore::getFeed(FeedId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_->prepare(std::string("SELECT ") + kFeedColumns + " FROM feeds WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) throw StorageError("feed " + std::to_string(id) + " not found");
    return feedFromRow(stmt);
}

std::optional<Feed> FeedStore::findFeedByUrl(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_->prepare(std::string("SELECT ") + kFeedColumns + " FROM feeds WHERE url = ?");
    stmt.bind(1, trim(url));
    if (!stmt.step()) return std::nullopt;
    return feedFromRow(stmt);
}

void FeedStore::setFeedTitle(FeedId id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    requireFeed(id);
    auto stmt = db_->prepare("UPDATE feeds SET title = ? WHERE id = ?");
    stmt.bindAll(title, id);
    stmt.execute();
    tx.commit();
}

void FeedStore::setCollapsed(FeedId id, bool collapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    requireFeed(id);
    auto stmt = db_->prepare("UPDATE feeds SET collapsed = ? WHERE id = ?");
    stmt.bindAll(collapsed, id);
    stmt.execute();
    tx.commit();
}

void FeedStore::recordSync(FeedId id, SyncStatus status, const std::string& message, Timestamp when) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    requireFeed(id);
    writeSync(id, status, message, when);
    tx.commit();
}

void FeedStore::writeSync(FeedId id, SyncStatus status, const std::string& message, Timestamp when) {
    auto stmt = db_->prepare(
        "UPDATE feeds SET last_sync_at = ?, last_sync_status = ?, last_sync_message = ? WHERE id = ?");
    stmt.bindAll(when, statusToText(status), message, id);
    stmt.execute();
}

UpsertCounts FeedStore::upsertEntries(FeedId feedId, const std::vector<ParsedEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    requireFeed(feedId);
    UpsertCounts counts = writeEntries(feedId, entries);
    tx.commit();
    spdlog::debug("Feed {}: {} inserted, {} updated", feedId, counts.inserted, counts.updated);
    return counts;
}

AddedFeed FeedStore::addFeedWithEntries(const std::string& url, const std::string& title,
                                        const std::vector<ParsedEntry>& entries, Timestamp when) {
    std::string cleanUrl = trim(url);
    if (cleanUrl.empty()) throw StorageError("feed URL is empty");

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    auto insert = db_->prepare("INSERT INTO feeds (url, title) VALUES (?, ?)");
    insert.bindAll(cleanUrl, title);
    insert.execute();

    AddedFeed added;
    added.id = db_->lastInsertRowId();
    added.counts = writeEntries(added.id, entries);
    writeSync(added.id, SyncStatus::Ok, describeCounts(added.counts), when);
    tx.commit();
    spdlog::debug("Added feed {} as {} with {} entries", cleanUrl, added.id, added.counts.inserted);
    return added;
}

UpsertCounts FeedStore::writeEntries(FeedId feedId, const std::vector<ParsedEntry>& entries) {
    auto select = db_->prepare(
        "SELECT id, title, summary, published_at FROM entries WHERE feed_id = ? AND identity_key = ?");
    auto insert = db_->prepare(
        "INSERT INTO entries (feed_id, identity_key, title, link, published_at, summary) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    auto update = db_->prepare(
        "UPDATE entries SET title = ?, summary = ?, published_at = COALESCE(published_at, ?) WHERE id = ?");

    UpsertCounts counts;
    for (const auto& parsed : entries) {
        std::string key = parsed.identityKey();
        if (key.empty()) {
            spdlog::warn("Skipping entry without guid, link or title in feed {}", feedId);
            continue;
        }

        select.reset();
        select.bindAll(feedId, key);
        if (select.step()) {
            EntryId id = select.getInt64(0);
            bool titleChanged = select.getString(1) != parsed.title;
            bool summaryChanged = select.getString(2) != parsed.summary;
            bool dateArrived = parsed.publishedAt && select.isNull(3);
            if (titleChanged || summaryChanged || dateArrived) {
                update.reset();
                update.bindAll(parsed.title, parsed.summary, parsed.publishedAt, id);
                update.execute();
                counts.updated++;
            }
        } else {
            insert.reset();
            insert.bindAll(feedId, key, parsed.title, parsed.link, parsed.publishedAt, parsed.summary);
            insert.execute();
            counts.inserted++;
        }
    }
    return counts;
}

std::vector<Entry> FeedStore::listEntries(FeedId feedId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entry> result;
    auto stmt = db_->prepare(std::string("SELECT ") + kEntryColumns +
                             " FROM entries WHERE feed_id = ?"
                             " ORDER BY published_at IS NULL, published_at DESC, id DESC");
    stmt.bind(1, feedId);
    while (stmt.step()) result.push_back(entryFromRow(stmt));
    return result;
}

Entry FeedStore::getEntry(EntryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_->prepare(std::string("SELECT ") + kEntryColumns + ", full_content FROM entries WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) throw StorageError("entry " + std::to_string(id) + " not found");
    Entry entry = entryFromRow(stmt);
    entry.fullContent = stmt.getOptionalString(9);
    return entry;
}

void FeedStore::setFullContent(EntryId id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    auto stmt = db_->prepare("UPDATE entries SET full_content = ? WHERE id = ?");
    stmt.bindAll(text, id);
    stmt.execute();
    if (db_->changes() == 0) {
        throw ReferentialError("entry " + std::to_string(id) + " does not exist");
    }
    tx.commit();
}

void FeedStore::markRead(EntryId id) { setRead(id, true); }
void FeedStore::markUnread(EntryId id) { setRead(id, false); }

void FeedStore::setRead(EntryId id, bool read) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    auto stmt = db_->prepare("UPDATE entries SET read = ? WHERE id = ?");
    stmt.bindAll(read, id);
    stmt.execute();
    if (db_->changes() == 0) {
        throw ReferentialError("entry " + std::to_string(id) + " does not exist");
    }
    tx.commit();
}

int FeedStore::expireEntries(Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(*db_);
    auto stmt = db_->prepare("DELETE FROM entries WHERE published_at IS NOT NULL AND published_at < ?");
    stmt.bind(1, cutoff);
    stmt.execute();
    int removed = db_->changes();
    tx.commit();
    if (removed > 0) spdlog::info("Expired {} entries older than {}", removed, formatTimestamp(cutoff));
    return removed;
}

}
