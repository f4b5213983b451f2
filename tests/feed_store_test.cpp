#include <gtest/gtest.h>
#include "TestFakes.hpp"
#include "storage/FeedStore.hpp"
#include "utils/Errors.hpp"

using namespace Pequod;
using Pequod::Testing::TempDir;
using Pequod::Testing::makeEntry;

class FeedStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<FeedStore>(dir_.file("feeds.db"));
    }

    TempDir dir_;
    std::unique_ptr<FeedStore> store_;
};

TEST_F(FeedStoreTest, UpsertFeedIsIdempotent) {
    FeedId first = store_->upsertFeed("https://example.com/rss");
    FeedId second = store_->upsertFeed("  https://example.com/rss ");
    EXPECT_EQ(first, second);
    ASSERT_EQ(store_->listFeeds().size(), 1u);
    EXPECT_TRUE(store_->listFeeds()[0].collapsed);
    EXPECT_EQ(store_->listFeeds()[0].lastSyncStatus, SyncStatus::Never);
}

TEST_F(FeedStoreTest, EmptyUrlIsRejected) {
    EXPECT_THROW(store_->upsertFeed("   "), StorageError);
}

TEST_F(FeedStoreTest, FeedsAreOrderedByTitleThenUrl) {
    FeedId zebra = store_->upsertFeed("https://z.example/feed");
    FeedId apple = store_->upsertFeed("https://a.example/feed");
    FeedId untitled = store_->upsertFeed("https://m.example/feed");
    store_->setFeedTitle(zebra, "zebra news");
    store_->setFeedTitle(apple, "Apple News");

    auto feeds = store_->listFeeds();
    ASSERT_EQ(feeds.size(), 3u);
    EXPECT_EQ(feeds[0].id, apple);
    EXPECT_EQ(feeds[1].id, untitled);
    EXPECT_EQ(feeds[2].id, zebra);
    EXPECT_EQ(feeds[1].displayTitle(), "https://m.example/feed");
}

TEST_F(FeedStoreTest, ResyncDoesNotDuplicateEntries) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    std::vector<ParsedEntry> batch = {makeEntry("a", "E1", 100), makeEntry("b", "E2", 200)};

    UpsertCounts first = store_->upsertEntries(feed, batch);
    EXPECT_EQ(first.inserted, 2);
    EXPECT_EQ(first.updated, 0);

    UpsertCounts second = store_->upsertEntries(feed, batch);
    EXPECT_EQ(second.inserted, 0);
    EXPECT_EQ(second.updated, 0);
    EXPECT_EQ(store_->listEntries(feed).size(), 2u);
}

TEST_F(FeedStoreTest, OverlappingBatchesStoreDistinctKeysOnly) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("a", "A"), makeEntry("b", "B")});
    store_->upsertEntries(feed, {makeEntry("b", "B"), makeEntry("c", "C")});
    store_->upsertEntries(feed, {makeEntry("a", "A"), makeEntry("c", "C"), makeEntry("d", "D")});
    EXPECT_EQ(store_->listEntries(feed).size(), 4u);
}

TEST_F(FeedStoreTest, UpdateKeepsReadFlagAndFullContent) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("a", "Old title", std::nullopt, "old")});
    EntryId id = store_->listEntries(feed)[0].id;
    store_->markRead(id);
    store_->setFullContent(id, "cached article");

    UpsertCounts counts = store_->upsertEntries(feed, {makeEntry("a", "New title", 500, "new")});
    EXPECT_EQ(counts.updated, 1);

    Entry entry = store_->getEntry(id);
    EXPECT_EQ(entry.title, "New title");
    EXPECT_EQ(entry.summary, "new");
    EXPECT_EQ(entry.publishedAt, 500);
    EXPECT_TRUE(entry.read);
    ASSERT_TRUE(entry.fullContent.has_value());
    EXPECT_EQ(*entry.fullContent, "cached article");
}

TEST_F(FeedStoreTest, KnownPublishTimeIsNotReplaced) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("a", "A", 100)});
    UpsertCounts counts = store_->upsertEntries(feed, {makeEntry("a", "A", 900)});
    EXPECT_EQ(counts.updated, 0);
    EXPECT_EQ(store_->listEntries(feed)[0].publishedAt, 100);
}

TEST_F(FeedStoreTest, EntriesListNewestFirstUndatedLast) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("old", "old", 100), makeEntry("none", "none"),
                                 makeEntry("new", "new", 300)});
    auto entries = store_->listEntries(feed);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].link, "new");
    EXPECT_EQ(entries[1].link, "old");
    EXPECT_EQ(entries[2].link, "none");
    EXPECT_FALSE(entries[0].fullContent.has_value());
}

TEST_F(FeedStoreTest, ListingReportsCachedContent) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("a", "A")});
    EntryId id = store_->listEntries(feed)[0].id;
    EXPECT_FALSE(store_->listEntries(feed)[0].hasFullContent);
    store_->setFullContent(id, "text");
    EXPECT_TRUE(store_->listEntries(feed)[0].hasFullContent);
}

TEST_F(FeedStoreTest, EntriesWithoutIdentityAreSkipped) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    ParsedEntry anonymous;
    anonymous.summary = "nothing to key on";
    UpsertCounts counts = store_->upsertEntries(feed, {anonymous, makeEntry("a", "A")});
    EXPECT_EQ(counts.inserted, 1);
}

TEST_F(FeedStoreTest, WritingEntriesForMissingFeedIsReferentialError) {
    EXPECT_THROW(store_->upsertEntries(4242, {makeEntry("a", "A")}), ReferentialError);
    EXPECT_THROW(store_->markRead(4242), ReferentialError);
    EXPECT_THROW(store_->setFullContent(4242, "x"), ReferentialError);
    EXPECT_THROW(store_->setCollapsed(4242, false), ReferentialError);
}

TEST_F(FeedStoreTest, MissingEntryIsStorageError) {
    EXPECT_THROW(store_->getEntry(4242), StorageError);
    EXPECT_THROW(store_->getFeed(4242), StorageError);
}

TEST_F(FeedStoreTest, DeleteCascadesToEntries) {
    FeedId keep = store_->upsertFeed("https://keep.example/rss");
    FeedId drop = store_->upsertFeed("https://drop.example/rss");
    store_->upsertEntries(keep, {makeEntry("k", "K")});
    store_->upsertEntries(drop, {makeEntry("d1", "D1"), makeEntry("d2", "D2")});
    EntryId dropped = store_->listEntries(drop)[0].id;

    store_->deleteFeed(drop);
    EXPECT_EQ(store_->listFeeds().size(), 1u);
    EXPECT_TRUE(store_->listEntries(drop).empty());
    EXPECT_THROW(store_->getEntry(dropped), StorageError);
    EXPECT_EQ(store_->listEntries(keep).size(), 1u);
}

TEST_F(FeedStoreTest, SameKeyInDifferentFeedsIsIndependent) {
    FeedId a = store_->upsertFeed("https://a.example/rss");
    FeedId b = store_->upsertFeed("https://b.example/rss");
    EXPECT_EQ(store_->upsertEntries(a, {makeEntry("shared", "S")}).inserted, 1);
    EXPECT_EQ(store_->upsertEntries(b, {makeEntry("shared", "S")}).inserted, 1);
}

TEST_F(FeedStoreTest, RecordSyncAndCollapsedArePersisted) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->recordSync(feed, SyncStatus::Error, "HTTP status 500", 1234);
    store_->setCollapsed(feed, false);

    FeedStore reopened(dir_.file("feeds.db"));
    Feed stored = reopened.getFeed(feed);
    EXPECT_EQ(stored.lastSyncStatus, SyncStatus::Error);
    EXPECT_EQ(stored.lastSyncMessage, "HTTP status 500");
    EXPECT_EQ(stored.lastSyncAt, 1234);
    EXPECT_FALSE(stored.collapsed);
}

TEST_F(FeedStoreTest, ReadFlagToggles) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("a", "A")});
    EntryId id = store_->listEntries(feed)[0].id;
    store_->markRead(id);
    EXPECT_TRUE(store_->getEntry(id).read);
    store_->markUnread(id);
    EXPECT_FALSE(store_->getEntry(id).read);
}

TEST_F(FeedStoreTest, ExpireRemovesOnlyOldDatedEntries) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    store_->upsertEntries(feed, {makeEntry("old", "old", 100), makeEntry("new", "new", 1000),
                                 makeEntry("undated", "undated")});
    EXPECT_EQ(store_->expireEntries(500), 1);
    auto entries = store_->listEntries(feed);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].link, "new");
    EXPECT_EQ(entries[1].link, "undated");
}

TEST_F(FeedStoreTest, FindFeedByUrl) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    auto found = store_->findFeedByUrl("https://example.com/rss");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, feed);
    EXPECT_FALSE(store_->findFeedByUrl("https://other.example/rss").has_value());
}

TEST(FeedStoreOpenTest, UnopenablePathIsStorageError) {
    EXPECT_THROW(FeedStore("/nonexistent-dir/definitely/missing/feeds.db"), StorageError);
}

TEST_F(FeedStoreTest, FailedBatchLeavesNothingBehind) {
    FeedId feed = store_->upsertFeed("https://example.com/rss");
    {
        Database side(dir_.file("feeds.db"));
        side.execute("CREATE TRIGGER reject_bad BEFORE INSERT ON entries WHEN NEW.identity_key = 'bad' "
                     "BEGIN SELECT RAISE(ABORT, 'rejected by test'); END");
    }
    std::vector<ParsedEntry> batch = {makeEntry("good", "Good"), makeEntry("bad", "Bad"), makeEntry("late", "Late")};
    EXPECT_THROW(store_->upsertEntries(feed, batch), StorageError);
    EXPECT_TRUE(store_->listEntries(feed).empty());
}

TEST_F(FeedStoreTest, AddFeedWithEntriesWritesEverything) {
    AddedFeed added = store_->addFeedWithEntries(" https://example.com/rss ", "Example",
                                                 {makeEntry("a", "A"), makeEntry("b", "B")}, 1136214245);
    EXPECT_EQ(added.counts.inserted, 2);

    Feed feed = store_->getFeed(added.id);
    EXPECT_EQ(feed.url, "https://example.com/rss");
    EXPECT_EQ(feed.title, "Example");
    EXPECT_EQ(feed.lastSyncStatus, SyncStatus::Ok);
    EXPECT_EQ(feed.lastSyncMessage, "2 new, 0 updated");
    EXPECT_EQ(feed.lastSyncAt, std::optional<Timestamp>(1136214245));
    EXPECT_EQ(store_->listEntries(added.id).size(), 2u);
}

TEST_F(FeedStoreTest, AddFeedWithEntriesRejectsKnownUrl) {
    FeedId existing = store_->upsertFeed("https://example.com/rss");
    EXPECT_THROW(store_->addFeedWithEntries("https://example.com/rss", "Again", {makeEntry("a", "A")}, 0),
                 StorageError);
    EXPECT_TRUE(store_->listEntries(existing).empty());
    EXPECT_EQ(store_->getFeed(existing).title, "");
}

TEST_F(FeedStoreTest, FailedAddLeavesNoFeed) {
    {
        Database side(dir_.file("feeds.db"));
        side.execute("CREATE TRIGGER disk_full BEFORE INSERT ON entries "
                     "BEGIN SELECT RAISE(ABORT, 'disk full'); END");
    }
    EXPECT_THROW(store_->addFeedWithEntries("https://example.com/rss", "Example", {makeEntry("a", "A")}, 0),
                 StorageError);
    EXPECT_FALSE(store_->findFeedByUrl("https://example.com/rss").has_value());
}
