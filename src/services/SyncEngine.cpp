#include "services/SyncEngine.hpp"
#include "utils/Errors.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>
#include <thread>

namespace Pequod {

namespace {

void fail(SyncResult& result, SyncErrorKind kind, const std::string& message) {
    result.status = SyncStatus::Error;
    result.errorKind = kind;
    result.message = message;
}

}

SyncEngine::SyncEngine(FeedStore& store, Transport& transport, FeedParser& parser, SyncOptions options)
    : store_(store), transport_(transport), parser_(parser), options_(options), cancelled_(false) {
    if (options_.concurrency < 1) options_.concurrency = 1;
}

std::vector<ParsedEntry> SyncEngine::withinAgeLimit(const std::vector<ParsedEntry>& entries) const {
    if (options_.maxEntryAgeSeconds <= 0) return entries;
    Timestamp cutoff = nowTimestamp() - options_.maxEntryAgeSeconds;
    std::vector<ParsedEntry> kept;
    kept.reserve(entries.size());
    for (const auto& entry : entries) {
        if (entry.publishedAt && *entry.publishedAt < cutoff) continue;
        kept.push_back(entry);
    }
    return kept;
}

SyncResult SyncEngine::syncFeed(const Feed& feed) {
    SyncResult result;
    result.feedId = feed.id;
    result.feedUrl = feed.url;

    if (cancelled_) {
        fail(result, SyncErrorKind::Cancelled, "sync cancelled");
        return result;
    }

    try {
        FetchedDocument doc = transport_.fetch(feed.url, options_.feedTimeoutSeconds);
        ParsedFeed parsed = parser_.parse(doc.body);
        UpsertCounts counts = store_.upsertEntries(feed.id, withinAgeLimit(parsed.entries));
        if (!parsed.title.empty() && parsed.title != feed.title) {
            store_.setFeedTitle(feed.id, parsed.title);
        }
        result.status = SyncStatus::Ok;
        result.insertedCount = counts.inserted;
        result.updatedCount = counts.updated;
        result.message = describeCounts(counts);
    } catch (const TimeoutError& e) {
        fail(result, SyncErrorKind::Timeout, e.what());
    } catch (const FetchError& e) {
        fail(result, cancelled_ ? SyncErrorKind::Cancelled : SyncErrorKind::Fetch, e.what());
    } catch (const ParseError& e) {
        fail(result, SyncErrorKind::Parse, e.what());
    } catch (const StorageError& e) {
        fail(result, SyncErrorKind::Storage, e.what());
    } catch (const ReferentialError& e) {
        spdlog::error("Referential failure syncing {}: {}", feed.url, e.what());
        fail(result, SyncErrorKind::Referential, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure syncing {}: {}", feed.url, e.what());
        fail(result, SyncErrorKind::Internal, e.what());
    }

    if (result.ok()) {
        spdlog::info("Synced {}: {}", feed.url, result.message);
    } else {
        spdlog::warn("Sync of {} failed: {}", feed.url, result.message);
    }
    recordOutcome(result);
    return result;
}

void SyncEngine::recordOutcome(const SyncResult& result) {
    // The feed is gone; nothing to record against.
    if (result.errorKind == SyncErrorKind::Referential) return;
    try {
        store_.recordSync(result.feedId, result.status, result.message, nowTimestamp());
    } catch (const StorageError& e) {
        spdlog::warn("Could not record sync outcome for feed {}: {}", result.feedId, e.what());
    } catch (const ReferentialError& e) {
        spdlog::error("Feed {} disappeared before its sync was recorded: {}", result.feedId, e.what());
    }
}

std::vector<SyncResult> SyncEngine::syncAll(const std::vector<Feed>& feeds) {
    std::vector<SyncResult> results(feeds.size());
    if (feeds.empty()) return results;

    std::atomic<size_t> next(0);
    auto worker = [&]() {
        for (size_t i = next++; i < feeds.size(); i = next++) {
            try {
                results[i] = syncFeed(feeds[i]);
            } catch (const std::exception& e) {
                spdlog::error("Sync worker failed on {}: {}", feeds[i].url, e.what());
                results[i].feedId = feeds[i].id;
                results[i].feedUrl = feeds[i].url;
                fail(results[i], SyncErrorKind::Internal, e.what());
            }
        }
    };

    size_t workerCount = std::min(static_cast<size_t>(options_.concurrency), feeds.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    try {
        for (size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        // Started workers pick up the remaining feeds.
        spdlog::error("Could only start {} of {} sync workers: {}", workers.size(), workerCount, e.what());
        if (workers.empty()) worker();
    }
    for (auto& t : workers) {
        t.join();
    }

    size_t failed = std::count_if(results.begin(), results.end(), [](const SyncResult& r) { return !r.ok(); });
    spdlog::info("Synced {} feeds, {} failed", feeds.size(), failed);
    return results;
}

bool SyncEngine::discoverFeed(const std::string& html, const std::string& pageUrl,
                              std::string& feedUrl, ParsedFeed& parsed) {
    for (const auto& candidate : parser_.discoverFeedLinks(html, pageUrl)) {
        if (cancelled_) return false;
        try {
            FetchedDocument doc = transport_.fetch(candidate, options_.feedTimeoutSeconds);
            parsed = parser_.parse(doc.body);
            feedUrl = candidate;
            spdlog::info("Discovered feed {} from {}", candidate, pageUrl);
            return true;
        } catch (const FetchError& e) {
            spdlog::debug("Feed candidate {} not reachable: {}", candidate, e.what());
        } catch (const ParseError& e) {
            spdlog::debug("Feed candidate {} is not a feed: {}", candidate, e.what());
        }
    }
    return false;
}

AddFeedResult SyncEngine::addFeed(const std::string& url) {
    AddFeedResult result;
    std::string requested = trim(url);
    result.feedUrl = requested;
    if (requested.empty()) {
        result.message = "feed URL is empty";
        return result;
    }

    try {
        if (store_.findFeedByUrl(requested)) {
            result.message = "feed already exists";
            return result;
        }

        FetchedDocument doc = transport_.fetch(requested, options_.feedTimeoutSeconds);
        std::string feedUrl = requested;
        ParsedFeed parsed;
        try {
            parsed = parser_.parse(doc.body);
        } catch (const ParseError& e) {
            spdlog::info("{} is not a feed ({}), trying autodiscovery", requested, e.what());
            if (!discoverFeed(doc.body, requested, feedUrl, parsed)) {
                throw ParseError("no feed found at " + requested);
            }
            if (store_.findFeedByUrl(feedUrl)) {
                result.feedUrl = feedUrl;
                result.message = "feed already exists";
                return result;
            }
        }

        AddedFeed added = store_.addFeedWithEntries(feedUrl, parsed.title, withinAgeLimit(parsed.entries),
                                                    nowTimestamp());
        result.ok = true;
        result.feedId = added.id;
        result.feedUrl = feedUrl;
        result.title = parsed.title.empty() ? feedUrl : parsed.title;
        result.insertedCount = added.counts.inserted;
        result.message = "Added " + result.title;
        spdlog::info("Added feed {} with {} entries", feedUrl, added.counts.inserted);
    } catch (const FetchError& e) {
        result.message = e.what();
    } catch (const ParseError& e) {
        result.message = e.what();
    } catch (const StorageError& e) {
        result.message = e.what();
    } catch (const ReferentialError& e) {
        spdlog::error("Referential failure adding {}: {}", requested, e.what());
        result.message = e.what();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure adding {}: {}", requested, e.what());
        result.message = e.what();
    }

    if (!result.ok) spdlog::warn("Failed to add feed {}: {}", requested, result.message);
    return result;
}

void SyncEngine::cancel() {
    cancelled_ = true;
    transport_.cancelAll();
}

}
