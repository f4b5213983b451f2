#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "utils/TimeUtils.hpp"

namespace Pequod {

using FeedId = std::int64_t;
using EntryId = std::int64_t;

enum class SyncStatus {
    Never,
    Ok,
    Error
};

struct Feed {
    FeedId id = 0;
    std::string url;
    std::string title;
    std::optional<Timestamp> lastSyncAt;
    SyncStatus lastSyncStatus = SyncStatus::Never;
    std::string lastSyncMessage;
    bool collapsed = true;

    // Title, or the URL until a sync has supplied one.
    const std::string& displayTitle() const { return title.empty() ? url : title; }
};

struct Entry {
    EntryId id = 0;
    FeedId feedId = 0;
    std::string identityKey;
    std::string title;
    std::string link;
    std::optional<Timestamp> publishedAt;
    std::string summary;
    // Only loaded by FeedStore::getEntry; listings set hasFullContent instead.
    std::optional<std::string> fullContent;
    bool hasFullContent = false;
    bool read = false;
};

// One item as produced by the feed parser, before reconciliation.
struct ParsedEntry {
    std::optional<std::string> guid;
    std::string link;
    std::string title;
    std::optional<Timestamp> publishedAt;
    std::string summary;

    // GUID, else link, else "title:<title>"; empty when nothing identifies it.
    std::string identityKey() const;
};

struct ParsedFeed {
    std::string title;
    std::vector<ParsedEntry> entries;
};

struct UpsertCounts {
    int inserted = 0;
    int updated = 0;
};

// "N new, M updated"
std::string describeCounts(const UpsertCounts& counts);

struct AddedFeed {
    FeedId id = 0;
    UpsertCounts counts;
};

}
