#pragma once
#include <optional>
#include <unordered_map>
#include <vector>
#include "storage/Models.hpp"

namespace Pequod {

enum class RowKind {
    Feed,
    Entry
};

struct TreeRow {
    RowKind kind = RowKind::Feed;
    FeedId feedId = 0;
    EntryId entryId = 0;
    int depth = 0;
};

struct FeedNode {
    Feed feed;
    // Newest first.
    std::vector<Entry> entries;
};

// Collapsible feed/entry hierarchy flattened into addressable rows. Rows hold
// identities only; details live in the feed and entry tables.
class NavigationTree {
public:
    // Keeps the selected feed or entry selected when it survives, otherwise
    // selects the nearest preceding row that does.
    void rebuild(std::vector<FeedNode> feeds);

    // Returns the new collapsed state.
    bool toggleCollapse(FeedId feedId);
    void setCollapsed(FeedId feedId, bool collapsed);
    bool isCollapsed(FeedId feedId) const;

    const TreeRow& rowAt(int index) const;
    int rowCount() const { return static_cast<int>(rows_.size()); }
    std::optional<int> indexOfEntry(EntryId entryId) const;
    std::optional<int> indexOfFeed(FeedId feedId) const;

    void select(int index);
    int selectedIndex() const { return selected_; }
    const TreeRow* selectedRow() const;

    const Feed* feed(FeedId feedId) const;
    const Entry* entry(EntryId entryId) const;
    int unreadCount(FeedId feedId) const;
    int feedCount() const { return static_cast<int>(feeds_.size()); }

    // Updates the in-memory read flag after the store has been written.
    void setEntryRead(EntryId entryId, bool read);

private:
    void layout();
    void restoreSelection(const std::vector<TreeRow>& oldRows, int oldSelected);
    std::optional<int> indexOfRow(const TreeRow& row) const;

    std::vector<FeedNode> feeds_;
    std::unordered_map<FeedId, size_t> feedSlot_;
    std::unordered_map<EntryId, std::pair<size_t, size_t>> entrySlot_;

    std::vector<TreeRow> rows_;
    std::unordered_map<FeedId, int> feedRow_;
    std::unordered_map<EntryId, int> entryRow_;
    int selected_ = 0;
};

}
