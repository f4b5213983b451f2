#include "ui/NavigationTree.hpp"
#include <algorithm>
#include <stdexcept>

namespace Pequod {

void NavigationTree::rebuild(std::vector<FeedNode> feeds) {
    std::vector<TreeRow> oldRows = std::move(rows_);
    int oldSelected = selected_;

    feeds_ = std::move(feeds);
    feedSlot_.clear();
    entrySlot_.clear();
    for (size_t i = 0; i < feeds_.size(); ++i) {
        feedSlot_[feeds_[i].feed.id] = i;
        for (size_t j = 0; j < feeds_[i].entries.size(); ++j) {
            entrySlot_[feeds_[i].entries[j].id] = {i, j};
        }
    }
    layout();
    restoreSelection(oldRows, oldSelected);
}

void NavigationTree::layout() {
    rows_.clear();
    feedRow_.clear();
    entryRow_.clear();
    for (const auto& node : feeds_) {
        feedRow_[node.feed.id] = static_cast<int>(rows_.size());
        rows_.push_back(TreeRow{RowKind::Feed, node.feed.id, 0, 0});
        if (node.feed.collapsed) continue;
        for (const auto& entry : node.entries) {
            entryRow_[entry.id] = static_cast<int>(rows_.size());
            rows_.push_back(TreeRow{RowKind::Entry, node.feed.id, entry.id, 1});
        }
    }
}

std::optional<int> NavigationTree::indexOfRow(const TreeRow& row) const {
    return row.kind == RowKind::Feed ? indexOfFeed(row.feedId) : indexOfEntry(row.entryId);
}

void NavigationTree::restoreSelection(const std::vector<TreeRow>& oldRows, int oldSelected) {
    if (rows_.empty() || oldRows.empty()) {
        selected_ = 0;
        return;
    }
    oldSelected = std::clamp(oldSelected, 0, static_cast<int>(oldRows.size()) - 1);
    for (int i = oldSelected; i >= 0; --i) {
        if (auto index = indexOfRow(oldRows[i])) {
            selected_ = *index;
            return;
        }
    }
    selected_ = 0;
}

bool NavigationTree::toggleCollapse(FeedId feedId) {
    bool collapsed = !isCollapsed(feedId);
    setCollapsed(feedId, collapsed);
    return collapsed;
}

void NavigationTree::setCollapsed(FeedId feedId, bool collapsed) {
    auto it = feedSlot_.find(feedId);
    if (it == feedSlot_.end()) return;
    Feed& feed = feeds_[it->second].feed;
    if (feed.collapsed == collapsed) return;

    std::vector<TreeRow> oldRows = rows_;
    int oldSelected = selected_;
    feed.collapsed = collapsed;
    layout();
    restoreSelection(oldRows, oldSelected);
}

bool NavigationTree::isCollapsed(FeedId feedId) const {
    const Feed* f = feed(feedId);
    return f ? f->collapsed : true;
}

const TreeRow& NavigationTree::rowAt(int index) const {
    if (index < 0 || index >= rowCount()) {
        throw std::out_of_range("row " + std::to_string(index) + " out of range");
    }
    return rows_[index];
}

std::optional<int> NavigationTree::indexOfEntry(EntryId entryId) const {
    auto it = entryRow_.find(entryId);
    if (it == entryRow_.end()) return std::nullopt;
    return it->second;
}

std::optional<int> NavigationTree::indexOfFeed(FeedId feedId) const {
    auto it = feedRow_.find(feedId);
    if (it == feedRow_.end()) return std::nullopt;
    return it->second;
}

void NavigationTree::select(int index) {
    if (rows_.empty()) {
        selected_ = 0;
        return;
    }
    selected_ = std::clamp(index, 0, rowCount() - 1);
}

const TreeRow* NavigationTree::selectedRow() const {
    if (rows_.empty()) return nullptr;
    return &rows_[selected_];
}

const Feed* NavigationTree::feed(FeedId feedId) const {
    auto it = feedSlot_.find(feedId);
    return it == feedSlot_.end() ? nullptr : &feeds_[it->second].feed;
}

const Entry* NavigationTree::entry(EntryId entryId) const {
    auto it = entrySlot_.find(entryId);
    if (it == entrySlot_.end()) return nullptr;
    return &feeds_[it->second.first].entries[it->second.second];
}

int NavigationTree::unreadCount(FeedId feedId) const {
    auto it = feedSlot_.find(feedId);
    if (it == feedSlot_.end()) return 0;
    const auto& entries = feeds_[it->second].entries;
    return static_cast<int>(std::count_if(entries.begin(), entries.end(), [](const Entry& e) { return !e.read; }));
}

void NavigationTree::setEntryRead(EntryId entryId, bool read) {
    auto it = entrySlot_.find(entryId);
    if (it == entrySlot_.end()) return;
    feeds_[it->second.first].entries[it->second.second].read = read;
}

}
