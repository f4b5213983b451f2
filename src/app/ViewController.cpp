#include "app/ViewController.hpp"
#include "utils/Errors.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Pequod {

namespace {

const char kSpinner[] = {'/', '-', '\\', '|'};

const std::vector<std::string> kFeedsHelp = {
    "j / Down        next row",
    "k / Up          previous row",
    "Ctrl-d / Ctrl-u half page down / up",
    "gg / G          first / last row",
    "Enter           expand feed or read entry",
    "c               collapse feed",
    "a               add feed",
    "d               delete feed",
    "s               sync all feeds",
    "h               this help",
    "q / Esc         quit",
};

const std::vector<std::string> kEntryHelp = {
    "j / Down        scroll down",
    "k / Up          scroll up",
    "Ctrl-d / Ctrl-u half page down / up",
    "gg / G          top / bottom",
    "f               fetch full article",
    "o               open in browser",
    "h               this help",
    "q / Esc         back to feeds",
};

std::string toUtf8(const std::u32string& text) {
    std::string out;
    for (char32_t cp : text) out += encodeUtf8(cp);
    return out;
}

std::string formatDate(const std::optional<Timestamp>& ts) {
    return ts ? formatTimestamp(*ts) : "";
}

}

ViewController::ViewController(FeedStore& store, SyncEngine& engine, ContentResolver& resolver,
                               BrowserLauncher& browser, BackgroundRunner& runner)
    : store_(store), engine_(engine), resolver_(resolver), browser_(browser), runner_(runner),
      view_(ViewMode::Feeds), overlay_(Overlay::None), width_(80), height_(24), treeScroll_(0),
      openEntryId_(0), showingFullContent_(false), bodyScroll_(0), promptCursor_(0), deleteTarget_(0),
      status_("Press h for help"), syncing_(false), adding_(false), resolving_(false), spinnerFrame_(0) {}

void ViewController::reload() {
    std::vector<FeedNode> nodes;
    try {
        for (auto& feed : store_.listFeeds()) {
            FeedNode node;
            node.entries = store_.listEntries(feed.id);
            node.feed = std::move(feed);
            nodes.push_back(std::move(node));
        }
    } catch (const StorageError& e) {
        spdlog::error("Failed to load feeds: {}", e.what());
        status_ = std::string("Storage error: ") + e.what();
        return;
    }
    tree_.rebuild(std::move(nodes));
    followSelection();
}

void ViewController::setViewport(int width, int height) {
    width_ = std::max(1, width);
    height_ = std::max(1, height);
    followSelection();
    if (view_ == ViewMode::Entry) layoutEntry();
}

int ViewController::listHeight() const {
    return std::max(1, height_ - 2);
}

int ViewController::halfPage() const {
    return std::max(1, (height_ - 2) / 2);
}

void ViewController::tick() {
    if (isBusy()) spinnerFrame_ = (spinnerFrame_ + 1) % 4;
}

bool ViewController::handleKey(const KeyEvent& key) {
    Action action = input_.handle(key, view_, overlay_);
    if (action.command == Command::Pending || action.command == Command::Unknown) return false;

    switch (overlay_) {
        case Overlay::HelpPopup:
            if (action.command == Command::Dismiss) overlay_ = Overlay::None;
            return false;
        case Overlay::ConfirmDelete:
            handleConfirmCommand(action);
            return false;
        case Overlay::AddFeedPrompt:
            handlePromptCommand(action);
            return false;
        case Overlay::None:
            break;
    }

    if (view_ == ViewMode::Feeds) {
        if (action.command == Command::Quit) return true;
        handleFeedsCommand(action);
    } else {
        handleEntryCommand(action);
    }
    return false;
}

void ViewController::handleFeedsCommand(const Action& action) {
    switch (action.command) {
        case Command::MoveDown: moveSelection(1); break;
        case Command::MoveUp: moveSelection(-1); break;
        case Command::HalfPageDown: moveSelection(halfPage()); break;
        case Command::HalfPageUp: moveSelection(-halfPage()); break;
        case Command::Top:
            tree_.select(0);
            followSelection();
            break;
        case Command::Bottom:
            tree_.select(tree_.rowCount() - 1);
            followSelection();
            break;
        case Command::Select: activateSelected(); break;
        case Command::Collapse: collapseSelected(); break;
        case Command::AddFeed:
            prompt_.clear();
            promptCursor_ = 0;
            overlay_ = Overlay::AddFeedPrompt;
            break;
        case Command::DeleteFeed:
            if (const TreeRow* row = tree_.selectedRow()) {
                deleteTarget_ = row->feedId;
                overlay_ = Overlay::ConfirmDelete;
            } else {
                status_ = "No feed selected";
            }
            break;
        case Command::Sync: startSync(); break;
        case Command::Help: overlay_ = Overlay::HelpPopup; break;
        default: break;
    }
}

void ViewController::handleEntryCommand(const Action& action) {
    switch (action.command) {
        case Command::MoveDown: scrollBody(1); break;
        case Command::MoveUp: scrollBody(-1); break;
        case Command::HalfPageDown: scrollBody(halfPage()); break;
        case Command::HalfPageUp: scrollBody(-halfPage()); break;
        case Command::Top: bodyScroll_ = 0; break;
        case Command::Bottom: scrollBody(static_cast<int>(bodyLines_.size())); break;
        case Command::FetchContent: startResolve(); break;
        case Command::OpenBrowser: openInBrowser(); break;
        case Command::Help: overlay_ = Overlay::HelpPopup; break;
        case Command::Back:
            view_ = ViewMode::Feeds;
            followSelection();
            break;
        default: break;
    }
}

void ViewController::handlePromptCommand(const Action& action) {
    switch (action.command) {
        case Command::InsertChar:
            prompt_.insert(prompt_.begin() + promptCursor_, static_cast<char32_t>(action.ch));
            promptCursor_++;
            break;
        case Command::DeleteChar:
            if (promptCursor_ > 0) {
                prompt_.erase(promptCursor_ - 1, 1);
                promptCursor_--;
            }
            break;
        case Command::CursorLeft:
            if (promptCursor_ > 0) promptCursor_--;
            break;
        case Command::CursorRight:
            if (promptCursor_ < prompt_.size()) promptCursor_++;
            break;
        case Command::Submit: submitFeed(); break;
        case Command::Cancel:
            prompt_.clear();
            promptCursor_ = 0;
            overlay_ = Overlay::None;
            break;
        default: break;
    }
}

void ViewController::handleConfirmCommand(const Action& action) {
    if (action.command == Command::Confirm) {
        confirmDelete();
    } else if (action.command == Command::Cancel) {
        overlay_ = Overlay::None;
        deleteTarget_ = 0;
    }
}

void ViewController::moveSelection(int delta) {
    tree_.select(tree_.selectedIndex() + delta);
    followSelection();
}

void ViewController::followSelection() {
    int height = listHeight();
    int selected = tree_.selectedIndex();
    if (selected < treeScroll_) treeScroll_ = selected;
    if (selected >= treeScroll_ + height) treeScroll_ = selected - height + 1;
    int maxScroll = std::max(0, tree_.rowCount() - height);
    treeScroll_ = std::clamp(treeScroll_, 0, maxScroll);
}

void ViewController::scrollBody(int delta) {
    int maxScroll = std::max(0, static_cast<int>(bodyLines_.size()) - listHeight());
    bodyScroll_ = std::clamp(bodyScroll_ + delta, 0, maxScroll);
}

void ViewController::activateSelected() {
    const TreeRow* row = tree_.selectedRow();
    if (!row) return;
    if (row->kind == RowKind::Feed) {
        setFeedCollapsed(row->feedId, !tree_.isCollapsed(row->feedId));
    } else {
        openEntry(row->entryId);
    }
}

void ViewController::collapseSelected() {
    const TreeRow* row = tree_.selectedRow();
    if (!row) return;
    setFeedCollapsed(row->feedId, true);
}

void ViewController::setFeedCollapsed(FeedId feedId, bool collapsed) {
    try {
        store_.setCollapsed(feedId, collapsed);
    } catch (const StorageError& e) {
        status_ = std::string("Could not save feed state: ") + e.what();
    } catch (const ReferentialError& e) {
        spdlog::error("Collapse of missing feed {}: {}", feedId, e.what());
    }
    tree_.setCollapsed(feedId, collapsed);
    followSelection();
}

void ViewController::openEntry(EntryId entryId) {
    Entry entry;
    try {
        store_.markRead(entryId);
        tree_.setEntryRead(entryId, true);
        entry = store_.getEntry(entryId);
    } catch (const StorageError& e) {
        status_ = std::string("Could not open entry: ") + e.what();
        return;
    } catch (const ReferentialError& e) {
        spdlog::error("Opened an entry that is not stored: {}", e.what());
        status_ = "Entry no longer exists";
        return;
    }

    openEntryId_ = entryId;
    showingFullContent_ = entry.fullContent.has_value();
    entryContent_ = showingFullContent_ ? *entry.fullContent : entry.summary;
    view_ = ViewMode::Entry;
    bodyScroll_ = 0;
    layoutEntry();
}

void ViewController::layoutEntry() {
    const Entry* entry = tree_.entry(openEntryId_);
    size_t width = static_cast<size_t>(std::max(1, width_ - 2));

    bodyLines_.clear();
    if (entry) {
        std::string date = formatDate(entry->publishedAt);
        if (!date.empty()) bodyLines_.push_back(date);
        if (!entry->link.empty()) bodyLines_.push_back(entry->link);
        bodyLines_.emplace_back();
    }
    auto content = wrapText(entryContent_.empty() ? "(no content)" : entryContent_, width);
    bodyLines_.insert(bodyLines_.end(), content.begin(), content.end());
    scrollBody(0);
}

void ViewController::confirmDelete() {
    overlay_ = Overlay::None;
    FeedId target = deleteTarget_;
    deleteTarget_ = 0;
    const Feed* feed = tree_.feed(target);
    std::string title = feed ? feed->displayTitle() : std::to_string(target);
    try {
        store_.deleteFeed(target);
        status_ = "Deleted " + title;
    } catch (const StorageError& e) {
        status_ = std::string("Failed to delete feed: ") + e.what();
        return;
    }
    reload();
}

void ViewController::submitFeed() {
    std::string url = trim(toUtf8(prompt_));
    prompt_.clear();
    promptCursor_ = 0;
    overlay_ = Overlay::None;
    if (url.empty()) return;
    if (adding_) {
        status_ = "Already adding a feed";
        return;
    }

    adding_ = true;
    status_ = "Adding " + url;
    bool started = dispatch([this, url]() {
        BackgroundEvent event;
        event.kind = BackgroundEvent::Kind::FeedAdded;
        try {
            event.addResult = engine_.addFeed(url);
        } catch (const std::exception& e) {
            event.addResult = AddFeedResult();
            event.addResult.feedUrl = url;
            event.addResult.message = e.what();
        }
        events_.push(std::move(event));
    });
    if (!started) adding_ = false;
}

void ViewController::startSync() {
    if (syncing_) {
        status_ = "Sync already in progress";
        return;
    }
    std::vector<Feed> feeds;
    try {
        feeds = store_.listFeeds();
    } catch (const StorageError& e) {
        status_ = std::string("Storage error: ") + e.what();
        return;
    }
    if (feeds.empty()) {
        status_ = "No feeds to sync, press a to add one";
        return;
    }

    syncing_ = true;
    status_ = "Syncing " + std::to_string(feeds.size()) + " feeds";
    bool started = dispatch([this, feeds]() {
        BackgroundEvent event;
        event.kind = BackgroundEvent::Kind::SyncFinished;
        try {
            event.syncResults = engine_.syncAll(feeds);
        } catch (const std::exception& e) {
            event.syncResults.clear();
            for (const auto& feed : feeds) {
                SyncResult failed;
                failed.feedId = feed.id;
                failed.feedUrl = feed.url;
                failed.status = SyncStatus::Error;
                failed.errorKind = SyncErrorKind::Internal;
                failed.message = e.what();
                event.syncResults.push_back(failed);
            }
        }
        events_.push(std::move(event));
    });
    if (!started) syncing_ = false;
}

void ViewController::startResolve() {
    if (resolving_) {
        status_ = "Already fetching an article";
        return;
    }
    const Entry* current = tree_.entry(openEntryId_);
    if (!current) return;

    resolving_ = true;
    status_ = "Fetching full article";
    Entry entry = *current;
    bool started = dispatch([this, entry]() {
        BackgroundEvent event;
        event.entryId = entry.id;
        event.kind = BackgroundEvent::Kind::ContentFailed;
        try {
            event.text = resolver_.resolveFullContent(entry);
            event.kind = BackgroundEvent::Kind::ContentResolved;
        } catch (const ResolutionError& e) {
            event.text = e.what();
        } catch (const std::exception& e) {
            spdlog::error("Unexpected failure resolving entry {}: {}", entry.id, e.what());
            event.text = e.what();
        }
        events_.push(std::move(event));
    });
    if (!started) resolving_ = false;
}

bool ViewController::dispatch(std::function<void()> task) {
    try {
        runner_.post(std::move(task));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Could not start background work: {}", e.what());
        status_ = std::string("Could not start background work: ") + e.what();
        return false;
    }
}

void ViewController::openInBrowser() {
    const Entry* entry = tree_.entry(openEntryId_);
    if (!entry || entry->link.empty()) {
        status_ = "Entry has no link";
        return;
    }
    status_ = browser_.open(entry->link) ? "Opened in browser" : "Could not start a browser";
}

bool ViewController::pumpEvents() {
    auto events = events_.drain();
    for (const auto& event : events) {
        switch (event.kind) {
            case BackgroundEvent::Kind::SyncFinished:
                applySyncResults(event.syncResults);
                break;
            case BackgroundEvent::Kind::FeedAdded:
                applyAddResult(event.addResult);
                break;
            case BackgroundEvent::Kind::ContentResolved:
                applyResolvedContent(event.entryId, event.text);
                break;
            case BackgroundEvent::Kind::ContentFailed:
                resolving_ = false;
                status_ = "Could not load article (" + event.text + "), press o to open in browser";
                break;
        }
    }
    return !events.empty();
}

void ViewController::applySyncResults(const std::vector<SyncResult>& results) {
    syncing_ = false;
    reload();

    int inserted = 0;
    const SyncResult* firstFailure = nullptr;
    int failed = 0;
    for (const auto& result : results) {
        inserted += result.insertedCount;
        if (!result.ok()) {
            failed++;
            if (!firstFailure) firstFailure = &result;
        }
    }
    status_ = "Synced " + std::to_string(results.size()) + " feeds, " + std::to_string(inserted) + " new entries";
    if (firstFailure) {
        status_ += ", " + std::to_string(failed) + " failed (" + firstFailure->feedUrl + ": " +
                   firstFailure->message + ")";
    }
}

void ViewController::applyAddResult(const AddFeedResult& result) {
    adding_ = false;
    if (!result.ok) {
        status_ = "Failed to add feed: " + result.message;
        return;
    }
    reload();
    if (auto index = tree_.indexOfFeed(result.feedId)) {
        tree_.select(*index);
        followSelection();
    }
    status_ = "Added " + result.title;
}

void ViewController::applyResolvedContent(EntryId entryId, const std::string& text) {
    resolving_ = false;
    try {
        store_.setFullContent(entryId, text);
    } catch (const StorageError& e) {
        status_ = std::string("Could not store article: ") + e.what();
    } catch (const ReferentialError& e) {
        spdlog::error("Resolved content for a deleted entry: {}", e.what());
        return;
    }
    if (view_ == ViewMode::Entry && openEntryId_ == entryId) {
        entryContent_ = text;
        showingFullContent_ = true;
        bodyScroll_ = 0;
        layoutEntry();
        status_ = "Loaded full article";
    }
}

RenderSnapshot ViewController::snapshot() const {
    RenderSnapshot snap;
    snap.width = width_;
    snap.height = height_;
    snap.view = view_;
    snap.overlay = overlay_;
    snap.status = status_;
    snap.busy = isBusy();
    snap.spinner = snap.busy ? kSpinner[spinnerFrame_] : ' ';
    snap.rowCount = tree_.rowCount();
    snap.selectedIndex = tree_.selectedIndex();
    snap.firstRow = treeScroll_;

    int last = std::min(tree_.rowCount(), treeScroll_ + listHeight());
    for (int i = treeScroll_; i < last; ++i) {
        const TreeRow& row = tree_.rowAt(i);
        RenderRow out;
        out.kind = row.kind;
        out.depth = row.depth;
        out.selected = (i == tree_.selectedIndex());
        if (row.kind == RowKind::Feed) {
            if (const Feed* feed = tree_.feed(row.feedId)) {
                out.title = feed->displayTitle();
                out.collapsed = feed->collapsed;
                out.syncFailed = feed->lastSyncStatus == SyncStatus::Error;
            }
            out.unreadCount = tree_.unreadCount(row.feedId);
        } else if (const Entry* entry = tree_.entry(row.entryId)) {
            out.title = entry->title.empty() ? entry->link : entry->title;
            out.date = formatDate(entry->publishedAt);
            out.read = entry->read;
        }
        snap.rows.push_back(std::move(out));
    }

    if (view_ == ViewMode::Entry) {
        if (const Entry* entry = tree_.entry(openEntryId_)) snap.entryTitle = entry->title;
        snap.bodyScroll = bodyScroll_;
        snap.bodyLineCount = static_cast<int>(bodyLines_.size());
        snap.showingFullContent = showingFullContent_;
        int end = std::min(static_cast<int>(bodyLines_.size()), bodyScroll_ + listHeight());
        for (int i = bodyScroll_; i < end; ++i) snap.bodyLines.push_back(bodyLines_[i]);
    }

    if (overlay_ == Overlay::HelpPopup) {
        snap.helpLines = (view_ == ViewMode::Feeds) ? kFeedsHelp : kEntryHelp;
    } else if (overlay_ == Overlay::AddFeedPrompt) {
        snap.promptText = toUtf8(prompt_);
        snap.promptCursor = static_cast<int>(promptCursor_);
    } else if (overlay_ == Overlay::ConfirmDelete) {
        const Feed* feed = tree_.feed(deleteTarget_);
        snap.deleteTarget = feed ? feed->displayTitle() : "";
    }
    return snap;
}

}
